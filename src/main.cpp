//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mdagent entry point: Spotlight search tools over newline-delimited JSON-RPC on stdio
//==========================================================================================================

#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mdagent/LineTransport.hpp"
#include "mdagent/SearchTools.h"
#include "mdagent/Server.h"
#include "mdagent/search/MdfindSearchEngine.h"
#include "mdagent/version.h"

using namespace mdagent;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--tools")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) return true;
    }
    return false;
}

// Command line first, then MDAGENT_* environment, then the default
static std::string option(int argc, char** argv, const char* key, const char* env, const std::string& def) {
    if (auto v = getArgValue(argc, argv, key); v.has_value()) return *v;
    return GetEnvOrDefault(env, def);
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (hasFlag(argc, argv, "--version")) {
        std::cout << SERVER_NAME << " " << getVersionString() << std::endl;
        return 0;
    }

    Logger::setLogLevelFromString(option(argc, argv, "--log-level", "MDAGENT_LOG_LEVEL", "INFO"));
    const std::string logFile = option(argc, argv, "--log-file", "MDAGENT_LOG_FILE", "");
    if (!logFile.empty()) {
        Logger::setLogFile(logFile);
    }

    search::MdfindConfig mdfind;
    mdfind.mdfindPath = option(argc, argv, "--mdfind", "MDAGENT_MDFIND", mdfind.mdfindPath);
    mdfind.mdlsPath = option(argc, argv, "--mdls", "MDAGENT_MDLS", mdfind.mdlsPath);

    ServerConfig config;
    config.info = Implementation{SERVER_NAME, getVersionString()};
    config.validationMode = validation::parseMode(option(argc, argv, "--validation", "MDAGENT_VALIDATION", "off"));

    auto enabled = ParseToolFilter(option(argc, argv, "--tools", "MDAGENT_TOOLS", ""));
    auto engine = std::make_shared<search::MdfindSearchEngine>(std::make_shared<search::PosixProcessRunner>(), mdfind);
    Server server(config, MakeDefaultToolRegistry(engine, enabled));

    LOG_INFO("{} {} starting (tools={} validation={})", SERVER_NAME, getVersionString(),
             server.Registry().Enabled().size(), validation::toString(config.validationMode));

    std::ios::sync_with_stdio(false);
    LineTransport transport(std::cin, std::cout);
    transport.SetRequestHandler([&server](const JSONRPCRequest& req) { return server.HandleJSONRPC(req); });
    transport.SetErrorHandler([](const std::string& err) { LOG_DEBUG("Transport error: {}", err); });
    transport.Run();

    LOG_INFO("{} exiting", SERVER_NAME);
    return 0;
}
