//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MdfindSearchEngine.h
// Purpose: ISearchEngine backed by the mdfind and mdls command line tools
//==========================================================================================================

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "mdagent/search/ProcessRunner.h"
#include "mdagent/search/SearchEngine.h"

namespace mdagent {
namespace search {

struct MdfindConfig {
    std::string mdfindPath{"mdfind"};
    std::string mdlsPath{"mdls"};
};

//==========================================================================================================
// MdlsRecord
// Purpose: Parsed "name = value" output of mdls. Quoted values are unquoted; "(null)" entries are dropped.
//==========================================================================================================
using MdlsRecord = std::map<std::string, std::string>;

MdlsRecord ParseMdlsOutput(const std::string& text);

// "2024-01-02 03:04:05 +0000" (mdls date form, UTC offset honoured)
std::optional<TimePoint> ParseMdlsDate(const std::string& text);

//==========================================================================================================
// MdfindSearchEngine
// Purpose: Runs "mdfind -0" for queries and "mdls" per result for attributes. Sorting happens here since
//          mdfind reports matches in index order.
// Notes:
//   - Without a sort attribute the path list is truncated before any mdls call.
//   - Sorting by file name needs no mdls lookup; any other attribute is fetched for every match.
//==========================================================================================================
class MdfindSearchEngine : public ISearchEngine {
public:
    MdfindSearchEngine(std::shared_ptr<IProcessRunner> runner, MdfindConfig config = {});

    std::vector<SearchResult> Execute(const SearchRequest& request) override;
    int64_t Count(const std::string& query, const std::vector<std::string>& scopes) override;
    std::string Metadata(const std::string& path) override;

private:
    ProcessOutput runMdfind(const std::vector<std::string>& flags, const std::string& query,
                            const std::vector<std::string>& scopes);
    MdlsRecord fetchAttributes(const std::string& path, const std::optional<std::string>& extra);

    std::shared_ptr<IProcessRunner> runner_;
    MdfindConfig config_;
};

} // namespace search
} // namespace mdagent
