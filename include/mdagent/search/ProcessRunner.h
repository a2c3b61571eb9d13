//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessRunner.h
// Purpose: Child-process execution seam used by the mdfind/mdls search engine
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

namespace mdagent {
namespace search {

//==========================================================================================================
// ProcessOutput
// Fields:
//   exitCode: Exit status; 128 + signal number when the child was killed; 127 when exec failed.
//   out: Captured stdout bytes.
//   err: Captured stderr bytes.
//==========================================================================================================
struct ProcessOutput {
    int exitCode{0};
    std::string out;
    std::string err;
};

class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    //==========================================================================================================
    // Runs argv[0] (PATH lookup) with the remaining arguments, without a shell, and waits for it.
    // Throws:
    //   std::system_error when pipes or the child cannot be created.
    //==========================================================================================================
    virtual ProcessOutput Run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp implementation draining stdout and stderr with poll()
class PosixProcessRunner : public IProcessRunner {
public:
    ProcessOutput Run(const std::vector<std::string>& argv) override;
};

} // namespace search
} // namespace mdagent
