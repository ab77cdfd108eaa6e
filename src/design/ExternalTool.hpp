// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_DESIGN_EXTERNALTOOL_H
#define PLPDESIGN_DESIGN_EXTERNALTOOL_H

#include <string>
#include <vector>
#include <chrono>
#include <atomic>
#include <filesystem>

namespace fs = std::filesystem;

// Subprocess boundary shared by the aligner and the search backend
class ExternalTool {
    std::string exe;
    fs::path workdir;
    std::chrono::seconds timeout;
    std::atomic<unsigned long long> serial {0};
public:
    // Constructor for an ExternalTool
    //  Args:
    //    exe: Executable name (looked up on PATH) or path.
    //    workdir: Directory for the scratch files of each invocation. Created if missing.
    //    timeout: Wall-clock limit per invocation.
    ExternalTool(std::string const& exe, fs::path const& workdir, const std::chrono::seconds& timeout);

    // A fresh scratch file name; safe to call from several threads
    fs::path scratch(std::string const& suffix);

    // Run the tool to completion with stdout redirected to a file
    //  Throws:
    //    PipelineError(ERR_EXTERNAL_TOOL_FAILURE) if the executable can't be found or started, times out, or exits nonzero.
    //    The message carries the command line and the tail of stderr.
    void run(std::vector<std::string> const& args, fs::path const& stdout_path);

    const std::string& get_exe() const {return exe;}
};

#endif //PLPDESIGN_DESIGN_EXTERNALTOOL_H
