// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <thread>
#include <boost/process.hpp>
#include <boost/log/trivial.hpp>
#include <plpdesign.hpp>
#include "ExternalTool.hpp"

namespace bp = boost::process;

static std::string read_tail(fs::path const& path, const std::size_t max_chars = 500) {
    std::ifstream infile(path);
    std::stringstream ss;
    ss << infile.rdbuf();
    std::string text = plpdesign::strstrip(ss.str());
    if (text.length() > max_chars) {
        text = "..." + text.substr(text.length() - max_chars);
    }
    return text;
}

ExternalTool::ExternalTool(std::string const& exe, fs::path const& workdir, const std::chrono::seconds& timeout) :
    exe(exe),
    workdir(workdir),
    timeout(timeout)
{
    fs::create_directories(workdir);
}

fs::path ExternalTool::scratch(std::string const& suffix) {
    std::stringstream ss;
    ss << fs::path(exe).filename().string() << "_" << std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000 << "_" << serial++ << suffix;
    return workdir / ss.str();
}

void ExternalTool::run(std::vector<std::string> const& args, fs::path const& stdout_path) {
    std::vector<std::string> cli {exe};
    cli.insert(cli.end(), args.cbegin(), args.cend());
    const std::string cmdline = plpdesign::shlexjoin(cli);

    boost::filesystem::path exe_path = exe.find('/') == std::string::npos ? bp::search_path(exe) : boost::filesystem::path(exe);
    if (exe_path.empty()) {
        throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, exe + ": executable not found on PATH");
    }
    fs::path stderr_path = stdout_path;
    stderr_path += ".err";
    BOOST_LOG_TRIVIAL(debug) << "Running " << cmdline;
    try {
        bp::child child(
            exe_path,
            bp::args(args),
            bp::std_in < bp::null,
            bp::std_out > boost::filesystem::path(stdout_path.string()),
            bp::std_err > boost::filesystem::path(stderr_path.string())
        );
        if (!child.wait_for(timeout)) {
            child.terminate();
            throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, cmdline + ": timed out after " + std::to_string(timeout.count()) + " s");
        }
        if (child.exit_code() != 0) {
            throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, cmdline + ": exit status " + std::to_string(child.exit_code()) + ": " + read_tail(stderr_path));
        }
    } catch (const bp::process_error& e) {
        throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, cmdline + ": " + e.what());
    }
    std::error_code ec;
    fs::remove(stderr_path, ec);
}
