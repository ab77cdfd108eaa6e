// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <iostream>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <plpdesign.hpp>
#include "AssignWorker.hpp"

constexpr std::string_view usage =
"usage: assign [-h] [-v] [--debug] [--mode {start,end,custom}] [--on VALUE] [--arm-length A] [--final-designed K]\n"
"              genes specific barcodes output\n";
constexpr std::string_view more_usage =
"\n"
"positional arguments:\n"
"  genes                 CSV/TSV file with a \"Gene\" column; sets the order in which barcode ids are handed out\n"
"  specific              Specific target table written by design (specific.tsv)\n"
"  barcodes              CSV/TSV barcode library with columns Lbar_ID, Backbone, Code\n"
"  output                Probe table to write\n"
"\n"
"options:\n"
"  -h, --help            show this help message and exit\n"
"  -v, --version         show the program version and exit\n"
"  --debug               Log each gene's assignment\n"
"  --mode {start,end,custom}\n"
"                        Count barcode ids up or down from --on, or read them from a Gene/Lbar_ID table (default: start)\n"
"  --on VALUE            First barcode id (start, end) or path to the assignment table (custom) (default: 1)\n"
"  --arm-length A        Length of the target's 5' half (default: half the target length)\n"
"  --final-designed K    Keep at most K targets per gene, earliest round first (default: keep all)";

typedef int opt_parse_t;
constexpr opt_parse_t opt_no = 0, opt_yes = 1, opt_inval = 2;

opt_parse_t get_arg(std::vector<std::string>::const_iterator& it, const std::vector<std::string>::const_iterator& end, std::string const& optstr, std::string& out) {
    if (*it != optstr) {
        return opt_no;
    }
    if (++it == end || it->empty() || it->front() == '-') {
        std::cerr << usage << "\nERR: missing value for " << optstr << std::endl;
        return opt_inval;
    }
    out = *it;
    return opt_yes;
}

opt_parse_t get_arg(std::vector<std::string>::const_iterator& it, const std::vector<std::string>::const_iterator& end, std::string const& optstr, int& out) {
    if (*it != optstr) {
        return opt_no;
    }
    if (++it == end || it->empty()) {
        std::cerr << usage << "\nERR: missing value for " << optstr << std::endl;
        return opt_inval;
    }
    try {
        std::size_t pos;
        out = std::stoi(*it, &pos);
        if (pos != it->length()) {
            throw std::invalid_argument(*it);
        }
    } catch (const std::exception& e) {
        std::cerr << usage << "\nERR: invalid value for " << optstr << ": " << e.what() << std::endl;
        return opt_inval;
    }
    return opt_yes;
}

int main(int argc, char ** argv) {
    std::string mode_s = "start";
    std::string on = "1";
    int arm_length = 0;
    int final_designed = 0;
    bool debug = false;
    opt_parse_t opt_parse_result;
    std::vector<std::string> args(argv, argv + argc);
    std::vector<std::string> posargs {}; // genes specific barcodes output

    for (auto it = std::next(args.cbegin()); it != args.cend(); ++it) {
        const std::string& opt = *it;
        if (opt == "-h" || opt == "--help") {
            std::cout << usage << more_usage << "\n";
            return 0;
        } else if (opt == "-v" || opt == "--version") {
            std::cout << "assign (PLPDesign v" << PLPDESIGN_VERSION_STR << ")" << std::endl;
            return 0;
        } else if (opt == "--debug") {
            debug = true;
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--mode", mode_s)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--on", on)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--arm-length", arm_length)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--final-designed", final_designed)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if (opt.front() == '-' && opt.length() > 1) {
            std::cerr << usage << "\nERR: Unrecognized option: " << opt << "\n";
            return 1;
        } else {
            posargs.push_back(opt);
        }
    }
    if (posargs.size() < 4) {
        const std::string posarg_name[4] {
            "genes",
            "specific",
            "barcodes",
            "output"
        };
        std::cerr << usage << "\nERR: Missing required argument: " << posarg_name[posargs.size()] << "\n";
        return 1;
    } else if (posargs.size() > 4) {
        std::cerr << usage << "\nERR: Unrecognized positional argument (first one: " << posargs[4] << ")\n";
        return 1;
    }

    // Check for invalid argument values
    if (arm_length < 0) {
        std::cerr << usage << "\nERR: Minimum allowed value for --arm-length is 0\n";
        return 1;
    }
    if (final_designed < 0) {
        std::cerr << usage << "\nERR: Minimum allowed value for --final-designed is 0\n";
        return 1;
    }
    plpdesign::AssignMode mode;
    try {
        mode = plpdesign::parse_assign_mode(mode_s);
    } catch (const std::exception& e) {
        std::cerr << usage << "\nERR: " << e.what() << "\n";
        return 1;
    }

    boost::log::trivial::severity_level level = debug ? boost::log::trivial::debug : boost::log::trivial::info;
    boost::log::core::get()->set_filter (
        boost::log::trivial::severity >= level
    );

    // Do the thing
    try {
        AssignConfig config {posargs.at(0), posargs.at(1), posargs.at(2), posargs.at(3), mode, on,
                             static_cast<std::size_t>(arm_length), static_cast<std::size_t>(final_designed)};
        AssignWorker worker {config};
        int result = worker.run();
        if (result != 0) {
            return result;
        }
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << e.what();
        std::cerr << "ERR: Barcode assignment failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
