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
#include "DesignWorker.hpp"

constexpr std::string_view usage =
"usage: design [-h] [-v] [--debug] [--kmer-length L] [--gc-min PCT] [--gc-max PCT] [--max-homopolymer N] [--forbid-5prime BASES] [--forbid-3prime BASES]\n"
"              [--forbid-ligation BASES] [--mismatch M] [--sample-size N] [--rescue-sample-size N2] [--rounds R] [--final-designed K] [--no-cap]\n"
"              [--attribution {gene,transcript}] [--seed SEED] [--threads T] [--search {internal,seqkit}] [--search-exe PATH] [--aligner PATH]\n"
"              [--timeout SECONDS] [--retries N] [--barcode-mode {start,end,custom}] [--barcode-on VALUE] [--arm-length A]\n"
"              genes transcriptome barcodes outdir\n";
constexpr std::string_view more_usage =
"\n"
"positional arguments:\n"
"  genes                 CSV/TSV file with a \"Gene\" column listing the genes to design probes for\n"
"  transcriptome         Reference transcriptome FASTA (optionally gzipped); gene symbols in parentheses in the headers\n"
"  barcodes              CSV/TSV barcode library with columns Lbar_ID, Backbone, Code\n"
"  outdir                Output directory\n"
"\n"
"options:\n"
"  -h, --help            show this help message and exit\n"
"  -v, --version         show the program version and exit\n"
"  --debug               Log per-k-mer details\n"
"  --kmer-length L       Target (hybridisation) sequence length (default: 30)\n"
"  --gc-min PCT          Minimum GC content of a target, in percent (default: 50)\n"
"  --gc-max PCT          Maximum GC content of a target, in percent (default: 65)\n"
"  --max-homopolymer N   Reject targets with a run of more than N identical bases; 0 disables (default: 4)\n"
"  --forbid-5prime BASES Reject targets starting with any of these bases (default: none)\n"
"  --forbid-3prime BASES Reject targets ending with any of these bases (default: none)\n"
"  --forbid-ligation BASES\n"
"                        Reject targets with any of these bases either side of the ligation site (default: none)\n"
"  --mismatch M          Maximum substitutions for a transcriptome hit (default: 5)\n"
"  --sample-size N       Targets sampled per gene in the first round (default: 10)\n"
"  --rescue-sample-size N2\n"
"                        Targets sampled per NoSpecific or TooFew gene in later rounds (default: 3 * N)\n"
"  --rounds R            Maximum number of sampling rounds (default: 2)\n"
"  --final-designed K    Specific targets a gene needs to be Good, and the per-gene cap on probes (default: 5)\n"
"  --no-cap              Emit a probe for every specific target instead of at most K per gene\n"
"  --attribution {gene,transcript}\n"
"                        Count hits per gene (a gene's own isoforms count once) or per transcript (default: gene)\n"
"  --seed SEED           Seed for reproducible sampling (default: random)\n"
"  --threads T           Search worker threads (default: one per CPU)\n"
"  --search {internal,seqkit}\n"
"                        Transcriptome search backend (default: internal)\n"
"  --search-exe PATH     seqkit executable for --search seqkit (default: seqkit)\n"
"  --aligner PATH        MAFFT-compatible aligner executable (default: mafft)\n"
"  --timeout SECONDS     Time limit per external tool invocation (default: 300)\n"
"  --retries N           Retries of a failed search query (default: 2)\n"
"  --barcode-mode {start,end,custom}\n"
"                        Assign barcode ids counting up or down from --barcode-on, or from a Gene/Lbar_ID table (default: start)\n"
"  --barcode-on VALUE    First barcode id (start, end) or path to the assignment table (custom) (default: 1)\n"
"  --arm-length A        Length of the target's 5' half (default: half the target length)";

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

opt_parse_t get_arg(std::vector<std::string>::const_iterator& it, const std::vector<std::string>::const_iterator& end, std::string const& optstr, unsigned long long& out) {
    if (*it != optstr) {
        return opt_no;
    }
    if (++it == end || it->empty() || it->front() == '-') {
        std::cerr << usage << "\nERR: missing value for " << optstr << std::endl;
        return opt_inval;
    }
    try {
        std::size_t pos;
        out = std::stoull(*it, &pos);
        if (pos != it->length()) {
            throw std::invalid_argument(*it);
        }
    } catch (const std::exception& e) {
        std::cerr << usage << "\nERR: invalid value for " << optstr << ": " << e.what() << std::endl;
        return opt_inval;
    }
    return opt_yes;
}

opt_parse_t get_arg(std::vector<std::string>::const_iterator& it, const std::vector<std::string>::const_iterator& end, std::string const& optstr, double& out) {
    if (*it != optstr) {
        return opt_no;
    }
    if (++it == end || it->empty()) {
        std::cerr << usage << "\nERR: missing value for " << optstr << std::endl;
        return opt_inval;
    }
    try {
        std::size_t pos;
        out = std::stod(*it, &pos);
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
    DesignConfig config;
    int sample_size = 10;
    int rescue_sample_size = 0;
    int final_designed = 5;
    int threads = 0;
    int timeout = 300;
    int arm_length = 0;
    unsigned long long seed;
    bool has_seed = false;
    std::string attribution = "gene";
    std::string barcode_mode = "start";
    bool debug = false;
    opt_parse_t opt_parse_result;
    std::vector<std::string> args(argv, argv + argc);
    std::vector<std::string> posargs {}; // genes transcriptome barcodes outdir

    for (auto it = std::next(args.cbegin()); it != args.cend(); ++it) {
        const std::string& opt = *it;
        if (opt == "-h" || opt == "--help") {
            std::cout << usage << more_usage << "\n";
            return 0;
        } else if (opt == "-v" || opt == "--version") {
            std::cout << "design (PLPDesign v" << PLPDESIGN_VERSION_STR << ")" << std::endl;
            return 0;
        } else if (opt == "--debug") {
            debug = true;
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--kmer-length", config.chemistry.kmer_length)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--gc-min", config.chemistry.gc_min)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--gc-max", config.chemistry.gc_max)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--max-homopolymer", config.chemistry.max_homopolymer)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--forbid-5prime", config.chemistry.forbid_5prime)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--forbid-3prime", config.chemistry.forbid_3prime)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--forbid-ligation", config.chemistry.forbid_ligation)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--mismatch", config.max_mismatch)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--sample-size", sample_size)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--rescue-sample-size", rescue_sample_size)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--rounds", config.rounds)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--final-designed", final_designed)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if (opt == "--no-cap") {
            config.cap = false;
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--attribution", attribution)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--seed", seed)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
            has_seed = true;
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--threads", threads)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--search", config.search)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--search-exe", config.search_exe)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--aligner", config.aligner)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--timeout", timeout)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--retries", config.retries)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--barcode-mode", barcode_mode)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--barcode-on", config.barcode_on)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, args.cend(), "--arm-length", arm_length)) != opt_no) {
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
            "transcriptome",
            "barcodes",
            "outdir"
        };
        std::cerr << usage << "\nERR: Missing required argument: " << posarg_name[posargs.size()] << "\n";
        return 1;
    } else if (posargs.size() > 4) {
        std::cerr << usage << "\nERR: Unrecognized positional argument (first one: " << posargs[4] << ")\n";
        return 1;
    }

    // Check for invalid argument values
    const int& kmer_length = config.chemistry.kmer_length;
    if (kmer_length < 2) {
        std::cerr << usage << "\nERR: Minimum allowed value for --kmer-length is 2\n";
        return 1;
    }
    if (config.chemistry.gc_min < 0 || config.chemistry.gc_max > 100 || config.chemistry.gc_min > config.chemistry.gc_max) {
        std::cerr << usage << "\nERR: Values for --gc-min and --gc-max must satisfy 0 <= gc-min <= gc-max <= 100\n";
        return 1;
    }
    if (config.chemistry.max_homopolymer < 0) {
        std::cerr << usage << "\nERR: Minimum allowed value for --max-homopolymer is 0\n";
        return 1;
    }
    if (config.max_mismatch < 0 || config.max_mismatch >= kmer_length) {
        std::cerr << usage << "\nERR: Allowed values for --mismatch are between 0 and " << kmer_length - 1 << "\n";
        return 1;
    }
    if (sample_size < 1) {
        std::cerr << usage << "\nERR: Minimum allowed value for --sample-size is 1\n";
        return 1;
    }
    if (rescue_sample_size < 0) {
        std::cerr << usage << "\nERR: Minimum allowed value for --rescue-sample-size is 1 (0 selects 3 * --sample-size)\n";
        return 1;
    }
    if (config.rounds < 1) {
        std::cerr << usage << "\nERR: Minimum allowed value for --rounds is 1\n";
        return 1;
    }
    if (final_designed < 1) {
        std::cerr << usage << "\nERR: Minimum allowed value for --final-designed is 1\n";
        return 1;
    }
    if (threads < 0) {
        std::cerr << usage << "\nERR: Minimum allowed value for --threads is 1\n";
        return 1;
    }
    if (timeout < 1) {
        std::cerr << usage << "\nERR: Minimum allowed value for --timeout is 1\n";
        return 1;
    }
    if (config.retries < 0) {
        std::cerr << usage << "\nERR: Minimum allowed value for --retries is 0\n";
        return 1;
    }
    if (arm_length < 0 || arm_length >= kmer_length) {
        std::cerr << usage << "\nERR: Allowed values for --arm-length are between 1 and " << kmer_length - 1 << "\n";
        return 1;
    }
    if (config.search != "internal" && config.search != "seqkit") {
        std::cerr << usage << "\nERR: Value for --search must be one of internal, seqkit\n";
        return 1;
    }
    try {
        config.attribution = parse_attribution_rule(attribution);
        config.barcode_mode = plpdesign::parse_assign_mode(barcode_mode);
    } catch (const std::exception& e) {
        std::cerr << usage << "\nERR: " << e.what() << "\n";
        return 1;
    }

    config.sample_size = sample_size;
    config.rescue_sample_size = rescue_sample_size;
    config.final_designed = final_designed;
    config.threads = threads;
    config.timeout = std::chrono::seconds(timeout);
    config.arm_length = arm_length;
    if (has_seed) {
        config.seed = seed;
    }
    config.genes_path = posargs.at(0);
    config.transcriptome_path = posargs.at(1);
    config.barcodes_path = posargs.at(2);
    config.outdir = posargs.at(3);

    boost::log::trivial::severity_level level = debug ? boost::log::trivial::debug : boost::log::trivial::info;
    boost::log::core::get()->set_filter (
        boost::log::trivial::severity >= level
    );

    // Do the thing
    try {
        DesignWorker worker {config, args};
        if (worker.run() < 0) {
            std::cerr << "ERR: Probe design failed" << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << e.what();
        std::cerr << "ERR: Probe design failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
