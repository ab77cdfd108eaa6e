// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_DESIGN_DESIGNWORKER_H
#define PLPDESIGN_DESIGN_DESIGNWORKER_H

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <optional>
#include <filesystem>
#include <plpdesign.hpp>
#include "ChemistryFilter.hpp"
#include "IsoformAligner.hpp"
#include "CandidateExtractor.hpp"
#include "Sampler.hpp"
#include "SearchBackend.hpp"
#include "SpecificityMatcher.hpp"
#include "Classifier.hpp"
#include "DesignStats.hpp"

namespace fs = std::filesystem;

struct DesignConfig {
    std::string genes_path;
    std::string transcriptome_path;
    std::string barcodes_path;
    fs::path outdir;

    ChemistryRules chemistry;
    int max_mismatch = 5;
    std::size_t sample_size = 10;
    std::size_t rescue_sample_size = 0;  // 0: three times sample_size
    int rounds = 2;
    std::size_t final_designed = 5;
    bool cap = true;
    AttributionRule attribution = ATTRIBUTE_GENE;
    std::optional<std::uint64_t> seed;
    unsigned threads = 0;

    std::string search = "internal";
    std::string search_exe = "seqkit";
    std::string aligner = "mafft";
    std::chrono::seconds timeout {300};
    int retries = 2;

    plpdesign::AssignMode barcode_mode = plpdesign::ASSIGN_START;
    std::string barcode_on = "1";
    std::size_t arm_length = 0;
};

class DesignWorker {
    DesignConfig config;
    std::vector<std::string> cli;
    std::vector<std::string> genes;
    plpdesign::Transcriptome transcriptome;
    plpdesign::BarcodeLibrary library;
    plpdesign::BarcodeAssigner assigner;
    std::unique_ptr<IsoformAligner> aligner;
    std::unique_ptr<SearchBackend> backend;
    DesignStats stats;

    ExtractionResult extraction;
    Classification final_classes;
    std::vector<plpdesign::MatchResult> final_specific;
    std::vector<plpdesign::Probe> probes;

    fs::path scratch_dir() const {return config.outdir / "tmp";}
    std::unique_ptr<SearchBackend> make_backend();
    void record_config();
    void dump_extraction() const;
    void dump_round(const int& round, plpdesign::RoundResults const& round_results,
                    Classification const& round_classes, Classification const& merged_classes) const;
public:
    // Constructor for the DesignWorker. Reads every input up front, so missing or malformed files fail before any work is done.
    //  Args:
    //    config: Run configuration.
    //    cli: Command line, recorded in the summary.
    //    aligner: Isoform aligner. If null, config.aligner is run as an external MAFFT-compatible tool.
    DesignWorker(DesignConfig const& config, std::vector<std::string> const& cli, std::unique_ptr<IsoformAligner> aligner = nullptr);

    // Extract, then sample/match/classify for up to config.rounds rounds, then assign barcodes.
    // Every artifact, summary.json included, is written under config.outdir.
    int run();

    // Write summary.json
    void dump_stats(fs::path const& fname) const;

    const DesignConfig& get_config() const {return config;}
    const ExtractionResult& get_extraction() const {return extraction;}
    const Classification& get_classification() const {return final_classes;}
    const std::vector<plpdesign::MatchResult>& get_specific() const {return final_specific;}
    const std::vector<plpdesign::Probe>& get_probes() const {return probes;}
    const std::vector<std::string>& get_genes() const {return genes;}
};

#endif //PLPDESIGN_DESIGN_DESIGNWORKER_H
