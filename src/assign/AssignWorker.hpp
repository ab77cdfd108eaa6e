// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_ASSIGN_ASSIGNWORKER_H
#define PLPDESIGN_ASSIGN_ASSIGNWORKER_H

#include <string>
#include <vector>
#include <plpdesign.hpp>

struct AssignConfig {
    std::string genes_path;
    std::string specific_path;
    std::string barcodes_path;
    std::string output_path;

    plpdesign::AssignMode mode = plpdesign::ASSIGN_START;
    std::string on = "1";
    std::size_t arm_length = 0;
    std::size_t final_designed = 0;  // 0: keep every specific k-mer
};

// Re-runs barcode assignment on the specific table of an earlier design run,
// e.g. to try another id range without repeating the search
class AssignWorker {
    AssignConfig config;
    std::vector<std::string> genes;
    std::vector<plpdesign::MatchResult> specific;
    plpdesign::BarcodeLibrary library;
    plpdesign::BarcodeAssigner assigner;
    std::vector<plpdesign::Probe> probes;
public:
    // Reads the gene list, the specific table, the barcode library and (custom mode) the assignment table
    AssignWorker(AssignConfig const& config);

    // assigner refers to this worker's own library
    AssignWorker(const AssignWorker& other) = delete;
    AssignWorker& operator=(const AssignWorker& other) = delete;

    // Build the probes and write them to config.output_path
    int run();

    const std::vector<std::string>& get_genes() const {return genes;}
    const std::vector<plpdesign::MatchResult>& get_specific() const {return specific;}
    const std::vector<plpdesign::Probe>& get_probes() const {return probes;}
};

#endif //PLPDESIGN_ASSIGN_ASSIGNWORKER_H
