// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_DESIGN_DESIGNSTATS_H
#define PLPDESIGN_DESIGN_DESIGNSTATS_H

#include <string>
#include <vector>
#include <map>
#include <array>
#include <iostream>
#include <nlohmann/json.hpp>
#include "CandidateExtractor.hpp"
#include "Classifier.hpp"

struct RoundStats {
    int round;
    std::size_t genes_sampled;
    std::size_t sampled;
    std::size_t queried;
    std::size_t specific;
    std::array<std::size_t, plpdesign::CLASS_MAX> round_buckets;
    std::array<std::size_t, plpdesign::CLASS_MAX> merged_buckets;
};

// Run summary, written as summary.json
struct DesignStats {
    nlohmann::ordered_json config;
    std::map<std::string, ChemistryCounts> chemistry;
    std::map<std::string, std::size_t> candidate_counts;
    std::map<std::string, plpdesign::GeneStatus> not_found;
    std::vector<RoundStats> rounds;
    std::size_t final_specific = 0;
    std::size_t probes = 0;

    void record_extraction(ExtractionResult const& extraction);
    void record_round(const int& round, const std::size_t& genes_sampled, const std::size_t& sampled,
                      Classification const& round_classes, Classification const& merged_classes, const std::size_t& queried);
    nlohmann::ordered_json to_json() const;
    friend std::ostream &operator<<(std::ostream &strm, DesignStats const &self);
};

#endif //PLPDESIGN_DESIGN_DESIGNSTATS_H
