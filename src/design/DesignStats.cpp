// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <iomanip>
#include <iostream>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <plpdesign.hpp>
#include "DesignStats.hpp"

static std::array<std::size_t, plpdesign::CLASS_MAX> bucket_sizes(Classification const& classification) {
    std::array<std::size_t, plpdesign::CLASS_MAX> sizes {};
    for (const auto& [gene, cls] : classification.classes) {
        ++sizes.at(cls);
    }
    return sizes;
}

static nlohmann::ordered_json buckets_to_json(std::array<std::size_t, plpdesign::CLASS_MAX> const& sizes) {
    nlohmann::ordered_json data = nlohmann::ordered_json::object();
    for (int i = plpdesign::CLASS_NOT_FOUND; i != plpdesign::CLASS_MAX; ++i) {
        data[plpdesign::GeneClassNames[i]] = sizes.at(i);
    }
    return data;
}

void DesignStats::record_extraction(ExtractionResult const& extraction) {
    chemistry = extraction.chemistry;
    not_found = extraction.not_found_genes;
    for (const auto& [gene, candidates] : extraction.found_genes) {
        candidate_counts[gene] = candidates.size();
    }
}

void DesignStats::record_round(const int& round, const std::size_t& genes_sampled, const std::size_t& sampled,
                               Classification const& round_classes, Classification const& merged_classes, const std::size_t& queried) {
    rounds.push_back({
        round,
        genes_sampled,
        sampled,
        queried,
        round_classes.specific.size(),
        bucket_sizes(round_classes),
        bucket_sizes(merged_classes),
    });
}

nlohmann::ordered_json DesignStats::to_json() const {
    BOOST_LOG_TRIVIAL(debug) << "to_json() invoked";
    nlohmann::ordered_json data = {
        {"version", PLPDESIGN_VERSION_STR},
        {"config", config},
        {"not_found", nlohmann::ordered_json::object()},
        {"candidate_counts", candidate_counts},
        {"chemistry_counts", nlohmann::ordered_json::object()},
        {"rounds", nlohmann::ordered_json::array()},
        {"final_specific", final_specific},
        {"probes", probes},
    };

    nlohmann::ordered_json& not_found_j = data["not_found"];
    for (const auto& [gene, status] : not_found) {
        not_found_j[gene] = plpdesign::GeneStatusNames[status];
    }

    nlohmann::ordered_json& chemistry_j = data["chemistry_counts"];
    for (const auto& [gene, counts] : chemistry) {
        nlohmann::ordered_json& entry = chemistry_j[gene] = nlohmann::ordered_json::object();
        for (int j = CHEM_PASS; j != CHEM_MAX; ++j) {
            entry[ChemistryFailNames[j]] = counts.at(j);
        }
    }

    nlohmann::ordered_json& rounds_j = data["rounds"];
    for (const RoundStats& r : rounds) {
        rounds_j.push_back({
            {"round", r.round},
            {"genes_sampled", r.genes_sampled},
            {"sampled", r.sampled},
            {"queried", r.queried},
            {"specific", r.specific},
            {"round_classes", buckets_to_json(r.round_buckets)},
            {"merged_classes", buckets_to_json(r.merged_buckets)},
        });
    }
    BOOST_LOG_TRIVIAL(debug) << "to_json() done";
    return data;
}

std::ostream &operator<<(std::ostream &strm, DesignStats const &self) {
    // Stream as JSON
    strm << std::setw(4) << self.to_json() << std::flush;
    return strm;
}
