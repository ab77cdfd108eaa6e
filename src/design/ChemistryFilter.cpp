// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <array>
#include <algorithm>
#include <plpdesign.hpp>
#include "ChemistryFilter.hpp"

ChemistryFilter::ChemistryFilter(const ChemistryRules& rules) :
    kmer_length(rules.kmer_length),
    ligation_pos(rules.arm_length > 0 ? rules.arm_length : rules.kmer_length / 2),
    gc_min(rules.gc_min),
    gc_max(rules.gc_max),
    forbid_5prime(plpdesign::to_upper(rules.forbid_5prime)),
    forbid_3prime(plpdesign::to_upper(rules.forbid_3prime)),
    forbid_ligation(plpdesign::to_upper(rules.forbid_ligation))
{
    if (rules.kmer_length < 2) {
        throw plpdesign::PipelineError(plpdesign::ERR_INVALID_INPUT, "k-mer length must be at least 2");
    }
    if (rules.arm_length < 0 || rules.arm_length >= rules.kmer_length) {
        throw plpdesign::PipelineError(plpdesign::ERR_INVALID_INPUT, "arm length " + std::to_string(rules.arm_length) + " does not split a "
                                       + std::to_string(rules.kmer_length) + "-mer");
    }
    if (gc_min < 0 || gc_max > 100 || gc_min > gc_max) {
        throw plpdesign::PipelineError(plpdesign::ERR_INVALID_INPUT, "GC bounds must satisfy 0 <= min <= max <= 100");
    }
    if (rules.max_homopolymer > 0) {
        enable_homopolymer = true;
        homopolymers.at(0).assign(rules.max_homopolymer + 1, 'A');
        homopolymers.at(1).assign(rules.max_homopolymer + 1, 'C');
        homopolymers.at(2).assign(rules.max_homopolymer + 1, 'G');
        homopolymers.at(3).assign(rules.max_homopolymer + 1, 'T');
    }
    enable_5prime = !forbid_5prime.empty();
    enable_3prime = !forbid_3prime.empty();
    enable_ligation = !forbid_ligation.empty();
}

ChemistryFailReason ChemistryFilter::operator()(std::string_view window) const {
    if (window.length() != kmer_length) {
        return CHEM_FAIL_LENGTH;
    }
    if (!std::ranges::all_of(window, plpdesign::is_canonical)) {
        return CHEM_FAIL_AMBIGUOUS_BASE;
    }
    double gc = plpdesign::gc_percent(window);
    if (gc < gc_min) {
        return CHEM_FAIL_GC_LOW;
    }
    if (gc > gc_max) {
        return CHEM_FAIL_GC_HIGH;
    }
    if (enable_homopolymer) {
        for (const std::string& homop : homopolymers) {
            if (window.find(homop) != std::string_view::npos) {
                return CHEM_FAIL_HOMOPOLYMER;
            }
        }
    }
    if (enable_5prime && forbid_5prime.find(window.front()) != std::string::npos) {
        return CHEM_FAIL_5PRIME_BASE;
    }
    if (enable_3prime && forbid_3prime.find(window.back()) != std::string::npos) {
        return CHEM_FAIL_3PRIME_BASE;
    }
    // The two bases either side of the probe's ligation junction
    if (enable_ligation && (forbid_ligation.find(window[ligation_pos - 1]) != std::string::npos ||
                            forbid_ligation.find(window[ligation_pos]) != std::string::npos)) {
        return CHEM_FAIL_LIGATION_SITE;
    }
    return CHEM_PASS;
}
