// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_DESIGN_CHEMISTRYFILTER_H
#define PLPDESIGN_DESIGN_CHEMISTRYFILTER_H

#include <string>
#include <string_view>
#include <array>

enum ChemistryFailReason {
    CHEM_PASS = 0,
    CHEM_FAIL_LENGTH,
    CHEM_FAIL_AMBIGUOUS_BASE,
    CHEM_FAIL_GC_LOW,
    CHEM_FAIL_GC_HIGH,
    CHEM_FAIL_HOMOPOLYMER,
    CHEM_FAIL_5PRIME_BASE,
    CHEM_FAIL_3PRIME_BASE,
    CHEM_FAIL_LIGATION_SITE,
    CHEM_MAX,
};

static const std::string ChemistryFailNames[ChemistryFailReason::CHEM_MAX] {
    "PASS",
    "FAIL_LENGTH",
    "FAIL_AMBIGUOUS_BASE",
    "FAIL_GC_LOW",
    "FAIL_GC_HIGH",
    "FAIL_HOMOPOLYMER",
    "FAIL_5PRIME_BASE",
    "FAIL_3PRIME_BASE",
    "FAIL_LIGATION_SITE",
};

// Chemistry constraints on a candidate window. Empty base sets and a zero homopolymer limit disable that check.
// arm_length places the ligation junction the same way the probe is split; 0 means the midpoint.
struct ChemistryRules {
    int kmer_length = 30;
    double gc_min = 50.0;
    double gc_max = 65.0;
    int max_homopolymer = 4;
    std::string forbid_5prime;
    std::string forbid_3prime;
    std::string forbid_ligation;
    int arm_length = 0;
};

class ChemistryFilter {
    bool enable_homopolymer = false;
    bool enable_5prime = false;
    bool enable_3prime = false;
    bool enable_ligation = false;

    std::size_t kmer_length;
    std::size_t ligation_pos;
    double gc_min, gc_max;
    std::string forbid_5prime, forbid_3prime, forbid_ligation;
    std::array<std::string, 4> homopolymers;
public:
    // Throws PipelineError(ERR_INVALID_INPUT) for rules that cannot be satisfied (k-mer length < 2, gc bounds out of order,
    // an arm length that does not split the k-mer)
    explicit ChemistryFilter(const ChemistryRules& rules);

    // First failed check for a window, or CHEM_PASS. Checks run in enum order.
    ChemistryFailReason operator()(std::string_view window) const;

    const std::size_t& get_kmer_length() const {return kmer_length;}
    const std::size_t& get_ligation_pos() const {return ligation_pos;}
};

#endif //PLPDESIGN_DESIGN_CHEMISTRYFILTER_H
