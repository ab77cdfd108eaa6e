// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_DESIGN_SPECIFICITYMATCHER_H
#define PLPDESIGN_DESIGN_SPECIFICITYMATCHER_H

#include <string>
#include <vector>
#include <plpdesign.hpp>
#include "SearchBackend.hpp"

// How matched transcriptome entries are counted
enum AttributionRule {
    ATTRIBUTE_GENE = 0,    // entries of one gene count once, so a gene's own isoforms are not off-target
    ATTRIBUTE_TRANSCRIPT,  // every entry counts
    ATTRIBUTE_MAX,
};

static const std::string AttributionRuleNames[AttributionRule::ATTRIBUTE_MAX] {
    "gene",
    "transcript",
};

// Throws PipelineError(ERR_INVALID_INPUT) for anything but gene or transcript
AttributionRule parse_attribution_rule(std::string const& s);

class SpecificityMatcher {
    const plpdesign::Transcriptome& transcriptome;
    SearchBackend& backend;
    int max_mismatch;
    AttributionRule rule;
    unsigned threads;
    int retries;

    plpdesign::MatchResult query(plpdesign::SampledKmer const& kmer) const;
public:
    // Constructor for the SpecificityMatcher
    //  Args:
    //    transcriptome: Reference; resolves hit ids to gene symbols.
    //    backend: Search collaborator, shared by all workers.
    //    max_mismatch: Substitutions allowed over the full k-mer length.
    //    rule: Attribution rule for hit_count and hit_genes.
    //    threads: Worker count. 0 means one per hardware thread.
    //    retries: Extra attempts for a query whose search fails before the failure is fatal.
    SpecificityMatcher(const plpdesign::Transcriptome& transcriptome, SearchBackend& backend, const int& max_mismatch,
                       const AttributionRule& rule = ATTRIBUTE_GENE, const unsigned& threads = 1, const int& retries = 0);

    // Fill in hit_count and hit_genes from the raw hit ids
    plpdesign::MatchResult annotate(plpdesign::SampledKmer const& kmer, std::vector<std::string> hits) const;

    // Query every k-mer of a round. The outcome does not depend on worker count or completion order:
    // results are keyed by (gene, sequence) and returned in sort_results order.
    //  Throws:
    //    PipelineError(ERR_EXTERNAL_TOOL_FAILURE) once a query has failed retries + 1 times
    plpdesign::RoundResults run(std::vector<plpdesign::SampledKmer> const& kmers, const int& round) const;

    const int& get_max_mismatch() const {return max_mismatch;}
    const AttributionRule& get_rule() const {return rule;}
};

#endif //PLPDESIGN_DESIGN_SPECIFICITYMATCHER_H
