// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_DESIGN_CANDIDATEEXTRACTOR_H
#define PLPDESIGN_DESIGN_CANDIDATEEXTRACTOR_H

#include <string>
#include <vector>
#include <map>
#include <array>
#include <plpdesign.hpp>
#include "ChemistryFilter.hpp"
#include "IsoformAligner.hpp"

using ChemistryCounts = std::array<unsigned long long, ChemistryFailReason::CHEM_MAX>;

struct ExtractionResult {
    std::map<std::string, std::vector<plpdesign::CandidateKmer>> found_genes;  // candidates in left-to-right order
    std::map<std::string, plpdesign::GeneStatus> not_found_genes;
    std::map<std::string, ChemistryCounts> chemistry;  // window verdicts per found gene
};

class CandidateExtractor {
    const plpdesign::Transcriptome& transcriptome;
    IsoformAligner& aligner;
    ChemistryFilter filter;
public:
    CandidateExtractor(const plpdesign::Transcriptome& transcriptome, IsoformAligner& aligner, const ChemistryRules& rules);

    // Maximal runs of alignment columns where every row carries the same base (no gaps), as [begin, end) column pairs
    static std::vector<std::pair<std::size_t, std::size_t>> conserved_runs(Alignment const& alignment);

    // Slide the window over each conserved run; keep passing windows, first occurrence of each sequence only
    //  Args:
    //    gene: Name stamped on each candidate.
    //    alignment: Output of the aligner for gene.
    //    counts: Tally of filter verdicts, one per window examined.
    std::vector<plpdesign::CandidateKmer> windows(std::string const& gene, Alignment const& alignment, ChemistryCounts& counts) const;

    // Run extraction for each gene. Genes missing from the reference, without a conserved region, or without a passing
    // window land in not_found_genes with the reason; they never abort the run.
    ExtractionResult extract(std::vector<std::string> const& genes);
};

#endif //PLPDESIGN_DESIGN_CANDIDATEEXTRACTOR_H
