// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_MATCHTABLE_H
#define PLPDESIGN_MATCHTABLE_H

#include <string>
#include <vector>
#include <plpdesign/Types.hpp>
#include <plpdesign/Table.hpp>

namespace plpdesign {
    // Columns: Gene, Round, Start, Sequence, GC, HitCount, Hits, HitGenes. List cells are ';'-joined.
    Table match_table(std::vector<MatchResult> const& results);
    Table candidate_table(std::vector<CandidateKmer> const& candidates);

    // Inverse of match_table, used by the standalone barcode assigner to pick up a specific table
    std::vector<MatchResult> read_match_table(const std::string& filename);

    // At most k rows per gene, earliest round then leftmost first. Output keeps sort_results order.
    std::vector<MatchResult> cap_per_gene(std::vector<MatchResult> const& specific, const std::size_t& k);
}

#endif //PLPDESIGN_MATCHTABLE_H
