// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_TYPES_H
#define PLPDESIGN_TYPES_H

#include <string>
#include <vector>
#include <algorithm>

namespace plpdesign {
    // Outcome of looking a gene up in the reference and extracting candidates from it
    enum GeneStatus {
        GENE_FOUND = 0,
        GENE_NOT_IN_REFERENCE,
        GENE_HEADER_FORMAT_MISMATCH,
        GENE_NO_CONSERVED_REGION,
        GENE_NO_VALID_WINDOW,
        GENE_STATUS_MAX,
    };

    static const std::string GeneStatusNames[GeneStatus::GENE_STATUS_MAX] {
        "FOUND",
        "NOT_IN_REFERENCE",
        "HEADER_FORMAT_MISMATCH",
        "NO_CONSERVED_REGION",
        "NO_VALID_WINDOW",
    };

    enum GeneClass {
        CLASS_NOT_FOUND = 0,
        CLASS_NO_SPECIFIC,
        CLASS_TOO_FEW,
        CLASS_GOOD,
        CLASS_MAX,
    };

    static const std::string GeneClassNames[GeneClass::CLASS_MAX] {
        "NotFound",
        "NoSpecific",
        "TooFew",
        "Good",
    };

    // A fixed-length window of a gene's isoform alignment. start is an alignment column.
    // round is 0 for a freshly extracted candidate and the sampling round once it has been drawn.
    struct CandidateKmer {
        std::string gene;
        std::size_t start = 0;
        std::string seq;
        double gc = 0.0;
        int round = 0;

        std::size_t end() const {return start + seq.length();}

        bool overlaps(CandidateKmer const& other) const {
            return start < other.end() && other.start < end();
        }

        bool operator==(CandidateKmer const& rhs) const = default;
    };

    using SampledKmer = CandidateKmer;

    struct MatchResult {
        SampledKmer kmer;
        std::size_t hit_count = 0;
        std::vector<std::string> hits;       // matched transcriptome entry ids, sorted, unique
        std::vector<std::string> hit_genes;  // gene symbols the hits are attributed to, sorted, unique

        int round() const {return kmer.round;}

        bool operator==(MatchResult const& rhs) const = default;
    };

    // All MatchResults of one round, or of a merge of several rounds
    struct RoundResults {
        std::vector<int> rounds;
        std::vector<MatchResult> results;

        std::string tag() const {
            if (rounds.empty()) {
                return "empty";
            }
            std::string result = rounds.size() == 1 ? "round" : "merged";
            for (const int& r : rounds) {
                result += "_" + std::to_string(r);
            }
            return result;
        }
    };

    // Canonical ordering of results for output: gene, then position, then sequence
    static inline void sort_results(std::vector<MatchResult>& results) {
        std::ranges::sort(results, [](MatchResult const& a, MatchResult const& b) {
            if (a.kmer.gene != b.kmer.gene) {
                return a.kmer.gene < b.kmer.gene;
            }
            if (a.kmer.start != b.kmer.start) {
                return a.kmer.start < b.kmer.start;
            }
            if (a.kmer.seq != b.kmer.seq) {
                return a.kmer.seq < b.kmer.seq;
            }
            return a.kmer.round < b.kmer.round;
        });
    }
}

#endif //PLPDESIGN_TYPES_H
