// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_DESIGN_CLASSIFIER_H
#define PLPDESIGN_DESIGN_CLASSIFIER_H

#include <string>
#include <vector>
#include <map>
#include <plpdesign.hpp>

// Buckets of one round, or of a merge of rounds. Built once by Classifier::classify and never modified.
struct Classification {
    std::string tag;
    std::vector<std::string> genes;                   // roster, in input order
    std::map<std::string, plpdesign::GeneClass> classes;
    std::map<std::string, std::size_t> specific_counts;
    std::vector<plpdesign::MatchResult> specific;     // in sort_results order

    // Genes of one bucket, in roster order
    std::vector<std::string> genes_in(const plpdesign::GeneClass& cls) const;
    bool operator==(Classification const& rhs) const = default;
};

class Classifier {
    std::size_t final_designed;
public:
    // Args:
    //   final_designed: Specific k-mers a gene needs to be Good.
    explicit Classifier(const std::size_t& final_designed);

    // hit_count == 1 and the one hit is attributed to the k-mer's own gene
    static bool is_specific(plpdesign::MatchResult const& result);

    // Bucket every gene of the roster
    //  Args:
    //    results: MatchResults of a round or merge.
    //    genes: Full gene roster.
    //    not_found: Genes the extractor produced no candidates for. They are NotFound whatever results holds.
    Classification classify(plpdesign::RoundResults const& results, std::vector<std::string> const& genes,
                            std::map<std::string, plpdesign::GeneStatus> const& not_found) const;

    // Union of two result sets, deduplicated by (gene, sequence). Where both carry a k-mer, the one with more matched-entry
    // evidence is kept; ties are broken by a fixed total order, so merge is commutative and associative.
    static plpdesign::RoundResults merge(plpdesign::RoundResults const& a, plpdesign::RoundResults const& b);

    const std::size_t& get_final_designed() const {return final_designed;}
};

// Columns: Gene, Class, Specific
plpdesign::Table classification_table(Classification const& classification);

#endif //PLPDESIGN_DESIGN_CLASSIFIER_H
