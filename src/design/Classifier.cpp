// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <map>
#include <tuple>
#include <algorithm>
#include <unordered_map>
#include <boost/log/trivial.hpp>
#include <plpdesign.hpp>
#include "Classifier.hpp"

std::vector<std::string> Classification::genes_in(const plpdesign::GeneClass& cls) const {
    std::vector<std::string> result;
    std::ranges::copy_if(genes, std::back_inserter(result), [&](std::string const& gene) {return classes.at(gene) == cls;});
    return result;
}

Classifier::Classifier(const std::size_t& final_designed) : final_designed(final_designed) {
    if (final_designed < 1) {
        throw plpdesign::PipelineError(plpdesign::ERR_INVALID_INPUT, "target specific count must be at least 1");
    }
}

bool Classifier::is_specific(plpdesign::MatchResult const& result) {
    return result.hit_count == 1 && result.hit_genes.size() == 1 && result.hit_genes.front() == result.kmer.gene;
}

Classification Classifier::classify(plpdesign::RoundResults const& results, std::vector<std::string> const& genes,
                                    std::map<std::string, plpdesign::GeneStatus> const& not_found) const {
    Classification out {results.tag(), genes, {}, {}, {}};
    for (const std::string& gene : genes) {
        out.specific_counts[gene] = 0;
    }
    for (const plpdesign::MatchResult& result : results.results) {
        if (!is_specific(result) || not_found.contains(result.kmer.gene)) {
            continue;
        }
        auto it = out.specific_counts.find(result.kmer.gene);
        if (it == out.specific_counts.end()) {
            throw plpdesign::PipelineError(plpdesign::ERR_INVALID_INPUT, "result for gene " + result.kmer.gene + ", which is not in the gene list");
        }
        ++it->second;
        out.specific.push_back(result);
    }
    plpdesign::sort_results(out.specific);
    for (const std::string& gene : genes) {
        const std::size_t& s = out.specific_counts.at(gene);
        plpdesign::GeneClass& cls = out.classes[gene];
        if (not_found.contains(gene)) {
            cls = plpdesign::CLASS_NOT_FOUND;
        } else if (s == 0) {
            cls = plpdesign::CLASS_NO_SPECIFIC;
        } else if (s < final_designed) {
            cls = plpdesign::CLASS_TOO_FEW;
        } else {
            cls = plpdesign::CLASS_GOOD;
        }
    }
    BOOST_LOG_TRIVIAL(info) << out.tag << ": " << out.specific.size() << " specific k-mers; "
                            << out.genes_in(plpdesign::CLASS_GOOD).size() << " Good, "
                            << out.genes_in(plpdesign::CLASS_TOO_FEW).size() << " TooFew, "
                            << out.genes_in(plpdesign::CLASS_NO_SPECIFIC).size() << " NoSpecific, "
                            << out.genes_in(plpdesign::CLASS_NOT_FOUND).size() << " NotFound";
    return out;
}

// Strict weak order on duplicates of one (gene, sequence): more evidence is greater
static bool less_evidence(plpdesign::MatchResult const& a, plpdesign::MatchResult const& b) {
    return std::forward_as_tuple(a.hits.size(), a.hit_count, a.hits, a.hit_genes, b.kmer.round, b.kmer.start)
         < std::forward_as_tuple(b.hits.size(), b.hit_count, b.hits, b.hit_genes, a.kmer.round, a.kmer.start);
}

plpdesign::RoundResults Classifier::merge(plpdesign::RoundResults const& a, plpdesign::RoundResults const& b) {
    plpdesign::RoundResults out;
    std::ranges::set_union(a.rounds, b.rounds, std::back_inserter(out.rounds));
    auto dup = std::ranges::unique(out.rounds);
    out.rounds.erase(dup.begin(), dup.end());

    std::unordered_map<std::pair<std::string, std::string>, plpdesign::MatchResult> best;
    for (const plpdesign::RoundResults* side : {&a, &b}) {
        for (const plpdesign::MatchResult& result : side->results) {
            auto [it, inserted] = best.try_emplace({result.kmer.gene, result.kmer.seq}, result);
            if (!inserted && less_evidence(it->second, result)) {
                it->second = result;
            }
        }
    }
    out.results.reserve(best.size());
    for (auto& [key, result] : best) {
        out.results.push_back(std::move(result));
    }
    plpdesign::sort_results(out.results);
    return out;
}

plpdesign::Table classification_table(Classification const& classification) {
    plpdesign::Table table {{"Gene", "Class", "Specific"}};
    for (const std::string& gene : classification.genes) {
        table.add_row({gene, plpdesign::GeneClassNames[classification.classes.at(gene)], std::to_string(classification.specific_counts.at(gene))});
    }
    return table;
}
