// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <tuple>
#include <algorithm>
#include <unordered_map>
#include <plpdesign/Util.hpp>
#include <plpdesign/Errors.hpp>
#include <plpdesign/MatchTable.hpp>

namespace plpdesign {

static std::string format_gc(const double& gc) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << gc;
    return ss.str();
}

static long long parse_count(std::string const& s, std::string const& column, std::string const& context) {
    long long value = parse_integer(s, context);
    if (value < 0) {
        throw PipelineError(ERR_INVALID_INPUT, context + ": negative " + column + " " + s);
    }
    return value;
}

static std::vector<std::string> split_list(std::string const& s) {
    if (s.empty()) {
        return {};
    }
    return strsplit(s, ";");
}

Table match_table(std::vector<MatchResult> const& results) {
    Table table {{"Gene", "Round", "Start", "Sequence", "GC", "HitCount", "Hits", "HitGenes"}};
    for (const MatchResult& res : results) {
        table.add_row({
            res.kmer.gene,
            std::to_string(res.kmer.round),
            std::to_string(res.kmer.start),
            res.kmer.seq,
            format_gc(res.kmer.gc),
            std::to_string(res.hit_count),
            strjoin(res.hits, ";"),
            strjoin(res.hit_genes, ";"),
        });
    }
    return table;
}

Table candidate_table(std::vector<CandidateKmer> const& candidates) {
    Table table {{"Gene", "Start", "Sequence", "GC"}};
    for (const CandidateKmer& kmer : candidates) {
        table.add_row({kmer.gene, std::to_string(kmer.start), kmer.seq, format_gc(kmer.gc)});
    }
    return table;
}

std::vector<MatchResult> read_match_table(const std::string& filename) {
    Table table = Table::read(filename);
    const std::size_t col_gene = table.column("Gene"),
                      col_round = table.column("Round"),
                      col_start = table.column("Start"),
                      col_seq = table.column("Sequence"),
                      col_gc = table.column("GC"),
                      col_count = table.column("HitCount"),
                      col_hits = table.column("Hits"),
                      col_genes = table.column("HitGenes");
    std::vector<MatchResult> results;
    results.reserve(table.size());
    for (std::size_t i = 0; i < table.size(); ++i) {
        const std::string context = filename + ":" + std::to_string(i + 2);
        MatchResult& res = results.emplace_back();
        res.kmer.gene = table.cell(i, col_gene);
        res.kmer.round = static_cast<int>(parse_count(table.cell(i, col_round), "Round", context));
        res.kmer.start = static_cast<std::size_t>(parse_count(table.cell(i, col_start), "Start", context));
        res.kmer.seq = to_upper(table.cell(i, col_seq));
        try {
            res.kmer.gc = std::stod(table.cell(i, col_gc));
        } catch (const std::exception&) {
            throw PipelineError(ERR_INVALID_INPUT, context + ": invalid GC value \"" + table.cell(i, col_gc) + "\"");
        }
        res.hit_count = static_cast<std::size_t>(parse_count(table.cell(i, col_count), "HitCount", context));
        res.hits = split_list(table.cell(i, col_hits));
        res.hit_genes = split_list(table.cell(i, col_genes));
        if (res.kmer.gene.empty() || res.kmer.seq.empty()) {
            throw PipelineError(ERR_INVALID_INPUT, context + ": gene and sequence are required");
        }
    }
    return results;
}

std::vector<MatchResult> cap_per_gene(std::vector<MatchResult> const& specific, const std::size_t& k) {
    std::vector<const MatchResult*> order;
    for (const MatchResult& result : specific) {
        order.push_back(&result);
    }
    std::ranges::stable_sort(order, [](const MatchResult* a, const MatchResult* b) {
        return std::tie(a->kmer.gene, a->kmer.round, a->kmer.start) < std::tie(b->kmer.gene, b->kmer.round, b->kmer.start);
    });
    std::vector<MatchResult> result;
    std::unordered_map<std::string, std::size_t> taken;
    for (const MatchResult* res : order) {
        if (taken[res->kmer.gene]++ < k) {
            result.push_back(*res);
        }
    }
    sort_results(result);
    return result;
}
}
