// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <boost/log/trivial.hpp>
#include <plpdesign/Util.hpp>
#include <plpdesign/Errors.hpp>
#include <plpdesign/Bases.hpp>
#include <plpdesign/Table.hpp>
#include <plpdesign/BarcodeAssigner.hpp>

namespace plpdesign {

BarcodeLibrary::BarcodeLibrary(const std::string& filename) {
    Table table = Table::read(filename);
    const std::size_t col_id = table.column("Lbar_ID"),
                      col_backbone = table.column("Backbone"),
                      col_code = table.column("Code");
    for (std::size_t i = 0; i < table.size(); ++i) {
        const std::string context = filename + ":" + std::to_string(i + 2);
        BarcodeEntry entry {
            parse_integer(table.cell(i, col_id), context),
            to_upper(table.cell(i, col_backbone)),
            table.cell(i, col_code)
        };
        if (entry.backbone.empty()) {
            throw PipelineError(ERR_INVALID_INPUT, context + ": empty backbone for barcode " + std::to_string(entry.id));
        }
        if (!entries.emplace(entry.id, entry).second) {
            throw PipelineError(ERR_INVALID_INPUT, context + ": duplicate barcode id " + std::to_string(entry.id));
        }
    }
    if (entries.empty()) {
        throw PipelineError(ERR_INVALID_INPUT, filename + ": barcode library is empty");
    }
    BOOST_LOG_TRIVIAL(info) << "Read " << entries.size() << " barcodes from " << filename;
}

BarcodeLibrary::BarcodeLibrary(std::vector<BarcodeEntry> const& records) {
    for (const BarcodeEntry& entry : records) {
        if (!entries.emplace(entry.id, entry).second) {
            throw PipelineError(ERR_INVALID_INPUT, "duplicate barcode id " + std::to_string(entry.id));
        }
    }
}

const BarcodeEntry* BarcodeLibrary::find(const long long& id) const {
    auto it = entries.find(id);
    return it == entries.cend() ? nullptr : &it->second;
}

AssignMode parse_assign_mode(std::string const& s) {
    for (int i = ASSIGN_START; i != ASSIGN_MAX; ++i) {
        if (s == AssignModeNames[i]) {
            return static_cast<AssignMode>(i);
        }
    }
    throw PipelineError(ERR_INVALID_INPUT, "invalid barcode assignment mode \"" + s + "\" (choose from start, end, custom)");
}

BarcodeAssigner::BarcodeAssigner(const BarcodeLibrary& library, const AssignMode mode, std::string const& on, const std::size_t arm_length) :
    library(library),
    mode(mode),
    arm_length(arm_length)
{
    if (mode == ASSIGN_CUSTOM) {
        read_custom(on);
    } else {
        this->on = parse_integer(on, "barcode " + AssignModeNames[mode] + " id");
    }
}

void BarcodeAssigner::read_custom(const std::string& filename) {
    Table table = Table::read(filename);
    const std::size_t col_gene = table.column("Gene"), col_id = table.column("Lbar_ID");
    for (std::size_t i = 0; i < table.size(); ++i) {
        const std::string context = filename + ":" + std::to_string(i + 2);
        std::string const& gene = table.cell(i, col_gene);
        if (!custom.emplace(gene, parse_integer(table.cell(i, col_id), context)).second) {
            throw PipelineError(ERR_INVALID_INPUT, context + ": gene " + gene + " assigned twice");
        }
    }
}

std::vector<std::pair<std::string, long long>> BarcodeAssigner::assign(std::vector<std::string> const& genes) const {
    std::vector<std::pair<std::string, long long>> result;
    result.reserve(genes.size());
    long long step = mode == ASSIGN_END ? -1 : 1;
    long long next = on;
    for (const std::string& gene : genes) {
        if (mode == ASSIGN_CUSTOM) {
            auto it = custom.find(gene);
            if (it != custom.cend()) {
                result.emplace_back(gene, it->second);
            }
        } else {
            result.emplace_back(gene, next);
            next += step;
        }
    }
    return result;
}

Probe BarcodeAssigner::assemble(MatchResult const& specific, BarcodeEntry const& barcode, const std::size_t arm_length) {
    std::string const& target = specific.kmer.seq;
    const std::size_t split = arm_length == 0 ? target.length() / 2 : arm_length;
    if (split == 0 || split >= target.length()) {
        throw PipelineError(ERR_INVALID_INPUT, "arm length " + std::to_string(split) + " does not split target " + target + " of gene " + specific.kmer.gene);
    }
    std::string arm5 = reverse_complement(std::string_view(target).substr(0, split));
    std::string arm3 = reverse_complement(std::string_view(target).substr(split));
    return Probe {
        arm5 + barcode.backbone + arm3,
        barcode.id,
        strjoin(specific.hits, ";"),
        specific.kmer.gene,
        barcode.code,
        target
    };
}

std::vector<Probe> BarcodeAssigner::make_probes(std::vector<std::string> const& genes, std::vector<MatchResult> const& specific) const {
    std::unordered_map<std::string, std::vector<const MatchResult*>> by_gene;
    for (const MatchResult& res : specific) {
        by_gene[res.kmer.gene].push_back(&res);
    }
    std::unordered_set<std::string> known(genes.cbegin(), genes.cend());
    for (const auto& [gene, rows] : by_gene) {
        if (!known.contains(gene)) {
            throw PipelineError(ERR_INVALID_INPUT, "specific k-mers given for gene " + gene + ", which is not in the gene list");
        }
    }

    std::unordered_map<std::string, long long> ids;
    for (const auto& [gene, id] : assign(genes)) {
        ids[gene] = id;
    }

    std::vector<Probe> probes;
    probes.reserve(specific.size());
    for (const std::string& gene : genes) {
        auto rows_it = by_gene.find(gene);
        if (rows_it == by_gene.cend()) {
            continue;
        }
        auto id_it = ids.find(gene);
        if (id_it == ids.cend()) {
            throw PipelineError(ERR_MISSING_CUSTOM_BARCODE_ENTRY, "no Lbar_ID for gene " + gene + " in the custom assignment table");
        }
        const long long& id = id_it->second;
        const BarcodeEntry* barcode = id >= 1 ? library.find(id) : nullptr;
        if (barcode == nullptr) {
            if (mode == ASSIGN_CUSTOM) {
                throw PipelineError(ERR_MISSING_CUSTOM_BARCODE_ENTRY, "Lbar_ID " + std::to_string(id) + " of gene " + gene + " is not in the barcode library");
            }
            throw PipelineError(ERR_BARCODE_RANGE_EXHAUSTED, "no barcode left for gene " + gene + " (id " + std::to_string(id) + " is not in the library)");
        }
        BOOST_LOG_TRIVIAL(debug) << "Gene " << gene << " -> Lbar_ID " << id << " (" << rows_it->second.size() << " probes)";
        for (const MatchResult* res : rows_it->second) {
            probes.push_back(assemble(*res, *barcode, arm_length));
        }
    }
    return probes;
}

Table probe_table(std::vector<Probe> const& probes) {
    Table table {{"Sequence", "Lbar_ID", "Annotation", "Gene", "Code", "Target"}};
    for (const Probe& probe : probes) {
        table.add_row({probe.sequence, std::to_string(probe.barcode_id), probe.annotation, probe.gene, probe.code, probe.target});
    }
    return table;
}
}
