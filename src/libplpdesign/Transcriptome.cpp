// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <cctype>
#include <filesystem>
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <kseq++/seqio.hpp>
#include <plpdesign/Util.hpp>
#include <plpdesign/Errors.hpp>
#include <plpdesign/Transcriptome.hpp>

namespace plpdesign {

Transcriptome::Transcriptome(const std::string& filename) : path(filename) {
    if (!std::filesystem::is_regular_file(filename)) {
        throw PipelineError(ERR_INPUT_NOT_FOUND, filename + ": transcriptome not found");
    }
    klibpp::SeqStreamIn fasta(filename.c_str());
    if (!fasta) {
        throw PipelineError(ERR_INPUT_NOT_FOUND, filename + ": unable to open transcriptome");
    }
    BOOST_LOG_TRIVIAL(info) << "Reading transcriptome " << filename;
    for (;;) {
        klibpp::KSeq record;
        fasta >> record;
        if (record.name.empty()) {
            break;
        }
        entries.push_back({record.name, record.comment, "", to_upper(record.seq)});
    }
    if (entries.empty()) {
        throw PipelineError(ERR_INVALID_INPUT, filename + ": no FASTA records");
    }
    build_index();
}

Transcriptome::Transcriptome(std::vector<TranscriptEntry> records, const std::string& path) : path(path), entries(std::move(records)) {
    for (TranscriptEntry& entry : entries) {
        entry.seq = to_upper(entry.seq);
    }
    build_index();
}

void Transcriptome::build_index() {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        TranscriptEntry& entry = entries[i];
        if (!id_index.emplace(entry.id, i).second) {
            throw PipelineError(ERR_INVALID_INPUT, (path.empty() ? "transcriptome" : path) + ": duplicate entry id " + entry.id);
        }
        if (entry.gene.empty()) {
            entry.gene = parse_gene_symbol(entry.id + " " + entry.description);
        }
        if (entry.gene.empty()) {
            unattributed.push_back(i);
        } else {
            gene_index[entry.gene].push_back(i);
        }
    }
    BOOST_LOG_TRIVIAL(info) << "Indexed " << entries.size() << " transcripts from " << gene_index.size() << " genes ("
                            << unattributed.size() << " headers without a (GENE) symbol)";
}

std::string Transcriptome::parse_gene_symbol(std::string const& header) {
    std::size_t close = header.rfind(')');
    while (close != std::string::npos && close > 0) {
        std::size_t open = header.rfind('(', close - 1);
        if (open == std::string::npos) {
            break;
        }
        std::string symbol = header.substr(open + 1, close - open - 1);
        if (!symbol.empty() && std::ranges::none_of(symbol, [](const char& c) {
            return std::isspace(static_cast<unsigned char>(c)) || c == '(' || c == ')';
        })) {
            return symbol;
        }
        close = open == 0 ? std::string::npos : header.rfind(')', open - 1);
    }
    return "";
}

GeneStatus Transcriptome::lookup(std::string const& gene) const {
    if (gene_index.contains(gene)) {
        return GENE_FOUND;
    }
    // Look for the symbol as a bare word in the headers we could not attribute
    auto is_word = [](const char& c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
    };
    for (const std::size_t& i : unattributed) {
        const std::string header = entries[i].id + " " + entries[i].description;
        for (std::size_t pos = header.find(gene); pos != std::string::npos; pos = header.find(gene, pos + 1)) {
            std::size_t end = pos + gene.length();
            if ((pos == 0 || !is_word(header[pos - 1])) && (end == header.length() || !is_word(header[end]))) {
                return GENE_HEADER_FORMAT_MISMATCH;
            }
        }
    }
    return GENE_NOT_IN_REFERENCE;
}

std::vector<const TranscriptEntry*> Transcriptome::isoforms(std::string const& gene) const {
    std::vector<const TranscriptEntry*> result;
    auto it = gene_index.find(gene);
    if (it != gene_index.cend()) {
        for (const std::size_t& i : it->second) {
            result.push_back(&entries[i]);
        }
    }
    return result;
}

const TranscriptEntry& Transcriptome::at(std::string const& id) const {
    return entries.at(id_index.at(id));
}
}
