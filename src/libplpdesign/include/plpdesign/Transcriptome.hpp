// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_TRANSCRIPTOME_H
#define PLPDESIGN_TRANSCRIPTOME_H

#include <string>
#include <vector>
#include <unordered_map>
#include <plpdesign/Types.hpp>

namespace plpdesign {
    // A single reference transcript. gene is empty when the header carries no "(SYMBOL)" token.
    struct TranscriptEntry {
        std::string id;
        std::string description;
        std::string gene;
        std::string seq;
    };

    // Read-only reference transcriptome, indexed by entry id and by gene symbol.
    // Shared by all matcher workers; nothing mutates it after construction.
    class Transcriptome {
        std::string path;
        std::vector<TranscriptEntry> entries;
        std::unordered_map<std::string, std::size_t> id_index;
        std::unordered_map<std::string, std::vector<std::size_t>> gene_index;
        std::vector<std::size_t> unattributed;

        void build_index();
    public:
        // Load a (optionally gzipped) FASTA file
        //  Throws:
        //    PipelineError(ERR_INPUT_NOT_FOUND) if the file does not exist
        //    PipelineError(ERR_INVALID_INPUT) if it holds no records or repeats an id
        explicit Transcriptome(const std::string& filename);

        // Build from records already in memory. Entries whose gene is empty are attributed from their description.
        explicit Transcriptome(std::vector<TranscriptEntry> records, const std::string& path = "");

        Transcriptome(const Transcriptome& other) = delete;

        // Extract the gene symbol from a FASTA header: the last parenthesised token that contains no whitespace.
        //  e.g. "NM_000168.6 Homo sapiens GLI family zinc finger 3 (GLI3), mRNA" -> "GLI3"
        //  Returns an empty string if there is none.
        static std::string parse_gene_symbol(std::string const& header);

        // Distinguishes a gene with isoforms in the reference from a naming problem:
        //  GENE_FOUND, GENE_HEADER_FORMAT_MISMATCH (named in a header, but not as "(SYMBOL)"), or GENE_NOT_IN_REFERENCE
        GeneStatus lookup(std::string const& gene) const;

        // Isoforms of a gene, in file order. Empty if lookup(gene) != GENE_FOUND.
        std::vector<const TranscriptEntry*> isoforms(std::string const& gene) const;

        // Entry by id. Throws std::out_of_range for an unknown id.
        const TranscriptEntry& at(std::string const& id) const;
        bool contains(std::string const& id) const {return id_index.contains(id);}

        const std::vector<TranscriptEntry>& get_entries() const {return entries;}
        const std::string& get_path() const {return path;}
        std::size_t size() const {return entries.size();}
        std::size_t get_num_genes() const {return gene_index.size();}
        std::size_t get_num_unattributed() const {return unattributed.size();}
    };
}

#endif //PLPDESIGN_TRANSCRIPTOME_H
