// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_DESIGN_SEARCHBACKEND_H
#define PLPDESIGN_DESIGN_SEARCHBACKEND_H

#include <string>
#include <vector>
#include <unordered_set>
#include <plpdesign.hpp>
#include "ExternalTool.hpp"

// Approximate substring search against the transcriptome: substitutions only, full query length
class SearchBackend {
public:
    virtual ~SearchBackend() = default;

    // Ids of the transcriptome entries containing a window within max_mismatch substitutions of query.
    // Each entry appears once, in no particular order. Must be safe to call from several threads at once.
    //  Throws:
    //    PipelineError(ERR_EXTERNAL_TOOL_FAILURE) if the search can't be run or its output can't be parsed
    virtual std::vector<std::string> search(std::string const& query, const int& max_mismatch) = 0;
};

// In-process scan of every window of every entry. An ambiguity code in the reference matches every base it
// stands for, so an N matches anything; seqkit locate counts reference ambiguity codes as mismatches.
class HammingScanBackend : public SearchBackend {
    const plpdesign::Transcriptome& transcriptome;
    std::vector<std::vector<unsigned char>> masks;

    // Substitutions between query and the window of ref at pos. Returns as soon as the count exceeds max_mismatch,
    // so the result is then only a lower bound.
    static int match_one(std::vector<unsigned char> const& query, std::vector<unsigned char> const& ref, const std::size_t& pos, const int& max_mismatch);
public:
    explicit HammingScanBackend(const plpdesign::Transcriptome& transcriptome);
    std::vector<std::string> search(std::string const& query, const int& max_mismatch) override;
};

// Runs seqkit locate on the transcriptome FASTA and parses its tab-separated match stream
class SeqkitBackend : public SearchBackend {
    ExternalTool tool;
    std::string transcriptome_path;
    std::unordered_set<std::string> known_ids;
public:
    // Constructor for the SeqkitBackend
    //  Args:
    //    exe: seqkit executable.
    //    workdir: Scratch directory for the match streams.
    //    timeout: Per-query wall-clock limit.
    //    transcriptome: Reference; its file is handed to the tool, and its ids validate the tool's output.
    SeqkitBackend(std::string const& exe, fs::path const& workdir, const std::chrono::seconds& timeout, const plpdesign::Transcriptome& transcriptome);
    std::vector<std::string> search(std::string const& query, const int& max_mismatch) override;

    // Arguments of one seqkit locate call. Matching ignores case, as the in-process scan sees upper-cased entries.
    static std::vector<std::string> locate_args(std::string const& query, const int& max_mismatch, std::string const& fasta);

    // Entry ids from a seqkit locate TSV stream (header row first, entry id in the first column)
    //  Throws:
    //    PipelineError(ERR_EXTERNAL_TOOL_FAILURE) for a malformed stream or an id not in known_ids
    static std::vector<std::string> parse_locate(std::istream& strm, std::unordered_set<std::string> const& known_ids);
};

#endif //PLPDESIGN_DESIGN_SEARCHBACKEND_H
