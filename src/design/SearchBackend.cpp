// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <fstream>
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <plpdesign.hpp>
#include "SearchBackend.hpp"

int HammingScanBackend::match_one(std::vector<unsigned char> const& query, std::vector<unsigned char> const& ref, const std::size_t& pos, const int& max_mismatch) {
    int nmismatch = 0;
    for (std::size_t i = 0; i < query.size(); ++i) {
        if (!(query[i] & ref[pos + i]) && ++nmismatch > max_mismatch) {
            break;
        }
    }
    return nmismatch;
}

HammingScanBackend::HammingScanBackend(const plpdesign::Transcriptome& transcriptome) : transcriptome(transcriptome) {
    masks.reserve(transcriptome.size());
    for (const plpdesign::TranscriptEntry& entry : transcriptome.get_entries()) {
        plpdesign::seq_to_mask(entry.seq, masks.emplace_back());
    }
}

std::vector<std::string> HammingScanBackend::search(std::string const& query, const int& max_mismatch) {
    std::vector<std::string> hits;
    const std::vector<unsigned char> qmask = plpdesign::seq_to_mask(query);
    std::vector<plpdesign::TranscriptEntry> const& entries = transcriptome.get_entries();
    for (std::size_t i = 0; i < entries.size(); ++i) {
        std::vector<unsigned char> const& ref = masks[i];
        if (ref.size() < qmask.size()) {
            continue;
        }
        for (std::size_t pos = 0; pos + qmask.size() <= ref.size(); ++pos) {
            if (match_one(qmask, ref, pos, max_mismatch) <= max_mismatch) {
                hits.push_back(entries[i].id);
                break;
            }
        }
    }
    return hits;
}

SeqkitBackend::SeqkitBackend(std::string const& exe, fs::path const& workdir, const std::chrono::seconds& timeout, const plpdesign::Transcriptome& transcriptome) :
    tool(exe, workdir, timeout),
    transcriptome_path(transcriptome.get_path())
{
    if (transcriptome_path.empty()) {
        throw plpdesign::PipelineError(plpdesign::ERR_INVALID_INPUT, exe + ": the transcriptome must be read from a file to search it externally");
    }
    for (const plpdesign::TranscriptEntry& entry : transcriptome.get_entries()) {
        known_ids.insert(entry.id);
    }
}

std::vector<std::string> SeqkitBackend::parse_locate(std::istream& strm, std::unordered_set<std::string> const& known_ids) {
    std::vector<std::string> hits;
    std::unordered_set<std::string> seen;
    std::string line;
    bool header = true;
    std::size_t lineno = 0;
    while (std::getline(strm, line)) {
        ++lineno;
        if (plpdesign::strstrip(line).empty()) {
            continue;
        }
        std::vector<std::string> fields = plpdesign::strsplit(line, "\t");
        if (header) {
            if (fields.front() != "seqID") {
                throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, "unexpected match stream header: " + line);
            }
            header = false;
            continue;
        }
        if (fields.size() < 2) {
            throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, "unparseable match on line " + std::to_string(lineno) + ": " + line);
        }
        std::string const& id = fields.front();
        if (!known_ids.contains(id)) {
            throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, "match against unknown entry " + id + " on line " + std::to_string(lineno));
        }
        if (seen.insert(id).second) {
            hits.push_back(id);
        }
    }
    return hits;
}

std::vector<std::string> SeqkitBackend::locate_args(std::string const& query, const int& max_mismatch, std::string const& fasta) {
    return {"locate", "--only-positive-strand", "--ignore-case", "--max-mismatch", std::to_string(max_mismatch), "--pattern", query, fasta};
}

std::vector<std::string> SeqkitBackend::search(std::string const& query, const int& max_mismatch) {
    fs::path outfile = tool.scratch(".tsv");
    tool.run(locate_args(query, max_mismatch, transcriptome_path), outfile);
    std::vector<std::string> hits;
    {
        std::ifstream infile(outfile);
        if (!infile) {
            throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, outfile.string() + ": unable to read match stream");
        }
        hits = parse_locate(infile, known_ids);
    }
    std::error_code ec;
    fs::remove(outfile, ec);
    return hits;
}
