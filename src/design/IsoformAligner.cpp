// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <fstream>
#include <unordered_map>
#include <boost/log/trivial.hpp>
#include <kseq++/seqio.hpp>
#include <plpdesign.hpp>
#include "IsoformAligner.hpp"

void IsoformAligner::validate(std::string const& gene, Alignment const& alignment) {
    if (alignment.empty()) {
        throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, "empty alignment for gene " + gene);
    }
    for (const std::string& row : alignment) {
        if (row.length() != alignment.front().length()) {
            throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, "alignment rows of gene " + gene + " disagree in length");
        }
    }
}

ExternalAligner::ExternalAligner(std::string const& exe, fs::path const& workdir, const std::chrono::seconds& timeout) :
    tool(exe, workdir, timeout)
{}

Alignment ExternalAligner::align(std::string const& gene, std::vector<const plpdesign::TranscriptEntry*> const& isoforms) {
    if (isoforms.size() == 1) {
        // Nothing to align
        return {isoforms.front()->seq};
    }
    fs::path infile = tool.scratch(".fa"), outfile = tool.scratch(".aln.fa");
    {
        std::ofstream fasta(infile);
        for (const plpdesign::TranscriptEntry* entry : isoforms) {
            fasta << ">" << entry->id << "\n" << entry->seq << "\n";
        }
        if (!fasta) {
            throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, infile.string() + ": unable to write aligner input");
        }
    }
    BOOST_LOG_TRIVIAL(debug) << "Aligning " << isoforms.size() << " isoforms of " << gene;
    tool.run({"--quiet", "--auto", infile.string()}, outfile);

    // Rows are matched to isoforms by id
    std::unordered_map<std::string, std::string> rows;
    {
        klibpp::SeqStreamIn aligned(outfile.c_str());
        for (;;) {
            klibpp::KSeq record;
            aligned >> record;
            if (record.name.empty()) {
                break;
            }
            rows[record.name] = plpdesign::to_upper(record.seq);
        }
    }
    Alignment alignment;
    for (const plpdesign::TranscriptEntry* entry : isoforms) {
        auto it = rows.find(entry->id);
        if (it == rows.cend()) {
            throw plpdesign::PipelineError(plpdesign::ERR_EXTERNAL_TOOL_FAILURE, tool.get_exe() + ": isoform " + entry->id + " of gene " + gene + " missing from the alignment");
        }
        alignment.push_back(std::move(it->second));
    }
    validate(gene, alignment);
    std::error_code ec;
    fs::remove(infile, ec);
    fs::remove(outfile, ec);
    return alignment;
}
