// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <unordered_set>
#include <boost/log/trivial.hpp>
#include <plpdesign.hpp>
#include "ChemistryFilter.hpp"
#include "IsoformAligner.hpp"
#include "CandidateExtractor.hpp"

CandidateExtractor::CandidateExtractor(const plpdesign::Transcriptome& transcriptome, IsoformAligner& aligner, const ChemistryRules& rules) :
    transcriptome(transcriptome),
    aligner(aligner),
    filter(rules)
{}

std::vector<std::pair<std::size_t, std::size_t>> CandidateExtractor::conserved_runs(Alignment const& alignment) {
    std::vector<std::pair<std::size_t, std::size_t>> runs;
    if (alignment.empty()) {
        return runs;
    }
    const std::size_t ncol = alignment.front().length();
    std::size_t run_start = std::string::npos;
    for (std::size_t col = 0; col <= ncol; ++col) {
        bool conserved = col < ncol && !plpdesign::is_gap(alignment.front()[col]);
        for (auto row = alignment.cbegin() + 1; conserved && row != alignment.cend(); ++row) {
            conserved = (*row)[col] == alignment.front()[col];
        }
        if (conserved && run_start == std::string::npos) {
            run_start = col;
        } else if (!conserved && run_start != std::string::npos) {
            runs.emplace_back(run_start, col);
            run_start = std::string::npos;
        }
    }
    return runs;
}

std::vector<plpdesign::CandidateKmer> CandidateExtractor::windows(std::string const& gene, Alignment const& alignment, ChemistryCounts& counts) const {
    std::vector<plpdesign::CandidateKmer> result;
    std::unordered_set<std::string> seen;
    const std::size_t& k = filter.get_kmer_length();
    for (const auto& [begin, end] : conserved_runs(alignment)) {
        if (end - begin < k) {
            continue;
        }
        std::string_view run = std::string_view(alignment.front()).substr(begin, end - begin);
        for (std::size_t offset = 0; offset + k <= run.length(); ++offset) {
            std::string_view window = run.substr(offset, k);
            ChemistryFailReason verdict = filter(window);
            ++counts.at(verdict);
            if (verdict != CHEM_PASS || !seen.emplace(window).second) {
                continue;
            }
            result.push_back({gene, begin + offset, std::string(window), plpdesign::gc_percent(window), 0});
        }
    }
    return result;
}

ExtractionResult CandidateExtractor::extract(std::vector<std::string> const& genes) {
    ExtractionResult result;
    for (const std::string& gene : genes) {
        plpdesign::GeneStatus status = transcriptome.lookup(gene);
        if (status != plpdesign::GENE_FOUND) {
            if (status == plpdesign::GENE_HEADER_FORMAT_MISMATCH) {
                BOOST_LOG_TRIVIAL(warning) << "Gene " << gene << " is named in the transcriptome, but not as \"(" << gene << ")\"; skipping";
            } else {
                BOOST_LOG_TRIVIAL(warning) << "Gene " << gene << " not found in the transcriptome";
            }
            result.not_found_genes[gene] = status;
            continue;
        }
        std::vector<const plpdesign::TranscriptEntry*> isoforms = transcriptome.isoforms(gene);
        Alignment alignment = aligner.align(gene, isoforms);
        IsoformAligner::validate(gene, alignment);
        if (conserved_runs(alignment).empty()) {
            BOOST_LOG_TRIVIAL(warning) << "Gene " << gene << ": no region conserved across its " << isoforms.size() << " isoforms";
            result.not_found_genes[gene] = plpdesign::GENE_NO_CONSERVED_REGION;
            continue;
        }
        ChemistryCounts& counts = result.chemistry[gene];
        counts.fill(0);
        std::vector<plpdesign::CandidateKmer> candidates = windows(gene, alignment, counts);
        if (candidates.empty()) {
            BOOST_LOG_TRIVIAL(warning) << "Gene " << gene << ": no window passes the chemistry filters";
            result.not_found_genes[gene] = plpdesign::GENE_NO_VALID_WINDOW;
            continue;
        }
        BOOST_LOG_TRIVIAL(info) << "Gene " << gene << ": " << isoforms.size() << " isoforms, " << candidates.size() << " candidates";
        result.found_genes[gene] = std::move(candidates);
    }
    return result;
}
