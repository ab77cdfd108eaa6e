// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_DESIGN_ISOFORMALIGNER_H
#define PLPDESIGN_DESIGN_ISOFORMALIGNER_H

#include <string>
#include <vector>
#include <plpdesign.hpp>
#include "ExternalTool.hpp"

// One row per isoform, all of equal length, bases and '-' gap markers
using Alignment = std::vector<std::string>;

// Multiple-sequence alignment of a gene's isoforms
class IsoformAligner {
public:
    virtual ~IsoformAligner() = default;

    // Align the isoforms of gene. Implementations must be callable for one gene at a time; the extractor does not share them across threads.
    //  Throws:
    //    PipelineError(ERR_EXTERNAL_TOOL_FAILURE) if the alignment can't be produced or read back
    virtual Alignment align(std::string const& gene, std::vector<const plpdesign::TranscriptEntry*> const& isoforms) = 0;

    // Throws PipelineError(ERR_EXTERNAL_TOOL_FAILURE) naming gene unless every row has the same length
    static void validate(std::string const& gene, Alignment const& alignment);
};

// Runs an MSA executable (MAFFT-compatible command line: <exe> --quiet --auto input.fa > output.fa)
class ExternalAligner : public IsoformAligner {
    ExternalTool tool;
public:
    ExternalAligner(std::string const& exe, fs::path const& workdir, const std::chrono::seconds& timeout);
    Alignment align(std::string const& gene, std::vector<const plpdesign::TranscriptEntry*> const& isoforms) override;
};

#endif //PLPDESIGN_DESIGN_ISOFORMALIGNER_H
