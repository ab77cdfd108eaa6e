// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_ERRORS_H
#define PLPDESIGN_ERRORS_H

#include <string>
#include <stdexcept>

namespace plpdesign {
    enum ErrorKind {
        ERR_INPUT_NOT_FOUND = 0,
        ERR_INVALID_INPUT,
        ERR_GENE_HEADER_FORMAT_MISMATCH,
        ERR_NO_CONSERVED_REGION,
        ERR_INSUFFICIENT_CANDIDATES,
        ERR_EXTERNAL_TOOL_FAILURE,
        ERR_BARCODE_RANGE_EXHAUSTED,
        ERR_MISSING_CUSTOM_BARCODE_ENTRY,
        ERR_MAX,
    };

    static const std::string ErrorKindNames[ErrorKind::ERR_MAX] {
        "InputNotFound",
        "InvalidInput",
        "GeneHeaderFormatMismatch",
        "NoConservedRegion",
        "InsufficientCandidates",
        "ExternalToolFailure",
        "BarcodeRangeExhausted",
        "MissingCustomBarcodeEntry",
    };

    // Fatal pipeline condition. Per-gene data problems are not thrown; they are recorded
    // as a GeneStatus or GeneClass and surfaced in the output tables instead.
    class PipelineError : public std::runtime_error {
        ErrorKind error_kind;
    public:
        PipelineError(const ErrorKind kind, std::string const& what) :
            std::runtime_error(ErrorKindNames[kind] + ": " + what),
            error_kind(kind)
        {}

        ErrorKind get_kind() const {return error_kind;}
    };
}

#endif //PLPDESIGN_ERRORS_H
