// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_BARCODEASSIGNER_H
#define PLPDESIGN_BARCODEASSIGNER_H

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <plpdesign/Types.hpp>
#include <plpdesign/Table.hpp>

namespace plpdesign {
    struct BarcodeEntry {
        long long id;
        std::string backbone;
        std::string code;
    };

    // Barcode id -> backbone/linker sequence and decoded readout code
    class BarcodeLibrary {
        std::map<long long, BarcodeEntry> entries;
    public:
        // Load from a table with columns Lbar_ID, Backbone, Code
        explicit BarcodeLibrary(const std::string& filename);
        explicit BarcodeLibrary(std::vector<BarcodeEntry> const& records);

        // nullptr if the id is not in the library
        const BarcodeEntry* find(const long long& id) const;
        std::size_t size() const {return entries.size();}
    };

    enum AssignMode {
        ASSIGN_START = 0,
        ASSIGN_END,
        ASSIGN_CUSTOM,
        ASSIGN_MAX,
    };

    static const std::string AssignModeNames[AssignMode::ASSIGN_MAX] {
        "start",
        "end",
        "custom",
    };

    // Throws PipelineError(ERR_INVALID_INPUT) for anything but start, end or custom
    AssignMode parse_assign_mode(std::string const& s);

    struct Probe {
        std::string sequence;
        long long barcode_id;
        std::string annotation;
        std::string gene;
        std::string code;
        std::string target;
    };

    class BarcodeAssigner {
        const BarcodeLibrary& library;
        AssignMode mode;
        long long on = 0;
        std::size_t arm_length;
        std::unordered_map<std::string, long long> custom;

        void read_custom(const std::string& filename);
    public:
        // Constructor for the BarcodeAssigner
        //  Args:
        //    library: Barcode library the assigned ids are resolved against.
        //    mode: start counts up from on, end counts down from on, custom reads on as a Gene/Lbar_ID table.
        //    on: Integer id to count from (start, end), or path to the assignment table (custom).
        //    arm_length: Length of the target's 5' half. 0 splits each target at its midpoint.
        BarcodeAssigner(const BarcodeLibrary& library, const AssignMode mode, std::string const& on, const std::size_t arm_length = 0);

        // Map genes to barcode ids. In start and end mode every gene receives an id by its position in genes;
        // in custom mode only genes listed in the table are mapped.
        std::vector<std::pair<std::string, long long>> assign(std::vector<std::string> const& genes) const;

        // Build one probe per specific k-mer. Genes are visited in the order of genes; rows of a gene keep their order.
        //  Throws:
        //    PipelineError(ERR_BARCODE_RANGE_EXHAUSTED) if a gene with probes gets an id below 1 or absent from the library
        //    PipelineError(ERR_MISSING_CUSTOM_BARCODE_ENTRY) if a gene with probes has no custom table row
        //    PipelineError(ERR_INVALID_INPUT) if specific names a gene that is not in genes
        std::vector<Probe> make_probes(std::vector<std::string> const& genes, std::vector<MatchResult> const& specific) const;

        // probe = revcomp(target 5' half) + backbone + revcomp(target 3' half), so both probe ends
        // hybridise next to each other at the ligation site
        static Probe assemble(MatchResult const& specific, BarcodeEntry const& barcode, const std::size_t arm_length = 0);
    };

    // Columns: Sequence, Lbar_ID, Annotation, Gene, Code, Target
    Table probe_table(std::vector<Probe> const& probes);
}

#endif //PLPDESIGN_BARCODEASSIGNER_H
