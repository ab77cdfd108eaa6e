// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <boost/log/trivial.hpp>
#include <plpdesign.hpp>
#include "AssignWorker.hpp"

AssignWorker::AssignWorker(AssignConfig const& config) :
    config(config),
    genes(plpdesign::read_gene_list(config.genes_path)),
    specific(plpdesign::read_match_table(config.specific_path)),
    library(config.barcodes_path),
    assigner(library, config.mode, config.on, config.arm_length)
{
    BOOST_LOG_TRIVIAL(info) << "Read " << genes.size() << " genes and " << specific.size() << " specific targets";
    if (config.final_designed > 0) {
        specific = plpdesign::cap_per_gene(specific, config.final_designed);
        BOOST_LOG_TRIVIAL(info) << specific.size() << " targets kept at " << config.final_designed << " per gene";
    }
}

int AssignWorker::run() {
    BOOST_LOG_TRIVIAL(info) << plpdesign::put_time() << ": Assigning barcodes (" << plpdesign::AssignModeNames[config.mode] << " " << config.on << ")";
    probes = assigner.make_probes(genes, specific);
    plpdesign::probe_table(probes).write(config.output_path);
    BOOST_LOG_TRIVIAL(info) << plpdesign::put_time() << ": Wrote " << probes.size() << " probes to " << config.output_path;
    return 0;
}
