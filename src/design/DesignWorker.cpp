// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <fstream>
#include <unordered_map>
#include <unordered_set>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <plpdesign.hpp>
#include "DesignWorker.hpp"

DesignWorker::DesignWorker(DesignConfig const& config, std::vector<std::string> const& cli, std::unique_ptr<IsoformAligner> aligner) :
    config(config),
    cli(cli),
    genes(plpdesign::read_gene_list(config.genes_path)),
    transcriptome(config.transcriptome_path),
    library(config.barcodes_path),
    assigner(library, config.barcode_mode, config.barcode_on, config.arm_length),
    aligner(std::move(aligner))
{
    // Windows are screened at the junction the probes will be ligated at
    this->config.chemistry.arm_length = static_cast<int>(config.arm_length);
    if (!this->aligner) {
        this->aligner = std::make_unique<ExternalAligner>(config.aligner, scratch_dir(), config.timeout);
    }
    backend = make_backend();
    record_config();
    BOOST_LOG_TRIVIAL(info) << "Designing probes for " << genes.size() << " genes";
}

std::unique_ptr<SearchBackend> DesignWorker::make_backend() {
    if (config.search == "internal") {
        return std::make_unique<HammingScanBackend>(transcriptome);
    }
    if (config.search == "seqkit") {
        return std::make_unique<SeqkitBackend>(config.search_exe, scratch_dir(), config.timeout, transcriptome);
    }
    throw plpdesign::PipelineError(plpdesign::ERR_INVALID_INPUT, "invalid search backend \"" + config.search + "\" (choose from internal, seqkit)");
}

void DesignWorker::record_config() {
    stats.config = {
        {"command_line", plpdesign::shlexjoin(cli)},
        {"genes", config.genes_path},
        {"transcriptome", config.transcriptome_path},
        {"barcodes", config.barcodes_path},
        {"outdir", config.outdir.string()},
        {"kmer_length", config.chemistry.kmer_length},
        {"gc_min", config.chemistry.gc_min},
        {"gc_max", config.chemistry.gc_max},
        {"max_homopolymer", config.chemistry.max_homopolymer},
        {"forbid_5prime", config.chemistry.forbid_5prime},
        {"forbid_3prime", config.chemistry.forbid_3prime},
        {"forbid_ligation", config.chemistry.forbid_ligation},
        {"arm_length", config.arm_length},
        {"mismatch", config.max_mismatch},
        {"sample_size", config.sample_size},
        {"rescue_sample_size", config.rescue_sample_size ? config.rescue_sample_size : 3 * config.sample_size},
        {"rounds", config.rounds},
        {"final_designed", config.final_designed},
        {"cap", config.cap},
        {"attribution", AttributionRuleNames[config.attribution]},
        {"seed", nullptr},
        {"search", config.search},
        {"barcode_mode", plpdesign::AssignModeNames[config.barcode_mode]},
        {"barcode_on", config.barcode_on},
    };
}

void DesignWorker::dump_extraction() const {
    plpdesign::Table not_found {{"Gene", "Reason"}};
    for (const std::string& gene : genes) {
        auto it = extraction.not_found_genes.find(gene);
        if (it != extraction.not_found_genes.cend()) {
            not_found.add_row({gene, plpdesign::GeneStatusNames[it->second]});
        }
    }
    not_found.write(config.outdir / "not_found.tsv");

    std::vector<plpdesign::CandidateKmer> candidates;
    for (const std::string& gene : genes) {
        auto it = extraction.found_genes.find(gene);
        if (it != extraction.found_genes.cend()) {
            candidates.insert(candidates.end(), it->second.cbegin(), it->second.cend());
        }
    }
    plpdesign::candidate_table(candidates).write(config.outdir / "candidates.tsv");
}

void DesignWorker::dump_round(const int& round, plpdesign::RoundResults const& round_results,
                              Classification const& round_classes, Classification const& merged_classes) const {
    const fs::path round_dir = config.outdir / ("round_" + std::to_string(round));
    const fs::path merged_dir = config.outdir / ("merged_" + std::to_string(round));
    plpdesign::match_table(round_results.results).write(round_dir / "mapped.tsv");
    classification_table(round_classes).write(round_dir / "classification.tsv");
    classification_table(merged_classes).write(merged_dir / "classification.tsv");
    plpdesign::match_table(merged_classes.specific).write(merged_dir / "specific.tsv");
}

int DesignWorker::run() {
    BOOST_LOG_TRIVIAL(info) << plpdesign::put_time() << ": Begin";
    fs::create_directories(config.outdir);

    CandidateExtractor extractor(transcriptome, *aligner, config.chemistry);
    extraction = extractor.extract(genes);
    stats.record_extraction(extraction);
    dump_extraction();

    Sampler sampler(config.seed);
    stats.config["seed"] = sampler.get_seed();
    SpecificityMatcher matcher(transcriptome, *backend, config.max_mismatch, config.attribution, config.threads, config.retries);
    Classifier classifier(config.final_designed);
    const std::size_t rescue_size = config.rescue_sample_size ? config.rescue_sample_size : 3 * config.sample_size;

    plpdesign::RoundResults merged;
    final_classes = classifier.classify(merged, genes, extraction.not_found_genes);
    std::unordered_map<std::string, std::unordered_set<std::string>> queried;
    for (int round = 1; round <= config.rounds; ++round) {
        std::vector<std::string> targets;
        if (round == 1) {
            std::ranges::copy_if(genes, std::back_inserter(targets), [this](std::string const& gene) {return extraction.found_genes.contains(gene);});
        } else {
            for (const std::string& gene : genes) {
                const plpdesign::GeneClass& cls = final_classes.classes.at(gene);
                if (cls == plpdesign::CLASS_NO_SPECIFIC || cls == plpdesign::CLASS_TOO_FEW) {
                    targets.push_back(gene);
                }
            }
        }
        if (targets.empty()) {
            BOOST_LOG_TRIVIAL(info) << "Round " << round << ": no genes left to sample";
            break;
        }

        // Rescue rounds draw from what is left: unqueried sequences clear of the gene's specific k-mers
        std::unordered_map<std::string, std::vector<plpdesign::CandidateKmer>> blocked;
        for (const plpdesign::MatchResult& result : final_classes.specific) {
            blocked[result.kmer.gene].push_back(result.kmer);
        }
        std::vector<plpdesign::SampledKmer> kmers;
        for (const std::string& gene : targets) {
            std::vector<plpdesign::CandidateKmer> const& candidates = extraction.found_genes.at(gene);
            std::vector<plpdesign::SampledKmer> sampled = round == 1
                ? sampler.sample(candidates, config.sample_size, round)
                : sampler.sample(Sampler::exclude(candidates, blocked[gene], queried[gene]), rescue_size, round);
            for (const plpdesign::SampledKmer& kmer : sampled) {
                queried[gene].insert(kmer.seq);
            }
            kmers.insert(kmers.end(), sampled.cbegin(), sampled.cend());
        }
        if (kmers.empty()) {
            BOOST_LOG_TRIVIAL(info) << "Round " << round << ": no candidates left for " << targets.size() << " genes";
            break;
        }
        BOOST_LOG_TRIVIAL(info) << plpdesign::put_time() << ": Round " << round << ": sampled " << kmers.size() << " k-mers from " << targets.size() << " genes";

        plpdesign::RoundResults round_results = matcher.run(kmers, round);
        Classification round_classes = classifier.classify(round_results, genes, extraction.not_found_genes);
        merged = round == 1 ? round_results : Classifier::merge(merged, round_results);
        final_classes = classifier.classify(merged, genes, extraction.not_found_genes);
        dump_round(round, round_results, round_classes, final_classes);
        stats.record_round(round, targets.size(), kmers.size(), round_classes, final_classes, round_results.results.size());
    }

    final_specific = config.cap ? plpdesign::cap_per_gene(final_classes.specific, config.final_designed) : final_classes.specific;
    plpdesign::match_table(final_specific).write(config.outdir / "specific.tsv");
    stats.final_specific = final_specific.size();

    probes = assigner.make_probes(genes, final_specific);
    plpdesign::probe_table(probes).write(config.outdir / "probes.tsv");
    stats.probes = probes.size();

    dump_stats(config.outdir / "summary.json");

    std::error_code ec;
    fs::remove_all(scratch_dir(), ec);
    BOOST_LOG_TRIVIAL(info) << plpdesign::put_time() << ": Finished with " << probes.size() << " probes for "
                            << final_classes.genes_in(plpdesign::CLASS_GOOD).size() << " Good and "
                            << final_classes.genes_in(plpdesign::CLASS_TOO_FEW).size() << " TooFew genes";
    return 0;
}

void DesignWorker::dump_stats(fs::path const& fname) const {
    std::ofstream outfile(fname);
    if (!outfile) {
        throw plpdesign::PipelineError(plpdesign::ERR_INPUT_NOT_FOUND, fname.string() + ": unable to open for writing");
    }
    outfile << stats;
}
