// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <boost/test/unit_test.hpp>
#include <fstream>
#include <filesystem>
#include <vector>
#include <string>
#include <map>
#include <type_traits>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>
#include <plpdesign.hpp>
#include "AssignWorker.hpp"

namespace fs = std::filesystem;

fs::path make_temp_filename(const std::string& suffix) {
    static char path[PATH_MAX+1] {};
    int fd = mkstemps(const_cast<char*>((fs::temp_directory_path() / ("tmpXXXXXX" + suffix)).c_str()), suffix.length());
    if (fd == -1) {
        throw std::runtime_error("io error");
    }
    std::string link = "/proc/self/fd/" + std::to_string(fd);
    ssize_t len = readlink(link.c_str(), path, PATH_MAX);
    close(fd);
    if (len == -1) {
        throw std::runtime_error("io error");
    }
    path[len] = '\0';
    return path;
}

struct kind_is {
    plpdesign::ErrorKind kind;
    bool operator()(plpdesign::PipelineError const& e) const {return e.get_kind() == kind;}
};

static plpdesign::MatchResult specific_row(std::string const& gene, const std::size_t& start, std::string const& seq, const int& round,
                                           std::vector<std::string> hits) {
    plpdesign::MatchResult res;
    res.kmer = {gene, start, seq, plpdesign::gc_percent(seq), round};
    res.hit_count = 1;
    res.hits = std::move(hits);
    res.hit_genes = {gene};
    return res;
}

// Three genes with specific targets, barcodes 225-230, and a custom table for the genes
struct AssignFixture {
    fs::path dir;
    AssignConfig config;
    std::map<long long, std::string> backbones;

    AssignFixture() {
        dir = make_temp_filename("");
        fs::remove(dir);
        fs::create_directories(dir);

        write(dir / "genes.csv", "Gene\nGLI3\nMSI2\nNR2E1\n");
        write(dir / "custom.csv", "Gene,Lbar_ID\nGLI3,227\nMSI2,229\nNR2E1,228\n");

        std::string barcodes = "Lbar_ID,Backbone,Code\n";
        for (long long id = 225; id <= 230; ++id) {
            backbones[id] = "ATCGTCGGACTGTAGAAC" + std::string(id - 220, 'T');
            barcodes += std::to_string(id) + "," + backbones[id] + ",code" + std::to_string(id) + "\n";
        }
        write(dir / "barcodes.csv", barcodes);

        std::vector<plpdesign::MatchResult> specific {
            specific_row("GLI3", 10, "AAAAACCCCCGGGGGTTTTT", 1, {"NM_000168.6"}),
            specific_row("GLI3", 40, "ACGTTGCAACGTTGCAACGT", 1, {"NM_000168.6"}),
            specific_row("GLI3", 5, "TTGGCCAATTGGCCAATTGG", 2, {"NM_000168.6"}),
            specific_row("MSI2", 0, "CAGTCAGTCAGTCAGTCAGT", 1, {"NM_138962.4", "NM_170721.3"}),
            specific_row("MSI2", 30, "GATCGATCGATCGATCGATC", 1, {"NM_138962.4", "NM_170721.3"}),
            specific_row("NR2E1", 12, "CCATGGCCATGGCCATGGCC", 1, {"NM_003269.5"}),
            specific_row("NR2E1", 64, "TGCATGCATGCATGCATGCA", 2, {"NM_003269.5"}),
        };
        plpdesign::match_table(specific).write((dir / "specific.tsv").string());

        config.genes_path = (dir / "genes.csv").string();
        config.specific_path = (dir / "specific.tsv").string();
        config.barcodes_path = (dir / "barcodes.csv").string();
        config.output_path = (dir / "probes.tsv").string();
        config.final_designed = 2;
    }

    ~AssignFixture() {
        fs::remove_all(dir);
    }

    static void write(fs::path const& path, std::string const& contents) {
        std::ofstream out(path);
        out << contents;
    }

    std::map<std::string, long long> ids_by_gene(std::vector<plpdesign::Probe> const& probes) const {
        std::map<std::string, long long> result;
        for (const plpdesign::Probe& probe : probes) {
            auto [it, inserted] = result.emplace(probe.gene, probe.barcode_id);
            BOOST_CHECK_EQUAL(it->second, probe.barcode_id);
        }
        return result;
    }
};

// Unit tests start here
BOOST_AUTO_TEST_CASE(test_assign_worker_not_copyable) {
    BOOST_CHECK(!std::is_copy_constructible_v<AssignWorker>);
    BOOST_CHECK(!std::is_copy_assignable_v<AssignWorker>);
}

BOOST_FIXTURE_TEST_CASE(test_assign_custom, AssignFixture) {
    config.mode = plpdesign::ASSIGN_CUSTOM;
    config.on = (dir / "custom.csv").string();
    AssignWorker worker {config};
    BOOST_CHECK_EQUAL(worker.get_specific().size(), 6u);
    BOOST_CHECK_EQUAL(worker.run(), 0);

    std::vector<plpdesign::Probe> const& probes = worker.get_probes();
    BOOST_TEST_REQUIRE(probes.size() == 6u);
    std::map<std::string, long long> ids = ids_by_gene(probes);
    BOOST_CHECK_EQUAL(ids.at("GLI3"), 227);
    BOOST_CHECK_EQUAL(ids.at("MSI2"), 229);
    BOOST_CHECK_EQUAL(ids.at("NR2E1"), 228);
    for (const plpdesign::Probe& probe : probes) {
        BOOST_CHECK_EQUAL(probe.code, "code" + std::to_string(probe.barcode_id));
        BOOST_CHECK(probe.sequence.find(backbones.at(probe.barcode_id)) != std::string::npos);
    }

    // Capped to two per gene: GLI3 keeps its round 1 targets
    BOOST_CHECK_EQUAL(probes[0].target, "AAAAACCCCCGGGGGTTTTT");
    BOOST_CHECK_EQUAL(probes[1].target, "ACGTTGCAACGTTGCAACGT");
    BOOST_CHECK_EQUAL(probes[2].annotation, "NM_138962.4;NM_170721.3");

    plpdesign::Table table = plpdesign::Table::read(config.output_path);
    std::vector<std::string> expected_header {"Sequence", "Lbar_ID", "Annotation", "Gene", "Code", "Target"};
    BOOST_CHECK(table.get_header() == expected_header);
    BOOST_TEST_REQUIRE(table.size() == 6u);
    BOOST_CHECK_EQUAL(table.cell(0, table.column("Lbar_ID")), "227");
    BOOST_CHECK_EQUAL(table.cell(5, table.column("Gene")), "NR2E1");
}

BOOST_FIXTURE_TEST_CASE(test_assign_start_and_end, AssignFixture) {
    config.on = "226";
    AssignWorker start {config};
    BOOST_CHECK_EQUAL(start.run(), 0);
    std::map<std::string, long long> ids = ids_by_gene(start.get_probes());
    BOOST_CHECK_EQUAL(ids.at("GLI3"), 226);
    BOOST_CHECK_EQUAL(ids.at("MSI2"), 227);
    BOOST_CHECK_EQUAL(ids.at("NR2E1"), 228);

    config.mode = plpdesign::ASSIGN_END;
    config.on = "230";
    AssignWorker end {config};
    BOOST_CHECK_EQUAL(end.run(), 0);
    ids = ids_by_gene(end.get_probes());
    BOOST_CHECK_EQUAL(ids.at("GLI3"), 230);
    BOOST_CHECK_EQUAL(ids.at("MSI2"), 229);
    BOOST_CHECK_EQUAL(ids.at("NR2E1"), 228);
}

BOOST_FIXTURE_TEST_CASE(test_assign_gene_without_targets_keeps_its_slot, AssignFixture) {
    std::vector<plpdesign::MatchResult> specific = plpdesign::read_match_table(config.specific_path);
    std::erase_if(specific, [](plpdesign::MatchResult const& res) {return res.kmer.gene == "MSI2";});
    plpdesign::match_table(specific).write(config.specific_path);

    config.on = "226";
    AssignWorker worker {config};
    BOOST_CHECK_EQUAL(worker.run(), 0);
    std::map<std::string, long long> ids = ids_by_gene(worker.get_probes());
    BOOST_CHECK_EQUAL(ids.size(), 2u);
    BOOST_CHECK_EQUAL(ids.at("GLI3"), 226);
    BOOST_CHECK_EQUAL(ids.at("NR2E1"), 228);
}

BOOST_FIXTURE_TEST_CASE(test_assign_keeps_all_without_cap, AssignFixture) {
    config.final_designed = 0;
    config.on = "225";
    AssignWorker worker {config};
    BOOST_CHECK_EQUAL(worker.run(), 0);
    BOOST_CHECK_EQUAL(worker.get_probes().size(), 7u);
}

BOOST_FIXTURE_TEST_CASE(test_assign_range_exhausted, AssignFixture) {
    config.on = "229";
    AssignWorker start {config};
    BOOST_CHECK_EXCEPTION(start.run(), plpdesign::PipelineError, kind_is {plpdesign::ERR_BARCODE_RANGE_EXHAUSTED});
    BOOST_CHECK(!fs::exists(config.output_path));

    config.mode = plpdesign::ASSIGN_END;
    config.on = "226";
    AssignWorker end {config};
    BOOST_CHECK_EXCEPTION(end.run(), plpdesign::PipelineError, kind_is {plpdesign::ERR_BARCODE_RANGE_EXHAUSTED});
}

BOOST_FIXTURE_TEST_CASE(test_assign_missing_custom_entry, AssignFixture) {
    config.mode = plpdesign::ASSIGN_CUSTOM;
    config.on = (dir / "custom.csv").string();

    write(config.on, "Gene,Lbar_ID\nGLI3,227\nMSI2,229\n");
    AssignWorker missing_gene {config};
    BOOST_CHECK_EXCEPTION(missing_gene.run(), plpdesign::PipelineError, kind_is {plpdesign::ERR_MISSING_CUSTOM_BARCODE_ENTRY});

    write(config.on, "Gene,Lbar_ID\nGLI3,227\nMSI2,229\nNR2E1,999\n");
    AssignWorker missing_barcode {config};
    BOOST_CHECK_EXCEPTION(missing_barcode.run(), plpdesign::PipelineError, kind_is {plpdesign::ERR_MISSING_CUSTOM_BARCODE_ENTRY});

    write(config.on, "Gene,Lbar_ID\nGLI3,227\nGLI3,229\n");
    BOOST_CHECK_EXCEPTION(AssignWorker {config}, plpdesign::PipelineError, kind_is {plpdesign::ERR_INVALID_INPUT});
}

BOOST_FIXTURE_TEST_CASE(test_assign_unknown_gene, AssignFixture) {
    write(config.genes_path, "Gene\nGLI3\nMSI2\n");
    AssignWorker worker {config};
    BOOST_CHECK_EXCEPTION(worker.run(), plpdesign::PipelineError, kind_is {plpdesign::ERR_INVALID_INPUT});
}

BOOST_FIXTURE_TEST_CASE(test_assign_bad_inputs, AssignFixture) {
    write(config.barcodes_path, "Lbar_ID,Backbone,Code\n1,ACGT,a\n1,TTTT,b\n");
    BOOST_CHECK_EXCEPTION(AssignWorker {config}, plpdesign::PipelineError, kind_is {plpdesign::ERR_INVALID_INPUT});

    write(config.barcodes_path, "Lbar_ID,Code\n1,a\n");
    BOOST_CHECK_EXCEPTION(AssignWorker {config}, plpdesign::PipelineError, kind_is {plpdesign::ERR_INVALID_INPUT});

    fs::remove(config.barcodes_path);
    BOOST_CHECK_EXCEPTION(AssignWorker {config}, plpdesign::PipelineError, kind_is {plpdesign::ERR_INPUT_NOT_FOUND});

    BOOST_CHECK_EXCEPTION(plpdesign::parse_assign_mode("middle"), plpdesign::PipelineError, kind_is {plpdesign::ERR_INVALID_INPUT});
    BOOST_CHECK_EQUAL(plpdesign::parse_assign_mode("end"), plpdesign::ASSIGN_END);
}

BOOST_AUTO_TEST_CASE(test_probe_geometry) {
    plpdesign::BarcodeEntry barcode {7, "GGGTTT", "c7"};
    plpdesign::MatchResult res = specific_row("GLI3", 0, "AAAAACCCCCGGGGGTTTTT", 1, {"NM_1", "NM_2"});

    plpdesign::Probe probe = plpdesign::BarcodeAssigner::assemble(res, barcode);
    BOOST_CHECK_EQUAL(probe.sequence, "GGGGGTTTTT" "GGGTTT" "AAAAACCCCC");
    BOOST_CHECK_EQUAL(probe.annotation, "NM_1;NM_2");
    BOOST_CHECK_EQUAL(probe.barcode_id, 7);
    BOOST_CHECK_EQUAL(probe.target, res.kmer.seq);

    probe = plpdesign::BarcodeAssigner::assemble(res, barcode, 5);
    BOOST_CHECK_EQUAL(probe.sequence, "TTTTT" "GGGTTT" "AAAAACCCCCGGGGG");

    // The arms read back to the target once reverse-complemented and swapped
    const std::string& seq = probe.sequence;
    std::string arm5 = seq.substr(0, 5), arm3 = seq.substr(seq.length() - 15);
    BOOST_CHECK_EQUAL(plpdesign::reverse_complement(arm5) + plpdesign::reverse_complement(arm3), res.kmer.seq);

    BOOST_CHECK_EXCEPTION(plpdesign::BarcodeAssigner::assemble(res, barcode, 20), plpdesign::PipelineError, kind_is {plpdesign::ERR_INVALID_INPUT});
}

BOOST_AUTO_TEST_CASE(test_barcode_library_records) {
    plpdesign::BarcodeLibrary library {std::vector<plpdesign::BarcodeEntry> {{1, "ACGT", "a"}, {2, "TTTT", "b"}}};
    BOOST_CHECK_EQUAL(library.size(), 2u);
    BOOST_TEST_REQUIRE(library.find(2) != nullptr);
    BOOST_CHECK_EQUAL(library.find(2)->code, "b");
    BOOST_CHECK(library.find(3) == nullptr);
    BOOST_CHECK_EXCEPTION((plpdesign::BarcodeLibrary {std::vector<plpdesign::BarcodeEntry> {{1, "ACGT", "a"}, {1, "TTTT", "b"}}}),
                          plpdesign::PipelineError, kind_is {plpdesign::ERR_INVALID_INPUT});
}
