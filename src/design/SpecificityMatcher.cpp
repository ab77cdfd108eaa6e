// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <set>
#include <algorithm>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <exception>
#include <unordered_map>
#include <boost/log/trivial.hpp>
#include <plpdesign.hpp>
#include "SearchBackend.hpp"
#include "SpecificityMatcher.hpp"

using namespace std::chrono_literals;

AttributionRule parse_attribution_rule(std::string const& s) {
    for (int i = ATTRIBUTE_GENE; i != ATTRIBUTE_MAX; ++i) {
        if (s == AttributionRuleNames[i]) {
            return static_cast<AttributionRule>(i);
        }
    }
    throw plpdesign::PipelineError(plpdesign::ERR_INVALID_INPUT, "invalid attribution rule \"" + s + "\" (choose from gene, transcript)");
}

SpecificityMatcher::SpecificityMatcher(const plpdesign::Transcriptome& transcriptome, SearchBackend& backend, const int& max_mismatch,
                                       const AttributionRule& rule, const unsigned& threads, const int& retries) :
    transcriptome(transcriptome),
    backend(backend),
    max_mismatch(max_mismatch),
    rule(rule),
    threads(threads == 0 ? std::max(1u, std::thread::hardware_concurrency()) : threads),
    retries(retries)
{
    if (max_mismatch < 0) {
        throw plpdesign::PipelineError(plpdesign::ERR_INVALID_INPUT, "mismatch threshold must be non-negative");
    }
}

plpdesign::MatchResult SpecificityMatcher::annotate(plpdesign::SampledKmer const& kmer, std::vector<std::string> hits) const {
    std::ranges::sort(hits);
    auto dup = std::ranges::unique(hits);
    hits.erase(dup.begin(), dup.end());

    std::set<std::string> genes;
    std::size_t unattributed = 0;
    for (const std::string& id : hits) {
        std::string const& gene = transcriptome.at(id).gene;
        if (gene.empty()) {
            ++unattributed;
        } else {
            genes.insert(gene);
        }
    }
    plpdesign::MatchResult result {kmer, 0, std::move(hits), {genes.cbegin(), genes.cend()}};
    result.hit_count = rule == ATTRIBUTE_GENE ? genes.size() + unattributed : result.hits.size();
    return result;
}

plpdesign::MatchResult SpecificityMatcher::query(plpdesign::SampledKmer const& kmer) const {
    for (int attempt = 0;; ++attempt) {
        try {
            return annotate(kmer, backend.search(kmer.seq, max_mismatch));
        } catch (const plpdesign::PipelineError& e) {
            if (e.get_kind() != plpdesign::ERR_EXTERNAL_TOOL_FAILURE || attempt >= retries) {
                throw;
            }
            BOOST_LOG_TRIVIAL(warning) << "Search for " << kmer.gene << ":" << kmer.start << " failed (attempt " << attempt + 1 << " of "
                                       << retries + 1 << "), retrying: " << e.what();
        }
    }
}

plpdesign::RoundResults SpecificityMatcher::run(std::vector<plpdesign::SampledKmer> const& kmers, const int& round) const {
    std::unordered_map<std::pair<std::string, std::string>, plpdesign::MatchResult> aggregate;
    std::mutex mtx;
    std::condition_variable done_cv;
    std::exception_ptr failure;
    std::atomic<std::size_t> next {0};
    std::size_t finished = 0;

    auto worker = [&]() {
        for (std::size_t i; (i = next++) < kmers.size();) {
            {
                std::lock_guard guard {mtx};
                if (failure) {
                    return;
                }
            }
            try {
                plpdesign::MatchResult result = query(kmers[i]);
                BOOST_LOG_TRIVIAL(debug) << "Round " << round << " " << result.kmer.gene << ":" << result.kmer.start << " " << result.kmer.seq
                                         << " hits " << result.hit_count;
                std::lock_guard guard {mtx};
                aggregate.insert_or_assign({result.kmer.gene, result.kmer.seq}, std::move(result));
                ++finished;
            } catch (const std::exception&) {
                std::lock_guard guard {mtx};
                if (!failure) {
                    failure = std::current_exception();
                }
            }
            done_cv.notify_all();
        }
    };

    BOOST_LOG_TRIVIAL(info) << "Round " << round << ": querying " << kmers.size() << " k-mers with " << threads << " threads, up to "
                            << max_mismatch << " mismatches";
    std::vector<std::thread> pool;
    const unsigned nworkers = std::min<std::size_t>(threads, std::max<std::size_t>(kmers.size(), 1));
    for (unsigned t = 0; t < nworkers; ++t) {
        pool.emplace_back(worker);
    }
    {
        // Report progress every 30 seconds until the workers are done
        std::unique_lock lck {mtx};
        while (!done_cv.wait_for(lck, 30s, [&]() {return failure || finished == kmers.size();})) {
            BOOST_LOG_TRIVIAL(info) << "Round " << round << ": " << finished << " of " << kmers.size() << " queries done";
        }
    }
    for (std::thread& t : pool) {
        t.join();
    }
    if (failure) {
        BOOST_LOG_TRIVIAL(error) << "Round " << round << ": search failed";
        std::rethrow_exception(failure);
    }

    plpdesign::RoundResults results {{round}, {}};
    results.results.reserve(aggregate.size());
    for (auto& [key, result] : aggregate) {
        results.results.push_back(std::move(result));
    }
    plpdesign::sort_results(results.results);
    BOOST_LOG_TRIVIAL(info) << "Round " << round << ": " << results.results.size() << " k-mers queried";
    return results;
}
