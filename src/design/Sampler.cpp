// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <random>
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <plpdesign.hpp>
#include "Sampler.hpp"

Sampler::Sampler(std::optional<std::uint64_t> const& seed) {
    if (seed) {
        this->seed = *seed;
    } else {
        std::random_device rd;
        this->seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
        BOOST_LOG_TRIVIAL(info) << "No seed given, sampling with random seed " << this->seed;
    }
}

std::uint64_t Sampler::derive_seed(const std::uint64_t& seed, std::string const& gene, const int& round) {
    std::uint64_t h = seed;
    for (int i = 0; i < 8; ++i) {
        h ^= 0xffull & (seed >> (8 * i));
        h *= 0x100000001b3ull;
    }
    return plpdesign::fnv1a(gene + "\t" + std::to_string(round), h);
}

std::vector<plpdesign::SampledKmer> Sampler::sample(std::vector<plpdesign::CandidateKmer> const& candidates, const std::size_t& n, const int& round) const {
    std::vector<plpdesign::SampledKmer> result;
    if (candidates.empty() || n == 0) {
        return result;
    }
    std::string const& gene = candidates.front().gene;
    std::mt19937_64 rng(derive_seed(seed, gene, round));

    // Partial Fisher-Yates over the indices: each step draws uniformly among the candidates not yet drawn
    std::vector<std::size_t> pool(candidates.size());
    for (std::size_t i = 0; i < pool.size(); ++i) {
        pool[i] = i;
    }
    for (std::size_t drawn = 0; drawn < pool.size() && result.size() < n; ++drawn) {
        std::uniform_int_distribution<std::size_t> dist(drawn, pool.size() - 1);
        std::swap(pool[drawn], pool[dist(rng)]);
        plpdesign::CandidateKmer const& pick = candidates[pool[drawn]];
        if (std::ranges::any_of(result, [&pick](plpdesign::SampledKmer const& s) {return s.overlaps(pick);})) {
            continue;
        }
        plpdesign::SampledKmer& kmer = result.emplace_back(pick);
        kmer.round = round;
    }
    std::ranges::sort(result, [](plpdesign::SampledKmer const& a, plpdesign::SampledKmer const& b) {return a.start < b.start;});
    if (result.size() < n) {
        BOOST_LOG_TRIVIAL(warning) << plpdesign::ErrorKindNames[plpdesign::ERR_INSUFFICIENT_CANDIDATES] << ": gene " << gene
                                   << " round " << round << ": sampled " << result.size() << " of " << n << " requested k-mers";
    }
    return result;
}

std::vector<plpdesign::CandidateKmer> Sampler::exclude(std::vector<plpdesign::CandidateKmer> const& candidates,
                                                       std::vector<plpdesign::CandidateKmer> const& blocked,
                                                       std::unordered_set<std::string> const& queried) {
    std::vector<plpdesign::CandidateKmer> result;
    std::ranges::copy_if(candidates, std::back_inserter(result), [&](plpdesign::CandidateKmer const& c) {
        return !queried.contains(c.seq) && std::ranges::none_of(blocked, [&c](plpdesign::CandidateKmer const& b) {return b.overlaps(c);});
    });
    return result;
}
