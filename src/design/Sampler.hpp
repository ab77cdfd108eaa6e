// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_DESIGN_SAMPLER_H
#define PLPDESIGN_DESIGN_SAMPLER_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <unordered_set>
#include <plpdesign.hpp>

class Sampler {
    std::uint64_t seed;
public:
    // Constructor for the Sampler
    //  Args:
    //    seed: Base seed. Without one, a seed is drawn from std::random_device and runs are not reproducible.
    explicit Sampler(std::optional<std::uint64_t> const& seed = std::nullopt);

    // Seed of the generator for one gene in one round. Every (gene, round) gets its own generator, so the draw
    // for one gene does not depend on which other genes are sampled or in what order.
    static std::uint64_t derive_seed(const std::uint64_t& seed, std::string const& gene, const int& round);

    // Draw up to n pairwise non-overlapping candidates uniformly at random, without replacement.
    // Fewer than n is not an error (InsufficientCandidates is logged as a warning).
    //  Returns:
    //    Sampled k-mers tagged with round, ordered by start.
    std::vector<plpdesign::SampledKmer> sample(std::vector<plpdesign::CandidateKmer> const& candidates, const std::size_t& n, const int& round) const;

    // Candidates still eligible for a rescue round: not queried before and not overlapping a k-mer already known to be specific
    static std::vector<plpdesign::CandidateKmer> exclude(std::vector<plpdesign::CandidateKmer> const& candidates,
                                                         std::vector<plpdesign::CandidateKmer> const& blocked,
                                                         std::unordered_set<std::string> const& queried);

    const std::uint64_t& get_seed() const {return seed;}
};

#endif //PLPDESIGN_DESIGN_SAMPLER_H
