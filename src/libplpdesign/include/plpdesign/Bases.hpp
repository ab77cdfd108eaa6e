// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_BASES_H
#define PLPDESIGN_BASES_H

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <bamtools/api/BamConstants.h>

namespace plpdesign {
    static inline unsigned char base_to_mask(char c) {
        switch (std::toupper(static_cast<unsigned char>(c))) {
        case (BamTools::Constants::BAM_DNA_A):
            return BamTools::Constants::BAM_BASECODE_A;
        case (BamTools::Constants::BAM_DNA_C):
            return BamTools::Constants::BAM_BASECODE_C;
        case (BamTools::Constants::BAM_DNA_M):
            return BamTools::Constants::BAM_BASECODE_M;
        case (BamTools::Constants::BAM_DNA_G):
            return BamTools::Constants::BAM_BASECODE_G;
        case (BamTools::Constants::BAM_DNA_R):
            return BamTools::Constants::BAM_BASECODE_R;
        case (BamTools::Constants::BAM_DNA_S):
            return BamTools::Constants::BAM_BASECODE_S;
        case (BamTools::Constants::BAM_DNA_V):
            return BamTools::Constants::BAM_BASECODE_V;
        case (BamTools::Constants::BAM_DNA_T):
        case 'U':
            return BamTools::Constants::BAM_BASECODE_T;
        case (BamTools::Constants::BAM_DNA_W):
            return BamTools::Constants::BAM_BASECODE_W;
        case (BamTools::Constants::BAM_DNA_Y):
            return BamTools::Constants::BAM_BASECODE_Y;
        case (BamTools::Constants::BAM_DNA_H):
            return BamTools::Constants::BAM_BASECODE_H;
        case (BamTools::Constants::BAM_DNA_K):
            return BamTools::Constants::BAM_BASECODE_K;
        case (BamTools::Constants::BAM_DNA_D):
            return BamTools::Constants::BAM_BASECODE_D;
        case (BamTools::Constants::BAM_DNA_B):
            return BamTools::Constants::BAM_BASECODE_B;
        case (BamTools::Constants::BAM_DNA_N):
        default:
            return BamTools::Constants::BAM_BASECODE_N;
        }
    }

    // Binarize DNA string. The output is populated with 4-bit characters, one bit per canonical base,
    // so that two positions are compatible iff the bitwise AND of their masks is nonzero.
    //  Args:
    //    seq: DNA sequence, composed of base or ambiguity codes.
    //    vec: Vector of unsigned char constituting the output. Resized to fit.
    static inline void seq_to_mask(std::string_view seq, std::vector<unsigned char>& vec) {
        vec.resize(seq.length());
        std::ranges::transform(seq, vec.begin(), base_to_mask);
    }

    static inline std::vector<unsigned char> seq_to_mask(std::string_view seq) {
        std::vector<unsigned char> vec;
        seq_to_mask(seq, vec);
        return vec;
    }

    static inline bool is_gap(char c) {
        return c == '-' || c == '.';
    }

    static inline bool is_canonical(char c) {
        return c == 'A' || c == 'C' || c == 'G' || c == 'T';
    }

    // IUPAC-aware complement. Case is preserved.
    static inline char complement(char c) {
        switch (c) {
        case 'A': return 'T';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'T': case 'U': return 'A';
        case 'R': return 'Y';
        case 'Y': return 'R';
        case 'K': return 'M';
        case 'M': return 'K';
        case 'B': return 'V';
        case 'V': return 'B';
        case 'D': return 'H';
        case 'H': return 'D';
        case 'a': return 't';
        case 'c': return 'g';
        case 'g': return 'c';
        case 't': case 'u': return 'a';
        default: return c;  // N, S, W and gaps are self-complementary
        }
    }

    static inline std::string reverse_complement(std::string_view seq) {
        std::string result(seq.rbegin(), seq.rend());
        std::ranges::transform(result, result.begin(), complement);
        return result;
    }

    // Percentage (0-100) of G or C bases in seq
    static inline double gc_percent(std::string_view seq) {
        if (seq.empty()) {
            return 0.0;
        }
        std::size_t count_GC = std::ranges::count_if(seq, [](const char& c) {
            return c == 'G' || c == 'C' || c == 'S' || c == 'g' || c == 'c';
        });
        return 100.0 * count_GC / seq.length();
    }
}

#endif //PLPDESIGN_BASES_H
