// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of PLPDesign.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef PLPDESIGN_UTIL_H
#define PLPDESIGN_UTIL_H

#include <string>
#include <vector>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <cctype>
#include <cstdint>
#include <ranges>

// (gene, sequence) is the aggregation key for k-mer results
template <>
struct std::hash<std::pair<std::string, std::string>> {
    unsigned long long operator()(const std::pair<std::string, std::string>& x) const {
        const std::hash<std::string> hasher {};
        return (hasher(x.first) << 1) ^ hasher(x.second);
    }
};

namespace plpdesign {
    // Join a vector of strings with a delimiter
    template<typename InputIt>
    std::string strjoin(InputIt begin, InputIt end, std::string const& j) {
        std::string result {};
        for (std::string sep {}; begin != end; ++begin) {
            result += sep + *begin;
            sep = j;
        }
        return result;
    }

    static inline std::string strjoin(std::vector<std::string> const& v, std::string const& j) {
        return strjoin(v.cbegin(), v.cend(), j);
    }

    template <std::ranges::forward_range RangeT, typename CharT = char>
        requires std::is_same_v<std::ranges::range_value_t<RangeT>, std::basic_string<CharT>>
    std::basic_string<CharT> strjoin(RangeT&& rng, const CharT *delim) {
        std::basic_string<CharT> result {};
        for (const CharT *sep {""}; auto word : rng) {
            result += sep + word;
            sep = delim;
        }
        return result;
    }

    // Join a vector of strings with a space delimeter. If a space exists in a substring, it will be double-quoted.
    // Used to log the command lines handed to external tools.
    template<typename InputIt>
    std::string shlexjoin(InputIt begin, InputIt end) {
        std::stringstream result {};
        for (auto it = begin; it != end;) {
            const std::string& s = *it++;
            if (s.find(' ') != std::string::npos) {
                result << std::quoted(s);
            } else {
                result << s;
            }
            if (it != end) {
                result << ' ';
            }
        }
        return result.str();
    }

    static inline std::string shlexjoin(std::vector<std::string> const& v) {
        return shlexjoin(v.cbegin(), v.cend());
    }

    // Split a string into a vector of strings. Empty fields are kept.
    template<typename OutputIt>
    OutputIt strsplit(OutputIt out, std::string const& s, std::string const& d) {
        std::size_t pos = 0, nextpos;
        while ((nextpos = s.find(d, pos)) != std::string::npos) {
            *out++ = s.substr(pos, nextpos - pos);
            pos = nextpos + d.length();
        }
        *out++ = s.substr(pos);
        return out;
    }

    static inline std::vector<std::string> strsplit(std::string const& s, std::string const& d) {
        std::vector<std::string> ret = {};
        strsplit(std::back_inserter(ret), s, d);
        return ret;
    }

    // Strip leading and trailing whitespace (including the '\r' of CRLF files)
    static inline std::string strstrip(std::string const& s) {
        std::size_t first = 0, last = s.length();
        while (first < last && std::isspace(static_cast<unsigned char>(s[first]))) {
            ++first;
        }
        while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) {
            --last;
        }
        return s.substr(first, last - first);
    }

    static inline std::string to_upper(std::string s) {
        for (char& c : s) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return s;
    }

    // 64-bit FNV-1a. Stable across platforms, unlike std::hash, so seeded runs reproduce everywhere.
    static inline std::uint64_t fnv1a(std::string const& s, std::uint64_t h = 0xcbf29ce484222325ull) {
        for (const char& c : s) {
            h ^= static_cast<unsigned char>(c);
            h *= 0x100000001b3ull;
        }
        return h;
    }

    // IOMANIP object to print the current local system time
    template<typename _CharT = char>
    std::_Put_time<_CharT> put_time() {
        const std::time_t t_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        return std::put_time(std::localtime(&t_c), "%F %T");
    }
}

#endif //PLPDESIGN_UTIL_H
