// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_UTIL_H
#define UMIDEDUP_UTIL_H

#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <ranges>
#include <sstream>
#include <utility>
#include <unistd.h>
#include <sys/resource.h>

namespace umidedup {
    // Join a vector of strings with a delimiter
    template<typename InputIt>
    std::string strjoin(InputIt begin, InputIt end, std::string const& j) {
        std::string result {};
        if (begin == end) {
            return result;
        }
        for (auto it = begin;; result += j) {
            result += *it;
            if (++it == end) {
                break;
            }
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
        for (const CharT *sep {""}; auto const& word : rng) {
            result += sep + word;
            sep = delim;
        }
        return result;
    }

    // Join a vector of strings with a space delimeter. Escapes double-quotes and backslashes. If a space exists in a substring, it will be double-quoted (unescaped).
    template<typename InputIt>
    std::string shlexjoin(InputIt begin, InputIt end) {
        std::stringstream result {};
        for (auto it = begin;; result << ' ') {
            const std::string& s = *it++;
            if (s.find(' ') != std::string::npos) {
                result << std::quoted(s);
            } else {
                result << s;
            }
            if (it == end) {
                break;
            }
        }
        return result.str();
    }

    static inline std::string shlexjoin(std::vector<std::string> const& v) {
        return shlexjoin(v.cbegin(), v.cend());
    }

    // Split on every occurrence of a single-character delimiter, keeping empty fields.
    static inline std::vector<std::string> strsplit_exact(std::string_view s, char d) {
        std::vector<std::string> ret = {};
        std::size_t pos = 0;
        for (std::size_t nextpos = s.find(d); nextpos != std::string_view::npos; nextpos = s.find(d, pos)) {
            ret.emplace_back(s.substr(pos, nextpos - pos));
            pos = nextpos + 1;
        }
        ret.emplace_back(s.substr(pos));
        return ret;
    }

    // Left-pad a non-negative integer with zeros to the given width
    static inline std::string zfill(unsigned long long value, std::size_t width) {
        std::string s = std::to_string(value);
        if (s.size() < width) {
            s.insert(0, width - s.size(), '0');
        }
        return s;
    }

    // Current resident set size and peak resident set size of this process, in megabytes
    static inline std::pair<double, double> memory_info() {
        double current = 0.0;
        std::ifstream statm("/proc/self/statm");
        unsigned long long pages_total, pages_resident;
        if (statm >> pages_total >> pages_resident) {
            current = static_cast<double>(pages_resident) * sysconf(_SC_PAGESIZE) / (1024.0 * 1024.0);
        }
        struct rusage usage {};
        getrusage(RUSAGE_SELF, &usage);
        // ru_maxrss is in kilobytes on Linux
        double peak = static_cast<double>(usage.ru_maxrss) / 1024.0;
        return {current, peak};
    }

    // IOMANIP object to print the current local system time
    static inline auto put_time() {
        const std::time_t t_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        return std::put_time(std::localtime(&t_c), "%F %T");
    }
}

#endif //UMIDEDUP_UTIL_H
