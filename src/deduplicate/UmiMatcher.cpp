// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <boost/log/trivial.hpp>
#include <umidedup.hpp>
#include "DedupReport.hpp"
#include "UmiMatcher.hpp"

int UmiMatcher::match_one(std::string const& umi, std::string const& ref, int max_distance) {
    int nmismatch = 0;
    for (std::size_t i = 0; i < umi.size(); ++i) {
        if (umi[i] != ref[i] && ++nmismatch > max_distance) {
            break;
        }
    }
    return nmismatch;
}

UmiMatcher::UmiMatcher(const umidedup::Kit& kit) : kit(kit), known(kit.umis.cbegin(), kit.umis.cend()) {}

UmiMatch const& UmiMatcher::match_umi(std::string const& umi) {
    auto it = memo.find(umi);
    if (it != memo.cend()) {
        return it->second;
    }
    if (umi.size() != kit.umi_length()) {
        throw umidedup::ParseError("UMI " + umi + " has length " + std::to_string(umi.size()) + ", kit " + kit.name + " uses " + std::to_string(kit.umi_length()) + "-nt UMIs");
    }
    UmiMatch result {0, {}};
    if (known.contains(umi)) {
        result.candidates.push_back(umi);
    } else {
        // One pass computes every distance; keeping the minimum is the same as
        // trying 1, 2, ... in turn and stopping at the first hit.
        result.distance = MAX_UMI_DISTANCE + 1;
        for (std::string const& ref : kit.umis) {
            int d = match_one(umi, ref, result.distance);
            if (d < result.distance) {
                result.distance = d;
                result.candidates.clear();
            }
            if (d == result.distance) {
                result.candidates.push_back(ref);
            }
        }
        if (result.distance > MAX_UMI_DISTANCE) {
            throw umidedup::ParseError("UMI " + umi + " is more than " + std::to_string(MAX_UMI_DISTANCE) + " substitutions from every known UMI of kit " + kit.name);
        }
        BOOST_LOG_TRIVIAL(debug) << "UMI " << umi << " is " << result.distance << " from " << result.candidates.size() << " known UMI(s)";
    }
    return memo.emplace(umi, std::move(result)).first->second;
}
