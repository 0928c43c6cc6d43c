// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_UMIMATCHER_H
#define UMIDEDUP_DEDUPLICATE_UMIMATCHER_H

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <umidedup.hpp>

// Nearest known UMIs of a sequenced UMI
struct UmiMatch {
    int distance; // Hamming distance to the nearest known UMI; 0 for an exact match
    std::vector<std::string> candidates; // Every known UMI at that distance

    // Exactly one known UMI, one substitution away
    bool is_correctable() const {
        return distance == 1 && candidates.size() == 1;
    }
};

class UmiMatcher {
    const umidedup::Kit& kit;
    std::unordered_set<std::string> known;
    std::unordered_map<std::string, UmiMatch> memo;

    // Count substitutions between two equal-length sequences.
    //  Returns:
    //    Number of substitutions. Stops counting once it exceeds max_distance, so the result is only exact up to max_distance + 1.
    static int match_one(std::string const& umi, std::string const& ref, int max_distance);
public:
    explicit UmiMatcher(const umidedup::Kit& kit);

    // Search the kit's UMIs for those nearest to a sequenced UMI. Distances 1
    // through MAX_UMI_DISTANCE are tried in turn and the search stops at the
    // first distance with any known UMI.
    //  Args:
    //    umi: The sequenced UMI from the read name annotation
    //  Returns:
    //    The distance and every known UMI at that distance
    //  Throws:
    //    ParseError if the UMI length differs from the kit's, or no known UMI is within MAX_UMI_DISTANCE
    UmiMatch const& match_umi(std::string const& umi);

};

#endif //UMIDEDUP_DEDUPLICATE_UMIMATCHER_H
