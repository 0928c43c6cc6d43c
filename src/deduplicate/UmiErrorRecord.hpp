// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_UMIERRORRECORD_H
#define UMIDEDUP_DEDUPLICATE_UMIERRORRECORD_H

#include <string>
#include <vector>
#include <ostream>

// UMI error tags appended to every alignment line of an affected read group:
//   d<m>:i:  Hamming distance from mate m's UMI to the nearest known UMI
//   n<m>:i:  Number of known UMIs at that distance
//   c<m>:Z:  The known UMI that replaced mate m's UMI, when it was corrected
constexpr char SAM_TAG_UMI_DISTANCE = 'd';
constexpr char SAM_TAG_UMI_CANDIDATES = 'n';
constexpr char SAM_TAG_UMI_CORRECTED = 'c';

// How far each mate's UMI was from the kit, stored per read group name
struct UmiErrorRecord {
    struct Mate {
        int distance = 0;
        unsigned long long candidates = 0;
        std::string corrected; // empty unless this mate's UMI was corrected

        bool operator==(const Mate& rhs) const = default;
    };
    std::vector<Mate> mates;

    // Largest distance over the mates
    int max_distance() const;

    // Tab-joined SAM tags for mate index m (0-based)
    std::string sam_tags(std::size_t m) const;

    // Mates joined by '^', fields of a mate by ','
    std::string serialize() const;
    static UmiErrorRecord deserialize(std::string const& s);

    bool operator==(const UmiErrorRecord& rhs) const = default;
    friend std::ostream& operator<<(std::ostream& strm, UmiErrorRecord const& self);
};

#endif //UMIDEDUP_DEDUPLICATE_UMIERRORRECORD_H
