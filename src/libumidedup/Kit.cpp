// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <umidedup/Errors.hpp>
#include <umidedup/Kit.hpp>
#include <umidedup/Util.hpp>

namespace umidedup {
    namespace {
        // Bioo Scientific NEXTflex: 96 inline 8-nt UMIs followed by a 1-nt T overhang
        const Kit KIT_BIOO {
            "bioo",
            {
                "AACGCCAT", "AAGGTACG", "AATTCCGG", "ACACAGAG", "ACACTCAG", "ACACTGTG", "ACAGGACA", "ACCTGTAG",
                "ACGAAGGT", "ACGACTTG", "ACGTCAAC", "ACGTCATG", "ACTGTCAG", "ACTGTGAC", "AGACACTC", "AGAGGAGA",
                "AGCATCGT", "AGCATGGA", "AGCTACCA", "AGCTCTAG", "AGGACAAC", "AGGACATG", "AGGTTGCT", "AGTCGAGA",
                "AGTGCTGT", "ATAAGCGG", "ATCCATGG", "ATCGAACC", "ATCGCGTA", "ATCGTTGG", "CAACGATC", "CAACGTTG",
                "CAACTGGT", "CAAGTCGT", "CACACACA", "CAGTACTG", "CATCAGCA", "CATCGTTC", "CCAAGGTT", "CCTAGCTT",
                "CGATTACG", "CGCCTATT", "CGTTCCAT", "CGTTGGAT", "CTACGTTC", "CTACTCGT", "CTAGAGGA", "CTAGGAAG",
                "CTAGGTAC", "CTCAGTCT", "CTGACTGA", "CTGAGTGT", "CTGATGTG", "CTGTTCAC", "CTTCGTTG", "GAACAGGT",
                "GAAGACCA", "GAAGTGCA", "GACATGAG", "GAGAAGAG", "GAGAAGTC", "GATCCTAG", "GATGTCGT", "GCCGATAT",
                "GCCGATTA", "GCGGTATT", "GGAATTGG", "GGATAACG", "GGCCTAAT", "GGCGTATT", "GTCTTGTC", "GTGATGAG",
                "GTGATGTC", "GTGTACTG", "GTGTAGTC", "GTTCACCT", "GTTCTGCT", "GTTGTCGA", "TACGAACC", "TAGCAAGG",
                "TAGCTAGC", "TAGGTTCG", "TATAGCGC", "TCAGGACT", "TCCACATC", "TCGACTTC", "TCGTAGGT", "TCGTCATC",
                "TGAGACTC", "TGAGAGTG", "TGAGTGAG", "TGCTTGGA", "TGGAGTAG", "TGTGTGTG", "TTCGCCTA", "TTCGTTCG",
            },
            9
        };

        const std::vector<const Kit*> KITS {&KIT_BIOO};
    }

    const Kit& Kit::by_name(std::string const& name) {
        std::string lower {name};
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
        for (const Kit* kit : KITS) {
            if (kit->name == lower) {
                return *kit;
            }
        }
        throw ConfigurationError("Kit " + name + " is not supported (supported: " + strjoin(names(), ", ") + ")");
    }

    std::vector<std::string> Kit::names() {
        std::vector<std::string> result;
        for (const Kit* kit : KITS) {
            result.push_back(kit->name);
        }
        return result;
    }
}
