// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_ANNOTATION_H
#define UMIDEDUP_ANNOTATION_H

#include <string>
#include <vector>

namespace umidedup {
    // Separates the read name from the annotation payload
    constexpr char DELIM_ANNO = '-';
    // Separates per-mate values within a record
    constexpr char DELIM_ANNO_READ_PAIR = '^';
    // Separates records of different types within the payload
    constexpr char DELIM_ANNO_TYPE = ';';

    // The UMI and 5' trim annotation carried in an annotated QNAME, e.g.
    //   D00597:180:C7NMDANXX:6:1101:1184:39633-GGCCTAAT^AGCTCTAG;2^0
    // which is read name, then UMI of each mate, then 5' trim of each mate.
    struct Annotation {
        std::string read_name;
        std::vector<std::string> umis;
        std::vector<long long> trims;

        // Parse an annotated QNAME. Throws ParseError.
        //  Args:
        //    qname: The annotated read name
        //    n_mates: Expected number of per-mate values (2 for paired-end, 1 for single-end). 0 accepts any count as long as UMIs and trims agree.
        static Annotation parse(std::string const& qname, std::size_t n_mates = 0);
    };
}

#endif //UMIDEDUP_ANNOTATION_H
