// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_LOCATION_H
#define UMIDEDUP_LOCATION_H

#include <string>
#include <string_view>
#include <ostream>
#include <umidedup/Sam.hpp>

namespace umidedup {
    // Separates the per-read entries of a location key
    constexpr char DELIM_LOCATION_KEY = ',';

    // Alignment boundaries of one read. start/end are the aligned reference
    // bases; the synthetic coordinates add soft-clipped bases back on. On the
    // reverse strand start is the rightmost base, so synthetic_start is the
    // 5' end of the read on either strand.
    struct AlignmentSpan {
        long long synthetic_start;
        long long start;
        long long end;
        long long synthetic_end;

        bool operator==(const AlignmentSpan& rhs) const = default;
        friend std::ostream& operator<<(std::ostream& strm, AlignmentSpan const& me) {
            return strm << "(" << me.synthetic_start << ", " << me.start << ", " << me.end << ", " << me.synthetic_end << ")";
        }
    };

    // Parse the CIGAR string of an alignment.
    //  Args:
    //    pos: SAM POS (1-based leftmost aligned base)
    //    strand: '+' or '-'
    //    cigar: SAM CIGAR string; "*" (unmapped) gives POS for every boundary
    //  Returns:
    //    The real and soft-clip corrected boundaries of the alignment
    //  Throws:
    //    HardClippingNotSupported if the CIGAR has an H operation, ParseError if it is malformed
    AlignmentSpan parse_alignment_span(long long pos, char strand, std::string_view cigar);

    // Location key of a read group, e.g. "chr5:1000000:+,chr5:1000500:-".
    // One entry per read, in read order, using the soft-clip corrected start
    // further corrected for the 5' trim recorded in the read name annotation.
    std::string to_location_key(ReadGroup const& read_group);
}

#endif //UMIDEDUP_LOCATION_H
