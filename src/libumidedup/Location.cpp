// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <string_view>
#include <umidedup/Errors.hpp>
#include <umidedup/Annotation.hpp>
#include <umidedup/Location.hpp>

namespace umidedup {
    AlignmentSpan parse_alignment_span(long long pos, char strand, std::string_view cigar) {
        // Unmapped: no aligned bases, every boundary is POS
        if (cigar == "*") {
            return {pos, pos, pos, pos};
        }
        long long clipped_left = 0;
        long long clipped_right = 0;
        long long align_len = 0;
        long long num = 0;
        bool have_num = false;
        bool first_op = true;

        for (char c : cigar) {
            if (c >= '0' && c <= '9') {
                num = num * 10 + (c - '0');
                have_num = true;
                continue;
            }
            if (c == 'H') {
                throw HardClippingNotSupported(
                    "hard clipping is not supported. cigar: " + std::string(cigar) +
                    ", left pos: " + std::to_string(pos) + ", strand: " + strand);
            }
            if (!have_num) {
                throw ParseError("CIGAR operation without length: " + std::string(cigar));
            }
            switch (c) {
            case 'S':
                // At most one clip on each end
                if (first_op) {
                    clipped_left = num;
                } else {
                    clipped_right = num;
                }
                break;
            case 'M':
            case '=':
            case 'X':
            case 'D':
            case 'N':
                align_len += num;
                break;
            case 'I':
            case 'P':
                break;
            default:
                throw ParseError("invalid CIGAR operation '" + std::string(1, c) + "': " + std::string(cigar));
            }
            num = 0;
            have_num = false;
            first_op = false;
        }
        if (have_num) {
            throw ParseError("CIGAR ends without an operation: " + std::string(cigar));
        }

        AlignmentSpan span;
        if (strand == '+') {
            span.synthetic_start = pos - clipped_left;
            span.start = pos;
            span.end = span.start + align_len - 1;
            span.synthetic_end = span.end + clipped_right;
        } else {
            span.synthetic_end = pos - clipped_left;
            span.end = pos;
            span.start = span.end + align_len - 1;
            span.synthetic_start = span.start + clipped_right;
        }
        return span;
    }

    std::string to_location_key(ReadGroup const& read_group) {
        // Annotation is identical for all reads in the group
        const std::vector<long long> trims_5p = Annotation::parse(read_group.name()).trims;

        std::string key {};
        for (std::size_t i = 0; i < read_group.size(); ++i) {
            const Read& read = read_group[i];
            const char strand = read.strand();
            long long start = parse_alignment_span(read.pos, strand, read.cigar).synthetic_start;
            if (strand == '+') {
                start -= trims_5p[i % trims_5p.size()];
            } else {
                start += trims_5p[i % trims_5p.size()];
            }
            if (i != 0) {
                key += DELIM_LOCATION_KEY;
            }
            key += read.rname + ':' + std::to_string(start) + ':' + strand;
        }
        return key;
    }
}
