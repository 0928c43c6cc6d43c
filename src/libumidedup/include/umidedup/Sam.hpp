// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_SAM_H
#define UMIDEDUP_SAM_H

#include <string>
#include <string_view>
#include <vector>
#include <ostream>

namespace umidedup {
    constexpr unsigned SAM_FLAG_PAIRED = 0x1;
    constexpr unsigned SAM_FLAG_MATE_UNMAPPED = 0x8;
    constexpr unsigned SAM_FLAG_REVERSE = 0x10;
    constexpr unsigned SAM_FLAG_DUPLICATE = 0x400;

    constexpr char DELIM_SAM_FIELD = '\t';
    // ASCII record separator; never legal inside a SAM field
    constexpr char DELIM_READ_LIST = '\x1e';

    // Pad read group ids with zeros to this many digits so that string order is numeric order
    constexpr std::size_t READ_GROUP_ID_DIGITS = 10;

    // Extract the QNAME field of a SAM alignment line without parsing the rest
    std::string_view sam_qname(std::string_view line);

    // Returns a copy of the SAM alignment line with the given bits set in FLAG
    std::string sam_set_flag(std::string_view line, unsigned bits);

    // One alignment line of a SAM file. Only the fields needed to place the
    // alignment are kept.
    struct Read {
        std::string qname;
        unsigned flag = 0;
        std::string rname;
        long long pos = 0;
        std::string mapq;
        std::string cigar;

        Read() = default;
        Read(std::string qname, unsigned flag, std::string rname, long long pos, std::string mapq, std::string cigar);

        // Parse the leading six columns of a SAM alignment line. Throws ParseError.
        static Read parse(std::string_view line);

        char strand() const {
            return (flag & SAM_FLAG_REVERSE) ? '-' : '+';
        }

        // Tab-joined QNAME FLAG RNAME POS MAPQ CIGAR
        std::string serialize() const;

        bool operator==(const Read& rhs) const = default;
        friend std::ostream& operator<<(std::ostream& strm, Read const& me);
    };

    // All alignment lines sharing one QNAME: a mate pair, or more for multimappers
    class ReadGroup {
        std::vector<Read> reads;
    public:
        ReadGroup() = default;
        explicit ReadGroup(std::vector<Read> reads) : reads(std::move(reads)) {}

        void push_back(Read read) {
            reads.push_back(std::move(read));
        }
        void clear() {
            reads.clear();
        }
        bool empty() const {return reads.empty();}
        std::size_t size() const {return reads.size();}
        const Read& operator[](std::size_t i) const {return reads[i];}
        const Read& back() const {return reads.back();}
        auto begin() const {return reads.cbegin();}
        auto end() const {return reads.cend();}

        // QNAME of the first read; the same for every member
        const std::string& name() const;

        std::string serialize() const;
        static ReadGroup deserialize(std::string const& s);

        bool operator==(const ReadGroup& rhs) const = default;
        friend std::ostream& operator<<(std::ostream& strm, ReadGroup const& me);
    };
}

#endif //UMIDEDUP_SAM_H
