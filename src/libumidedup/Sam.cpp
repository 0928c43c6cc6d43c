// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <string_view>
#include <charconv>
#include <array>
#include <umidedup/Errors.hpp>
#include <umidedup/Sam.hpp>

namespace umidedup {
    namespace {
        template<typename T>
        T parse_int(std::string_view field, const char* what, std::string_view line) {
            T value {};
            auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
            if (ec != std::errc() || ptr != field.data() + field.size() || field.empty()) {
                throw ParseError("invalid " + std::string(what) + " \"" + std::string(field) + "\" in SAM line: " + std::string(line));
            }
            return value;
        }
    }

    std::string_view sam_qname(std::string_view line) {
        return line.substr(0, line.find(DELIM_SAM_FIELD));
    }

    std::string sam_set_flag(std::string_view line, unsigned bits) {
        std::size_t tab1 = line.find(DELIM_SAM_FIELD);
        std::size_t tab2 = tab1 == std::string_view::npos ? tab1 : line.find(DELIM_SAM_FIELD, tab1 + 1);
        if (tab2 == std::string_view::npos) {
            throw ParseError("SAM line has no FLAG field: " + std::string(line));
        }
        unsigned flag = parse_int<unsigned>(line.substr(tab1 + 1, tab2 - tab1 - 1), "FLAG", line);
        std::string result {line.substr(0, tab1 + 1)};
        result += std::to_string(flag | bits);
        result += line.substr(tab2);
        return result;
    }

    Read::Read(std::string qname, unsigned flag, std::string rname, long long pos, std::string mapq, std::string cigar) :
        qname(std::move(qname)),
        flag(flag),
        rname(std::move(rname)),
        pos(pos),
        mapq(std::move(mapq)),
        cigar(std::move(cigar))
    {}

    Read Read::parse(std::string_view line) {
        std::array<std::string_view, 6> fields;
        std::size_t pos = 0;
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (pos > line.size()) {
                throw ParseError("SAM line has fewer than 6 fields: " + std::string(line));
            }
            std::size_t nextpos = line.find(DELIM_SAM_FIELD, pos);
            fields[i] = line.substr(pos, nextpos == std::string_view::npos ? std::string_view::npos : nextpos - pos);
            pos = nextpos == std::string_view::npos ? line.size() + 1 : nextpos + 1;
        }
        return Read {
            std::string(fields[0]),
            parse_int<unsigned>(fields[1], "FLAG", line),
            std::string(fields[2]),
            parse_int<long long>(fields[3], "POS", line),
            std::string(fields[4]),
            std::string(fields[5])
        };
    }

    std::string Read::serialize() const {
        std::string s {qname};
        s += DELIM_SAM_FIELD;
        s += std::to_string(flag);
        s += DELIM_SAM_FIELD;
        s += rname;
        s += DELIM_SAM_FIELD;
        s += std::to_string(pos);
        s += DELIM_SAM_FIELD;
        s += mapq;
        s += DELIM_SAM_FIELD;
        s += cigar;
        return s;
    }

    std::ostream& operator<<(std::ostream& strm, Read const& me) {
        return strm << me.serialize();
    }

    const std::string& ReadGroup::name() const {
        if (reads.empty()) {
            throw InvariantError("name() of an empty ReadGroup");
        }
        return reads.front().qname;
    }

    std::string ReadGroup::serialize() const {
        std::string s {};
        for (auto it = reads.cbegin(); it != reads.cend(); ++it) {
            if (it != reads.cbegin()) {
                s += DELIM_READ_LIST;
            }
            s += it->serialize();
        }
        return s;
    }

    ReadGroup ReadGroup::deserialize(std::string const& s) {
        ReadGroup rg;
        std::size_t pos = 0;
        while (true) {
            std::size_t nextpos = s.find(DELIM_READ_LIST, pos);
            rg.reads.push_back(Read::parse(std::string_view(s).substr(pos, nextpos == std::string::npos ? std::string::npos : nextpos - pos)));
            if (nextpos == std::string::npos) {
                break;
            }
            pos = nextpos + 1;
        }
        return rg;
    }

    std::ostream& operator<<(std::ostream& strm, ReadGroup const& me) {
        for (const Read& read : me) {
            strm << read << "\n";
        }
        return strm;
    }
}
