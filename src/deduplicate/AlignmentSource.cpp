// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <sstream>
#include <fstream>
#include <vector>
#include <type_traits>
#include <boost/log/trivial.hpp>
#include <bamtools/api/BamReader.h>
#include <bamtools/api/BamAlignment.h>
#include <bamtools/api/BamAux.h>
#include <umidedup.hpp>
#include "AlignmentSource.hpp"

namespace {
    // Scalar tags are read with the exact type they are stored as
    template<typename T>
    void write_tag_value(std::ostream& out, BamTools::BamAlignment const& aln, std::string const& tag) {
        T value {};
        if (!aln.GetTag<T>(tag, value)) {
            throw umidedup::ParseError("cannot decode tag " + tag + " of " + aln.Name);
        }
        if constexpr (std::is_integral_v<T>) {
            out << static_cast<long long>(value);
        } else {
            out << value;
        }
    }

    template<typename T>
    void write_array_tag_values(std::ostream& out, BamTools::BamAlignment const& aln, std::string const& tag) {
        std::vector<T> values;
        if (!aln.GetTag<T>(tag, values)) {
            throw umidedup::ParseError("cannot decode array tag " + tag + " of " + aln.Name);
        }
        for (T const& value : values) {
            out << ',';
            if constexpr (std::is_integral_v<T>) {
                out << static_cast<long long>(value);
            } else {
                out << value;
            }
        }
    }

    void write_tag(std::ostream& out, BamTools::BamAlignment const& aln, std::string const& tag) {
        char type;
        if (!aln.GetTagType(tag, type)) {
            throw umidedup::ParseError("cannot decode type of tag " + tag + " of " + aln.Name);
        }
        out << umidedup::DELIM_SAM_FIELD << tag << ':';
        switch (type) {
        case 'A': {
            uint8_t value {};
            if (!aln.GetTag<uint8_t>(tag, value)) {
                throw umidedup::ParseError("cannot decode tag " + tag + " of " + aln.Name);
            }
            out << "A:" << static_cast<char>(value);
            break;
        }
        case 'c':
            out << "i:";
            write_tag_value<int8_t>(out, aln, tag);
            break;
        case 'C':
            out << "i:";
            write_tag_value<uint8_t>(out, aln, tag);
            break;
        case 's':
            out << "i:";
            write_tag_value<int16_t>(out, aln, tag);
            break;
        case 'S':
            out << "i:";
            write_tag_value<uint16_t>(out, aln, tag);
            break;
        case 'i':
            out << "i:";
            write_tag_value<int32_t>(out, aln, tag);
            break;
        case 'I':
            out << "i:";
            write_tag_value<uint32_t>(out, aln, tag);
            break;
        case 'f':
            out << "f:";
            write_tag_value<float>(out, aln, tag);
            break;
        case 'Z':
        case 'H':
            out << type << ':';
            write_tag_value<std::string>(out, aln, tag);
            break;
        case 'B': {
            char subtype;
            if (!aln.GetArrayTagType(tag, subtype)) {
                throw umidedup::ParseError("cannot decode element type of tag " + tag + " of " + aln.Name);
            }
            out << "B:" << subtype;
            switch (subtype) {
            case 'c':
                write_array_tag_values<int8_t>(out, aln, tag);
                break;
            case 'C':
                write_array_tag_values<uint8_t>(out, aln, tag);
                break;
            case 's':
                write_array_tag_values<int16_t>(out, aln, tag);
                break;
            case 'S':
                write_array_tag_values<uint16_t>(out, aln, tag);
                break;
            case 'i':
                write_array_tag_values<int32_t>(out, aln, tag);
                break;
            case 'I':
                write_array_tag_values<uint32_t>(out, aln, tag);
                break;
            case 'f':
                write_array_tag_values<float>(out, aln, tag);
                break;
            default:
                throw umidedup::ParseError("invalid element type '" + std::string(1, subtype) + "' of tag " + tag + " of " + aln.Name);
            }
            break;
        }
        default:
            throw umidedup::ParseError("invalid type '" + std::string(1, type) + "' of tag " + tag + " of " + aln.Name);
        }
    }
}

SamTextSource::SamTextSource(fs::path const& filename) : AlignmentSource(filename), file(filename) {
    if (!file) {
        throw umidedup::PrerequisiteError("cannot open " + filename.string());
    }
}

bool SamTextSource::next_line(std::string& line) {
    if (!std::getline(file, line)) {
        if (file.bad()) {
            throw umidedup::ParseError("read error on " + filename.string());
        }
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

BamSource::BamSource(fs::path const& filename) : AlignmentSource(filename) {
    if (!reader.Open(filename.string())) {
        throw umidedup::PrerequisiteError("cannot open BAM " + filename.string() + ": " + reader.GetErrorString());
    }
    references = reader.GetReferenceData();
    bool has_sq = false;
    for (std::string const& line : umidedup::strsplit_exact(reader.GetHeaderText(), '\n')) {
        if (line.empty()) {
            continue;
        }
        has_sq = has_sq || line.starts_with("@SQ");
        header.push_back(line);
    }
    // The binary reference list is authoritative; render it if the text lacks it
    if (!has_sq) {
        auto it = header.begin();
        if (it != header.end() && it->starts_with("@HD")) {
            ++it;
        }
        for (BamTools::RefData const& ref : references) {
            it = std::next(header.insert(it, "@SQ\tSN:" + ref.RefName + "\tLN:" + std::to_string(ref.RefLength)));
        }
    }
    BOOST_LOG_TRIVIAL(debug) << "opened BAM " << filename << " with " << references.size() << " references";
}

BamSource::~BamSource() {
    reader.Close();
}

bool BamSource::next_line(std::string& line) {
    if (!header.empty()) {
        line = std::move(header.front());
        header.pop_front();
        return true;
    }
    if (!reader.GetNextAlignment(alignment)) {
        if (!reader.GetErrorString().empty()) {
            throw umidedup::ParseError("cannot decode " + filename.string() + ": " + reader.GetErrorString());
        }
        return false;
    }
    line = to_sam(alignment, references);
    return true;
}

std::string BamSource::to_sam(BamTools::BamAlignment const& aln, BamTools::RefVector const& refs) {
    auto refname = [&refs](int32_t id) -> std::string {
        return id < 0 || static_cast<std::size_t>(id) >= refs.size() ? "*" : refs[id].RefName;
    };
    constexpr char tab = umidedup::DELIM_SAM_FIELD;
    std::ostringstream out;
    out << aln.Name << tab << aln.AlignmentFlag << tab << refname(aln.RefID) << tab << aln.Position + 1 << tab << aln.MapQuality << tab;
    if (aln.CigarData.empty()) {
        out << '*';
    }
    for (BamTools::CigarOp const& op : aln.CigarData) {
        out << op.Length << op.Type;
    }
    out << tab;
    if (aln.MateRefID < 0) {
        out << '*';
    } else if (aln.MateRefID == aln.RefID) {
        out << '=';
    } else {
        out << refname(aln.MateRefID);
    }
    out << tab << aln.MatePosition + 1 << tab << aln.InsertSize << tab;
    out << (aln.QueryBases.empty() ? "*" : aln.QueryBases) << tab;
    // Unstored qualities decode as 0xFF bytes (or 0xFF + 33 in older releases)
    if (aln.Qualities.empty() || aln.Qualities[0] == ' ' || static_cast<unsigned char>(aln.Qualities[0]) == 0xFF) {
        out << '*';
    } else {
        out << aln.Qualities;
    }
    for (std::string const& tag : aln.GetTagNames()) {
        write_tag(out, aln, tag);
    }
    return out.str();
}

bool is_bam_file(fs::path const& filename) {
    if (filename.extension() == ".bam") {
        return true;
    }
    std::ifstream file(filename, std::ios::binary);
    char magic[2] {};
    if (!file.read(magic, 2)) {
        return false;
    }
    return static_cast<unsigned char>(magic[0]) == 0x1f && static_cast<unsigned char>(magic[1]) == 0x8b;
}

std::unique_ptr<AlignmentSource> open_alignment_source(fs::path const& filename) {
    if (!fs::is_regular_file(filename)) {
        throw umidedup::PrerequisiteError("input " + filename.string() + " does not exist or is not a regular file");
    }
    if (is_bam_file(filename)) {
        return std::make_unique<BamSource>(filename);
    }
    return std::make_unique<SamTextSource>(filename);
}
