// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <charconv>
#include <umidedup/Errors.hpp>
#include <umidedup/Util.hpp>
#include <umidedup/Annotation.hpp>

namespace umidedup {
    Annotation Annotation::parse(std::string const& qname, std::size_t n_mates) {
        // Read names may themselves contain DELIM_ANNO, the payload never does
        std::size_t anno_pos = qname.rfind(DELIM_ANNO);
        if (anno_pos == std::string::npos) {
            throw ParseError("read name carries no UMI annotation: " + qname);
        }
        Annotation anno;
        anno.read_name = qname.substr(0, anno_pos);
        std::vector<std::string> records = strsplit_exact(std::string_view(qname).substr(anno_pos + 1), DELIM_ANNO_TYPE);
        if (records.size() < 2) {
            throw ParseError("read name annotation lacks 5' trim record: " + qname);
        }
        anno.umis = strsplit_exact(records[0], DELIM_ANNO_READ_PAIR);
        for (std::string const& trim : strsplit_exact(records[1], DELIM_ANNO_READ_PAIR)) {
            long long value = 0;
            auto [ptr, ec] = std::from_chars(trim.data(), trim.data() + trim.size(), value);
            if (ec != std::errc() || ptr != trim.data() + trim.size() || trim.empty()) {
                throw ParseError("invalid 5' trim \"" + trim + "\" in read name: " + qname);
            }
            anno.trims.push_back(value);
        }
        if (anno.umis.size() != anno.trims.size()) {
            throw ParseError("read name annotation has " + std::to_string(anno.umis.size()) + " UMIs but " + std::to_string(anno.trims.size()) + " trims: " + qname);
        }
        if (n_mates != 0 && anno.umis.size() != n_mates) {
            throw ParseError("expected " + std::to_string(n_mates) + " UMIs in read name annotation, found " + std::to_string(anno.umis.size()) + ": " + qname);
        }
        return anno;
    }
}
