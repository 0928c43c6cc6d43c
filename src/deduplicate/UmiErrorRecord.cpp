// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <algorithm>
#include <umidedup.hpp>
#include "UmiErrorRecord.hpp"

namespace {
    constexpr char DELIM_MATE = '^';
    constexpr char DELIM_FIELD = ',';
}

int UmiErrorRecord::max_distance() const {
    int result = 0;
    for (const Mate& mate : mates) {
        result = std::max(result, mate.distance);
    }
    return result;
}

std::string UmiErrorRecord::sam_tags(std::size_t m) const {
    const Mate& mate = mates.at(m);
    const std::string num = std::to_string(m + 1);
    std::string tags {};
    tags += SAM_TAG_UMI_DISTANCE + num + ":i:" + std::to_string(mate.distance);
    tags += umidedup::DELIM_SAM_FIELD;
    tags += SAM_TAG_UMI_CANDIDATES + num + ":i:" + std::to_string(mate.candidates);
    if (!mate.corrected.empty()) {
        tags += umidedup::DELIM_SAM_FIELD;
        tags += SAM_TAG_UMI_CORRECTED + num + ":Z:" + mate.corrected;
    }
    return tags;
}

std::string UmiErrorRecord::serialize() const {
    std::vector<std::string> parts;
    for (const Mate& mate : mates) {
        parts.push_back(std::to_string(mate.distance) + DELIM_FIELD + std::to_string(mate.candidates) + DELIM_FIELD + mate.corrected);
    }
    return umidedup::strjoin(parts, std::string(1, DELIM_MATE));
}

UmiErrorRecord UmiErrorRecord::deserialize(std::string const& s) {
    UmiErrorRecord record;
    for (std::string const& part : umidedup::strsplit_exact(s, DELIM_MATE)) {
        std::vector<std::string> fields = umidedup::strsplit_exact(part, DELIM_FIELD);
        if (fields.size() != 3) {
            throw umidedup::StoreError("corrupt UMI error record: " + s);
        }
        try {
            record.mates.push_back({std::stoi(fields[0]), std::stoull(fields[1]), fields[2]});
        } catch (std::logic_error const& e) {
            throw umidedup::StoreError("corrupt UMI error record: " + s + ": " + e.what());
        }
    }
    return record;
}

std::ostream& operator<<(std::ostream& strm, UmiErrorRecord const& self) {
    for (std::size_t m = 0; m < self.mates.size(); ++m) {
        if (m != 0) {
            strm << umidedup::DELIM_SAM_FIELD;
        }
        strm << self.sam_tags(m);
    }
    return strm;
}
