// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <algorithm>
#include <ostream>
#include <nlohmann/json.hpp>
#include <umidedup.hpp>
#include "DedupReport.hpp"

void DedupReport::record_umi_error(int distance, bool rejected) {
    if (distance < 1 || distance > MAX_UMI_DISTANCE) {
        throw umidedup::InvariantError("UMI error distance out of range: " + std::to_string(distance));
    }
    ++num_read_groups_with_umi_error;
    ++num_read_groups_with_umi_error_dist.at(distance - 1);
    if (rejected) {
        ++num_read_groups_rejected_due_to_umi_error_dist.at(distance - 1);
    }
}

std::vector<std::pair<std::string, unsigned long long>> DedupReport::entries() const {
    std::vector<std::pair<std::string, unsigned long long>> result {
        {"num_read_groups", num_read_groups},
        {"num_dropped_hard_clipped", num_dropped_hard_clipped},
        {"num_locations", num_locations},
        {"num_unique_umi_and_location_combinations", num_unique_umi_and_location_combinations},
        {"num_dup_groups", num_dup_groups},
        {"num_read_groups_with_umi_error", num_read_groups_with_umi_error},
    };
    for (int d = 1; d <= MAX_UMI_DISTANCE; ++d) {
        result.emplace_back("num_read_groups_with_umi_error_dist" + std::to_string(d), num_read_groups_with_umi_error_dist[d - 1]);
        result.emplace_back("num_read_groups_rejected_due_to_umi_error_dist" + std::to_string(d), num_read_groups_rejected_due_to_umi_error_dist[d - 1]);
    }
    std::sort(result.begin(), result.end());
    return result;
}

nlohmann::ordered_json DedupReport::to_json(nlohmann::ordered_json const& config) const {
    nlohmann::ordered_json data = {
        {"version", UMIDEDUP_VERSION_STR},
        {"config", config},
        {"counts", {
            {"num_read_groups", num_read_groups},
            {"num_dropped_hard_clipped", num_dropped_hard_clipped},
            {"num_locations", num_locations},
            {"num_unique_umi_and_location_combinations", num_unique_umi_and_location_combinations},
            {"num_dup_groups", num_dup_groups},
            {"num_read_groups_with_umi_error", num_read_groups_with_umi_error},
            {"num_read_groups_with_umi_error_dist", num_read_groups_with_umi_error_dist},
            {"num_read_groups_rejected_due_to_umi_error_dist", num_read_groups_rejected_due_to_umi_error_dist},
        }},
    };
    return data;
}

std::ostream& operator<<(std::ostream& strm, DedupReport const& self) {
    for (auto const& [name, value] : self.entries()) {
        strm << name << ": " << value << "\n";
    }
    return strm;
}
