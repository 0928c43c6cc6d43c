// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_DEDUPREPORT_H
#define UMIDEDUP_DEDUPLICATE_DEDUPREPORT_H

#include <array>
#include <string>
#include <vector>
#include <utility>
#include <ostream>
#include <nlohmann/json.hpp>

// Largest Hamming distance searched between a sequenced UMI and the known UMIs of a kit
constexpr int MAX_UMI_DISTANCE = 8;

typedef std::array<unsigned long long, MAX_UMI_DISTANCE> umi_distance_histogram;

// Counters collected over one deduplication run
struct DedupReport {
    unsigned long long num_read_groups = 0;
    unsigned long long num_dropped_hard_clipped = 0;
    unsigned long long num_locations = 0;
    unsigned long long num_unique_umi_and_location_combinations = 0;
    unsigned long long num_dup_groups = 0;
    unsigned long long num_read_groups_with_umi_error = 0;
    // Index d - 1 counts read groups whose worse mate is d from the nearest known UMI
    umi_distance_histogram num_read_groups_with_umi_error_dist {};
    umi_distance_histogram num_read_groups_rejected_due_to_umi_error_dist {};

    // Record a read group with a UMI error. distance is the larger of the mates' distances.
    void record_umi_error(int distance, bool rejected);

    // Every counter as (name, value), sorted by name
    std::vector<std::pair<std::string, unsigned long long>> entries() const;

    // Counters, with the histograms as arrays, under "counts"; config is stored under "config"
    nlohmann::ordered_json to_json(nlohmann::ordered_json const& config) const;

    // One "name: value" line per counter
    friend std::ostream& operator<<(std::ostream& strm, DedupReport const& self);
};

#endif //UMIDEDUP_DEDUPLICATE_DEDUPREPORT_H
