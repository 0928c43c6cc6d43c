// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_DEDUPOPTIONS_H
#define UMIDEDUP_DEDUPLICATE_DEDUPOPTIONS_H

#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

constexpr unsigned long long DEFAULT_BATCH_SIZE = 100000;
constexpr const char* DEFAULT_RANDOM_SEED = "Little Ashes";

// Everything a deduplication run can be configured with
struct DedupOptions {
    fs::path outdir = ".";
    std::string kit = "bioo";
    bool paired = true;
    std::string store = "sqlite";
    unsigned long long batch_size = DEFAULT_BATCH_SIZE;
    bool reject_umi_errors = true;
    bool correct_umis = false;
    std::string random_seed = DEFAULT_RANDOM_SEED;

    bool write_dedupped_sam = true;
    bool write_flagged_sam = false;
    bool write_dup_only_sam = true;
    bool write_dup_group_file = true;
    bool write_umi_error_sam = true;
    bool write_sam_headers = true;

    bool keep_db = false;
    bool dump_rg_db = false;
    bool dump_loc_db = false;
    bool dump_dup_group_db = false;
    bool dump_dup_db = false;
    bool dump_umi_error_db = false;

    // Mates per read group annotation
    std::size_t n_mates() const {
        return paired ? 2 : 1;
    }

    // Throws ConfigurationError for an unknown kit or store, a zero batch size,
    // or UMI correction requested together with UMI rejection.
    void validate() const;

    nlohmann::ordered_json to_json() const;
};

#endif //UMIDEDUP_DEDUPLICATE_DEDUPOPTIONS_H
