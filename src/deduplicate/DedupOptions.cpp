// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <nlohmann/json.hpp>
#include <umidedup.hpp>
#include "DedupOptions.hpp"

void DedupOptions::validate() const {
    umidedup::Kit::by_name(kit);
    umidedup::store_kind_from_name(store);
    if (batch_size == 0) {
        throw umidedup::ConfigurationError("batch size must be at least 1");
    }
    if (reject_umi_errors && correct_umis) {
        throw umidedup::ConfigurationError("cannot both reject and correct UMI errors; to correct UMIs, also keep bad UMIs");
    }
}

nlohmann::ordered_json DedupOptions::to_json() const {
    const umidedup::Kit& k = umidedup::Kit::by_name(kit);
    return {
        {"outdir", outdir.string()},
        {"kit", k.name},
        {"kit_umi_length", k.umi_length()},
        {"kit_clip_length", k.clip_length},
        {"paired", paired},
        {"store", store},
        {"batch_size", batch_size},
        {"reject_umi_errors", reject_umi_errors},
        {"correct_umis", correct_umis},
        {"random_seed", random_seed},
        {"write_dedupped_sam", write_dedupped_sam},
        {"write_flagged_sam", write_flagged_sam},
        {"write_dup_only_sam", write_dup_only_sam},
        {"write_dup_group_file", write_dup_group_file},
        {"write_umi_error_sam", write_umi_error_sam},
        {"write_sam_headers", write_sam_headers},
    };
}
