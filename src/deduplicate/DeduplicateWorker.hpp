// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_DEDUPLICATEWORKER_H
#define UMIDEDUP_DEDUPLICATE_DEDUPLICATEWORKER_H

#include <string>
#include <vector>
#include <memory>
#include <ostream>
#include <filesystem>
#include <umidedup.hpp>
#include "DedupOptions.hpp"
#include "DedupReport.hpp"
#include "DuplicateResolver.hpp"
#include "LocationIndex.hpp"
#include "UmiErrorRecord.hpp"

namespace fs = std::filesystem;

// Table names in the store environment
constexpr const char* TABLE_READ_GROUPS = "read_group";
constexpr const char* TABLE_LOCATIONS = "location_bucket_store";
constexpr const char* TABLE_UMI_ERRORS = "umi_error";
constexpr const char* TABLE_DUPLICATES = "duplicate";

class DeduplicateWorker {
    const std::vector<std::string> cli;
    const DedupOptions options;
    const fs::path input;
    DedupReport report;
    std::unique_ptr<umidedup::StoreEnvironment> env; // Must outlive every store below
    umidedup::SimpleObjectStore<umidedup::ReadGroup> read_groups; // read group id -> ReadGroup
    LocationIndex locations; // location key -> read group ids
    umidedup::SimpleObjectStore<UmiErrorRecord> umi_errors; // read group name -> UMI distances
    umidedup::BucketStore losers; // read group name -> (nothing); the duplicates to remove
    std::vector<DupGroup> dup_groups;

    void dump_stores(std::ostream& strm);
public:
    DeduplicateWorker(
        const std::vector<std::string>& cli,
        const fs::path& input,
        const DedupOptions& options
    );

    // Run every phase and write the outputs. Throws on any fatal error, leaving no partial outputs.
    void run();

    // Database file of the durable store
    static fs::path db_path(const fs::path& input, const DedupOptions& options);

    const DedupReport& get_report() const {return report;}
    const std::vector<DupGroup>& get_dup_groups() const {return dup_groups;}
};

#endif //UMIDEDUP_DEDUPLICATE_DEDUPLICATEWORKER_H
