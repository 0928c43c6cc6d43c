// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_DUPLICATERESOLVER_H
#define UMIDEDUP_DEDUPLICATE_DUPLICATERESOLVER_H

#include <string>
#include <vector>
#include <set>
#include <random>
#include <unordered_map>
#include <umidedup.hpp>
#include "DedupOptions.hpp"
#include "DedupReport.hpp"
#include "LocationIndex.hpp"
#include "UmiErrorRecord.hpp"
#include "UmiMatcher.hpp"

// Read group ids sharing a location and UMI pair, in id order
typedef std::set<std::string> DupGroup;

// Collects DupGroups, merging any that share a member
class DupGroupIndex {
    std::vector<DupGroup> groups;
    std::unordered_map<std::string, std::size_t> group_of;
public:
    // Add a set of read group ids that are duplicates of each other.
    //  Throws:
    //    InvariantError if the ids already belong to two different DupGroups
    void add(std::vector<std::string> const& members);

    // Which DupGroup a read group belongs to, if any
    const DupGroup* find(std::string const& read_group_id) const;

    // Every DupGroup, ordered by smallest member
    std::vector<DupGroup> finalize() const;

    std::size_t size() const {return groups.size();}
};

// Finds DupGroups at each location and chooses which member of each to keep
class DuplicateResolver {
    umidedup::StoreEnvironment& env;
    umidedup::SimpleObjectStore<umidedup::ReadGroup>& read_groups;
    LocationIndex& locations;
    umidedup::SimpleObjectStore<UmiErrorRecord>& umi_errors;
    umidedup::BucketStore& losers;
    DedupReport& report;
    UmiMatcher matcher;
    const std::size_t n_mates;
    const bool reject_umi_errors;
    const bool correct_umis;
    const unsigned long long batch_size;
    const std::string seed;
    std::mt19937 rng;
    DupGroupIndex index;
    std::vector<DupGroup> dup_groups;

    void reseed();

    // Partition the read groups of one location by UMI pair, recording UMI errors
    //  Returns:
    //    The partitions with more than one member
    std::vector<std::vector<std::string>> process_location(umidedup::Transaction& txn, std::vector<std::string> const& read_group_ids);
public:
    DuplicateResolver(
        umidedup::StoreEnvironment& env,
        umidedup::SimpleObjectStore<umidedup::ReadGroup>& read_groups,
        LocationIndex& locations,
        umidedup::SimpleObjectStore<UmiErrorRecord>& umi_errors,
        umidedup::BucketStore& losers,
        DedupReport& report,
        DedupOptions const& options
    );

    // Scan every location and build the DupGroups
    void find_dup_groups();

    // Pick one member of each DupGroup at random to keep and store the rest as losers
    void choose_losers();

    // Finalized DupGroups, ordered by smallest member
    const std::vector<DupGroup>& get_dup_groups() const {return dup_groups;}
};

#endif //UMIDEDUP_DEDUPLICATE_DUPLICATERESOLVER_H
