// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_READGROUPINGESTER_H
#define UMIDEDUP_DEDUPLICATE_READGROUPINGESTER_H

#include <string>
#include <umidedup.hpp>
#include "AlignmentSource.hpp"
#include "LocationIndex.hpp"
#include "DedupReport.hpp"

// First pass over the input: store every read group under a new id and index it by location
class ReadGroupIngester {
    umidedup::StoreEnvironment& env;
    umidedup::SimpleObjectStore<umidedup::ReadGroup>& read_groups;
    LocationIndex& locations;
    DedupReport& report;
    const unsigned long long batch_size;
    const bool paired;
    unsigned long long last_id;

    void check_collated(umidedup::ReadGroup const& read_group) const;
    void add(umidedup::Transaction& txn, umidedup::ReadGroup const& read_group);
public:
    ReadGroupIngester(
        umidedup::StoreEnvironment& env,
        umidedup::SimpleObjectStore<umidedup::ReadGroup>& read_groups,
        LocationIndex& locations,
        DedupReport& report,
        unsigned long long batch_size,
        bool paired
    );

    // Stream the source to the end, committing every batch_size read groups.
    //  Returns:
    //    The number of read groups stored
    //  Throws:
    //    ParseError if an alignment line is malformed or paired input is not collated by read name
    unsigned long long run(AlignmentSource& source);
};

#endif //UMIDEDUP_DEDUPLICATE_READGROUPINGESTER_H
