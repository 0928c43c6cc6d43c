// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_LOCATIONINDEX_H
#define UMIDEDUP_DEDUPLICATE_LOCATIONINDEX_H

#include <string>
#include <vector>
#include <memory>
#include <umidedup.hpp>
#include "DedupReport.hpp"

// Read group ids bucketed by the location key of the read group
class LocationIndex {
    umidedup::BucketStore bucket;
    DedupReport& report;
public:
    LocationIndex(std::unique_ptr<umidedup::KeyValueTable> table, DedupReport& report);

    // Add a read group under its location key. A read group with a hard clip
    // has no location; it is logged and counted in the report instead.
    //  Returns:
    //    true if the read group was indexed
    bool append(umidedup::Transaction& txn, std::string const& read_group_id, umidedup::ReadGroup const& read_group);

    template<typename Visitor>
    void for_each(umidedup::Transaction& txn, Visitor&& visitor) const {
        bucket.for_each(txn, std::forward<Visitor>(visitor));
    }

    std::size_t size(umidedup::Transaction& txn) const {
        return bucket.size(txn);
    }

    const std::string& get_name() const {
        return bucket.get_name();
    }
};

#endif //UMIDEDUP_DEDUPLICATE_LOCATIONINDEX_H
