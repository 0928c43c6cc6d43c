// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <boost/log/trivial.hpp>
#include <umidedup.hpp>
#include "DedupReport.hpp"
#include "LocationIndex.hpp"

LocationIndex::LocationIndex(std::unique_ptr<umidedup::KeyValueTable> table, DedupReport& report) :
    bucket(std::move(table)),
    report(report)
{}

bool LocationIndex::append(umidedup::Transaction& txn, std::string const& read_group_id, umidedup::ReadGroup const& read_group) {
    std::string key;
    try {
        key = umidedup::to_location_key(read_group);
    } catch (umidedup::HardClippingNotSupported const& e) {
        BOOST_LOG_TRIVIAL(warning) << "Skipping location of read group " << read_group_id << " (" << read_group.name() << "): " << e.what();
        ++report.num_dropped_hard_clipped;
        return false;
    }
    bucket.append(txn, key, read_group_id);
    return true;
}
