// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <chrono>
#include <memory>
#include <boost/log/trivial.hpp>
#include <umidedup.hpp>
#include "AlignmentSource.hpp"
#include "LocationIndex.hpp"
#include "DedupReport.hpp"
#include "ReadGroupIngester.hpp"

ReadGroupIngester::ReadGroupIngester(
    umidedup::StoreEnvironment& env,
    umidedup::SimpleObjectStore<umidedup::ReadGroup>& read_groups,
    LocationIndex& locations,
    DedupReport& report,
    unsigned long long batch_size,
    bool paired
) :
    env(env),
    read_groups(read_groups),
    locations(locations),
    report(report),
    batch_size(batch_size),
    paired(paired),
    last_id(0)
{}

void ReadGroupIngester::check_collated(umidedup::ReadGroup const& read_group) const {
    if (!paired || read_group.size() != 1) {
        return;
    }
    // A lone alignment that claims a mapped mate means the mate is elsewhere in the file
    const unsigned flag = read_group[0].flag;
    if ((flag & umidedup::SAM_FLAG_PAIRED) && !(flag & umidedup::SAM_FLAG_MATE_UNMAPPED)) {
        throw umidedup::ParseError("input not collated by read name: mate of " + read_group.name() + " is not adjacent");
    }
}

void ReadGroupIngester::add(umidedup::Transaction& txn, umidedup::ReadGroup const& read_group) {
    check_collated(read_group);
    const std::string id = umidedup::zfill(++last_id, umidedup::READ_GROUP_ID_DIGITS);
    read_groups.put(txn, id, read_group);
    locations.append(txn, id, read_group);
}

unsigned long long ReadGroupIngester::run(AlignmentSource& source) {
    const auto t0 = std::chrono::steady_clock::now();
    auto commit = [&](umidedup::Transaction& txn) {
        txn.commit();
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t0;
        const auto [mem_current, mem_peak] = umidedup::memory_info();
        BOOST_LOG_TRIVIAL(info) << "Commit read group store at read group id = " << last_id
            << ", elapsed = " << elapsed.count() << "s"
            << ", memory (MB): current " << mem_current << ", peak " << mem_peak;
    };

    std::unique_ptr<umidedup::Transaction> txn = env.begin(true);
    unsigned long long in_batch = 0;
    umidedup::ReadGroup group;
    auto flush = [&]() {
        add(*txn, group);
        group.clear();
        if (++in_batch == batch_size) {
            commit(*txn);
            txn = env.begin(true);
            in_batch = 0;
        }
    };

    std::string line;
    while (source.next_line(line)) {
        if (line.empty() || line[0] == '@') {
            continue;
        }
        umidedup::Read read = umidedup::Read::parse(line);
        if (!group.empty() && read.qname != group.name()) {
            flush();
        }
        group.push_back(std::move(read));
    }
    if (!group.empty()) {
        flush();
    }
    commit(*txn);
    report.num_read_groups = last_id;
    return last_id;
}
