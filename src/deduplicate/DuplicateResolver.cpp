// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <map>
#include <set>
#include <random>
#include <chrono>
#include <memory>
#include <optional>
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <umidedup.hpp>
#include "DedupOptions.hpp"
#include "DedupReport.hpp"
#include "LocationIndex.hpp"
#include "UmiErrorRecord.hpp"
#include "UmiMatcher.hpp"
#include "DuplicateResolver.hpp"

void DupGroupIndex::add(std::vector<std::string> const& members) {
    std::set<std::size_t> existing;
    for (std::string const& id : members) {
        auto it = group_of.find(id);
        if (it != group_of.cend()) {
            existing.insert(it->second);
        }
    }
    if (existing.size() > 1) {
        throw umidedup::InvariantError("read groups " + umidedup::strjoin(members, ",") + " already belong to " + std::to_string(existing.size()) + " different duplicate groups");
    }
    std::size_t idx;
    if (existing.empty()) {
        idx = groups.size();
        groups.emplace_back();
    } else {
        idx = *existing.cbegin();
    }
    for (std::string const& id : members) {
        groups[idx].insert(id);
        group_of[id] = idx;
    }
}

const DupGroup* DupGroupIndex::find(std::string const& read_group_id) const {
    auto it = group_of.find(read_group_id);
    if (it == group_of.cend()) {
        return nullptr;
    }
    return &groups[it->second];
}

std::vector<DupGroup> DupGroupIndex::finalize() const {
    std::vector<DupGroup> result;
    for (DupGroup const& group : groups) {
        if (group.size() > 1) {
            result.push_back(group);
        }
    }
    std::sort(result.begin(), result.end(), [](DupGroup const& a, DupGroup const& b) {
        return *a.cbegin() < *b.cbegin();
    });
    return result;
}

DuplicateResolver::DuplicateResolver(
    umidedup::StoreEnvironment& env,
    umidedup::SimpleObjectStore<umidedup::ReadGroup>& read_groups,
    LocationIndex& locations,
    umidedup::SimpleObjectStore<UmiErrorRecord>& umi_errors,
    umidedup::BucketStore& losers,
    DedupReport& report,
    DedupOptions const& options
) :
    env(env),
    read_groups(read_groups),
    locations(locations),
    umi_errors(umi_errors),
    losers(losers),
    report(report),
    matcher(umidedup::Kit::by_name(options.kit)),
    n_mates(options.n_mates()),
    reject_umi_errors(options.reject_umi_errors),
    correct_umis(options.correct_umis),
    batch_size(options.batch_size),
    seed(options.random_seed)
{
    reseed();
}

void DuplicateResolver::reseed() {
    std::seed_seq seq(seed.cbegin(), seed.cend());
    rng.seed(seq);
}

std::vector<std::vector<std::string>> DuplicateResolver::process_location(umidedup::Transaction& txn, std::vector<std::string> const& read_group_ids) {
    // Keyed by the comma-joined (possibly corrected) UMIs of the mates
    std::map<std::string, std::vector<std::string>> partitions;
    for (std::string const& id : read_group_ids) {
        std::optional<umidedup::ReadGroup> read_group = read_groups.get(txn, id);
        if (!read_group) {
            throw umidedup::InvariantError("read group " + id + " is in the location index but not in " + read_groups.get_name());
        }
        const umidedup::Annotation anno = umidedup::Annotation::parse(read_group->name(), n_mates);
        std::vector<std::string> umis = anno.umis;
        UmiErrorRecord record;
        bool has_error = false;
        for (std::size_t m = 0; m < umis.size(); ++m) {
            const UmiMatch& match = matcher.match_umi(anno.umis[m]);
            UmiErrorRecord::Mate mate {match.distance, match.candidates.size(), ""};
            if (match.distance != 0) {
                has_error = true;
                if (correct_umis && match.is_correctable()) {
                    umis[m] = mate.corrected = match.candidates.front();
                }
            }
            record.mates.push_back(std::move(mate));
        }
        if (has_error) {
            umi_errors.put(txn, read_group->name(), record);
            report.record_umi_error(record.max_distance(), reject_umi_errors);
            if (reject_umi_errors) {
                continue;
            }
        }
        partitions[umidedup::strjoin(umis, ",")].push_back(id);
    }

    report.num_unique_umi_and_location_combinations += partitions.size();
    std::vector<std::vector<std::string>> result;
    for (auto& [umi_pair, members] : partitions) {
        if (members.size() > 1) {
            result.push_back(std::move(members));
        }
    }
    report.num_dup_groups += result.size();
    return result;
}

void DuplicateResolver::find_dup_groups() {
    // Location scan and UMI error records share one write transaction
    std::unique_ptr<umidedup::Transaction> txn = env.begin(true);
    locations.for_each(*txn, [&](std::string const& location_key, std::vector<std::string> const& read_group_ids) {
        ++report.num_locations;
        if (read_group_ids.size() == 1) {
            ++report.num_unique_umi_and_location_combinations;
            return;
        }
        for (std::vector<std::string> const& members : process_location(*txn, read_group_ids)) {
            index.add(members);
        }
    });
    txn->commit();
    dup_groups = index.finalize();
    BOOST_LOG_TRIVIAL(info) << "Found " << dup_groups.size() << " duplicate groups at " << report.num_locations << " locations";
}

void DuplicateResolver::choose_losers() {
    const auto t0 = std::chrono::steady_clock::now();
    reseed();
    unsigned long long count = 0;
    auto it = dup_groups.cbegin();
    while (it != dup_groups.cend()) {
        std::unique_ptr<umidedup::Transaction> txn = env.begin(true);
        for (unsigned long long in_batch = 0; it != dup_groups.cend() && in_batch < batch_size; ++it, ++in_batch, ++count) {
            const std::vector<std::string> members(it->cbegin(), it->cend());
            std::uniform_int_distribution<std::size_t> pick(0, members.size() - 1);
            const std::size_t winner = pick(rng);
            for (std::size_t i = 0; i < members.size(); ++i) {
                if (i == winner) {
                    continue;
                }
                std::optional<umidedup::ReadGroup> loser = read_groups.get(*txn, members[i]);
                if (!loser) {
                    throw umidedup::InvariantError("read group " + members[i] + " is in a duplicate group but not in " + read_groups.get_name());
                }
                losers.put(*txn, loser->name(), {});
            }
        }
        txn->commit();
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t0;
        const auto [mem_current, mem_peak] = umidedup::memory_info();
        BOOST_LOG_TRIVIAL(info) << "Commit duplicate store at duplicate group count = " << count
            << ", elapsed = " << elapsed.count() << "s"
            << ", memory (MB): current " << mem_current << ", peak " << mem_peak;
    }
}
