// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <ostream>
#include <boost/log/trivial.hpp>
#include <umidedup.hpp>
#include "AlignmentSource.hpp"
#include "DedupOptions.hpp"
#include "DuplicateResolver.hpp"
#include "OutputStreams.hpp"
#include "UmiErrorRecord.hpp"
#include "Reconciler.hpp"

Reconciler::Reconciler(
    umidedup::StoreEnvironment& env,
    const umidedup::SimpleObjectStore<umidedup::ReadGroup>& read_groups,
    const umidedup::SimpleObjectStore<UmiErrorRecord>& umi_errors,
    const umidedup::BucketStore& losers,
    DedupOptions const& options,
    std::string command_line
) :
    env(env),
    read_groups(read_groups),
    umi_errors(umi_errors),
    losers(losers),
    reject_umi_errors(options.reject_umi_errors),
    write_sam_headers(options.write_sam_headers),
    pg_line(make_pg_line(command_line))
{}

std::string Reconciler::make_pg_line(std::string const& command_line) {
    return std::string("@PG\tID:umidedup\tPN:umidedup\tVN:") + UMIDEDUP_VERSION_STR + "\tCL:" + command_line;
}

void Reconciler::write_header_line(OutputStreams& out, std::string const& line) const {
    if (!write_sam_headers) {
        return;
    }
    for (OutputFile* f : out.sam_files()) {
        f->stream() << line << '\n';
    }
}

void Reconciler::write_group(umidedup::Transaction& txn, OutputStreams& out, std::vector<std::string>& lines) const {
    const std::string name {umidedup::sam_qname(lines.front())};
    const std::optional<UmiErrorRecord> error = umi_errors.get(txn, name);
    if (error && !error->mates.empty()) {
        // Alignment lines alternate between the mates
        for (std::size_t i = 0; i < lines.size(); ++i) {
            lines[i] += umidedup::DELIM_SAM_FIELD;
            lines[i] += error->sam_tags(i % error->mates.size());
        }
    }
    if (losers.contains(txn, name)) {
        for (std::string const& line : lines) {
            const std::string flagged = umidedup::sam_set_flag(line, umidedup::SAM_FLAG_DUPLICATE);
            out.flagged.stream() << flagged << '\n';
            out.dup_only.stream() << flagged << '\n';
        }
    } else if (error && reject_umi_errors) {
        for (std::string const& line : lines) {
            out.umi_errors.stream() << line << '\n';
        }
    } else {
        for (std::string const& line : lines) {
            out.dedupped.stream() << line << '\n';
            out.flagged.stream() << line << '\n';
        }
    }
}

unsigned long long Reconciler::run(AlignmentSource& source, OutputStreams& out, unsigned long long expected_groups) const {
    std::unique_ptr<umidedup::Transaction> txn = env.begin(false);
    bool in_header = true;
    bool pg_written = false;
    unsigned long long groups = 0;
    std::vector<std::string> lines;
    std::string line;
    while (source.next_line(line)) {
        if (line.empty()) {
            continue;
        }
        if (line[0] == '@') {
            if (in_header) {
                write_header_line(out, line);
                if (!pg_written) {
                    write_header_line(out, pg_line);
                    pg_written = true;
                }
            }
            continue;
        }
        if (in_header) {
            in_header = false;
            if (!pg_written) {
                write_header_line(out, pg_line);
                pg_written = true;
            }
        }
        if (!lines.empty() && umidedup::sam_qname(line) != umidedup::sam_qname(lines.front())) {
            write_group(*txn, out, lines);
            lines.clear();
            ++groups;
        }
        lines.push_back(std::move(line));
    }
    if (!lines.empty()) {
        write_group(*txn, out, lines);
        ++groups;
    }
    if (!pg_written) {
        write_header_line(out, pg_line);
    }
    txn->commit();
    if (groups != expected_groups) {
        throw umidedup::ParseError("input changed between passes: found " + std::to_string(groups) + " read groups, expected " + std::to_string(expected_groups));
    }
    BOOST_LOG_TRIVIAL(info) << "Wrote " << groups << " read groups";
    return groups;
}

void Reconciler::write_dup_groups(std::vector<DupGroup> const& dup_groups, std::ostream& out) const {
    std::unique_ptr<umidedup::Transaction> txn = env.begin(false);
    for (DupGroup const& group : dup_groups) {
        for (std::string const& id : group) {
            std::optional<umidedup::ReadGroup> read_group = read_groups.get(*txn, id);
            if (!read_group) {
                throw umidedup::InvariantError("read group " + id + " is in a duplicate group but not in " + read_groups.get_name());
            }
            for (umidedup::Read const& read : *read_group) {
                out << read.serialize() << '\n';
            }
        }
        out << '\n';
    }
    txn->commit();
}
