// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_RECONCILER_H
#define UMIDEDUP_DEDUPLICATE_RECONCILER_H

#include <string>
#include <vector>
#include <ostream>
#include <umidedup.hpp>
#include "AlignmentSource.hpp"
#include "DedupOptions.hpp"
#include "DuplicateResolver.hpp"
#include "OutputStreams.hpp"
#include "UmiErrorRecord.hpp"

// Second pass over the input: route every read group to the output streams
class Reconciler {
    umidedup::StoreEnvironment& env;
    const umidedup::SimpleObjectStore<umidedup::ReadGroup>& read_groups;
    const umidedup::SimpleObjectStore<UmiErrorRecord>& umi_errors;
    const umidedup::BucketStore& losers;
    const bool reject_umi_errors;
    const bool write_sam_headers;
    const std::string pg_line;

    void write_header_line(OutputStreams& out, std::string const& line) const;
    void write_group(umidedup::Transaction& txn, OutputStreams& out, std::vector<std::string>& lines) const;
public:
    Reconciler(
        umidedup::StoreEnvironment& env,
        const umidedup::SimpleObjectStore<umidedup::ReadGroup>& read_groups,
        const umidedup::SimpleObjectStore<UmiErrorRecord>& umi_errors,
        const umidedup::BucketStore& losers,
        DedupOptions const& options,
        std::string command_line
    );

    // The @PG header line naming this program and its command line
    static std::string make_pg_line(std::string const& command_line);

    // Copy the input to the SAM streams, tagging UMI errors and flagging duplicates.
    //  Args:
    //    source: The same input the read group store was built from
    //    out: Destination streams
    //    expected_groups: Number of read groups found by the first pass
    //  Returns:
    //    The number of read groups written
    //  Throws:
    //    ParseError if the number of read groups differs from expected_groups
    unsigned long long run(AlignmentSource& source, OutputStreams& out, unsigned long long expected_groups) const;

    // Write the reads of each DupGroup, one per line, with a blank line after each group
    void write_dup_groups(std::vector<DupGroup> const& dup_groups, std::ostream& out) const;
};

#endif //UMIDEDUP_DEDUPLICATE_RECONCILER_H
