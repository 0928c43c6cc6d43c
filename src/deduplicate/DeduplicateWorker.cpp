// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <filesystem>
#include <boost/log/trivial.hpp>
#include <umidedup.hpp>
#include "AlignmentSource.hpp"
#include "DedupOptions.hpp"
#include "DedupReport.hpp"
#include "DuplicateResolver.hpp"
#include "LocationIndex.hpp"
#include "OutputStreams.hpp"
#include "ReadGroupIngester.hpp"
#include "Reconciler.hpp"
#include "UmiErrorRecord.hpp"
#include "DeduplicateWorker.hpp"

namespace fs = std::filesystem;

namespace {
    const DedupOptions& validated(const DedupOptions& options) {
        options.validate();
        return options;
    }

    const fs::path& checked_input(const fs::path& input) {
        if (!fs::is_regular_file(input)) {
            throw umidedup::PrerequisiteError("input " + input.string() + " does not exist or is not a regular file");
        }
        return input;
    }

    std::unique_ptr<umidedup::StoreEnvironment> make_environment(const fs::path& input, const DedupOptions& options) {
        fs::create_directories(options.outdir);
        const umidedup::StoreKind kind = umidedup::store_kind_from_name(options.store);
        return umidedup::make_store_environment(kind, DeduplicateWorker::db_path(input, options).string(), options.keep_db);
    }

    void log_phase(std::string const& what, std::chrono::steady_clock::time_point t0) {
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - t0;
        const auto [mem_current, mem_peak] = umidedup::memory_info();
        BOOST_LOG_TRIVIAL(info) << what << " took " << elapsed.count() << "s, memory (MB): current " << mem_current << ", peak " << mem_peak;
    }
}

DeduplicateWorker::DeduplicateWorker(
    const std::vector<std::string>& cli,
    const fs::path& input,
    const DedupOptions& options
) :
    cli(cli),
    options(validated(options)),
    input(checked_input(input)),
    env(make_environment(input, options)),
    read_groups(env->open_table(TABLE_READ_GROUPS)),
    locations(env->open_table(TABLE_LOCATIONS), report),
    umi_errors(env->open_table(TABLE_UMI_ERRORS)),
    losers(env->open_table(TABLE_DUPLICATES))
{
    BOOST_LOG_TRIVIAL(debug) << "store " << options.store << " at " << db_path(input, options);
}

fs::path DeduplicateWorker::db_path(const fs::path& input, const DedupOptions& options) {
    return options.outdir / (input.filename().string() + ".umidedup.db");
}

void DeduplicateWorker::run() {
    auto t0 = std::chrono::steady_clock::now();
    {
        std::unique_ptr<AlignmentSource> source = open_alignment_source(input);
        ReadGroupIngester ingester(*env, read_groups, locations, report, options.batch_size, options.paired);
        ingester.run(*source);
    }
    log_phase("Building read group and location stores", t0);

    DuplicateResolver resolver(*env, read_groups, locations, umi_errors, losers, report, options);
    t0 = std::chrono::steady_clock::now();
    resolver.find_dup_groups();
    log_phase("Building duplicate groups", t0);

    t0 = std::chrono::steady_clock::now();
    resolver.choose_losers();
    dup_groups = resolver.get_dup_groups();
    log_phase("Building duplicate store", t0);

    // Outputs are only opened once the stores are complete
    OutputStreams out(input, options);
    Reconciler reconciler(*env, read_groups, umi_errors, losers, options, umidedup::shlexjoin(cli));

    t0 = std::chrono::steady_clock::now();
    reconciler.write_dup_groups(dup_groups, out.dup_groups.stream());
    log_phase("Writing duplicate group file", t0);

    t0 = std::chrono::steady_clock::now();
    {
        std::unique_ptr<AlignmentSource> source = open_alignment_source(input);
        reconciler.run(*source, out, report.num_read_groups);
    }
    log_phase("Writing output files", t0);

    for (auto const& [name, value] : report.entries()) {
        BOOST_LOG_TRIVIAL(info) << name << ": " << value;
    }
    out.report_txt.stream() << report;
    out.report_json.stream() << std::setw(4) << report.to_json(options.to_json()) << std::endl;
    out.commit();

    dump_stores(std::cerr);
}

void DeduplicateWorker::dump_stores(std::ostream& strm) {
    if (!(options.dump_rg_db || options.dump_loc_db || options.dump_dup_group_db || options.dump_dup_db || options.dump_umi_error_db)) {
        return;
    }
    std::unique_ptr<umidedup::Transaction> txn = env->begin(false);
    if (options.dump_rg_db) {
        strm << read_groups.get_name() << ":\n";
        read_groups.for_each(*txn, [&strm](std::string const& id, umidedup::ReadGroup const& read_group) {
            strm << id << ":\n" << read_group;
        });
    }
    if (options.dump_loc_db) {
        strm << locations.get_name() << ":\n";
        locations.for_each(*txn, [&strm](std::string const& key, std::vector<std::string> const& ids) {
            strm << key << '\t' << umidedup::strjoin(ids, ",") << '\n';
        });
    }
    if (options.dump_dup_group_db) {
        strm << "dup_group:\n";
        for (DupGroup const& group : dup_groups) {
            strm << umidedup::strjoin(group.cbegin(), group.cend(), ",") << '\n';
        }
    }
    if (options.dump_dup_db) {
        strm << losers.get_name() << ":\n";
        losers.for_each(*txn, [&strm](std::string const& name, std::vector<std::string> const&) {
            strm << name << '\n';
        });
    }
    if (options.dump_umi_error_db) {
        strm << umi_errors.get_name() << ":\n";
        umi_errors.for_each(*txn, [&strm](std::string const& name, UmiErrorRecord const& record) {
            strm << name << '\t' << record << '\n';
        });
    }
    strm << std::flush;
    txn->commit();
}
