// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <boost/test/unit_test.hpp>
#include <boost/log/trivial.hpp>
#include <fstream>
#include <filesystem>
#include <vector>
#include <string>
#include <set>
#include <utility>
#include <algorithm>
#include <climits>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include <bamtools/api/BamWriter.h>
#include <bamtools/api/BamAlignment.h>
#include <bamtools/api/BamAux.h>
#include <umidedup.hpp>
#include "AlignmentSource.hpp"
#include "DedupOptions.hpp"
#include "DedupReport.hpp"
#include "DeduplicateWorker.hpp"
#include "DuplicateResolver.hpp"
#include "LocationIndex.hpp"
#include "OutputStreams.hpp"
#include "ReadGroupIngester.hpp"
#include "Reconciler.hpp"
#include "UmiErrorRecord.hpp"
#include "UmiMatcher.hpp"

namespace fs = std::filesystem;

fs::path make_temp_filename(const std::string& suffix) {
    static char path[PATH_MAX+1] {};
    std::string templ = (fs::temp_directory_path() / ("tmpXXXXXX" + suffix)).string();
    int fd = mkstemps(templ.data(), suffix.length());
    if (fd == -1) {
        throw std::runtime_error("io error");
    }
    std::string link = "/proc/self/fd/" + std::to_string(fd);
    ssize_t len = readlink(link.c_str(), path, PATH_MAX);
    close(fd);
    if (len == -1) {
        throw std::runtime_error("io error");
    }
    path[len] = '\0';
    return path;
}

fs::path make_temp_dir() {
    fs::path dir = make_temp_filename(".d");
    fs::remove(dir);
    fs::create_directories(dir);
    return dir;
}

const std::string SAM_HEADER = "@HD\tVN:1.6\tSO:unsorted\n@SQ\tSN:chr1\tLN:10000\n";

// Known UMIs of the bioo kit
const std::string UMI_A = "AACGCCAT";
const std::string UMI_B = "AAGGTACG";
const std::string UMI_C = "CACACACA";
// One substitution from UMI_A and from no other known UMI
const std::string UMI_A_ERR = "AACGCCAA";

std::string anno_name(std::string const& name, std::string const& umi1, std::string const& umi2, int trim1 = 0, int trim2 = 0) {
    return name + "-" + umi1 + "^" + umi2 + ";" + std::to_string(trim1) + "^" + std::to_string(trim2);
}

std::string sam_line(std::string const& qname, unsigned flag, long long pos, std::string const& cigar, long long pnext, long long tlen) {
    return qname + "\t" + std::to_string(flag) + "\tchr1\t" + std::to_string(pos) + "\t60\t" + cigar + "\t=\t"
        + std::to_string(pnext) + "\t" + std::to_string(tlen) + "\tACGTACGTAC\tIIIIIIIIII";
}

// Properly paired forward/reverse mates
std::string pair_lines(std::string const& qname, long long pos1, long long pos2, std::string const& cigar = "10M") {
    return sam_line(qname, 99, pos1, cigar, pos2, pos2 - pos1 + 10) + "\n"
        + sam_line(qname, 147, pos2, cigar, pos1, pos1 - pos2 - 10) + "\n";
}

fs::path write_sam(std::string const& body, bool with_header = true) {
    fs::path path = make_temp_filename(".sam");
    std::ofstream file(path);
    if (with_header) {
        file << SAM_HEADER;
    }
    file << body;
    return path;
}

std::vector<std::string> read_lines(fs::path const& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> alignment_lines(fs::path const& path) {
    std::vector<std::string> lines;
    for (std::string const& line : read_lines(path)) {
        if (!line.empty() && line[0] != '@') {
            lines.push_back(line);
        }
    }
    return lines;
}

std::set<std::string> qnames(std::vector<std::string> const& lines) {
    std::set<std::string> names;
    for (std::string const& line : lines) {
        names.emplace(umidedup::sam_qname(line));
    }
    return names;
}

struct DedupRun {
    fs::path input;
    fs::path outdir;
    DedupReport report;
    std::vector<DupGroup> dup_groups;

    fs::path output(const char* suffix) const {
        return outdir / (output_root(input) + suffix);
    }
};

DedupRun run_dedup(fs::path const& input, DedupOptions options) {
    options.outdir = make_temp_dir();
    if (options.store == "sqlite") {
        options.store = "memory";
    }
    DeduplicateWorker worker({"umidedup", input.string()}, input, options);
    worker.run();
    return {input, options.outdir, worker.get_report(), worker.get_dup_groups()};
}

// Every record of a table, in key order
std::vector<std::pair<std::string, std::string>> snapshot(umidedup::StoreEnvironment& env, std::string const& name) {
    std::unique_ptr<umidedup::KeyValueTable> table = env.open_table(name);
    std::unique_ptr<umidedup::Transaction> txn = env.begin(false);
    std::vector<std::pair<std::string, std::string>> records;
    table->for_each(*txn, [&records](std::string const& key, std::string const& value) {
        records.emplace_back(key, value);
    });
    txn->commit();
    return records;
}

// UmiMatcher

BOOST_AUTO_TEST_CASE(test_umi_matcher_exact) {
    UmiMatcher matcher(umidedup::Kit::by_name("bioo"));
    const UmiMatch& match = matcher.match_umi(UMI_A);
    BOOST_CHECK_EQUAL(match.distance, 0);
    BOOST_REQUIRE_EQUAL(match.candidates.size(), 1);
    BOOST_CHECK_EQUAL(match.candidates[0], UMI_A);
    BOOST_CHECK(!match.is_correctable());
}

BOOST_AUTO_TEST_CASE(test_umi_matcher_one_substitution) {
    UmiMatcher matcher(umidedup::Kit::by_name("bioo"));
    const UmiMatch& match = matcher.match_umi(UMI_A_ERR);
    BOOST_CHECK_EQUAL(match.distance, 1);
    BOOST_REQUIRE_EQUAL(match.candidates.size(), 1);
    BOOST_CHECK_EQUAL(match.candidates[0], UMI_A);
    BOOST_CHECK(match.is_correctable());
}

BOOST_AUTO_TEST_CASE(test_umi_matcher_brute_force) {
    const umidedup::Kit& kit = umidedup::Kit::by_name("bioo");
    UmiMatcher matcher(kit);
    for (std::string const& umi : {"NNNNNNNN", "AAAAAAAA", "GGGGGGGG", "ACGTACGT", "TTTTCCCC", "CACACAGG"}) {
        int best = INT_MAX;
        std::vector<std::string> expected;
        for (std::string const& ref : kit.umis) {
            int d = 0;
            for (std::size_t i = 0; i < ref.size(); ++i) {
                d += ref[i] != umi[i];
            }
            if (d < best) {
                best = d;
                expected.clear();
            }
            if (d == best) {
                expected.push_back(ref);
            }
        }
        const UmiMatch& match = matcher.match_umi(umi);
        BOOST_TEST_CONTEXT("umi = " << umi) {
            BOOST_CHECK_EQUAL(match.distance, best);
            BOOST_CHECK_EQUAL_COLLECTIONS(match.candidates.cbegin(), match.candidates.cend(), expected.cbegin(), expected.cend());
        }
    }
}

BOOST_AUTO_TEST_CASE(test_umi_matcher_wrong_length) {
    UmiMatcher matcher(umidedup::Kit::by_name("bioo"));
    BOOST_CHECK_THROW(matcher.match_umi("AACGCCA"), umidedup::ParseError);
    BOOST_CHECK_THROW(matcher.match_umi("AACGCCATT"), umidedup::ParseError);
}

// UmiErrorRecord

BOOST_AUTO_TEST_CASE(test_umi_error_record) {
    UmiErrorRecord record {{{1, 1, UMI_A}, {0, 1, ""}}};
    BOOST_CHECK_EQUAL(record.max_distance(), 1);
    BOOST_CHECK_EQUAL(record.sam_tags(0), "d1:i:1\tn1:i:1\tc1:Z:" + UMI_A);
    BOOST_CHECK_EQUAL(record.sam_tags(1), "d2:i:0\tn2:i:1");
    BOOST_CHECK(UmiErrorRecord::deserialize(record.serialize()) == record);

    UmiErrorRecord uncorrected {{{3, 2, ""}}};
    BOOST_CHECK_EQUAL(uncorrected.sam_tags(0), "d1:i:3\tn1:i:2");
    BOOST_CHECK(UmiErrorRecord::deserialize(uncorrected.serialize()) == uncorrected);

    BOOST_CHECK_THROW(UmiErrorRecord::deserialize("1,1"), umidedup::StoreError);
    BOOST_CHECK_THROW(UmiErrorRecord::deserialize("x,1,"), umidedup::StoreError);
}

// DedupReport

BOOST_AUTO_TEST_CASE(test_dedup_report) {
    DedupReport report;
    report.record_umi_error(2, true);
    report.record_umi_error(1, false);
    BOOST_CHECK_EQUAL(report.num_read_groups_with_umi_error, 2);
    BOOST_CHECK_EQUAL(report.num_read_groups_with_umi_error_dist[0], 1);
    BOOST_CHECK_EQUAL(report.num_read_groups_with_umi_error_dist[1], 1);
    BOOST_CHECK_EQUAL(report.num_read_groups_rejected_due_to_umi_error_dist[1], 1);
    BOOST_CHECK_EQUAL(report.num_read_groups_rejected_due_to_umi_error_dist[0], 0);
    BOOST_CHECK_THROW(report.record_umi_error(0, false), umidedup::InvariantError);
    BOOST_CHECK_THROW(report.record_umi_error(MAX_UMI_DISTANCE + 1, false), umidedup::InvariantError);

    auto entries = report.entries();
    BOOST_CHECK_EQUAL(entries.size(), 6 + 2 * MAX_UMI_DISTANCE);
    BOOST_CHECK(std::is_sorted(entries.cbegin(), entries.cend()));

    nlohmann::ordered_json json = report.to_json({{"store", "memory"}});
    BOOST_CHECK_EQUAL(json["counts"]["num_read_groups_with_umi_error"].get<unsigned long long>(), 2);
    BOOST_CHECK_EQUAL(json["counts"]["num_read_groups_with_umi_error_dist"].size(), MAX_UMI_DISTANCE);
    BOOST_CHECK_EQUAL(json["config"]["store"].get<std::string>(), "memory");
}

// DupGroupIndex

BOOST_AUTO_TEST_CASE(test_dup_group_index) {
    DupGroupIndex index;
    index.add({"0000000005", "0000000006"});
    index.add({"0000000001", "0000000002"});
    index.add({"0000000002", "0000000003"});
    BOOST_CHECK_EQUAL(index.size(), 2);
    BOOST_REQUIRE(index.find("0000000003") != nullptr);
    BOOST_CHECK(index.find("0000000003") == index.find("0000000001"));
    BOOST_CHECK(index.find("0000000004") == nullptr);

    std::vector<DupGroup> groups = index.finalize();
    BOOST_REQUIRE_EQUAL(groups.size(), 2);
    BOOST_CHECK(groups[0] == (DupGroup {"0000000001", "0000000002", "0000000003"}));
    BOOST_CHECK(groups[1] == (DupGroup {"0000000005", "0000000006"}));

    // A read group may not join two existing DupGroups
    BOOST_CHECK_THROW(index.add({"0000000003", "0000000006"}), umidedup::InvariantError);
}

// DedupOptions

BOOST_AUTO_TEST_CASE(test_options_validate) {
    DedupOptions options;
    BOOST_CHECK_NO_THROW(options.validate());
    BOOST_CHECK_EQUAL(options.n_mates(), 2);
    BOOST_CHECK_EQUAL(options.random_seed, "Little Ashes");

    DedupOptions both = options;
    both.correct_umis = true;
    BOOST_CHECK_THROW(both.validate(), umidedup::ConfigurationError);
    both.reject_umi_errors = false;
    BOOST_CHECK_NO_THROW(both.validate());

    DedupOptions kit = options;
    kit.kit = "nextflex-v2";
    BOOST_CHECK_THROW(kit.validate(), umidedup::ConfigurationError);
    kit.kit = "BIOO";
    BOOST_CHECK_NO_THROW(kit.validate());

    DedupOptions store = options;
    store.store = "lmdb";
    BOOST_CHECK_THROW(store.validate(), umidedup::ConfigurationError);

    DedupOptions batch = options;
    batch.batch_size = 0;
    BOOST_CHECK_THROW(batch.validate(), umidedup::ConfigurationError);
}

BOOST_AUTO_TEST_CASE(test_worker_rejects_bad_configuration_before_io) {
    fs::path outdir = make_temp_dir() / "not_created";
    DedupOptions options;
    options.outdir = outdir;
    options.correct_umis = true;
    BOOST_CHECK_THROW(DeduplicateWorker({"umidedup", "missing.sam"}, "missing.sam", options), umidedup::ConfigurationError);
    BOOST_CHECK(!fs::exists(outdir));

    options.correct_umis = false;
    BOOST_CHECK_THROW(DeduplicateWorker({"umidedup", "missing.sam"}, "missing.sam", options), umidedup::PrerequisiteError);
    BOOST_CHECK(!fs::exists(outdir));
}

// OutputStreams

BOOST_AUTO_TEST_CASE(test_output_root) {
    BOOST_CHECK_EQUAL(output_root("/data/sample1.sam"), "sample1");
    BOOST_CHECK_EQUAL(output_root("/data/sample1.bam"), "sample1");
    BOOST_CHECK_EQUAL(output_root("sample1.aligned.sam"), "sample1.aligned");
    BOOST_CHECK_EQUAL(output_root("sample1.txt"), "sample1.txt");
}

BOOST_AUTO_TEST_CASE(test_output_file_commit_and_abandon) {
    fs::path dir = make_temp_dir();
    {
        OutputFile kept(dir / "kept.txt", true);
        OutputFile abandoned(dir / "abandoned.txt", true);
        OutputFile disabled(dir / "disabled.txt", false);
        kept.stream() << "kept\n";
        abandoned.stream() << "abandoned\n";
        disabled.stream() << "disabled\n";
        BOOST_CHECK(fs::exists(dir / "kept.txt.tmp"));
        BOOST_CHECK(!fs::exists(dir / "kept.txt"));
        kept.commit();
        disabled.commit();
    }
    BOOST_CHECK(fs::exists(dir / "kept.txt"));
    BOOST_CHECK(!fs::exists(dir / "kept.txt.tmp"));
    BOOST_CHECK(!fs::exists(dir / "abandoned.txt"));
    BOOST_CHECK(!fs::exists(dir / "abandoned.txt.tmp"));
    BOOST_CHECK(!fs::exists(dir / "disabled.txt"));
    BOOST_CHECK(!fs::exists(dir / "disabled.txt.tmp"));
    std::vector<std::string> lines = read_lines(dir / "kept.txt");
    BOOST_REQUIRE_EQUAL(lines.size(), 1);
    BOOST_CHECK_EQUAL(lines[0], "kept");
}

// Ingestion

BOOST_AUTO_TEST_CASE(test_ingest_batch_boundaries) {
    std::string body;
    for (int i = 0; i < 7; ++i) {
        // Groups 0, 2 and 4 share a location
        long long pos = i % 2 == 0 && i < 6 ? 100 : 1000 + 100 * i;
        body += pair_lines(anno_name("read" + std::to_string(i), UMI_A, UMI_B), pos, pos + 200);
    }
    fs::path input = write_sam(body);

    std::vector<std::vector<std::pair<std::string, std::string>>> read_group_tables, location_tables;
    for (unsigned long long batch_size : {1ull, 3ull, 7ull, 100ull}) {
        fs::path db = make_temp_filename(".sqlite");
        umidedup::SqliteEnvironment env {db};
        DedupReport report;
        umidedup::SimpleObjectStore<umidedup::ReadGroup> read_groups(env.open_table(TABLE_READ_GROUPS));
        LocationIndex locations(env.open_table(TABLE_LOCATIONS), report);
        ReadGroupIngester ingester(env, read_groups, locations, report, batch_size, true);
        std::unique_ptr<AlignmentSource> source = open_alignment_source(input);
        BOOST_CHECK_EQUAL(ingester.run(*source), 7);
        BOOST_CHECK_EQUAL(report.num_read_groups, 7);
        read_group_tables.push_back(snapshot(env, TABLE_READ_GROUPS));
        location_tables.push_back(snapshot(env, TABLE_LOCATIONS));
    }
    BOOST_REQUIRE_EQUAL(read_group_tables[0].size(), 7);
    BOOST_CHECK_EQUAL(read_group_tables[0].front().first, "0000000001");
    BOOST_CHECK_EQUAL(read_group_tables[0].back().first, "0000000007");
    BOOST_REQUIRE_EQUAL(location_tables[0].size(), 5);
    BOOST_CHECK_EQUAL(location_tables[0].front().first, "chr1:100:+,chr1:309:-");
    BOOST_CHECK_EQUAL(location_tables[0].front().second, "0000000001,0000000003,0000000005");
    for (std::size_t i = 1; i < read_group_tables.size(); ++i) {
        BOOST_CHECK(read_group_tables[i] == read_group_tables[0]);
        BOOST_CHECK(location_tables[i] == location_tables[0]);
    }
}

BOOST_AUTO_TEST_CASE(test_ingest_not_collated) {
    const std::string a = anno_name("readA", UMI_A, UMI_B), b = anno_name("readB", UMI_A, UMI_B);
    fs::path input = write_sam(
        sam_line(a, 99, 100, "10M", 300, 210) + "\n" +
        sam_line(b, 99, 500, "10M", 700, 210) + "\n" +
        sam_line(a, 147, 300, "10M", 100, -210) + "\n" +
        sam_line(b, 147, 700, "10M", 500, -210) + "\n"
    );
    umidedup::MemoryEnvironment env;
    DedupReport report;
    umidedup::SimpleObjectStore<umidedup::ReadGroup> read_groups(env.open_table(TABLE_READ_GROUPS));
    LocationIndex locations(env.open_table(TABLE_LOCATIONS), report);
    ReadGroupIngester ingester(env, read_groups, locations, report, 10, true);
    std::unique_ptr<AlignmentSource> source = open_alignment_source(input);
    BOOST_CHECK_THROW(ingester.run(*source), umidedup::ParseError);

    // The same layout is fine single-end: every line is its own read group
    DedupOptions options;
    options.paired = false;
    fs::path single = write_sam(
        sam_line("readA-" + UMI_A + ";0", 0, 100, "10M", 0, 0) + "\n"
    );
    BOOST_CHECK_NO_THROW(run_dedup(single, options));
}

// End to end

BOOST_AUTO_TEST_CASE(test_dedup_pair_duplicates) {
    const std::string a = anno_name("readA", UMI_A, UMI_B);
    const std::string b = anno_name("readB", UMI_A, UMI_B);
    const std::string c = anno_name("readC", UMI_A, UMI_B);
    fs::path input = write_sam(pair_lines(a, 100, 300) + pair_lines(b, 100, 300) + pair_lines(c, 500, 700));
    DedupOptions options;
    options.write_flagged_sam = true;
    DedupRun run = run_dedup(input, options);

    BOOST_CHECK_EQUAL(run.report.num_read_groups, 3);
    BOOST_CHECK_EQUAL(run.report.num_locations, 2);
    BOOST_CHECK_EQUAL(run.report.num_unique_umi_and_location_combinations, 2);
    BOOST_CHECK_EQUAL(run.report.num_dup_groups, 1);
    BOOST_CHECK_EQUAL(run.report.num_read_groups_with_umi_error, 0);
    BOOST_REQUIRE_EQUAL(run.dup_groups.size(), 1);
    BOOST_CHECK(run.dup_groups[0] == (DupGroup {"0000000001", "0000000002"}));

    std::vector<std::string> dedupped = alignment_lines(run.output(SUFFIX_DEDUPPED_SAM));
    BOOST_REQUIRE_EQUAL(dedupped.size(), 4);
    std::set<std::string> kept = qnames(dedupped);
    BOOST_CHECK_EQUAL(kept.size(), 2);
    BOOST_CHECK(kept.contains(c));
    BOOST_CHECK(kept.contains(a) != kept.contains(b));
    const std::string loser = kept.contains(a) ? b : a;

    std::vector<std::string> dup_only = alignment_lines(run.output(SUFFIX_DUP_ONLY_SAM));
    BOOST_REQUIRE_EQUAL(dup_only.size(), 2);
    BOOST_CHECK(qnames(dup_only) == std::set<std::string> {loser});
    BOOST_CHECK_EQUAL(umidedup::Read::parse(dup_only[0]).flag, 99u | umidedup::SAM_FLAG_DUPLICATE);
    BOOST_CHECK_EQUAL(umidedup::Read::parse(dup_only[1]).flag, 147u | umidedup::SAM_FLAG_DUPLICATE);

    std::vector<std::string> flagged = alignment_lines(run.output(SUFFIX_FLAGGED_SAM));
    BOOST_REQUIRE_EQUAL(flagged.size(), 6);
    for (std::string const& line : flagged) {
        umidedup::Read read = umidedup::Read::parse(line);
        BOOST_CHECK_EQUAL(bool(read.flag & umidedup::SAM_FLAG_DUPLICATE), read.qname == loser);
    }

    // Headers are copied with the @PG line after the first one
    std::vector<std::string> lines = read_lines(run.output(SUFFIX_DEDUPPED_SAM));
    BOOST_REQUIRE_GE(lines.size(), 3);
    BOOST_CHECK_EQUAL(lines[0], "@HD\tVN:1.6\tSO:unsorted");
    BOOST_CHECK_EQUAL(lines[1], Reconciler::make_pg_line("umidedup " + input.string()));
    BOOST_CHECK_EQUAL(lines[2], "@SQ\tSN:chr1\tLN:10000");

    // Both members of the group, then a blank line
    std::vector<std::string> dump = read_lines(run.output(SUFFIX_DUP_GROUPS));
    BOOST_REQUIRE_EQUAL(dump.size(), 5);
    BOOST_CHECK_EQUAL(umidedup::Read::parse(dump[0]).qname, a);
    BOOST_CHECK_EQUAL(umidedup::Read::parse(dump[2]).qname, b);
    BOOST_CHECK_EQUAL(dump[4], "");

    BOOST_CHECK(alignment_lines(run.output(SUFFIX_UMI_ERROR_SAM)).empty());
    BOOST_CHECK(fs::exists(run.output(SUFFIX_REPORT_TXT)));
    std::ifstream json_file(run.output(SUFFIX_REPORT_JSON));
    nlohmann::json json = nlohmann::json::parse(json_file);
    BOOST_CHECK_EQUAL(json["counts"]["num_dup_groups"].get<unsigned long long>(), 1);
    BOOST_CHECK_EQUAL(json["config"]["store"].get<std::string>(), "memory");
    BOOST_CHECK_EQUAL(json["config"]["kit"].get<std::string>(), "bioo");
    BOOST_CHECK_EQUAL(json["config"]["kit_clip_length"].get<std::size_t>(), 9u);

    // No temporaries and no database are left behind
    for (auto const& entry : fs::directory_iterator(run.outdir)) {
        BOOST_CHECK_NE(entry.path().extension().string(), ".tmp");
        BOOST_CHECK_NE(entry.path().extension().string(), ".db");
    }
}

BOOST_AUTO_TEST_CASE(test_dedup_sqlite_matches_memory) {
    std::string body;
    for (int i = 0; i < 12; ++i) {
        body += pair_lines(anno_name("read" + std::to_string(i), i % 3 ? UMI_A : UMI_C, UMI_B), 100 + 50 * (i % 4), 400);
    }
    fs::path input = write_sam(body);
    DedupOptions options;
    options.write_flagged_sam = true;
    options.batch_size = 2;
    DedupRun memory = run_dedup(input, options);

    fs::path outdir = make_temp_dir();
    options.outdir = outdir;
    options.store = "sqlite";
    {
        DeduplicateWorker worker({"umidedup", input.string()}, input, options);
        worker.run();
        BOOST_CHECK_EQUAL(worker.get_report().num_dup_groups, memory.report.num_dup_groups);
        BOOST_CHECK(worker.get_dup_groups() == memory.dup_groups);
    }
    BOOST_CHECK(!fs::exists(DeduplicateWorker::db_path(input, options)));
    const std::string root = output_root(input);
    BOOST_CHECK(read_lines(outdir / (root + SUFFIX_FLAGGED_SAM)) == read_lines(memory.output(SUFFIX_FLAGGED_SAM)));
    BOOST_CHECK(read_lines(outdir / (root + SUFFIX_DUP_GROUPS)) == read_lines(memory.output(SUFFIX_DUP_GROUPS)));

    options.keep_db = true;
    {
        DeduplicateWorker worker({"umidedup", input.string()}, input, options);
        worker.run();
    }
    BOOST_CHECK(fs::exists(DeduplicateWorker::db_path(input, options)));
}

BOOST_AUTO_TEST_CASE(test_dedup_deterministic_winner) {
    std::string body;
    for (int i = 0; i < 40; ++i) {
        body += pair_lines(anno_name("read" + std::to_string(i), UMI_A, UMI_B), 100 + 1000 * (i % 5), 400 + 1000 * (i % 5));
    }
    fs::path input = write_sam(body);
    DedupOptions options;
    DedupRun first = run_dedup(input, options);
    DedupRun second = run_dedup(input, options);
    BOOST_CHECK_EQUAL(first.report.num_dup_groups, 5);
    std::vector<std::string> dups = alignment_lines(first.output(SUFFIX_DUP_ONLY_SAM));
    BOOST_CHECK_EQUAL(dups.size(), 2 * 35);
    BOOST_CHECK(dups == alignment_lines(second.output(SUFFIX_DUP_ONLY_SAM)));
    BOOST_CHECK(alignment_lines(first.output(SUFFIX_DEDUPPED_SAM)) == alignment_lines(second.output(SUFFIX_DEDUPPED_SAM)));
}

BOOST_AUTO_TEST_CASE(test_dedup_umi_error_rejected) {
    const std::string good = anno_name("good", UMI_A, UMI_B);
    const std::string bad = anno_name("bad", UMI_A_ERR, UMI_B);
    fs::path input = write_sam(pair_lines(good, 100, 300) + pair_lines(bad, 100, 300));
    DedupRun run = run_dedup(input, DedupOptions {});

    BOOST_CHECK_EQUAL(run.report.num_read_groups_with_umi_error, 1);
    BOOST_CHECK_EQUAL(run.report.num_read_groups_with_umi_error_dist[0], 1);
    BOOST_CHECK_EQUAL(run.report.num_read_groups_rejected_due_to_umi_error_dist[0], 1);
    BOOST_CHECK_EQUAL(run.report.num_unique_umi_and_location_combinations, 1);
    BOOST_CHECK_EQUAL(run.report.num_dup_groups, 0);

    std::vector<std::string> dedupped = alignment_lines(run.output(SUFFIX_DEDUPPED_SAM));
    BOOST_CHECK(qnames(dedupped) == std::set<std::string> {good});
    std::vector<std::string> rejects = alignment_lines(run.output(SUFFIX_UMI_ERROR_SAM));
    BOOST_REQUIRE_EQUAL(rejects.size(), 2);
    BOOST_CHECK_EQUAL(rejects[0], sam_line(bad, 99, 100, "10M", 300, 210) + "\td1:i:1\tn1:i:1\td2:i:0\tn2:i:1");
    BOOST_CHECK_EQUAL(rejects[1], sam_line(bad, 147, 300, "10M", 100, -210) + "\td1:i:1\tn1:i:1\td2:i:0\tn2:i:1");
}

BOOST_AUTO_TEST_CASE(test_dedup_umi_error_corrected) {
    const std::string good = anno_name("good", UMI_A, UMI_B);
    const std::string bad = anno_name("bad", UMI_A_ERR, UMI_B);
    fs::path input = write_sam(pair_lines(good, 100, 300) + pair_lines(bad, 100, 300));
    DedupOptions options;
    options.reject_umi_errors = false;
    options.correct_umis = true;
    options.write_flagged_sam = true;
    DedupRun run = run_dedup(input, options);

    BOOST_CHECK_EQUAL(run.report.num_read_groups_with_umi_error, 1);
    BOOST_CHECK_EQUAL(run.report.num_read_groups_with_umi_error_dist[0], 1);
    BOOST_CHECK_EQUAL(run.report.num_read_groups_rejected_due_to_umi_error_dist[0], 0);
    BOOST_CHECK_EQUAL(run.report.num_dup_groups, 1);
    BOOST_CHECK(alignment_lines(run.output(SUFFIX_UMI_ERROR_SAM)).empty());

    // Only the corrected mate carries the corrected UMI
    std::vector<std::string> bad_lines;
    for (std::string const& line : alignment_lines(run.output(SUFFIX_FLAGGED_SAM))) {
        if (umidedup::sam_qname(line) == bad) {
            bad_lines.push_back(line);
        }
    }
    BOOST_REQUIRE_EQUAL(bad_lines.size(), 2);
    BOOST_CHECK(bad_lines[0].ends_with("\td1:i:1\tn1:i:1\tc1:Z:" + UMI_A));
    BOOST_CHECK(bad_lines[1].ends_with("\td2:i:0\tn2:i:1"));
}

BOOST_AUTO_TEST_CASE(test_dedup_umi_error_kept) {
    const std::string good = anno_name("good", UMI_A, UMI_B);
    const std::string bad = anno_name("bad", UMI_A_ERR, UMI_B);
    fs::path input = write_sam(pair_lines(good, 100, 300) + pair_lines(bad, 100, 300));
    DedupOptions options;
    options.reject_umi_errors = false;
    DedupRun run = run_dedup(input, options);

    BOOST_CHECK_EQUAL(run.report.num_read_groups_with_umi_error, 1);
    BOOST_CHECK_EQUAL(run.report.num_unique_umi_and_location_combinations, 2);
    BOOST_CHECK_EQUAL(run.report.num_dup_groups, 0);
    std::vector<std::string> dedupped = alignment_lines(run.output(SUFFIX_DEDUPPED_SAM));
    BOOST_CHECK(qnames(dedupped) == (std::set<std::string> {good, bad}));
    for (std::string const& line : dedupped) {
        BOOST_CHECK(line.find("\tc1:Z:") == std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(test_dedup_hard_clip_dropped) {
    const std::string clipped = anno_name("clipped", UMI_A, UMI_B);
    const std::string plain = anno_name("plain", UMI_A, UMI_B);
    fs::path input = write_sam(pair_lines(clipped, 100, 300, "2H8M") + pair_lines(plain, 100, 300));
    DedupRun run = run_dedup(input, DedupOptions {});

    BOOST_CHECK_EQUAL(run.report.num_read_groups, 2);
    BOOST_CHECK_EQUAL(run.report.num_dropped_hard_clipped, 1);
    BOOST_CHECK_EQUAL(run.report.num_locations, 1);
    BOOST_CHECK_EQUAL(run.report.num_dup_groups, 0);
    BOOST_CHECK(qnames(alignment_lines(run.output(SUFFIX_DEDUPPED_SAM))) == (std::set<std::string> {clipped, plain}));
}

BOOST_AUTO_TEST_CASE(test_dedup_unmapped_mate) {
    const std::string half = anno_name("half", UMI_A, UMI_B);
    const std::string both = anno_name("both", UMI_A, UMI_B);
    fs::path input = write_sam(
        sam_line(half, 73, 100, "10M", 100, 0) + "\n" +
        sam_line(half, 133, 100, "*", 100, 0) + "\n" +
        pair_lines(both, 100, 300)
    );
    DedupRun run = run_dedup(input, DedupOptions {});
    BOOST_CHECK_EQUAL(run.report.num_read_groups, 2);
    BOOST_CHECK_EQUAL(run.report.num_locations, 2);
    BOOST_CHECK_EQUAL(run.report.num_dup_groups, 0);
    std::vector<std::string> dedupped = alignment_lines(run.output(SUFFIX_DEDUPPED_SAM));
    BOOST_CHECK_EQUAL(dedupped.size(), 4);
    BOOST_CHECK(qnames(dedupped) == (std::set<std::string> {half, both}));
}

std::string single_name(std::string const& name, std::string const& umi, int trim = 0) {
    return name + "-" + umi + ";" + std::to_string(trim);
}

BOOST_AUTO_TEST_CASE(test_dedup_single_end_duplicates) {
    const std::string a = single_name("readA", UMI_A);
    const std::string b = single_name("readB", UMI_A);
    const std::string c = single_name("readC", UMI_A);
    const std::string d = single_name("readD", UMI_C);
    fs::path input = write_sam(
        sam_line(a, 0, 100, "10M", 0, 0) + "\n" +
        sam_line(b, 0, 100, "10M", 0, 0) + "\n" +
        sam_line(c, 16, 100, "10M", 0, 0) + "\n" +
        sam_line(d, 0, 100, "10M", 0, 0) + "\n"
    );
    DedupOptions options;
    options.paired = false;
    DedupRun run = run_dedup(input, options);

    // c is on the other strand; d carries another UMI
    BOOST_CHECK_EQUAL(run.report.num_read_groups, 4);
    BOOST_CHECK_EQUAL(run.report.num_locations, 2);
    BOOST_CHECK_EQUAL(run.report.num_unique_umi_and_location_combinations, 3);
    BOOST_CHECK_EQUAL(run.report.num_dup_groups, 1);
    BOOST_REQUIRE_EQUAL(run.dup_groups.size(), 1);
    BOOST_CHECK(run.dup_groups[0] == (DupGroup {"0000000001", "0000000002"}));

    std::set<std::string> kept = qnames(alignment_lines(run.output(SUFFIX_DEDUPPED_SAM)));
    BOOST_CHECK_EQUAL(kept.size(), 3);
    BOOST_CHECK(kept.contains(c));
    BOOST_CHECK(kept.contains(d));
    BOOST_CHECK(kept.contains(a) != kept.contains(b));

    std::vector<std::string> dups = alignment_lines(run.output(SUFFIX_DUP_ONLY_SAM));
    BOOST_REQUIRE_EQUAL(dups.size(), 1);
    BOOST_CHECK_EQUAL(umidedup::sam_qname(dups[0]), kept.contains(a) ? b : a);
    BOOST_CHECK_EQUAL(umidedup::Read::parse(dups[0]).flag, umidedup::SAM_FLAG_DUPLICATE);
}

BOOST_AUTO_TEST_CASE(test_dedup_single_end_umi_error) {
    const std::string good = single_name("good", UMI_A);
    const std::string bad = single_name("bad", UMI_A_ERR);
    fs::path input = write_sam(
        sam_line(good, 0, 100, "10M", 0, 0) + "\n" +
        sam_line(bad, 0, 100, "10M", 0, 0) + "\n"
    );
    DedupOptions options;
    options.paired = false;
    DedupRun rejected = run_dedup(input, options);

    BOOST_CHECK_EQUAL(rejected.report.num_read_groups_with_umi_error, 1);
    BOOST_CHECK_EQUAL(rejected.report.num_read_groups_with_umi_error_dist[0], 1);
    BOOST_CHECK_EQUAL(rejected.report.num_read_groups_rejected_due_to_umi_error_dist[0], 1);
    BOOST_CHECK_EQUAL(rejected.report.num_dup_groups, 0);
    BOOST_CHECK(qnames(alignment_lines(rejected.output(SUFFIX_DEDUPPED_SAM))) == std::set<std::string> {good});
    std::vector<std::string> rejects = alignment_lines(rejected.output(SUFFIX_UMI_ERROR_SAM));
    BOOST_REQUIRE_EQUAL(rejects.size(), 1);
    BOOST_CHECK_EQUAL(rejects[0], sam_line(bad, 0, 100, "10M", 0, 0) + "\td1:i:1\tn1:i:1");

    options.reject_umi_errors = false;
    options.correct_umis = true;
    options.write_flagged_sam = true;
    DedupRun corrected = run_dedup(input, options);
    BOOST_CHECK_EQUAL(corrected.report.num_read_groups_rejected_due_to_umi_error_dist[0], 0);
    BOOST_CHECK_EQUAL(corrected.report.num_dup_groups, 1);
    BOOST_CHECK(alignment_lines(corrected.output(SUFFIX_UMI_ERROR_SAM)).empty());
    bool found = false;
    for (std::string const& line : alignment_lines(corrected.output(SUFFIX_FLAGGED_SAM))) {
        if (umidedup::sam_qname(line) == bad) {
            found = true;
            BOOST_CHECK(line.ends_with("\td1:i:1\tn1:i:1\tc1:Z:" + UMI_A));
        }
    }
    BOOST_CHECK(found);
}

BOOST_AUTO_TEST_CASE(test_dedup_trim_shifts_location) {
    // Trimmed reads start further out, so these two land on the same location
    const std::string trimmed = anno_name("trimmed", UMI_A, UMI_B, 2, 3);
    const std::string untrimmed = anno_name("untrimmed", UMI_A, UMI_B);
    fs::path input = write_sam(pair_lines(trimmed, 102, 297) + pair_lines(untrimmed, 100, 300));
    DedupRun run = run_dedup(input, DedupOptions {});
    BOOST_CHECK_EQUAL(run.report.num_locations, 1);
    BOOST_CHECK_EQUAL(run.report.num_dup_groups, 1);
}

BOOST_AUTO_TEST_CASE(test_dedup_headers) {
    const std::string a = anno_name("readA", UMI_A, UMI_B);
    fs::path input = write_sam(pair_lines(a, 100, 300), false);
    DedupRun run = run_dedup(input, DedupOptions {});
    std::vector<std::string> lines = read_lines(run.output(SUFFIX_DEDUPPED_SAM));
    BOOST_REQUIRE_EQUAL(lines.size(), 3);
    BOOST_CHECK(lines[0].starts_with("@PG\tID:umidedup\tPN:umidedup\tVN:"));

    DedupOptions options;
    options.write_sam_headers = false;
    fs::path with_header = write_sam(pair_lines(a, 100, 300));
    run = run_dedup(with_header, options);
    lines = read_lines(run.output(SUFFIX_DEDUPPED_SAM));
    BOOST_REQUIRE_EQUAL(lines.size(), 2);
    BOOST_CHECK_EQUAL(umidedup::sam_qname(lines[0]), a);
}

BOOST_AUTO_TEST_CASE(test_dedup_disabled_outputs) {
    const std::string a = anno_name("readA", UMI_A, UMI_B);
    fs::path input = write_sam(pair_lines(a, 100, 300));
    DedupOptions options;
    options.write_dedupped_sam = false;
    options.write_dup_only_sam = false;
    options.write_dup_group_file = false;
    options.write_umi_error_sam = false;
    DedupRun run = run_dedup(input, options);
    BOOST_CHECK(!fs::exists(run.output(SUFFIX_DEDUPPED_SAM)));
    BOOST_CHECK(!fs::exists(run.output(SUFFIX_FLAGGED_SAM)));
    BOOST_CHECK(!fs::exists(run.output(SUFFIX_DUP_ONLY_SAM)));
    BOOST_CHECK(!fs::exists(run.output(SUFFIX_DUP_GROUPS)));
    BOOST_CHECK(!fs::exists(run.output(SUFFIX_UMI_ERROR_SAM)));
    BOOST_CHECK(fs::exists(run.output(SUFFIX_REPORT_TXT)));
    BOOST_CHECK(fs::exists(run.output(SUFFIX_REPORT_JSON)));
}

BOOST_AUTO_TEST_CASE(test_dedup_bad_annotation_leaves_no_outputs) {
    const std::string a = anno_name("readA", UMI_A, UMI_B);
    const std::string b = "readB-" + UMI_A + "^" + UMI_B + ";x^0";
    fs::path input = write_sam(pair_lines(a, 100, 300) + pair_lines(b, 100, 300));
    DedupOptions options;
    options.outdir = make_temp_dir();
    options.store = "memory";
    DeduplicateWorker worker({"umidedup", input.string()}, input, options);
    BOOST_CHECK_THROW(worker.run(), umidedup::ParseError);
    BOOST_CHECK(fs::is_empty(options.outdir));
}

BOOST_AUTO_TEST_CASE(test_reconcile_group_count_mismatch) {
    const std::string a = anno_name("readA", UMI_A, UMI_B);
    fs::path input = write_sam(pair_lines(a, 100, 300));
    umidedup::MemoryEnvironment env;
    umidedup::SimpleObjectStore<umidedup::ReadGroup> read_groups(env.open_table(TABLE_READ_GROUPS));
    umidedup::SimpleObjectStore<UmiErrorRecord> umi_errors(env.open_table(TABLE_UMI_ERRORS));
    umidedup::BucketStore losers(env.open_table(TABLE_DUPLICATES));
    DedupOptions options;
    options.outdir = make_temp_dir();
    Reconciler reconciler(env, read_groups, umi_errors, losers, options, "umidedup");
    {
        OutputStreams out(input, options);
        std::unique_ptr<AlignmentSource> source = open_alignment_source(input);
        BOOST_CHECK_EQUAL(reconciler.run(*source, out, 1), 1);
    }
    {
        OutputStreams out(input, options);
        std::unique_ptr<AlignmentSource> source = open_alignment_source(input);
        BOOST_CHECK_THROW(reconciler.run(*source, out, 2), umidedup::ParseError);
    }
}

// BAM input

void write_bam(fs::path const& path) {
    BamTools::RefVector refs {BamTools::RefData("chr1", 10000)};
    BamTools::BamWriter writer;
    BOOST_TEST_REQUIRE(writer.Open(path.string(), SAM_HEADER, refs));
    const std::string a = anno_name("readA", UMI_A, UMI_B);
    for (int mate = 0; mate < 2; ++mate) {
        BamTools::BamAlignment aln;
        aln.Name = a;
        aln.QueryBases = "ACGTACGTAC";
        aln.Qualities = "IIIIIIIIII";
        aln.Length = static_cast<int32_t>(aln.QueryBases.size());
        aln.RefID = 0;
        aln.MateRefID = 0;
        aln.MapQuality = 60;
        if (mate == 0) {
            aln.AlignmentFlag = 99;
            aln.Position = 99;
            aln.MatePosition = 299;
            aln.InsertSize = 210;
            aln.CigarData = {BamTools::CigarOp('S', 2), BamTools::CigarOp('M', 8)};
        } else {
            aln.AlignmentFlag = 147;
            aln.Position = 299;
            aln.MatePosition = 99;
            aln.InsertSize = -210;
            aln.CigarData = {BamTools::CigarOp('M', 10)};
        }
        BOOST_TEST_REQUIRE(aln.AddTag<std::string>("RG", "Z", "group1"));
        BOOST_TEST_REQUIRE(aln.AddTag<int32_t>("NM", "i", mate));
        BOOST_TEST_REQUIRE(aln.AddTag<float>("XF", "f", 1.5f));
        BOOST_TEST_REQUIRE(writer.SaveAlignment(aln));
    }
    writer.Close();
}

const std::vector<std::string> BAM_AS_SAM {
    "@HD\tVN:1.6\tSO:unsorted",
    "@SQ\tSN:chr1\tLN:10000",
    anno_name("readA", UMI_A, UMI_B) + "\t99\tchr1\t100\t60\t2S8M\t=\t300\t210\tACGTACGTAC\tIIIIIIIIII\tRG:Z:group1\tNM:i:0\tXF:f:1.5",
    anno_name("readA", UMI_A, UMI_B) + "\t147\tchr1\t300\t60\t10M\t=\t100\t-210\tACGTACGTAC\tIIIIIIIIII\tRG:Z:group1\tNM:i:1\tXF:f:1.5",
};

BOOST_AUTO_TEST_CASE(test_bam_source) {
    fs::path bam = make_temp_filename(".bam");
    write_bam(bam);
    BOOST_CHECK(is_bam_file(bam));

    std::unique_ptr<AlignmentSource> source = open_alignment_source(bam);
    std::vector<std::string> lines;
    std::string line;
    while (source->next_line(line)) {
        lines.push_back(line);
    }
    BOOST_CHECK_EQUAL_COLLECTIONS(lines.cbegin(), lines.cend(), BAM_AS_SAM.cbegin(), BAM_AS_SAM.cend());
}

BOOST_AUTO_TEST_CASE(test_bam_matches_sam) {
    fs::path bam = make_temp_filename(".bam");
    write_bam(bam);
    fs::path sam = make_temp_filename(".sam");
    {
        std::ofstream file(sam);
        for (std::string const& line : BAM_AS_SAM) {
            file << line << "\n";
        }
    }
    BOOST_CHECK(!is_bam_file(sam));

    DedupOptions options;
    options.write_flagged_sam = true;
    DedupRun from_bam = run_dedup(bam, options);
    DedupRun from_sam = run_dedup(sam, options);
    BOOST_CHECK_EQUAL(from_bam.report.num_read_groups, 1);
    BOOST_CHECK(alignment_lines(from_bam.output(SUFFIX_FLAGGED_SAM)) == alignment_lines(from_sam.output(SUFFIX_FLAGGED_SAM)));
}

BOOST_AUTO_TEST_CASE(test_missing_input) {
    BOOST_CHECK_THROW(open_alignment_source("/nonexistent/input.sam"), umidedup::PrerequisiteError);
    BOOST_CHECK_THROW(open_alignment_source("/nonexistent/input.bam"), umidedup::PrerequisiteError);
}
