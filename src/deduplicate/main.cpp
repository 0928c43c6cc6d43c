// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <filesystem>
#include <vector>
#include <string>
#include <string_view>
#include <initializer_list>
#include <algorithm>
#include <stdexcept>
#include <iostream>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <umidedup.hpp>
#include "DedupOptions.hpp"
#include "DeduplicateWorker.hpp"

constexpr std::string_view usage =
"usage: umidedup [-h] [-v] [-o OUTDIR] [-k KIT] [-u] [--store STORE]\n"
"                [--batch-size N] [-K] [-c] [--random-seed SEED]\n"
"                [--no-write-dedupped-sam] [--write-flagged-sam] [--no-write-dup-sam]\n"
"                [--no-write-dup-group-file] [--no-write-umi-error-sam]\n"
"                [--no-write-sam-headers] [--keep-db] [--dump-rg-db] [--dump-loc-db]\n"
"                [--dump-dup-group-db] [--dump-dup-db] [--dump-umi-error-db]\n"
"                [--debug] alignment-file\n";
constexpr std::string_view more_usage =
"\n"
"positional arguments:\n"
"  alignment-file        SAM or BAM file of aligned reads whose names carry the\n"
"                        UMI annotation, with the alignments of each read name\n"
"                        on adjacent lines\n"
"\n"
"options:\n"
"  -h, --help            show this help message and exit\n"
"  -v, --version         show the program version and exit\n"
"  -o OUTDIR             Place results in directory OUTDIR (default: current directory)\n"
"  -k KIT, --kit KIT     The library prep kit, case insensitive (default: bioo)\n"
"  -u, --unpaired        Reads are single-end (default: paired-end)\n"
"  --store STORE         Storage backend: sqlite or memory (default: sqlite)\n"
"  --batch-size N        Records written per store transaction (default: 100000)\n"
"  -K, --keep-bad-umis   Keep read groups with an error in a UMI. By default they\n"
"                        are written to the UMI error file instead of being\n"
"                        deduplicated. See also --correct-umis\n"
"  -c, --correct-umis    Replace a UMI that is one substitution from exactly one\n"
"                        known UMI with that UMI. Requires --keep-bad-umis\n"
"  --random-seed SEED    Seed for choosing which member of a duplicate group to\n"
"                        keep (default: Little Ashes)\n"
"  --no-write-dedupped-sam\n"
"                        Do not write the SAM file with duplicates removed\n"
"  --write-flagged-sam   Write a SAM file with duplicates kept and flagged 0x400\n"
"  --no-write-dup-sam    Do not write the SAM file of duplicates only\n"
"  --no-write-dup-group-file\n"
"                        Do not write the SAM-like file of duplicate groups\n"
"  --no-write-umi-error-sam\n"
"                        Do not write the SAM file of read groups rejected for\n"
"                        UMI errors\n"
"  --no-write-sam-headers\n"
"                        Do not copy the input header to the SAM outputs\n"
"  --keep-db             Keep the database file of the sqlite store\n"
"  --dump-rg-db          Print the read group store to stderr when done\n"
"  --dump-loc-db         Print the location store to stderr when done\n"
"  --dump-dup-group-db   Print the duplicate groups to stderr when done\n"
"  --dump-dup-db         Print the duplicate store to stderr when done\n"
"  --dump-umi-error-db   Print the UMI error store to stderr when done\n"
"  --debug               Increase logging verbosity\n";

typedef int opt_parse_t;
constexpr opt_parse_t opt_no = 0, opt_yes = 1, opt_inval = 2;

opt_parse_t get_arg(std::vector<std::string>::const_iterator& it, const std::vector<std::string>::const_iterator& end, std::initializer_list<std::string_view> optstrs, std::string& out) {
    const std::string& opt = *it;
    if (std::find(optstrs.begin(), optstrs.end(), opt) == optstrs.end()) {
        return opt_no;
    }
    if (++it == end || (*it)[0] == '-') {
        std::cerr << usage << "\nERR: missing value for " << opt << std::endl;
        return opt_inval;
    }
    out = *it;
    return opt_yes;
}

opt_parse_t get_arg(std::vector<std::string>::const_iterator& it, const std::vector<std::string>::const_iterator& end, std::initializer_list<std::string_view> optstrs, unsigned long long& out) {
    const std::string& opt = *it;
    if (std::find(optstrs.begin(), optstrs.end(), opt) == optstrs.end()) {
        return opt_no;
    }
    if (++it == end || (*it)[0] == '-') {
        std::cerr << usage << "\nERR: missing value for " << opt << std::endl;
        return opt_inval;
    }
    try {
        std::size_t nchars;
        out = std::stoull(*it, &nchars);
        if (nchars != it->size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception& e) {
        std::cerr << usage << "\nERR: invalid value for " << opt << ": " << e.what() << std::endl;
        return opt_inval;
    }
    return opt_yes;
}

opt_parse_t get_arg(std::vector<std::string>::const_iterator& it, const std::vector<std::string>::const_iterator& end, std::initializer_list<std::string_view> optstrs, fs::path& out) {
    std::string s;
    opt_parse_t result = get_arg(it, end, optstrs, s);
    if (result == opt_yes) {
        out = s;
    }
    return result;
}

int main(int argc, char ** argv) {
    DedupOptions options;
    bool debug = false;
    opt_parse_t opt_parse_result;

    std::vector<std::string> cli(argv, argv + argc);
    std::vector<std::string> posargs; // alignment-file

    for (auto it = std::next(cli.cbegin()); it != cli.cend(); ++it) {
        const std::string& opt = *it;
        if (opt == "-h" || opt == "--help") {
            std::cout << usage << more_usage << std::endl;
            return 0;
        } else if (opt == "-v" || opt == "--version") {
            std::cout << "umidedup v" << UMIDEDUP_VERSION_STR << std::endl;
            return 0;
        } else if (opt == "--debug") {
            debug = true;
        } else if ((opt_parse_result = get_arg(it, cli.cend(), {"-o"}, options.outdir)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, cli.cend(), {"-k", "--kit"}, options.kit)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, cli.cend(), {"--store"}, options.store)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, cli.cend(), {"--batch-size"}, options.batch_size)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = get_arg(it, cli.cend(), {"--random-seed"}, options.random_seed)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if (opt == "-u" || opt == "--unpaired") {
            options.paired = false;
        } else if (opt == "-K" || opt == "--keep-bad-umis") {
            options.reject_umi_errors = false;
        } else if (opt == "-c" || opt == "--correct-umis") {
            options.correct_umis = true;
        } else if (opt == "--no-write-dedupped-sam") {
            options.write_dedupped_sam = false;
        } else if (opt == "--write-flagged-sam") {
            options.write_flagged_sam = true;
        } else if (opt == "--no-write-dup-sam") {
            options.write_dup_only_sam = false;
        } else if (opt == "--no-write-dup-group-file") {
            options.write_dup_group_file = false;
        } else if (opt == "--no-write-umi-error-sam") {
            options.write_umi_error_sam = false;
        } else if (opt == "--no-write-sam-headers") {
            options.write_sam_headers = false;
        } else if (opt == "--keep-db") {
            options.keep_db = true;
        } else if (opt == "--dump-rg-db") {
            options.dump_rg_db = true;
        } else if (opt == "--dump-loc-db") {
            options.dump_loc_db = true;
        } else if (opt == "--dump-dup-group-db") {
            options.dump_dup_group_db = true;
        } else if (opt == "--dump-dup-db") {
            options.dump_dup_db = true;
        } else if (opt == "--dump-umi-error-db") {
            options.dump_umi_error_db = true;
        } else if (opt[0] == '-') {
            std::cerr << usage << "\nERR: Unrecognized option flag: \"" << opt << "\"\n";
            return 1;
        } else {
            posargs.push_back(opt);
        }
    }

    if (posargs.empty()) {
        std::cerr << usage << "\nERR: Missing required positional opt: alignment-file\n";
        return 1;
    }
    if (posargs.size() > 1) {
        std::cerr << usage << "\nERR: Extra unrecognized positional opt (first one: " << posargs[1] << ")\n";
        return 1;
    }

    try {
        options.validate();
    } catch (const umidedup::ConfigurationError& e) {
        std::cerr << usage << "\nERR: " << e.what() << "\n";
        return 1;
    }

    boost::log::trivial::severity_level level = debug ? boost::log::trivial::debug : boost::log::trivial::info;
    boost::log::core::get()->set_filter (
        boost::log::trivial::severity >= level
    );

    std::cerr << umidedup::put_time() << ": Begin deduplicate workflow" << std::endl;
    try {
        DeduplicateWorker worker(cli, posargs[0], options);
        worker.run();
    } catch (const std::exception& e) {
        std::cerr << "ERR: Error deduplicating: " << e.what() << std::endl;
        return 1;
    }
    std::cerr << umidedup::put_time() << ": Finished deduplicate workflow!" << std::endl;
    return 0;
}
