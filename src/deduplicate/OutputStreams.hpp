// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_OUTPUTSTREAMS_H
#define UMIDEDUP_DEDUPLICATE_OUTPUTSTREAMS_H

#include <string>
#include <array>
#include <fstream>
#include <ostream>
#include <filesystem>
#include "DedupOptions.hpp"

namespace fs = std::filesystem;

// File name suffixes of the outputs, appended to the input name without .sam/.bam
constexpr const char* SUFFIX_DEDUPPED_SAM = ".dups_removed.sam";
constexpr const char* SUFFIX_FLAGGED_SAM = ".dups_flagged.sam";
constexpr const char* SUFFIX_DUP_ONLY_SAM = ".duplicates.sam";
constexpr const char* SUFFIX_DUP_GROUPS = ".dup_groups.samlike";
constexpr const char* SUFFIX_UMI_ERROR_SAM = ".umi_errors.sam";
constexpr const char* SUFFIX_REPORT_TXT = ".dedup_report.txt";
constexpr const char* SUFFIX_REPORT_JSON = ".dedup_report.json";

// An output written to "<path>.tmp" and moved into place by commit(). The
// temporary is removed if the object is destroyed first. A disabled output
// discards everything written to it and creates no file.
class OutputFile {
    const fs::path path;
    const fs::path tmp_path;
    const bool enabled;
    bool committed;
    std::ofstream file;
    std::ostream null_sink;
public:
    OutputFile(fs::path path, bool enabled);
    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;
    ~OutputFile();

    std::ostream& stream() {
        return enabled ? static_cast<std::ostream&>(file) : null_sink;
    }

    // Flush, close and rename into place. Throws std::runtime_error on write failure.
    void commit();

    const fs::path& get_path() const {return path;}
};

// The input file name with a trailing .sam or .bam removed
std::string output_root(fs::path const& input);

// Every output of a run
struct OutputStreams {
    OutputFile dedupped;
    OutputFile flagged;
    OutputFile dup_only;
    OutputFile dup_groups;
    OutputFile umi_errors;
    OutputFile report_txt;
    OutputFile report_json;

    OutputStreams(fs::path const& input, DedupOptions const& options);

    // The streams that carry SAM headers
    std::array<OutputFile*, 4> sam_files() {
        return {&dedupped, &flagged, &dup_only, &umi_errors};
    }

    void commit();
};

#endif //UMIDEDUP_DEDUPLICATE_OUTPUTSTREAMS_H
