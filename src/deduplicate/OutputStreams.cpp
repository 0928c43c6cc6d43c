// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <umidedup.hpp>
#include "DedupOptions.hpp"
#include "OutputStreams.hpp"

OutputFile::OutputFile(fs::path path, bool enabled) :
    path(std::move(path)),
    tmp_path(this->path.string() + ".tmp"),
    enabled(enabled),
    committed(false),
    null_sink(nullptr)
{
    if (enabled) {
        file.open(tmp_path);
        if (!file) {
            throw umidedup::PrerequisiteError("cannot open " + tmp_path.string() + " for writing");
        }
    }
}

OutputFile::~OutputFile() {
    if (!enabled || committed) {
        return;
    }
    file.close();
    std::error_code ec;
    fs::remove(tmp_path, ec);
    if (ec) {
        BOOST_LOG_TRIVIAL(warning) << "cannot remove " << tmp_path << ": " << ec.message();
    }
}

void OutputFile::commit() {
    if (!enabled || committed) {
        return;
    }
    file.close();
    if (!file) {
        throw std::runtime_error("write to " + tmp_path.string() + " failed");
    }
    fs::rename(tmp_path, path);
    committed = true;
    BOOST_LOG_TRIVIAL(debug) << "wrote " << path;
}

std::string output_root(fs::path const& input) {
    const fs::path ext = input.extension();
    if (ext == ".sam" || ext == ".bam") {
        return input.stem().string();
    }
    return input.filename().string();
}

namespace {
    fs::path output_path(fs::path const& input, DedupOptions const& options, const char* suffix) {
        return options.outdir / (output_root(input) + suffix);
    }
}

OutputStreams::OutputStreams(fs::path const& input, DedupOptions const& options) :
    dedupped(output_path(input, options, SUFFIX_DEDUPPED_SAM), options.write_dedupped_sam),
    flagged(output_path(input, options, SUFFIX_FLAGGED_SAM), options.write_flagged_sam),
    dup_only(output_path(input, options, SUFFIX_DUP_ONLY_SAM), options.write_dup_only_sam),
    dup_groups(output_path(input, options, SUFFIX_DUP_GROUPS), options.write_dup_group_file),
    umi_errors(output_path(input, options, SUFFIX_UMI_ERROR_SAM), options.write_umi_error_sam),
    report_txt(output_path(input, options, SUFFIX_REPORT_TXT), true),
    report_json(output_path(input, options, SUFFIX_REPORT_JSON), true)
{}

void OutputStreams::commit() {
    for (OutputFile* f : {&dedupped, &flagged, &dup_only, &dup_groups, &umi_errors, &report_txt, &report_json}) {
        f->commit();
    }
}
