// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_DEDUPLICATE_ALIGNMENTSOURCE_H
#define UMIDEDUP_DEDUPLICATE_ALIGNMENTSOURCE_H

#include <string>
#include <deque>
#include <memory>
#include <fstream>
#include <filesystem>
#include <bamtools/api/BamReader.h>
#include <bamtools/api/BamAlignment.h>
#include <bamtools/api/BamAux.h>

namespace fs = std::filesystem;

// A stream of SAM text lines: header lines first, then one line per alignment
class AlignmentSource {
protected:
    const fs::path filename;
public:
    explicit AlignmentSource(fs::path filename) : filename(std::move(filename)) {}
    virtual ~AlignmentSource() = default;

    // Read the next line without its line terminator.
    // returns: false at end of input
    virtual bool next_line(std::string& line) = 0;

};

// Plain SAM text
class SamTextSource : public AlignmentSource {
    std::ifstream file;
public:
    explicit SamTextSource(fs::path const& filename);
    bool next_line(std::string& line) override;
};

// BAM decoded in-process and rendered as SAM text
class BamSource : public AlignmentSource {
    BamTools::BamReader reader;
    BamTools::RefVector references;
    BamTools::BamAlignment alignment;
    std::deque<std::string> header;
public:
    explicit BamSource(fs::path const& filename);
    ~BamSource() override;
    bool next_line(std::string& line) override;

    // Render one alignment as a SAM line
    static std::string to_sam(BamTools::BamAlignment const& aln, BamTools::RefVector const& refs);
};

// True if the file starts with the gzip magic shared by BGZF, or has a .bam extension
bool is_bam_file(fs::path const& filename);

// Open a SAM or BAM file for one pass.
//  Throws:
//    PrerequisiteError if the file does not exist or cannot be opened or decoded
std::unique_ptr<AlignmentSource> open_alignment_source(fs::path const& filename);

#endif //UMIDEDUP_DEDUPLICATE_ALIGNMENTSOURCE_H
