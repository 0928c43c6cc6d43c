// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_KIT_H
#define UMIDEDUP_KIT_H

#include <string>
#include <vector>

namespace umidedup {
    // A library prep kit with a fixed, known set of UMIs
    struct Kit {
        std::string name;
        std::vector<std::string> umis;
        // Bases clipped from the 5' end of each read by the UMI annotator (UMI plus ligation overhang)
        std::size_t clip_length;

        std::size_t umi_length() const {
            return umis.front().size();
        }

        // Look up a supported kit by (case-insensitive) name. Throws ConfigurationError.
        static const Kit& by_name(std::string const& name);

        // Names of all supported kits
        static std::vector<std::string> names();
    };
}

#endif //UMIDEDUP_KIT_H
