// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_ERRORS_H
#define UMIDEDUP_ERRORS_H

#include <stdexcept>
#include <string>

namespace umidedup {
    // Base class of everything umidedup throws on purpose
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // CIGAR contains a hard clip; the fragment origin cannot be recovered.
    // Recoverable: only the location index entry is dropped.
    class HardClippingNotSupported : public Error {
    public:
        using Error::Error;
    };

    // Malformed SAM line, read-name annotation or CIGAR, or input that is not
    // collated by read name.
    class ParseError : public Error {
    public:
        using Error::Error;
    };

    // Unsupported kit or store, or an incompatible combination of options
    class ConfigurationError : public Error {
    public:
        using Error::Error;
    };

    // Input missing, unreadable or undecodable
    class PrerequisiteError : public Error {
    public:
        using Error::Error;
    };

    // Any failure reported by a storage backend
    class StoreError : public Error {
    public:
        using Error::Error;
    };

    // Internal bookkeeping contradicts itself (e.g. a read group in two DupGroups)
    class InvariantError : public Error {
    public:
        using Error::Error;
    };
}

#endif //UMIDEDUP_ERRORS_H
