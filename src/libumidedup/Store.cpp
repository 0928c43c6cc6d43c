// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <memory>
#include <umidedup/Errors.hpp>
#include <umidedup/Store.hpp>
#include <umidedup/MemoryStore.hpp>
#include <umidedup/SqliteStore.hpp>

namespace umidedup {
    void KeyValueTable::check_txn(Transaction const& txn, bool for_write) const {
        if (txn.is_finished()) {
            throw StoreError("table " + name + " accessed through a finished transaction");
        }
        if (for_write && !txn.is_writable()) {
            throw StoreError("table " + name + " modified through a read-only transaction");
        }
    }

    StoreKind store_kind_from_name(std::string const& name) {
        if (name == "memory") {
            return StoreKind::MEMORY;
        }
        if (name == "sqlite") {
            return StoreKind::SQLITE;
        }
        throw ConfigurationError("Store " + name + " is not supported (choose from sqlite, memory)");
    }

    std::string store_kind_name(StoreKind kind) {
        switch (kind) {
        case StoreKind::MEMORY:
            return "memory";
        case StoreKind::SQLITE:
            return "sqlite";
        }
        throw ConfigurationError("unknown store kind");
    }

    std::unique_ptr<StoreEnvironment> make_store_environment(StoreKind kind, std::string const& path, bool keep_file) {
        switch (kind) {
        case StoreKind::MEMORY:
            return std::make_unique<MemoryEnvironment>();
        case StoreKind::SQLITE:
            return std::make_unique<SqliteEnvironment>(path, keep_file);
        }
        throw ConfigurationError("unknown store kind");
    }
}
