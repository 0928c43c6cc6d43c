// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <map>
#include <memory>
#include <optional>
#include <umidedup/Store.hpp>
#include <umidedup/MemoryStore.hpp>

namespace umidedup {
    std::optional<std::string> MemoryTable::get(Transaction& txn, std::string const& key) const {
        check_txn(txn, false);
        auto it = records.find(key);
        if (it == records.cend()) {
            return std::nullopt;
        }
        return it->second;
    }

    void MemoryTable::put(Transaction& txn, std::string const& key, std::string const& value) {
        check_txn(txn, true);
        records[key] = value;
    }

    void MemoryTable::append(Transaction& txn, std::string const& key, std::string const& item, char delim) {
        check_txn(txn, true);
        auto [it, inserted] = records.try_emplace(key, item);
        if (!inserted) {
            it->second += delim;
            it->second += item;
        }
    }

    void MemoryTable::for_each(Transaction& txn, KeyValueVisitor const& visitor) const {
        check_txn(txn, false);
        for (auto const& [key, value] : records) {
            visitor(key, value);
        }
    }

    std::size_t MemoryTable::size(Transaction& txn) const {
        check_txn(txn, false);
        return records.size();
    }

    std::unique_ptr<Transaction> MemoryEnvironment::begin(bool write) {
        return std::make_unique<MemoryTransaction>(write);
    }

    std::unique_ptr<KeyValueTable> MemoryEnvironment::open_table(std::string const& name) {
        return std::make_unique<MemoryTable>(name, tables[name]);
    }
}
