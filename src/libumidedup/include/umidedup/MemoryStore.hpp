// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_MEMORYSTORE_H
#define UMIDEDUP_MEMORYSTORE_H

#include <string>
#include <map>
#include <memory>
#include <optional>
#include <umidedup/Store.hpp>

namespace umidedup {
    // Transactions of the memory backend do nothing; every write is immediately visible.
    class MemoryTransaction : public Transaction {
    public:
        explicit MemoryTransaction(bool write) : Transaction(write) {}
        void commit() override {
            finished = true;
        }
    };

    class MemoryTable : public KeyValueTable {
        std::map<std::string, std::string>& records;
    public:
        MemoryTable(std::string name, std::map<std::string, std::string>& records) :
            KeyValueTable(std::move(name)),
            records(records)
        {}

        std::optional<std::string> get(Transaction& txn, std::string const& key) const override;
        void put(Transaction& txn, std::string const& key, std::string const& value) override;
        void append(Transaction& txn, std::string const& key, std::string const& item, char delim) override;
        void for_each(Transaction& txn, KeyValueVisitor const& visitor) const override;
        std::size_t size(Transaction& txn) const override;
    };

    // Keeps every table in an ordered map. Nothing is durable.
    class MemoryEnvironment : public StoreEnvironment {
        std::map<std::string, std::map<std::string, std::string>> tables;
    public:
        std::unique_ptr<Transaction> begin(bool write) override;
        std::unique_ptr<KeyValueTable> open_table(std::string const& name) override;
    };
}

#endif //UMIDEDUP_MEMORYSTORE_H
