// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_STORE_H
#define UMIDEDUP_STORE_H

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <umidedup/Util.hpp>

namespace umidedup {
    // Default item separator of a BucketStore
    constexpr char DELIM_BUCKET = ',';

    // A unit of work against a StoreEnvironment. Destroying a transaction that
    // was never committed aborts it.
    class Transaction {
    protected:
        const bool write;
        bool finished;
    public:
        explicit Transaction(bool write) : write(write), finished(false) {}
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
        virtual ~Transaction() = default;

        bool is_writable() const {return write;}
        bool is_finished() const {return finished;}

        // Make every mutation of this transaction visible. Throws StoreError.
        virtual void commit() = 0;
    };

    typedef std::function<void(std::string const& key, std::string const& value)> KeyValueVisitor;

    // A named table of string keys to string values, sorted by key
    class KeyValueTable {
    protected:
        const std::string name;

        // Throws StoreError unless txn is open, and writable if for_write.
        void check_txn(Transaction const& txn, bool for_write) const;
    public:
        explicit KeyValueTable(std::string name) : name(std::move(name)) {}
        KeyValueTable(const KeyValueTable&) = delete;
        KeyValueTable& operator=(const KeyValueTable&) = delete;
        virtual ~KeyValueTable() = default;

        const std::string& get_name() const {return name;}

        virtual std::optional<std::string> get(Transaction& txn, std::string const& key) const = 0;
        virtual void put(Transaction& txn, std::string const& key, std::string const& value) = 0;
        // Concatenate item onto the existing value with delim between, or create the value
        virtual void append(Transaction& txn, std::string const& key, std::string const& item, char delim) = 0;
        // Visit every record in ascending key order
        virtual void for_each(Transaction& txn, KeyValueVisitor const& visitor) const = 0;
        virtual std::size_t size(Transaction& txn) const = 0;
    };

    // Owns the storage of a set of tables and hands out transactions against it
    class StoreEnvironment {
    public:
        StoreEnvironment() = default;
        StoreEnvironment(const StoreEnvironment&) = delete;
        StoreEnvironment& operator=(const StoreEnvironment&) = delete;
        virtual ~StoreEnvironment() = default;

        virtual std::unique_ptr<Transaction> begin(bool write) = 0;
        // Open (creating if necessary) a table. The table must not outlive the environment.
        virtual std::unique_ptr<KeyValueTable> open_table(std::string const& name) = 0;
    };

    // Stores objects of type T under string ids. T must provide
    //   std::string T::serialize() const
    //   static T T::deserialize(std::string const&)
    // and deserialize(serialize(x)) must equal x.
    template<typename T>
    class SimpleObjectStore {
        std::unique_ptr<KeyValueTable> table;
    public:
        explicit SimpleObjectStore(std::unique_ptr<KeyValueTable> table) : table(std::move(table)) {}

        void put(Transaction& txn, std::string const& id, T const& object) {
            table->put(txn, id, object.serialize());
        }

        std::optional<T> get(Transaction& txn, std::string const& id) const {
            std::optional<std::string> value = table->get(txn, id);
            if (!value) {
                return std::nullopt;
            }
            return T::deserialize(*value);
        }

        bool contains(Transaction& txn, std::string const& id) const {
            return table->get(txn, id).has_value();
        }

        template<typename Visitor>
        void for_each(Transaction& txn, Visitor&& visitor) const {
            table->for_each(txn, [&visitor](std::string const& key, std::string const& value) {
                visitor(key, T::deserialize(value));
            });
        }

        std::size_t size(Transaction& txn) const {
            return table->size(txn);
        }

        const std::string& get_name() const {
            return table->get_name();
        }
    };

    // Stores a delimited list of items under each key. Items must not contain the delimiter.
    class BucketStore {
        std::unique_ptr<KeyValueTable> table;
        const char delim;
    public:
        explicit BucketStore(std::unique_ptr<KeyValueTable> table, char delim = DELIM_BUCKET) :
            table(std::move(table)),
            delim(delim)
        {}

        void put(Transaction& txn, std::string const& key, std::vector<std::string> const& items) {
            table->put(txn, key, strjoin(items, std::string(1, delim)));
        }

        void append(Transaction& txn, std::string const& key, std::string const& item) {
            table->append(txn, key, item, delim);
        }

        std::optional<std::vector<std::string>> get(Transaction& txn, std::string const& key) const {
            std::optional<std::string> value = table->get(txn, key);
            if (!value) {
                return std::nullopt;
            }
            return split(*value);
        }

        bool contains(Transaction& txn, std::string const& key) const {
            return table->get(txn, key).has_value();
        }

        template<typename Visitor>
        void for_each(Transaction& txn, Visitor&& visitor) const {
            table->for_each(txn, [this, &visitor](std::string const& key, std::string const& value) {
                visitor(key, split(value));
            });
        }

        std::size_t size(Transaction& txn) const {
            return table->size(txn);
        }

        const std::string& get_name() const {
            return table->get_name();
        }

    private:
        std::vector<std::string> split(std::string const& value) const {
            if (value.empty()) {
                return {};
            }
            return strsplit_exact(value, delim);
        }
    };

    // Backend chosen by configuration
    enum class StoreKind {
        MEMORY,
        SQLITE,
    };

    // "memory" or "sqlite". Throws ConfigurationError.
    StoreKind store_kind_from_name(std::string const& name);

    std::string store_kind_name(StoreKind kind);

    // Create the environment for a backend. path is the database file of a
    // durable backend; any existing file there is replaced, and the file is
    // deleted with the environment unless keep_file is set.
    std::unique_ptr<StoreEnvironment> make_store_environment(StoreKind kind, std::string const& path, bool keep_file = false);
}

#endif //UMIDEDUP_STORE_H
