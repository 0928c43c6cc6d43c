// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef UMIDEDUP_SQLITESTORE_H
#define UMIDEDUP_SQLITESTORE_H

#include <string>
#include <memory>
#include <optional>
#include <filesystem>
#include <sqlite3.h>
#include <umidedup/Store.hpp>

namespace umidedup {
    class SqliteEnvironment;

    typedef std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> sqlite_stmt_ptr;

    class SqliteTransaction : public Transaction {
        SqliteEnvironment& env;
    public:
        SqliteTransaction(SqliteEnvironment& env, bool write);
        // Rolls back unless committed
        ~SqliteTransaction() override;
        void commit() override;
    };

    // One WITHOUT ROWID table per KeyValueTable
    class SqliteTable : public KeyValueTable {
        SqliteEnvironment& env;
        sqlite_stmt_ptr stmt_get;
        sqlite_stmt_ptr stmt_put;
        sqlite_stmt_ptr stmt_append;
        sqlite_stmt_ptr stmt_count;
        std::string sql_scan;
    public:
        SqliteTable(SqliteEnvironment& env, std::string const& name);

        std::optional<std::string> get(Transaction& txn, std::string const& key) const override;
        void put(Transaction& txn, std::string const& key, std::string const& value) override;
        void append(Transaction& txn, std::string const& key, std::string const& item, char delim) override;
        void for_each(Transaction& txn, KeyValueVisitor const& visitor) const override;
        std::size_t size(Transaction& txn) const override;
    };

    // A single SQLite database file. At most one transaction may be open at a time.
    class SqliteEnvironment : public StoreEnvironment {
        friend class SqliteTransaction;
        friend class SqliteTable;

        const std::filesystem::path path;
        const bool keep_file;
        std::unique_ptr<sqlite3, decltype(&sqlite3_close_v2)> db;
        bool in_transaction;

        // Run one or more statements that return no rows. Throws StoreError.
        void exec(const char* sql);
        // Compile a statement. Throws StoreError.
        sqlite_stmt_ptr prepare(std::string const& sql);
        // Throws StoreError carrying the last error of the connection
        [[noreturn]] void fail(std::string const& what) const;
    public:
        // Creates the database file, replacing any file at path
        SqliteEnvironment(std::filesystem::path path, bool keep_file = false);
        // Closes the database and deletes its file unless keep_file
        ~SqliteEnvironment() override;

        const std::filesystem::path& get_path() const {return path;}

        std::unique_ptr<Transaction> begin(bool write) override;
        std::unique_ptr<KeyValueTable> open_table(std::string const& name) override;
    };
}

#endif //UMIDEDUP_SQLITESTORE_H
