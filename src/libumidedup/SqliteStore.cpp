// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of umidedup.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <memory>
#include <optional>
#include <filesystem>
#include <system_error>
#include <sqlite3.h>
#include <boost/log/trivial.hpp>
#include <umidedup/Errors.hpp>
#include <umidedup/Store.hpp>
#include <umidedup/SqliteStore.hpp>

namespace fs = std::filesystem;

namespace umidedup {
    namespace {
        // Resets a cached statement on every exit path so it can be reused
        class StatementReset {
            sqlite3_stmt* stmt;
        public:
            explicit StatementReset(sqlite3_stmt* stmt) : stmt(stmt) {}
            ~StatementReset() {
                sqlite3_reset(stmt);
                sqlite3_clear_bindings(stmt);
            }
        };

        std::string column_string(sqlite3_stmt* stmt, int col) {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            int nbytes = sqlite3_column_bytes(stmt, col);
            if (text == nullptr) {
                return {};
            }
            return std::string(reinterpret_cast<const char*>(text), nbytes);
        }
    }

    // Transaction

    SqliteTransaction::SqliteTransaction(SqliteEnvironment& env, bool write) : Transaction(write), env(env) {
        if (env.in_transaction) {
            throw StoreError("cannot begin a transaction on " + env.path.string() + ": another transaction is open");
        }
        env.exec(write ? "BEGIN IMMEDIATE" : "BEGIN");
        env.in_transaction = true;
    }

    SqliteTransaction::~SqliteTransaction() {
        if (finished) {
            return;
        }
        if (sqlite3_exec(env.db.get(), "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            BOOST_LOG_TRIVIAL(warning) << "rollback failed on " << env.path << ": " << sqlite3_errmsg(env.db.get());
        }
        env.in_transaction = false;
    }

    void SqliteTransaction::commit() {
        if (finished) {
            throw StoreError("transaction on " + env.path.string() + " already finished");
        }
        env.exec("COMMIT");
        finished = true;
        env.in_transaction = false;
    }

    // Table

    SqliteTable::SqliteTable(SqliteEnvironment& env, std::string const& name) :
        KeyValueTable(name),
        env(env),
        stmt_get(nullptr, &sqlite3_finalize),
        stmt_put(nullptr, &sqlite3_finalize),
        stmt_append(nullptr, &sqlite3_finalize),
        stmt_count(nullptr, &sqlite3_finalize)
    {
        if (name.empty() || name.find('"') != std::string::npos) {
            throw StoreError("invalid table name: " + name);
        }
        const std::string quoted = "\"" + name + "\"";
        env.exec(("CREATE TABLE IF NOT EXISTS " + quoted + " (k TEXT PRIMARY KEY NOT NULL, v TEXT NOT NULL) WITHOUT ROWID").c_str());
        stmt_get = env.prepare("SELECT v FROM " + quoted + " WHERE k = ?1");
        stmt_put = env.prepare("INSERT OR REPLACE INTO " + quoted + " (k, v) VALUES (?1, ?2)");
        stmt_append = env.prepare("INSERT INTO " + quoted + " (k, v) VALUES (?1, ?2) ON CONFLICT (k) DO UPDATE SET v = v || ?3 || excluded.v");
        stmt_count = env.prepare("SELECT COUNT(*) FROM " + quoted);
        sql_scan = "SELECT k, v FROM " + quoted + " ORDER BY k";
    }

    std::optional<std::string> SqliteTable::get(Transaction& txn, std::string const& key) const {
        check_txn(txn, false);
        sqlite3_stmt* stmt = stmt_get.get();
        StatementReset reset {stmt};
        sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_STATIC);
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            return column_string(stmt, 0);
        }
        if (rc != SQLITE_DONE) {
            env.fail("get from " + name);
        }
        return std::nullopt;
    }

    void SqliteTable::put(Transaction& txn, std::string const& key, std::string const& value) {
        check_txn(txn, true);
        sqlite3_stmt* stmt = stmt_put.get();
        StatementReset reset {stmt};
        sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_STATIC);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            env.fail("put to " + name);
        }
    }

    void SqliteTable::append(Transaction& txn, std::string const& key, std::string const& item, char delim) {
        check_txn(txn, true);
        sqlite3_stmt* stmt = stmt_append.get();
        StatementReset reset {stmt};
        sqlite3_bind_text(stmt, 1, key.data(), static_cast<int>(key.size()), SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, item.data(), static_cast<int>(item.size()), SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, &delim, 1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            env.fail("append to " + name);
        }
    }

    void SqliteTable::for_each(Transaction& txn, KeyValueVisitor const& visitor) const {
        check_txn(txn, false);
        // Prepared per call so that a visitor may scan this table again
        sqlite_stmt_ptr stmt = env.prepare(sql_scan);
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            visitor(column_string(stmt.get(), 0), column_string(stmt.get(), 1));
        }
        if (rc != SQLITE_DONE) {
            env.fail("scan of " + name);
        }
    }

    std::size_t SqliteTable::size(Transaction& txn) const {
        check_txn(txn, false);
        sqlite3_stmt* stmt = stmt_count.get();
        StatementReset reset {stmt};
        if (sqlite3_step(stmt) != SQLITE_ROW) {
            env.fail("count of " + name);
        }
        return static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }

    // Environment

    SqliteEnvironment::SqliteEnvironment(fs::path path, bool keep_file) :
        path(std::move(path)),
        keep_file(keep_file),
        db(nullptr, &sqlite3_close_v2),
        in_transaction(false)
    {
        std::error_code ec;
        fs::remove(this->path, ec);
        if (ec) {
            throw StoreError("cannot replace " + this->path.string() + ": " + ec.message());
        }
        sqlite3* handle = nullptr;
        int rc = sqlite3_open_v2(this->path.c_str(), &handle, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        // A handle is returned even on failure and must be closed
        db.reset(handle);
        if (rc != SQLITE_OK) {
            fail("open");
        }
        BOOST_LOG_TRIVIAL(debug) << "opened SQLite database " << this->path;
    }

    SqliteEnvironment::~SqliteEnvironment() {
        db.reset();
        if (!keep_file) {
            std::error_code ec;
            fs::remove(path, ec);
            if (ec) {
                BOOST_LOG_TRIVIAL(warning) << "could not remove " << path << ": " << ec.message();
            }
        }
    }

    void SqliteEnvironment::exec(const char* sql) {
        char* errmsg = nullptr;
        if (sqlite3_exec(db.get(), sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string msg = errmsg != nullptr ? errmsg : sqlite3_errmsg(db.get());
            sqlite3_free(errmsg);
            throw StoreError(path.string() + ": " + sql + ": " + msg);
        }
    }

    sqlite_stmt_ptr SqliteEnvironment::prepare(std::string const& sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db.get(), sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr) != SQLITE_OK) {
            fail("prepare \"" + sql + "\"");
        }
        return sqlite_stmt_ptr(stmt, &sqlite3_finalize);
    }

    void SqliteEnvironment::fail(std::string const& what) const {
        throw StoreError(path.string() + ": " + what + ": " + (db ? sqlite3_errmsg(db.get()) : "out of memory"));
    }

    std::unique_ptr<Transaction> SqliteEnvironment::begin(bool write) {
        return std::make_unique<SqliteTransaction>(*this, write);
    }

    std::unique_ptr<KeyValueTable> SqliteEnvironment::open_table(std::string const& name) {
        return std::make_unique<SqliteTable>(*this, name);
    }
}
