/*
 * JitGuard - Endpoint Privilege Elevation Service
 * Copyright (C) 2026 JitGuard Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

/**
 * ============================================================================
 * JitGuard DatabaseManager - HEADER
 * ============================================================================
 *
 * @file DatabaseManager.hpp
 * @brief SQLite storage layer with connection pooling and RAII transactions.
 *
 * Shared by the Policy Repository and the Audit Log. Each consumer owns its
 * own tables and creates them through Execute()/ExecuteMany(); the manager
 * itself only owns the _metadata table used for schema versioning.
 *
 *   PolicyRepository        AuditLog        RequestRouter
 *          │                   │                  │
 *          └─────────┬─────────┴──────────────────┘
 *                    ▼
 *   ┌──────────────────────────────────────────────┐
 *   │          DatabaseManager (Singleton)          │
 *   │   Execute / Query / *WithParams / Begin...    │
 *   │        │                        │             │
 *   │  ┌────────────┐         ┌──────────────┐      │
 *   │  │ Connection │         │ Transaction  │      │
 *   │  │    Pool    │         │    (RAII)    │      │
 *   │  └────────────┘         └──────────────┘      │
 *   └──────────────────────────────────────────────┘
 *                    │
 *                    ▼
 *            SQLiteCpp / SQLite3
 *
 * Thread Safety:
 * --------------
 * - DatabaseManager: Thread-safe singleton
 * - ConnectionPool: Thread-safe acquire/release
 * - QueryResult: NOT thread-safe (single-thread use)
 * - Transaction: NOT thread-safe (single-thread use)
 *
 * @note ":memory:" databases are not supported: every pooled connection
 *       would see its own private database.
 * ============================================================================
 */

#include <SQLiteCpp/SQLiteCpp.h>
#include <sqlite3.h>

#include "../Utils/Logger.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <chrono>
#include <unordered_map>
#include <condition_variable>
#include <atomic>
#include <limits>
#include <type_traits>

namespace JitGuard {
    namespace Database {

        class DatabaseManager;

        // ============================================================================
        // ERROR HANDLING
        // ============================================================================

        /**
         * @brief Structured error information for database operations.
         *
         * @note All fields are cleared on Clear() call
         */
        struct DatabaseError {
            int sqliteCode = SQLITE_OK;     ///< Primary SQLite result code
            int extendedCode = 0;           ///< Extended error code for details
            std::wstring message;           ///< Human-readable error message
            std::wstring query;             ///< SQL query that caused the error
            std::wstring context;           ///< Operation context (function name)

            bool HasError() const noexcept { return sqliteCode != SQLITE_OK; }

            void Clear() noexcept {
                sqliteCode = SQLITE_OK;
                extendedCode = 0;
                message.clear();
                query.clear();
                context.clear();
            }
        };

        // ============================================================================
        // SQL SECURITY UTILITIES
        // ============================================================================

        /**
         * @brief Validates that a string is a safe SQL identifier (table/column name).
         *
         * Identifiers cannot be bound as parameters, so anything spliced into SQL
         * text (e.g. a caller-chosen ORDER BY column) must pass this whitelist.
         *
         * @code
         * IsValidSqlIdentifier("target_path")     // true
         * IsValidSqlIdentifier("id;DROP")         // false
         * IsValidSqlIdentifier("123table")        // false
         * @endcode
         */
        [[nodiscard]] inline bool IsValidSqlIdentifier(std::string_view identifier) noexcept {
            if (identifier.empty()) {
                return false;
            }

            constexpr size_t MAX_IDENTIFIER_LENGTH = 128;
            if (identifier.size() > MAX_IDENTIFIER_LENGTH) {
                return false;
            }

            const char first = identifier.front();
            if (!((first >= 'a' && first <= 'z') ||
                  (first >= 'A' && first <= 'Z') ||
                  first == '_')) {
                return false;
            }

            for (const char c : identifier) {
                const bool isValid = (c >= 'a' && c <= 'z') ||
                                     (c >= 'A' && c <= 'Z') ||
                                     (c >= '0' && c <= '9') ||
                                     c == '_';
                if (!isValid) {
                    return false;
                }
            }

            return true;
        }

        // ============================================================================
        // CONFIGURATION
        // ============================================================================

        /**
         * @brief Configuration options for DatabaseManager initialization.
         *
         * @note Changes only take effect on next Initialize() call
         */
        struct DatabaseConfig {
            // === Core Settings ===
            std::wstring databasePath;                  ///< Full path to database file
            bool enableWAL = true;                      ///< Write-Ahead Logging (else DELETE journal)
            bool enableForeignKeys = true;              ///< Enable FK constraint checking

            // === Performance Tuning ===
            size_t cacheSizeKB = 4096;                  ///< Page cache size
            int busyTimeoutMs = 5000;                   ///< Wait time for locked database

            // === Connection Pooling ===
            size_t maxConnections = 8;                  ///< Maximum pool size
            size_t minConnections = 1;                  ///< Pre-warmed connections
            std::chrono::milliseconds connectionTimeout = std::chrono::seconds(10);

            // === Advanced SQLite PRAGMAs ===
            std::wstring synchronousMode = L"NORMAL";   ///< OFF/NORMAL/FULL/EXTRA

            [[nodiscard]] bool IsValid() const noexcept {
                return !databasePath.empty() &&
                       maxConnections > 0 &&
                       minConnections <= maxConnections &&
                       busyTimeoutMs >= 0;
            }
        };

        // ============================================================================
        // QUERY RESULT
        // ============================================================================

        /**
         * @brief Iterator-style result set wrapper for SELECT queries.
         *
         * Returns its connection to the pool when destroyed. Results created
         * inside a Transaction do not own a connection.
         *
         * @note Move-only semantics - cannot be copied
         * @note Getters throw SQLite::Exception / std::runtime_error on a bad
         *       column; callers catch at their module boundary.
         */
        class QueryResult {
        public:
            QueryResult() = default;

            /** @brief Constructs from statement only (transaction-scoped) */
            explicit QueryResult(std::unique_ptr<SQLite::Statement>&& stmt) noexcept
                : m_statement(std::move(stmt))
            {
                if (m_statement) {
                    m_hasRows = (m_statement->getColumnCount() > 0);
                }
            }

            explicit QueryResult(
                std::unique_ptr<SQLite::Statement>&& stmt,
                std::shared_ptr<SQLite::Database> conn,
                DatabaseManager* manager
            ) noexcept;

            ~QueryResult();

            QueryResult(const QueryResult&) = delete;
            QueryResult& operator=(const QueryResult&) = delete;

            QueryResult(QueryResult&& other) noexcept;
            QueryResult& operator=(QueryResult&& other) noexcept;

            // === Navigation ===

            /** @brief Advances to the next row. @return false if no more rows */
            bool Next();

            bool HasRows() const noexcept { return m_hasRows; }

            int ColumnCount() const noexcept;

            // === Type-safe Value Retrieval (by index) ===

            int GetInt(int columnIndex) const;
            int64_t GetInt64(int columnIndex) const;
            double GetDouble(int columnIndex) const;
            std::string GetString(int columnIndex) const;

            // === Type-safe Value Retrieval (by name) ===

            int GetInt(std::string_view columnName) const;
            int64_t GetInt64(std::string_view columnName) const;
            double GetDouble(std::string_view columnName) const;
            std::string GetString(std::string_view columnName) const;

            // === NULL Checking ===

            bool IsNull(int columnIndex) const;
            bool IsNull(std::string_view columnName) const;

        private:
            int getColumnIndex(std::string_view columnName) const;

            std::unique_ptr<SQLite::Statement> m_statement;
            std::shared_ptr<SQLite::Database> m_connection;
            DatabaseManager* m_manager = nullptr;
            bool m_hasRows = false;
            mutable std::unordered_map<std::string, int> m_columnIndexCache;
        };

        // ============================================================================
        // CONNECTION POOL
        // ============================================================================

        /**
         * @brief Pre-warmed pool of SQLite connections.
         *
         * Grows on demand up to maxConnections; Acquire() waits on a condition
         * variable until a connection is released or the timeout elapses.
         */
        class ConnectionPool {
        public:
            explicit ConnectionPool(const DatabaseConfig& config) noexcept;
            ~ConnectionPool();

            ConnectionPool(const ConnectionPool&) = delete;
            ConnectionPool& operator=(const ConnectionPool&) = delete;

            bool Initialize(DatabaseError* err = nullptr);
            void Shutdown();

            std::shared_ptr<SQLite::Database> Acquire(
                std::chrono::milliseconds timeout = std::chrono::seconds(10),
                DatabaseError* err = nullptr
            );

            void Release(std::shared_ptr<SQLite::Database> conn);

            size_t AvailableConnections() const noexcept;
            size_t TotalConnections() const noexcept;

        private:
            struct PooledConnection {
                std::shared_ptr<SQLite::Database> connection;
                std::chrono::steady_clock::time_point lastUsed;
                bool inUse = false;
            };

            /// @note Caller must hold m_mutex
            bool createConnection(DatabaseError* err);
            bool configureConnection(SQLite::Database& db, DatabaseError* err);

            DatabaseConfig m_config;
            mutable std::mutex m_mutex;
            std::condition_variable m_cv;
            std::vector<PooledConnection> m_connections;
            std::atomic<bool> m_shutdown{ false };
            std::atomic<size_t> m_activeCount{ 0 };
        };

        // ============================================================================
        // TRANSACTION (RAII)
        // ============================================================================

        /**
         * @brief RAII transaction bound to one pooled connection.
         *
         * Rolls back in the destructor unless Commit() succeeded; always returns
         * its connection to the pool.
         */
        class Transaction {
        public:
            enum class Type {
                Deferred,   ///< Lock acquired on first read/write
                Immediate,  ///< RESERVED lock acquired immediately
                Exclusive   ///< EXCLUSIVE lock acquired immediately
            };

            explicit Transaction(
                SQLite::Database& db,
                std::shared_ptr<SQLite::Database> conn,
                DatabaseManager* manager,
                Type type = Type::Deferred,
                DatabaseError* err = nullptr
            );

            ~Transaction();

            Transaction(const Transaction&) = delete;
            Transaction& operator=(const Transaction&) = delete;
            Transaction(Transaction&&) noexcept;
            Transaction& operator=(Transaction&&) noexcept;

            bool Commit(DatabaseError* err = nullptr);
            bool Rollback(DatabaseError* err = nullptr);
            bool IsActive() const noexcept { return m_active; }

            bool Execute(std::string_view sql, DatabaseError* err = nullptr);

            template<typename... Args>
            bool ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            /**
             * @brief Runs a SELECT on the transaction's connection.
             *
             * The returned result must not outlive the transaction.
             */
            template<typename... Args>
            QueryResult QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            /// @brief Rowid of the last INSERT on this transaction's connection.
            int64_t LastInsertRowId() const noexcept;

            /// @brief Rows changed by the last statement on this connection.
            int Changes() const noexcept;

        private:
            void setError(DatabaseError* err, const SQLite::Exception& ex, std::wstring_view ctx) const;
            void setInactiveError(DatabaseError* err) const;

            SQLite::Database* m_db = nullptr;
            std::shared_ptr<SQLite::Database> m_connection;
            DatabaseManager* m_manager = nullptr;
            bool m_active = false;
            bool m_committed = false;
        };

        // ============================================================================
        // DATABASE MANAGER (MAIN INTERFACE)
        // ============================================================================

        class DatabaseManager {
        public:
            static DatabaseManager& Instance();

            // === Initialization ===

            /**
             * @brief Opens the pool and creates the _metadata table.
             * @note Subsequent calls while initialized are no-ops.
             */
            bool Initialize(const DatabaseConfig& config, DatabaseError* err = nullptr);
            void Shutdown();
            bool IsInitialized() const noexcept { return m_initialized.load(); }

            // === Schema Management ===

            int GetSchemaVersion(std::string_view component, DatabaseError* err = nullptr);
            bool SetSchemaVersion(std::string_view component, int version, DatabaseError* err = nullptr);

            // === Query Execution ===

            bool Execute(std::string_view sql, DatabaseError* err = nullptr);

            /// @brief Runs all statements in one IMMEDIATE transaction.
            bool ExecuteMany(const std::vector<std::string>& statements, DatabaseError* err = nullptr);

            QueryResult Query(std::string_view sql, DatabaseError* err = nullptr);

            // === Parameterized Queries ===

            template<typename... Args>
            bool ExecuteWithParams(
                std::string_view sql,
                DatabaseError* err,
                Args&&... args
            );

            template<typename... Args>
            QueryResult QueryWithParams(
                std::string_view sql,
                DatabaseError* err,
                Args&&... args
            );

            QueryResult QueryWithParamsVector(std::string_view sql,
                const std::vector<std::string>& params,
                DatabaseError* err = nullptr);

            // === Transactions ===

            std::unique_ptr<Transaction> BeginTransaction(
                Transaction::Type type = Transaction::Type::Deferred,
                DatabaseError* err = nullptr
            );

            // === Utility Functions ===

            bool TableExists(std::string_view tableName, DatabaseError* err = nullptr);

            const DatabaseConfig& GetConfig() const noexcept { return m_config; }

            // === Connection Access (Advanced) ===

            std::shared_ptr<SQLite::Database> AcquireConnection(DatabaseError* err = nullptr);
            void ReleaseConnection(std::shared_ptr<SQLite::Database> conn);

            // === Parameter Binding Helpers ===

            template<typename T>
            void bindParameter(SQLite::Statement& stmt, int index, T&& value);

            template<typename T, typename... Args>
            void bindParameters(SQLite::Statement& stmt, int index, T&& first, Args&&... rest);

            void bindParameters(SQLite::Statement&, int) {}

        private:
            DatabaseManager();
            ~DatabaseManager();

            DatabaseManager(const DatabaseManager&) = delete;
            DatabaseManager& operator=(const DatabaseManager&) = delete;

            bool ensureDatabaseDirectory(DatabaseError* err);

            // === Error Handling ===
            void setError(DatabaseError* err, int code, std::wstring_view msg, std::wstring_view ctx = L"") const;
            void setError(DatabaseError* err, const SQLite::Exception& ex, std::wstring_view ctx = L"") const;

            std::atomic<bool> m_initialized{ false };
            DatabaseConfig m_config;
            std::unique_ptr<ConnectionPool> m_connectionPool;
            mutable std::shared_mutex m_configMutex;

            std::atomic<int64_t> m_totalQueries{ 0 };
            std::atomic<int64_t> m_totalTransactions{ 0 };
        };

        // ============================================================================
        // TEMPLATE IMPLEMENTATIONS
        // ============================================================================

        template<typename... Args>
        bool Transaction::ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            if (!m_active || !m_db) {
                setInactiveError(err);
                return false;
            }

            try {
                SQLite::Statement stmt(*m_db, std::string(sql));
                if (m_manager) {
                    m_manager->bindParameters(stmt, 1, std::forward<Args>(args)...);
                }
                stmt.exec();
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"Transaction::ExecuteWithParams");
                return false;
            }
        }

        template<typename... Args>
        QueryResult Transaction::QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            if (!m_active || !m_db) {
                setInactiveError(err);
                return QueryResult{};
            }

            try {
                auto stmt = std::make_unique<SQLite::Statement>(*m_db, std::string(sql));
                if (m_manager) {
                    m_manager->bindParameters(*stmt, 1, std::forward<Args>(args)...);
                }
                return QueryResult{ std::move(stmt) };
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"Transaction::QueryWithParams");
                return QueryResult{};
            }
        }

        template<typename... Args>
        bool DatabaseManager::ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            auto conn = this->AcquireConnection(err);
            if (!conn) return false;

            // RAII guard ensures connection release even on exception
            struct ConnectionGuard {
                DatabaseManager* mgr;
                std::shared_ptr<SQLite::Database> conn;
                ~ConnectionGuard() {
                    if (conn && mgr) {
                        mgr->ReleaseConnection(conn);
                    }
                }
            } guard{ this, conn };

            try {
                SQLite::Statement stmt(*conn, std::string(sql));
                this->bindParameters(stmt, 1, std::forward<Args>(args)...);
                stmt.exec();
                this->m_totalQueries.fetch_add(1, std::memory_order_relaxed);
                return true;
            }
            catch (const SQLite::Exception& ex) {
                this->setError(err, ex, L"ExecuteWithParams");
                return false;
            }
        }

        template<typename... Args>
        QueryResult DatabaseManager::QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            auto conn = this->AcquireConnection(err);
            if (!conn) return QueryResult{};

            struct ConnectionGuard {
                DatabaseManager* mgr;
                std::shared_ptr<SQLite::Database> conn;
                bool released = false;
                ~ConnectionGuard() {
                    if (conn && mgr && !released) {
                        mgr->ReleaseConnection(conn);
                    }
                }
            } guard{ this, conn };

            try {
                auto stmt = std::make_unique<SQLite::Statement>(*conn, std::string(sql));
                this->bindParameters(*stmt, 1, std::forward<Args>(args)...);
                this->m_totalQueries.fetch_add(1, std::memory_order_relaxed);

                // QueryResult now owns the connection
                guard.released = true;
                return QueryResult{ std::move(stmt), conn, this };
            }
            catch (const SQLite::Exception& ex) {
                this->setError(err, ex, L"QueryWithParams");
                return QueryResult{};
            }
        }

        template<typename T>
        void DatabaseManager::bindParameter(SQLite::Statement& stmt, int index, T&& value) {
            using DecayT = std::decay_t<T>;

            if constexpr (std::is_same_v<DecayT, bool>) {
                stmt.bind(index, static_cast<int>(value));
            }
            else if constexpr (std::is_same_v<DecayT, int>) {
                stmt.bind(index, value);
            }
            else if constexpr (std::is_same_v<DecayT, int64_t> || std::is_same_v<DecayT, long long> ||
                               std::is_same_v<DecayT, uint32_t>) {
                stmt.bind(index, static_cast<int64_t>(value));
            }
            else if constexpr (std::is_same_v<DecayT, double> || std::is_same_v<DecayT, float>) {
                stmt.bind(index, static_cast<double>(value));
            }
            else if constexpr (std::is_same_v<DecayT, const char*> || std::is_same_v<DecayT, char*> ||
                               std::is_same_v<DecayT, std::string>) {
                stmt.bind(index, std::string(value));
            }
            else if constexpr (std::is_same_v<DecayT, std::string_view>) {
                stmt.bind(index, std::string(value));
            }
            else if constexpr (std::is_same_v<DecayT, std::optional<std::string>>) {
                if (value.has_value()) {
                    stmt.bind(index, *value);
                }
                else {
                    stmt.bind(index);
                }
            }
            else if constexpr (std::is_same_v<DecayT, std::nullptr_t>) {
                stmt.bind(index);  // NULL
            }
            else {
                static_assert(sizeof(T) == 0, "Unsupported parameter type");
            }
        }

        template<typename T, typename... Args>
        void DatabaseManager::bindParameters(SQLite::Statement& stmt, int index, T&& first, Args&&... rest) {
            bindParameter(stmt, index, std::forward<T>(first));
            bindParameters(stmt, index + 1, std::forward<Args>(rest)...);
        }

    } // namespace Database
} // namespace JitGuard
