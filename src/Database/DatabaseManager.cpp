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

/**
 * ============================================================================
 * JitGuard DatabaseManager - IMPLEMENTATION
 * ============================================================================
 *
 * @file DatabaseManager.cpp
 * @brief SQLite connection pool, transactions and query helpers.
 *
 * SQLite Configuration:
 * ---------------------
 * - Journal mode: WAL (DELETE when WAL is disabled)
 * - Synchronous: NORMAL by default
 * - Foreign keys: ON by default
 * - busy_timeout: from DatabaseConfig, applied at open
 * ============================================================================
 */

#include "DatabaseManager.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace JitGuard {
    namespace Database {

        // ============================================================================
        // INTERNAL UTILITIES & CONSTANTS
        // ============================================================================

        namespace {
            constexpr const wchar_t* LOG_CATEGORY = L"Database";

            using Utils::ToWide;
            using Utils::ToNarrow;

            /**
             * @brief Internal key/value table.
             *
             * Holds one schema_version:<component> row per table owner so the
             * policy and audit schemas can migrate independently.
             */
            constexpr const char* SQL_CREATE_METADATA_TABLE = R"(
                CREATE TABLE IF NOT EXISTS _metadata (
                    key TEXT PRIMARY KEY NOT NULL,
                    value TEXT NOT NULL,
                    updated_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now'))
                ) WITHOUT ROWID;
            )";

            constexpr const char* SQL_GET_SCHEMA_VERSION =
                "SELECT value FROM _metadata WHERE key = ?";

            constexpr const char* SQL_SET_SCHEMA_VERSION =
                "INSERT OR REPLACE INTO _metadata (key, value) VALUES (?, ?)";

            std::string SchemaVersionKey(std::string_view component) {
                return "schema_version:" + std::string(component);
            }
        } // anonymous namespace

        // ============================================================================
        // QUERY RESULT IMPLEMENTATION
        // ============================================================================

        QueryResult::QueryResult(
            std::unique_ptr<SQLite::Statement>&& stmt,
            std::shared_ptr<SQLite::Database> conn,
            DatabaseManager* manager
        ) noexcept
            : m_statement(std::move(stmt))
            , m_connection(std::move(conn))
            , m_manager(manager)
        {
            if (m_statement) {
                m_hasRows = (m_statement->getColumnCount() > 0);
            }
        }

        /**
         * @brief Releases the statement, then returns the connection to the pool.
         *
         * The statement holds a reference to the connection and must go first.
         */
        QueryResult::~QueryResult() {
            m_statement.reset();

            if (m_connection && m_manager) {
                m_manager->ReleaseConnection(m_connection);
            }
        }

        QueryResult::QueryResult(QueryResult&& other) noexcept
            : m_statement(std::move(other.m_statement))
            , m_connection(std::move(other.m_connection))
            , m_manager(other.m_manager)
            , m_hasRows(other.m_hasRows)
            , m_columnIndexCache(std::move(other.m_columnIndexCache))
        {
            other.m_manager = nullptr;
            other.m_hasRows = false;
        }

        QueryResult& QueryResult::operator=(QueryResult&& other) noexcept {
            if (this != &other) {
                m_statement.reset();

                if (m_connection && m_manager) {
                    m_manager->ReleaseConnection(m_connection);
                }

                m_statement = std::move(other.m_statement);
                m_connection = std::move(other.m_connection);
                m_manager = other.m_manager;
                m_hasRows = other.m_hasRows;
                m_columnIndexCache = std::move(other.m_columnIndexCache);

                other.m_manager = nullptr;
                other.m_hasRows = false;
            }
            return *this;
        }

        /**
         * @brief Advances to the next row in the result set.
         *
         * @return true if a row is available, false if no more rows or error
         * @note Logs errors but does not throw
         */
        bool QueryResult::Next() {
            if (!m_statement) return false;

            try {
                return m_statement->executeStep();
            }
            catch (const SQLite::Exception& ex) {
                JG_LOG_ERROR(LOG_CATEGORY, L"QueryResult::Next failed: %ls", ToWide(ex.what()).c_str());
                return false;
            }
        }

        int QueryResult::ColumnCount() const noexcept {
            return m_statement ? m_statement->getColumnCount() : 0;
        }

        int QueryResult::GetInt(int columnIndex) const {
            if (!m_statement) throw std::runtime_error("Invalid statement");
            return m_statement->getColumn(columnIndex).getInt();
        }

        int64_t QueryResult::GetInt64(int columnIndex) const {
            if (!m_statement) throw std::runtime_error("Invalid statement");
            return m_statement->getColumn(columnIndex).getInt64();
        }

        double QueryResult::GetDouble(int columnIndex) const {
            if (!m_statement) throw std::runtime_error("Invalid statement");
            return m_statement->getColumn(columnIndex).getDouble();
        }

        std::string QueryResult::GetString(int columnIndex) const {
            if (!m_statement) throw std::runtime_error("Invalid statement");
            return m_statement->getColumn(columnIndex).getString();
        }

        int QueryResult::GetInt(std::string_view columnName) const {
            return GetInt(getColumnIndex(columnName));
        }

        int64_t QueryResult::GetInt64(std::string_view columnName) const {
            return GetInt64(getColumnIndex(columnName));
        }

        double QueryResult::GetDouble(std::string_view columnName) const {
            return GetDouble(getColumnIndex(columnName));
        }

        std::string QueryResult::GetString(std::string_view columnName) const {
            return GetString(getColumnIndex(columnName));
        }

        bool QueryResult::IsNull(int columnIndex) const {
            if (!m_statement) return true;
            return m_statement->getColumn(columnIndex).isNull();
        }

        bool QueryResult::IsNull(std::string_view columnName) const {
            return IsNull(getColumnIndex(columnName));
        }

        int QueryResult::getColumnIndex(std::string_view columnName) const {
            std::string name(columnName);

            auto it = m_columnIndexCache.find(name);
            if (it != m_columnIndexCache.end()) {
                return it->second;
            }

            if (!m_statement) throw std::runtime_error("Invalid statement");

            for (int i = 0; i < ColumnCount(); ++i) {
                if (m_statement->getColumnName(i) == name) {
                    m_columnIndexCache[name] = i;
                    return i;
                }
            }

            throw std::runtime_error("Column not found: " + name);
        }

        // ============================================================================
        // CONNECTION POOL IMPLEMENTATION
        // ============================================================================

        ConnectionPool::ConnectionPool(const DatabaseConfig& config) noexcept
            : m_config(config)
        {
        }

        ConnectionPool::~ConnectionPool() {
            Shutdown();
        }

        /**
         * @brief Pre-warms the pool with minConnections connections.
         *
         * If any connection fails to open, the whole pool is shut down.
         */
        bool ConnectionPool::Initialize(DatabaseError* err) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);

                const size_t initial = std::max<size_t>(1, m_config.minConnections);
                bool ok = true;
                for (size_t i = 0; i < initial; ++i) {
                    if (!createConnection(err)) {
                        ok = false;
                        break;
                    }
                }

                if (ok) {
                    JG_LOG_INFO(LOG_CATEGORY, L"Connection pool initialized with %zu connections", m_connections.size());
                    return true;
                }
            }

            Shutdown();
            return false;
        }

        void ConnectionPool::Shutdown() {
            const bool wasShutdown = m_shutdown.exchange(true, std::memory_order_acq_rel);
            if (wasShutdown) {
                return;
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_cv.notify_all();

            // Connections still held by a QueryResult stay alive through their
            // shared_ptr and close when the last owner lets go.
            m_connections.clear();
            m_activeCount.store(0, std::memory_order_release);

            JG_LOG_INFO(LOG_CATEGORY, L"Connection pool shut down");
        }

        std::shared_ptr<SQLite::Database> ConnectionPool::Acquire(
            std::chrono::milliseconds timeout,
            DatabaseError* err
        ) {
            std::unique_lock<std::mutex> lock(m_mutex);

            const auto deadline = std::chrono::steady_clock::now() + timeout;

            while (true) {
                if (m_shutdown.load(std::memory_order_acquire)) {
                    if (err) {
                        err->sqliteCode = SQLITE_ERROR;
                        err->message = L"Connection pool is shut down";
                    }
                    return nullptr;
                }

                for (auto& pooled : m_connections) {
                    if (!pooled.inUse) {
                        pooled.inUse = true;
                        pooled.lastUsed = std::chrono::steady_clock::now();
                        m_activeCount.fetch_add(1, std::memory_order_relaxed);
                        return pooled.connection;
                    }
                }

                if (m_connections.size() < m_config.maxConnections) {
                    if (createConnection(err)) {
                        auto& pooled = m_connections.back();
                        pooled.inUse = true;
                        m_activeCount.fetch_add(1, std::memory_order_relaxed);
                        return pooled.connection;
                    }
                    return nullptr;
                }

                if (m_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
                    if (err) {
                        err->sqliteCode = SQLITE_BUSY;
                        err->message = L"Connection acquisition timeout";
                    }
                    JG_LOG_WARN(LOG_CATEGORY, L"Connection acquisition timeout after %lld ms",
                        static_cast<long long>(timeout.count()));
                    return nullptr;
                }
            }
        }

        void ConnectionPool::Release(std::shared_ptr<SQLite::Database> conn) {
            if (!conn) return;

            std::lock_guard<std::mutex> lock(m_mutex);

            for (auto& pooled : m_connections) {
                if (pooled.connection == conn) {
                    pooled.inUse = false;
                    pooled.lastUsed = std::chrono::steady_clock::now();
                    m_activeCount.fetch_sub(1, std::memory_order_relaxed);
                    m_cv.notify_one();
                    return;
                }
            }

            // Expected after Shutdown(): the pool no longer tracks it.
            JG_LOG_DEBUG(LOG_CATEGORY, L"Released connection not found in pool");
        }

        size_t ConnectionPool::AvailableConnections() const noexcept {
            std::lock_guard<std::mutex> lock(m_mutex);

            size_t available = 0;
            for (const auto& pooled : m_connections) {
                if (!pooled.inUse) ++available;
            }
            return available;
        }

        size_t ConnectionPool::TotalConnections() const noexcept {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_connections.size();
        }

        bool ConnectionPool::createConnection(DatabaseError* err) {
            try {
                const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

                auto connection = std::make_shared<SQLite::Database>(
                    ToNarrow(m_config.databasePath),
                    flags,
                    m_config.busyTimeoutMs
                );

                if (!configureConnection(*connection, err)) {
                    return false;
                }

                PooledConnection pooled;
                pooled.connection = std::move(connection);
                pooled.lastUsed = std::chrono::steady_clock::now();
                pooled.inUse = false;

                m_connections.push_back(std::move(pooled));

                JG_LOG_DEBUG(LOG_CATEGORY, L"Created new database connection (%zu total)", m_connections.size());
                return true;
            }
            catch (const SQLite::Exception& ex) {
                if (err) {
                    err->sqliteCode = ex.getErrorCode();
                    err->extendedCode = ex.getExtendedErrorCode();
                    err->message = ToWide(ex.what());
                    err->context = L"createConnection";
                }
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to create connection: %ls", ToWide(ex.what()).c_str());
                return false;
            }
        }

        bool ConnectionPool::configureConnection(SQLite::Database& db, DatabaseError* err) {
            try {
                if (m_config.enableForeignKeys) {
                    db.exec("PRAGMA foreign_keys = ON");
                }

                db.exec(m_config.enableWAL ? "PRAGMA journal_mode = WAL" : "PRAGMA journal_mode = DELETE");

                db.exec("PRAGMA synchronous = " + ToNarrow(m_config.synchronousMode));

                db.exec("PRAGMA cache_size = -" + std::to_string(m_config.cacheSizeKB));

                db.exec("PRAGMA temp_store = MEMORY");

                return true;
            }
            catch (const SQLite::Exception& ex) {
                if (err) {
                    err->sqliteCode = ex.getErrorCode();
                    err->extendedCode = ex.getExtendedErrorCode();
                    err->message = ToWide(ex.what());
                    err->context = L"configureConnection";
                }
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to configure connection: %ls", ToWide(ex.what()).c_str());
                return false;
            }
        }

        // ============================================================================
        // TRANSACTION IMPLEMENTATION
        // ============================================================================
        //
        // Usage Pattern:
        //   auto txn = manager.BeginTransaction(Transaction::Type::Immediate, &err);
        //   if (!txn || !txn->IsActive()) { handle error }
        //   txn->ExecuteWithParams("INSERT ...", &err, a, b);
        //   txn->Commit(&err);   // otherwise the destructor rolls back
        // ============================================================================

        Transaction::Transaction(
            SQLite::Database& db,
            std::shared_ptr<SQLite::Database> conn,
            DatabaseManager* manager,
            Type type,
            DatabaseError* err
        ) : m_db(&db)
            , m_connection(std::move(conn))
            , m_manager(manager)
        {
            try {
                const char* sql = "BEGIN DEFERRED TRANSACTION";
                switch (type) {
                case Type::Deferred:
                    sql = "BEGIN DEFERRED TRANSACTION";
                    break;
                case Type::Immediate:
                    sql = "BEGIN IMMEDIATE TRANSACTION";
                    break;
                case Type::Exclusive:
                    sql = "BEGIN EXCLUSIVE TRANSACTION";
                    break;
                }

                m_db->exec(sql);
                m_active = true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"Transaction::Begin");
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to begin transaction: %ls", ToWide(ex.what()).c_str());
                m_active = false;
            }
        }

        Transaction::~Transaction() {
            if (m_active && !m_committed && m_db) {
                try {
                    m_db->exec("ROLLBACK");
                    JG_LOG_DEBUG(LOG_CATEGORY, L"Transaction rolled back (destructor)");
                }
                catch (const SQLite::Exception& ex) {
                    JG_LOG_ERROR(LOG_CATEGORY, L"Failed to rollback transaction: %ls", ToWide(ex.what()).c_str());
                }
            }

            if (m_connection && m_manager) {
                m_manager->ReleaseConnection(m_connection);
            }
        }

        Transaction::Transaction(Transaction&& other) noexcept
            : m_db(other.m_db)
            , m_connection(std::move(other.m_connection))
            , m_manager(other.m_manager)
            , m_active(other.m_active)
            , m_committed(other.m_committed)
        {
            other.m_db = nullptr;
            other.m_manager = nullptr;
            other.m_active = false;
            other.m_committed = false;
        }

        Transaction& Transaction::operator=(Transaction&& other) noexcept {
            if (this != &other) {
                if (m_active && !m_committed && m_db) {
                    try {
                        m_db->exec("ROLLBACK");
                    }
                    catch (const SQLite::Exception& ex) {
                        JG_LOG_ERROR(LOG_CATEGORY, L"Failed to rollback transaction: %ls", ToWide(ex.what()).c_str());
                    }
                }

                if (m_connection && m_manager) {
                    m_manager->ReleaseConnection(m_connection);
                }

                m_db = other.m_db;
                m_connection = std::move(other.m_connection);
                m_manager = other.m_manager;
                m_active = other.m_active;
                m_committed = other.m_committed;

                other.m_db = nullptr;
                other.m_manager = nullptr;
                other.m_active = false;
                other.m_committed = false;
            }
            return *this;
        }

        bool Transaction::Execute(std::string_view sql, DatabaseError* err) {
            if (!m_active || !m_db) {
                setInactiveError(err);
                return false;
            }

            try {
                m_db->exec(std::string(sql));
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"Transaction::Execute");
                return false;
            }
        }

        bool Transaction::Commit(DatabaseError* err) {
            if (!m_active) {
                setInactiveError(err);
                return false;
            }

            try {
                m_db->exec("COMMIT");
                m_committed = true;
                m_active = false;
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"Transaction::Commit");
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to commit transaction: %ls", ToWide(ex.what()).c_str());
                return false;
            }
        }

        bool Transaction::Rollback(DatabaseError* err) {
            if (!m_active) {
                setInactiveError(err);
                return false;
            }

            try {
                m_db->exec("ROLLBACK");
                m_active = false;
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"Transaction::Rollback");
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to rollback transaction: %ls", ToWide(ex.what()).c_str());
                return false;
            }
        }

        int64_t Transaction::LastInsertRowId() const noexcept {
            return m_db ? m_db->getLastInsertRowid() : -1;
        }

        int Transaction::Changes() const noexcept {
            return m_db ? sqlite3_changes(m_db->getHandle()) : 0;
        }

        void Transaction::setError(DatabaseError* err, const SQLite::Exception& ex, std::wstring_view ctx) const {
            if (!err) return;
            err->sqliteCode = ex.getErrorCode();
            err->extendedCode = ex.getExtendedErrorCode();
            err->message = ToWide(ex.what());
            err->context = ctx;
        }

        void Transaction::setInactiveError(DatabaseError* err) const {
            if (!err) return;
            err->sqliteCode = SQLITE_MISUSE;
            err->message = L"Transaction not active";
        }

        // ============================================================================
        // DATABASE MANAGER IMPLEMENTATION
        // ============================================================================

        DatabaseManager& DatabaseManager::Instance() {
            static DatabaseManager instance;
            return instance;
        }

        DatabaseManager::DatabaseManager() {
        }

        DatabaseManager::~DatabaseManager() {
            Shutdown();
        }

        bool DatabaseManager::Initialize(const DatabaseConfig& config, DatabaseError* err) {
            if (m_initialized.load(std::memory_order_acquire)) {
                JG_LOG_WARN(LOG_CATEGORY, L"DatabaseManager already initialized");
                return true;
            }

            if (!config.IsValid()) {
                setError(err, SQLITE_MISUSE, L"Invalid database configuration", L"Initialize");
                return false;
            }

            JG_LOG_INFO(LOG_CATEGORY, L"Initializing DatabaseManager (%ls)", config.databasePath.c_str());

            std::unique_lock<std::shared_mutex> lock(m_configMutex);
            m_config = config;

            if (m_connectionPool) {
                m_connectionPool->Shutdown();
                m_connectionPool.reset();
            }

            if (!ensureDatabaseDirectory(err)) {
                return false;
            }

            m_connectionPool = std::make_unique<ConnectionPool>(m_config);
            if (!m_connectionPool->Initialize(err)) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to initialize connection pool");
                m_connectionPool.reset();
                return false;
            }

            // Set before Execute() so AcquireConnection() works during setup
            m_initialized.store(true, std::memory_order_release);

            if (!Execute(SQL_CREATE_METADATA_TABLE, err)) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to create metadata table");
                m_initialized.store(false, std::memory_order_release);
                m_connectionPool->Shutdown();
                m_connectionPool.reset();
                return false;
            }

            JG_LOG_INFO(LOG_CATEGORY, L"DatabaseManager initialized successfully");
            return true;
        }

        void DatabaseManager::Shutdown() {
            const bool wasInitialized = m_initialized.exchange(false, std::memory_order_acq_rel);
            if (!wasInitialized && !m_connectionPool) {
                return;
            }

            std::unique_lock<std::shared_mutex> lock(m_configMutex);
            if (m_connectionPool) {
                m_connectionPool->Shutdown();
                m_connectionPool.reset();
            }

            JG_LOG_INFO(LOG_CATEGORY, L"DatabaseManager shut down");
        }

        bool DatabaseManager::Execute(std::string_view sql, DatabaseError* err) {
            auto conn = AcquireConnection(err);
            if (!conn) return false;

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
                conn->exec(std::string(sql));
                m_totalQueries.fetch_add(1, std::memory_order_relaxed);
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"Execute");
                return false;
            }
        }

        bool DatabaseManager::ExecuteMany(const std::vector<std::string>& statements, DatabaseError* err) {
            auto tx = BeginTransaction(Transaction::Type::Immediate, err);
            if (!tx || !tx->IsActive()) {
                return false;
            }

            for (const auto& sql : statements) {
                if (!tx->Execute(sql, err)) {
                    // Destructor rolls back
                    return false;
                }
                m_totalQueries.fetch_add(1, std::memory_order_relaxed);
            }

            return tx->Commit(err);
        }

        QueryResult DatabaseManager::Query(std::string_view sql, DatabaseError* err) {
            auto conn = AcquireConnection(err);
            if (!conn) return QueryResult{};

            try {
                auto stmt = std::make_unique<SQLite::Statement>(*conn, std::string(sql));
                m_totalQueries.fetch_add(1, std::memory_order_relaxed);
                return QueryResult{ std::move(stmt), conn, this };
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"Query");
                ReleaseConnection(conn);
                return QueryResult{};
            }
        }

        /**
         * @brief Executes a query whose parameters are all strings.
         *
         * Used by dynamically built filters where the number of bound values
         * depends on which filter fields are present.
         */
        QueryResult DatabaseManager::QueryWithParamsVector(
            std::string_view sql,
            const std::vector<std::string>& params,
            DatabaseError* err
        ) {
            auto conn = AcquireConnection(err);
            if (!conn) {
                return QueryResult();
            }

            try {
                auto stmt = std::make_unique<SQLite::Statement>(*conn, std::string(sql));

                for (size_t i = 0; i < params.size(); ++i) {
                    stmt->bind(static_cast<int>(i + 1), params[i]);
                }

                m_totalQueries.fetch_add(1, std::memory_order_relaxed);
                return QueryResult(std::move(stmt), conn, this);
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"QueryWithParamsVector");
                ReleaseConnection(conn);
                return QueryResult();
            }
        }

        std::unique_ptr<Transaction> DatabaseManager::BeginTransaction(
            Transaction::Type type,
            DatabaseError* err
        ) {
            auto conn = AcquireConnection(err);
            if (!conn) return nullptr;

            m_totalTransactions.fetch_add(1, std::memory_order_relaxed);

            auto tx = std::make_unique<Transaction>(*conn, conn, this, type, err);
            if (!tx->IsActive()) {
                return nullptr;
            }
            return tx;
        }

        bool DatabaseManager::TableExists(std::string_view tableName, DatabaseError* err) {
            try {
                auto result = QueryWithParams(
                    "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?",
                    err,
                    std::string(tableName)
                );

                if (result.Next()) {
                    return result.GetInt(0) > 0;
                }
                return false;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"TableExists");
                return false;
            }
        }

        std::shared_ptr<SQLite::Database> DatabaseManager::AcquireConnection(DatabaseError* err) {
            if (!m_initialized.load(std::memory_order_acquire) || !m_connectionPool) {
                setError(err, SQLITE_MISUSE, L"DatabaseManager not initialized");
                return nullptr;
            }

            return m_connectionPool->Acquire(m_config.connectionTimeout, err);
        }

        void DatabaseManager::ReleaseConnection(std::shared_ptr<SQLite::Database> conn) {
            if (conn && m_connectionPool) {
                m_connectionPool->Release(conn);
            }
        }

        // ============================================================================
        // SCHEMA VERSIONING
        // ============================================================================

        /**
         * @brief Gets the schema version recorded for a component.
         * @return Version number, 0 if not set, -1 on error
         */
        int DatabaseManager::GetSchemaVersion(std::string_view component, DatabaseError* err) {
            try {
                DatabaseError local;
                auto result = QueryWithParams(SQL_GET_SCHEMA_VERSION, &local, SchemaVersionKey(component));
                if (local.HasError()) {
                    if (err) *err = local;
                    return -1;
                }
                if (result.Next()) {
                    return std::stoi(result.GetString(0));
                }
                return 0;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, L"GetSchemaVersion");
                return -1;
            }
            catch (const std::logic_error&) {
                setError(err, SQLITE_MISMATCH, L"Corrupt schema version value", L"GetSchemaVersion");
                return -1;
            }
        }

        bool DatabaseManager::SetSchemaVersion(std::string_view component, int version, DatabaseError* err) {
            return ExecuteWithParams(SQL_SET_SCHEMA_VERSION, err, SchemaVersionKey(component), std::to_string(version));
        }

        bool DatabaseManager::ensureDatabaseDirectory(DatabaseError* err) {
            const std::filesystem::path dbPath(ToNarrow(m_config.databasePath));
            if (!dbPath.has_parent_path()) {
                return true;
            }

            std::error_code ec;
            std::filesystem::create_directories(dbPath.parent_path(), ec);
            if (ec) {
                setError(err, SQLITE_CANTOPEN, ToWide(ec.message()), L"ensureDatabaseDirectory");
                JG_LOG_ERROR(LOG_CATEGORY, L"Cannot create database directory: %ls", ToWide(ec.message()).c_str());
                return false;
            }
            return true;
        }

        // ============================================================================
        // ERROR HANDLING
        // ============================================================================

        void DatabaseManager::setError(
            DatabaseError* err,
            int code,
            std::wstring_view msg,
            std::wstring_view ctx
        ) const {
            if (!err) return;

            err->sqliteCode = code;
            err->message = msg;
            err->context = ctx;
        }

        void DatabaseManager::setError(
            DatabaseError* err,
            const SQLite::Exception& ex,
            std::wstring_view ctx
        ) const {
            if (!err) return;

            err->sqliteCode = ex.getErrorCode();
            err->extendedCode = ex.getExtendedErrorCode();
            err->message = ToWide(ex.what());
            err->context = ctx;
        }

    } // namespace Database
} // namespace JitGuard
