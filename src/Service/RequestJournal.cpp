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
#include "RequestJournal.hpp"

#include "../Audit/AuditLog.hpp"
#include "../Database/DatabaseManager.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <chrono>

namespace JitGuard {
    namespace Service {

        using Core::ErrorKind;
        using Core::ServiceError;
        using Core::SetError;
        using Core::SetStorageError;
        using Database::DatabaseError;
        using Database::Transaction;

        namespace {
            constexpr const wchar_t* LOG_CATEGORY = L"RequestJournal";

            constexpr int JOURNAL_SCHEMA_VERSION = 1;

            const std::vector<std::string>& SchemaStatements() {
                static const std::vector<std::string> statements = {
                    R"(CREATE TABLE IF NOT EXISTS service_run (
                        id          INTEGER PRIMARY KEY AUTOINCREMENT,
                        start_time  INTEGER NOT NULL,
                        endpoint    TEXT NOT NULL
                    ))",
                    R"(CREATE TABLE IF NOT EXISTS request_log (
                        id          INTEGER PRIMARY KEY,
                        run_id      INTEGER NOT NULL REFERENCES service_run(id),
                        timestamp   INTEGER NOT NULL,
                        method      TEXT NOT NULL,
                        path        TEXT NOT NULL,
                        status_code INTEGER NOT NULL
                    ))"
                };
                return statements;
            }
        }

        RequestJournal::RequestJournal(Database::DatabaseManager& database) noexcept
            : m_db(database) {
        }

        bool RequestJournal::Initialize(std::string_view endpoint, ServiceError* err) {
            if (!m_db.IsInitialized()) {
                return SetError(err, ErrorKind::Internal, L"Database is not initialized", L"RequestJournal::Initialize");
            }

            DatabaseError dbErr;
            if (!m_db.ExecuteMany(SchemaStatements(), &dbErr)) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to create journal schema: %ls", dbErr.message.c_str());
                return SetStorageError(err, dbErr, L"RequestJournal::Initialize");
            }
            if (m_db.GetSchemaVersion("journal", &dbErr) < JOURNAL_SCHEMA_VERSION) {
                dbErr.Clear();
                if (!m_db.SetSchemaVersion("journal", JOURNAL_SCHEMA_VERSION, &dbErr)) {
                    return SetStorageError(err, dbErr, L"RequestJournal::Initialize");
                }
            }

            auto tx = m_db.BeginTransaction(Transaction::Type::Immediate, &dbErr);
            if (!tx) {
                return SetStorageError(err, dbErr, L"RequestJournal::Initialize");
            }

            int64_t lastRequestId = 0;
            {
                auto rows = tx->QueryWithParams("SELECT COALESCE(MAX(id), 0) FROM request_log", &dbErr);
                if (dbErr.HasError()) {
                    return SetStorageError(err, dbErr, L"RequestJournal::Initialize");
                }
                try {
                    if (rows.Next()) {
                        lastRequestId = rows.GetInt64(0);
                    }
                }
                catch (const SQLite::Exception& e) {
                    return SetError(err, ErrorKind::Internal, Utils::ToWide(e.what()), L"RequestJournal::Initialize",
                        e.getErrorCode());
                }
            }

            const int64_t startTime = Audit::ToUnixMicros(std::chrono::system_clock::now());
            if (!tx->ExecuteWithParams("INSERT INTO service_run (start_time, endpoint) VALUES (?, ?)",
                &dbErr, startTime, std::string(endpoint))) {
                return SetStorageError(err, dbErr, L"RequestJournal::Initialize");
            }
            const int64_t runId = tx->LastInsertRowId();
            if (!tx->Commit(&dbErr)) {
                return SetStorageError(err, dbErr, L"RequestJournal::Initialize");
            }

            m_lastRequestId.store(lastRequestId);
            m_runId.store(runId);
            JG_LOG_INFO(LOG_CATEGORY, L"Run %lld started on %ls, request counter at %lld",
                static_cast<long long>(runId), Utils::ToWide(endpoint).c_str(), static_cast<long long>(lastRequestId));
            return true;
        }

        bool RequestJournal::Record(int64_t requestId, std::string_view method, std::string_view path,
            int statusCode) noexcept {
            const int64_t runId = m_runId.load();
            if (runId == 0) {
                return false;
            }
            try {
                DatabaseError dbErr;
                if (!m_db.ExecuteWithParams(
                    "INSERT INTO request_log (id, run_id, timestamp, method, path, status_code) VALUES (?, ?, ?, ?, ?, ?)",
                    &dbErr,
                    requestId,
                    runId,
                    Audit::ToUnixMicros(std::chrono::system_clock::now()),
                    std::string(method),
                    std::string(path),
                    statusCode)) {
                    JG_LOG_ERROR(LOG_CATEGORY, L"Failed to record request %lld: %ls",
                        static_cast<long long>(requestId), dbErr.message.c_str());
                    return false;
                }
                return true;
            }
            catch (const std::bad_alloc&) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to record request %lld: out of memory",
                    static_cast<long long>(requestId));
                return false;
            }
        }

    } // namespace Service
} // namespace JitGuard
