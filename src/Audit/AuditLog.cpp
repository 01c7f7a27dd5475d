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
#include "AuditLog.hpp"

#include "../Database/DatabaseManager.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <sstream>

namespace JitGuard {
    namespace Audit {

        using Core::ErrorKind;
        using Core::ServiceError;
        using Core::SetError;
        using Core::SetStorageError;
        using Database::DatabaseError;
        using Database::Transaction;

        namespace {
            constexpr const wchar_t* LOG_CATEGORY = L"AuditLog";

            constexpr int AUDIT_SCHEMA_VERSION = 1;

            constexpr const char* SELECT_COLUMNS =
                "SELECT id, timestamp, outcome, success, error_code, "
                "user_account_name, user_domain_name, user_account_sid, user_domain_sid, "
                "asker_path, target_path, target_command_line, target_working_directory, "
                "target_sha1, target_sha256, target_signature_status, target_signer, "
                "elevation_kind, elevation_method, profile_id, rule_id, reason "
                "FROM jit_elevation_log";

            const std::vector<std::string>& SchemaStatements() {
                static const std::vector<std::string> statements = {
                    R"(CREATE TABLE IF NOT EXISTS jit_elevation_log (
                        id                          INTEGER PRIMARY KEY AUTOINCREMENT,
                        timestamp                   INTEGER NOT NULL,
                        outcome                     TEXT NOT NULL,
                        success                     INTEGER NOT NULL,
                        error_code                  INTEGER NOT NULL DEFAULT 0,
                        user_account_name           TEXT NOT NULL,
                        user_domain_name            TEXT NOT NULL,
                        user_account_sid            TEXT NOT NULL,
                        user_domain_sid             TEXT NOT NULL,
                        asker_path                  TEXT NOT NULL,
                        target_path                 TEXT NOT NULL,
                        target_command_line         TEXT NOT NULL,
                        target_working_directory    TEXT NOT NULL,
                        target_sha1                 TEXT NOT NULL,
                        target_sha256               TEXT NOT NULL,
                        target_signature_status     INTEGER NOT NULL,
                        target_signer               TEXT,
                        elevation_kind              TEXT,
                        elevation_method            TEXT,
                        profile_id                  INTEGER,
                        rule_id                     INTEGER,
                        reason                      TEXT NOT NULL DEFAULT ''
                    ))",
                    "CREATE INDEX IF NOT EXISTS idx_jit_log_timestamp ON jit_elevation_log(timestamp)",
                    "CREATE INDEX IF NOT EXISTS idx_jit_log_user ON jit_elevation_log(user_account_sid)"
                };
                return statements;
            }

            /// Maps a caller-supplied column name onto a fixed SQL identifier
            const char* ResolveSortColumn(std::string_view column) noexcept {
                if (column == "id")                                 return "id";
                if (column == "timestamp")                          return "timestamp";
                if (column == "success")                            return "success";
                if (column == "target_path")                        return "target_path";
                if (column == "user" || column == "target_user_id") return "user_account_name";
                return "timestamp";
            }

            std::optional<std::string> OptionalText(const std::optional<std::string>& value) {
                return value;
            }

            std::optional<std::string> OptionalId(const std::optional<int64_t>& value) {
                if (!value) return std::nullopt;
                return std::to_string(*value);
            }

            std::string EncodeCommandLine(const std::vector<std::string>& tokens) {
                std::string out;
                if (!Utils::JSON::Stringify(nlohmann::json(tokens), out)) {
                    out = "[]";
                }
                return out;
            }

            std::vector<std::string> DecodeCommandLine(const std::string& text) {
                Utils::JSON::Json j;
                if (!Utils::JSON::Parse(text, j) || !j.is_array()) {
                    return {};
                }
                std::vector<std::string> tokens;
                for (const auto& item : j) {
                    if (item.is_string()) {
                        tokens.push_back(item.get<std::string>());
                    }
                }
                return tokens;
            }
        } // anonymous namespace

        std::string_view GetAuditOutcomeName(AuditOutcome outcome) noexcept {
            switch (outcome) {
            case AuditOutcome::Granted:         return "Granted";
            case AuditOutcome::Denied:          return "Denied";
            case AuditOutcome::LaunchSucceeded: return "LaunchSucceeded";
            case AuditOutcome::LaunchFailed:    return "LaunchFailed";
            default:                            return "Unknown";
            }
        }

        std::optional<AuditOutcome> ParseAuditOutcome(std::string_view name) noexcept {
            if (name == "Granted")         return AuditOutcome::Granted;
            if (name == "Denied")          return AuditOutcome::Denied;
            if (name == "LaunchSucceeded") return AuditOutcome::LaunchSucceeded;
            if (name == "LaunchFailed")    return AuditOutcome::LaunchFailed;
            return std::nullopt;
        }

        int64_t ToUnixMicros(std::chrono::system_clock::time_point tp) noexcept {
            return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
        }

        std::chrono::system_clock::time_point FromUnixMicros(int64_t micros) noexcept {
            micros = std::clamp(micros, MIN_UNIX_MICROS, MAX_UNIX_MICROS);
            return std::chrono::system_clock::time_point(
                std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(micros)));
        }

        // ============================================================================
        // LIFECYCLE
        // ============================================================================

        AuditLog::AuditLog(Database::DatabaseManager& database, uint32_t maxPageSize) noexcept
            : m_db(database)
            , m_maxPageSize(maxPageSize == 0 ? DEFAULT_MAX_PAGE_SIZE : maxPageSize) {
        }

        bool AuditLog::Initialize(ServiceError* err) {
            if (!m_db.IsInitialized()) {
                return SetError(err, ErrorKind::Internal, L"Database is not initialized", L"AuditLog::Initialize");
            }

            DatabaseError dbErr;
            if (!m_db.ExecuteMany(SchemaStatements(), &dbErr)) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to create audit schema: %ls", dbErr.message.c_str());
                return SetStorageError(err, dbErr, L"AuditLog::Initialize");
            }
            if (m_db.GetSchemaVersion("audit", &dbErr) < AUDIT_SCHEMA_VERSION) {
                dbErr.Clear();
                if (!m_db.SetSchemaVersion("audit", AUDIT_SCHEMA_VERSION, &dbErr)) {
                    return SetStorageError(err, dbErr, L"AuditLog::Initialize");
                }
            }

            auto rows = m_db.Query("SELECT COALESCE(MAX(timestamp), 0) FROM jit_elevation_log", &dbErr);
            if (dbErr.HasError()) {
                return SetStorageError(err, dbErr, L"AuditLog::Initialize");
            }
            try {
                if (rows.Next()) {
                    std::lock_guard<std::mutex> lock(m_writeMutex);
                    m_lastTimestampUs = rows.GetInt64(0);
                }
            }
            catch (const SQLite::Exception& e) {
                return SetError(err, ErrorKind::Internal, Utils::ToWide(e.what()), L"AuditLog::Initialize",
                    e.getErrorCode());
            }

            JG_LOG_INFO(LOG_CATEGORY, L"Audit log ready");
            return true;
        }

        // ============================================================================
        // WRITE
        // ============================================================================

        int64_t AuditLog::Append(const AuditEntry& entry) noexcept {
            try {
                std::lock_guard<std::mutex> lock(m_writeMutex);

                int64_t timestampUs = entry.timestamp.time_since_epoch().count() == 0
                    ? ToUnixMicros(std::chrono::system_clock::now())
                    : ToUnixMicros(entry.timestamp);
                timestampUs = std::max(timestampUs, m_lastTimestampUs);

                std::optional<std::string> kind;
                if (entry.elevationKind) kind = std::string(Policy::GetElevationKindName(*entry.elevationKind));
                std::optional<std::string> method;
                if (entry.elevationMethod) method = std::string(Policy::GetElevationMethodName(*entry.elevationMethod));

                DatabaseError dbErr;
                auto tx = m_db.BeginTransaction(Transaction::Type::Immediate, &dbErr);
                if (!tx) {
                    JG_LOG_ERROR(LOG_CATEGORY, L"Audit append failed to begin: %ls", dbErr.message.c_str());
                    return -1;
                }

                if (!tx->ExecuteWithParams(
                    "INSERT INTO jit_elevation_log ("
                    "timestamp, outcome, success, error_code, "
                    "user_account_name, user_domain_name, user_account_sid, user_domain_sid, "
                    "asker_path, target_path, target_command_line, target_working_directory, "
                    "target_sha1, target_sha256, target_signature_status, target_signer, "
                    "elevation_kind, elevation_method, profile_id, rule_id, reason"
                    ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
                    &dbErr,
                    timestampUs,
                    std::string(GetAuditOutcomeName(entry.outcome)),
                    entry.success,
                    static_cast<int64_t>(entry.errorCode),
                    entry.user.accountName,
                    entry.user.domainName,
                    entry.user.accountSid,
                    entry.user.domainSid,
                    entry.askerPath,
                    entry.targetPath,
                    EncodeCommandLine(entry.targetCommandLine),
                    entry.targetWorkingDirectory,
                    entry.targetHash.sha1,
                    entry.targetHash.sha256,
                    static_cast<int>(entry.targetSignatureStatus),
                    OptionalText(entry.targetSigner),
                    kind,
                    method,
                    OptionalId(entry.profileId),
                    OptionalId(entry.ruleId),
                    entry.reason)) {
                    JG_LOG_ERROR(LOG_CATEGORY, L"Audit append failed: %ls", dbErr.message.c_str());
                    return -1;
                }

                const int64_t id = tx->LastInsertRowId();
                if (!tx->Commit(&dbErr)) {
                    JG_LOG_ERROR(LOG_CATEGORY, L"Audit append commit failed: %ls", dbErr.message.c_str());
                    return -1;
                }

                m_lastTimestampUs = timestampUs;
                JG_LOG_DEBUG(LOG_CATEGORY, L"Audit entry %lld (%ls)", static_cast<long long>(id),
                    Utils::ToWide(GetAuditOutcomeName(entry.outcome)).c_str());
                return id;
            }
            catch (const std::exception& e) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Audit append failed: %ls", Utils::ToWide(e.what()).c_str());
                return -1;
            }
        }

        // ============================================================================
        // READ
        // ============================================================================

        std::string AuditLog::buildWhereSQL(const AuditQuery& query, int64_t snapshotId,
            std::vector<std::string>& outParams) const {
            std::ostringstream sql;
            sql << " WHERE id <= ?";
            outParams.push_back(std::to_string(snapshotId));

            if (query.accountSid) {
                sql << " AND user_account_sid = ?";
                outParams.push_back(*query.accountSid);
            }

            if (query.startTime) {
                sql << " AND timestamp >= ?";
                outParams.push_back(std::to_string(ToUnixMicros(*query.startTime)));
            }

            if (query.endTime) {
                sql << " AND timestamp <= ?";
                outParams.push_back(std::to_string(ToUnixMicros(*query.endTime)));
            }

            if (query.outcome) {
                sql << " AND outcome = ?";
                outParams.push_back(std::string(GetAuditOutcomeName(*query.outcome)));
            }

            return sql.str();
        }

        AuditEntry AuditLog::rowToEntry(Database::QueryResult& row) {
            AuditEntry entry;
            entry.id = row.GetInt64(0);
            entry.timestamp = FromUnixMicros(row.GetInt64(1));
            entry.outcome = ParseAuditOutcome(row.GetString(2)).value_or(AuditOutcome::Denied);
            entry.success = row.GetInt(3) != 0;
            entry.errorCode = row.GetInt(4);
            entry.user.accountName = row.GetString(5);
            entry.user.domainName = row.GetString(6);
            entry.user.accountSid = row.GetString(7);
            entry.user.domainSid = row.GetString(8);
            entry.askerPath = row.GetString(9);
            entry.targetPath = row.GetString(10);
            entry.targetCommandLine = DecodeCommandLine(row.GetString(11));
            entry.targetWorkingDirectory = row.GetString(12);
            entry.targetHash.sha1 = row.GetString(13);
            entry.targetHash.sha256 = row.GetString(14);
            entry.targetSignatureStatus = static_cast<Policy::SignatureStatus>(row.GetInt(15));
            if (!row.IsNull(16)) entry.targetSigner = row.GetString(16);
            if (!row.IsNull(17)) entry.elevationKind = Policy::ParseElevationKind(row.GetString(17));
            if (!row.IsNull(18)) entry.elevationMethod = Policy::ParseElevationMethod(row.GetString(18));
            if (!row.IsNull(19)) entry.profileId = row.GetInt64(19);
            if (!row.IsNull(20)) entry.ruleId = row.GetInt64(20);
            entry.reason = row.GetString(21);
            return entry;
        }

        int64_t AuditLog::LatestId(ServiceError* err) const {
            DatabaseError dbErr;
            auto rows = m_db.Query("SELECT COALESCE(MAX(id), 0) FROM jit_elevation_log", &dbErr);
            if (dbErr.HasError()) {
                SetStorageError(err, dbErr, L"AuditLog::LatestId");
                return 0;
            }
            try {
                return rows.Next() ? rows.GetInt64(0) : 0;
            }
            catch (const SQLite::Exception& e) {
                SetError(err, ErrorKind::Internal, Utils::ToWide(e.what()), L"AuditLog::LatestId", e.getErrorCode());
                return 0;
            }
        }

        std::optional<AuditPage> AuditLog::Query(const AuditQuery& query, ServiceError* err) const {
            if (query.pageNumber == 0) {
                SetError(err, ErrorKind::InvalidParameter, L"Page numbers start at 1", L"AuditLog::Query");
                return std::nullopt;
            }
            if (query.pageSize == 0) {
                SetError(err, ErrorKind::InvalidParameter, L"Page size must be positive", L"AuditLog::Query");
                return std::nullopt;
            }
            if (query.startTime && query.endTime && *query.startTime > *query.endTime) {
                SetError(err, ErrorKind::InvalidParameter, L"Start time is after end time", L"AuditLog::Query");
                return std::nullopt;
            }

            const int64_t pageSize = std::min(query.pageSize, m_maxPageSize);

            AuditPage page;
            if (query.snapshotId) {
                page.snapshotId = *query.snapshotId;
            }
            else {
                ServiceError latestErr;
                page.snapshotId = LatestId(&latestErr);
                if (latestErr.HasError()) {
                    if (err) *err = latestErr;
                    return std::nullopt;
                }
            }

            std::vector<std::string> params;
            const std::string where = buildWhereSQL(query, page.snapshotId, params);
            DatabaseError dbErr;

            try {
                {
                    auto rows = m_db.QueryWithParamsVector("SELECT COUNT(*) FROM jit_elevation_log" + where, params, &dbErr);
                    if (dbErr.HasError()) {
                        SetStorageError(err, dbErr, L"AuditLog::Query");
                        return std::nullopt;
                    }
                    page.totalRecords = rows.Next() ? rows.GetInt64(0) : 0;
                }
                page.totalPages = (page.totalRecords + pageSize - 1) / pageSize;

                const char* direction = query.sortDescending ? "DESC" : "ASC";
                std::ostringstream sql;
                sql << SELECT_COLUMNS << where
                    << " ORDER BY " << ResolveSortColumn(query.sortColumn) << ' ' << direction
                    << ", id " << direction
                    << " LIMIT " << pageSize
                    << " OFFSET " << (static_cast<int64_t>(query.pageNumber) - 1) * pageSize;

                auto rows = m_db.QueryWithParamsVector(sql.str(), params, &dbErr);
                if (dbErr.HasError()) {
                    SetStorageError(err, dbErr, L"AuditLog::Query");
                    return std::nullopt;
                }
                while (rows.Next()) {
                    page.rows.push_back(rowToEntry(rows));
                }
            }
            catch (const SQLite::Exception& e) {
                SetError(err, ErrorKind::Internal, Utils::ToWide(e.what()), L"AuditLog::Query", e.getErrorCode());
                return std::nullopt;
            }

            return page;
        }

        std::optional<AuditEntry> AuditLog::GetEntry(int64_t id, ServiceError* err) const {
            DatabaseError dbErr;
            try {
                auto rows = m_db.QueryWithParams(std::string(SELECT_COLUMNS) + " WHERE id = ?", &dbErr, id);
                if (dbErr.HasError()) {
                    SetStorageError(err, dbErr, L"AuditLog::GetEntry");
                    return std::nullopt;
                }
                if (!rows.Next()) {
                    SetError(err, ErrorKind::NotFound, L"Log entry " + std::to_wstring(id) + L" not found",
                        L"AuditLog::GetEntry");
                    return std::nullopt;
                }
                return rowToEntry(rows);
            }
            catch (const SQLite::Exception& e) {
                SetError(err, ErrorKind::Internal, Utils::ToWide(e.what()), L"AuditLog::GetEntry", e.getErrorCode());
                return std::nullopt;
            }
        }

        // ============================================================================
        // JSON
        // ============================================================================

        void to_json(nlohmann::json& j, const AuditEntry& entry) {
            Policy::Signature signature;
            signature.status = entry.targetSignatureStatus;
            signature.signer = entry.targetSigner;

            j = nlohmann::json{
                {"Id", entry.id},
                {"Timestamp", ToUnixMicros(entry.timestamp)},
                {"Outcome", std::string(GetAuditOutcomeName(entry.outcome))},
                {"Success", entry.success},
                {"ErrorCode", entry.errorCode},
                {"User", entry.user},
                {"AskerPath", entry.askerPath},
                {"TargetPath", entry.targetPath},
                {"TargetCommandLine", entry.targetCommandLine},
                {"TargetWorkingDirectory", entry.targetWorkingDirectory},
                {"TargetHash", entry.targetHash},
                {"TargetSignature", signature},
                {"Reason", entry.reason}
            };
            if (entry.elevationKind) j["ElevationKind"] = *entry.elevationKind;
            if (entry.elevationMethod) j["ElevationMethod"] = *entry.elevationMethod;
            if (entry.profileId) j["ProfileId"] = *entry.profileId;
            if (entry.ruleId) j["RuleId"] = *entry.ruleId;
        }

        void to_json(nlohmann::json& j, const AuditPage& page) {
            j = nlohmann::json{
                {"Results", page.rows},
                {"TotalRecords", page.totalRecords},
                {"TotalPages", page.totalPages},
                {"SnapshotId", page.snapshotId}
            };
        }

    } // namespace Audit
} // namespace JitGuard
