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
 * JitGuard Audit Log
 * ============================================================================
 *
 * @file AuditLog.hpp
 * @brief Append-only, queryable record of elevation decisions and launches.
 *
 * Storage: one row per entry in the jit_elevation_log table, keyed by an
 * AUTOINCREMENT id. Appends are serialized behind a single writer mutex and
 * timestamps are clamped to be non-decreasing, so id order, append order and
 * timestamp order agree.
 *
 * Paging uses snapshot-at-first-page semantics: the first Query captures
 * snapshotId = MAX(id) and every count and row is restricted to
 * id <= snapshotId. Callers hand the snapshotId back for later pages, so
 * entries appended in between never shift rows across pages.
 * ============================================================================
 */

#include "../Core/ServiceError.hpp"
#include "../Policy/PolicyTypes.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace JitGuard {

    namespace Database {
        class DatabaseManager;
        class QueryResult;
    }

    namespace Audit {

        enum class AuditOutcome : uint8_t {
            Granted = 0,        ///< Decision allowed elevation
            Denied,             ///< Decision refused elevation (policy or fail-closed)
            LaunchSucceeded,    ///< Launch executor created the process
            LaunchFailed        ///< Launch executor reported a platform error
        };

        [[nodiscard]] std::string_view GetAuditOutcomeName(AuditOutcome outcome) noexcept;
        [[nodiscard]] std::optional<AuditOutcome> ParseAuditOutcome(std::string_view name) noexcept;

        struct AuditEntry {
            int64_t id = 0;                                     ///< Assigned by Append
            std::chrono::system_clock::time_point timestamp{};  ///< Epoch = "now" on Append
            AuditOutcome outcome = AuditOutcome::Denied;
            bool success = false;
            int32_t errorCode = 0;                              ///< Platform code for LaunchFailed / Internal

            Policy::User user;
            std::string askerPath;
            std::string targetPath;
            std::vector<std::string> targetCommandLine;
            std::string targetWorkingDirectory;
            Policy::Hash targetHash;
            Policy::SignatureStatus targetSignatureStatus = Policy::SignatureStatus::NotSigned;
            std::optional<std::string> targetSigner;

            std::optional<Policy::ElevationKind> elevationKind;
            std::optional<Policy::ElevationMethod> elevationMethod;
            std::optional<int64_t> profileId;
            std::optional<int64_t> ruleId;
            std::string reason;
        };

        struct AuditQuery {
            // Filters
            std::optional<std::string> accountSid;
            std::optional<std::chrono::system_clock::time_point> startTime;    ///< Inclusive
            std::optional<std::chrono::system_clock::time_point> endTime;      ///< Inclusive
            std::optional<AuditOutcome> outcome;

            // Sort: id, timestamp, success, target_path, user (anything else: timestamp)
            std::string sortColumn = "timestamp";
            bool sortDescending = true;

            // Paging (1-based)
            uint32_t pageNumber = 1;
            uint32_t pageSize = 50;
            std::optional<int64_t> snapshotId;
        };

        struct AuditPage {
            std::vector<AuditEntry> rows;
            int64_t totalRecords = 0;
            int64_t totalPages = 0;
            int64_t snapshotId = 0;
        };

        class AuditLog {
        public:
            static constexpr uint32_t DEFAULT_MAX_PAGE_SIZE = 1000;

            explicit AuditLog(Database::DatabaseManager& database,
                              uint32_t maxPageSize = DEFAULT_MAX_PAGE_SIZE) noexcept;

            AuditLog(const AuditLog&) = delete;
            AuditLog& operator=(const AuditLog&) = delete;

            bool Initialize(Core::ServiceError* err = nullptr);

            /**
             * @brief Appends one entry.
             * @return New id, or -1 if storage failed (logged, never thrown).
             */
            int64_t Append(const AuditEntry& entry) noexcept;

            std::optional<AuditPage> Query(const AuditQuery& query, Core::ServiceError* err = nullptr) const;

            std::optional<AuditEntry> GetEntry(int64_t id, Core::ServiceError* err = nullptr) const;

            /// @brief Highest id written so far (0 when empty).
            int64_t LatestId(Core::ServiceError* err = nullptr) const;

            [[nodiscard]] uint32_t MaxPageSize() const noexcept { return m_maxPageSize; }

        private:
            std::string buildWhereSQL(const AuditQuery& query, int64_t snapshotId,
                                      std::vector<std::string>& outParams) const;
            static AuditEntry rowToEntry(Database::QueryResult& row);

            Database::DatabaseManager& m_db;
            uint32_t m_maxPageSize;

            std::mutex m_writeMutex;
            int64_t m_lastTimestampUs = 0;
        };

        // === JSON (JitElevationLogRow / JitElevationLogPage shapes) ===

        void to_json(nlohmann::json& j, const AuditEntry& entry);
        void to_json(nlohmann::json& j, const AuditPage& page);

        /// Widest Unix-microsecond value a system_clock time point can hold
        constexpr int64_t MAX_UNIX_MICROS = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::duration::max()).count();
        constexpr int64_t MIN_UNIX_MICROS = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::duration::min()).count();

        [[nodiscard]] int64_t ToUnixMicros(std::chrono::system_clock::time_point tp) noexcept;

        /// @brief Values outside [MIN_UNIX_MICROS, MAX_UNIX_MICROS] are clamped.
        [[nodiscard]] std::chrono::system_clock::time_point FromUnixMicros(int64_t micros) noexcept;

    } // namespace Audit
} // namespace JitGuard
