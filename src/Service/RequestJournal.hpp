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
 * @file RequestJournal.hpp
 * @brief Durable record of service runs and handled requests.
 *
 * Tables:
 *   service_run(id, start_time, endpoint)
 *   request_log(id, run_id, timestamp, method, path, status_code)
 *
 * Request ids continue from the highest stored id, so they stay unique
 * across restarts.
 */

#include "../Core/ServiceError.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace JitGuard {
    namespace Database {
        class DatabaseManager;
    }

    namespace Service {

        class RequestJournal {
        public:
            explicit RequestJournal(Database::DatabaseManager& database) noexcept;

            RequestJournal(const RequestJournal&) = delete;
            RequestJournal& operator=(const RequestJournal&) = delete;

            /**
             * @brief Creates the tables, records this run and restores the request counter.
             */
            bool Initialize(std::string_view endpoint, Core::ServiceError* err = nullptr);

            [[nodiscard]] bool IsInitialized() const noexcept { return m_runId.load() != 0; }
            [[nodiscard]] int64_t RunId() const noexcept { return m_runId.load(); }

            /// @brief Next request id; valid before Initialize too (starts at 1).
            [[nodiscard]] int64_t NextRequestId() noexcept { return m_lastRequestId.fetch_add(1) + 1; }
            [[nodiscard]] int64_t LastRequestId() const noexcept { return m_lastRequestId.load(); }

            /// @brief Logs and returns false on storage failure; never throws.
            bool Record(int64_t requestId, std::string_view method, std::string_view path, int statusCode) noexcept;

        private:
            Database::DatabaseManager& m_db;
            std::atomic<int64_t> m_runId{ 0 };
            std::atomic<int64_t> m_lastRequestId{ 0 };
        };

    } // namespace Service
} // namespace JitGuard
