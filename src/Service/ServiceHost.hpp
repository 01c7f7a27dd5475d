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
 * JitGuard Service Host
 * ============================================================================
 *
 * @file ServiceHost.hpp
 * @brief Owns every subsystem and drives their lifecycle.
 *
 * Start order: logger -> database -> policy repository -> audit log ->
 * request journal -> expiry sweeper. Stop runs in reverse. The platform
 * collaborators are supplied by the embedding process and must outlive
 * the host.
 * ============================================================================
 */

#include "Collaborators.hpp"
#include "ElevationService.hpp"
#include "RequestJournal.hpp"
#include "RequestRouter.hpp"
#include "../Audit/AuditLog.hpp"
#include "../Config/ServiceConfig.hpp"
#include "../Core/ServiceError.hpp"
#include "../Elevation/SessionManager.hpp"
#include "../Policy/DecisionEngine.hpp"
#include "../Policy/PolicyRepository.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace JitGuard {
    namespace Service {

        namespace ServiceConstants {
            constexpr const char* SERVICE_NAME = "JitGuard";
            constexpr const char* DEFAULT_ENDPOINT = "jitguard";
        }

        class ServiceHost final {
        public:
            ServiceHost(IApplicationIdentityResolver& resolver, ILaunchExecutor& executor,
                        std::shared_ptr<const Elevation::IClock> clock = std::make_shared<Elevation::SystemClock>());
            ~ServiceHost();

            ServiceHost(const ServiceHost&) = delete;
            ServiceHost& operator=(const ServiceHost&) = delete;

            /**
             * @brief Brings every subsystem up; on failure everything started so far is stopped again.
             */
            bool Start(const Config::ServiceConfig& config,
                       std::string_view endpoint = ServiceConstants::DEFAULT_ENDPOINT,
                       Core::ServiceError* err = nullptr);

            void Stop();

            [[nodiscard]] bool IsRunning() const noexcept { return m_running.load(); }

            /// @brief Valid only while running.
            [[nodiscard]] RequestRouter& GetRouter() noexcept { return *m_router; }
            [[nodiscard]] ElevationService& GetService() noexcept { return *m_service; }

            /// @brief Session-change hook for the platform layer.
            void OnSessionLogoff(const Policy::User& user);

            /// @brief JSON summary of subsystem state and request counters.
            [[nodiscard]] std::string GetStatusReport() const;

        private:
            IApplicationIdentityResolver& m_resolver;
            ILaunchExecutor& m_executor;
            std::shared_ptr<const Elevation::IClock> m_clock;

            mutable std::mutex m_lifecycleMutex;
            std::atomic<bool> m_running{ false };
            bool m_ownsDatabase = false;    ///< Host initialized the shared DatabaseManager

            std::unique_ptr<Policy::PolicyRepository> m_repository;
            std::unique_ptr<Audit::AuditLog> m_auditLog;
            std::unique_ptr<Policy::DecisionEngine> m_decisionEngine;
            std::unique_ptr<Elevation::SessionManager> m_sessions;
            std::unique_ptr<RequestJournal> m_journal;
            std::unique_ptr<ElevationService> m_service;
            std::unique_ptr<RequestRouter> m_router;
        };

    } // namespace Service
} // namespace JitGuard
