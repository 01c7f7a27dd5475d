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
 * JitGuard Elevation Service
 * ============================================================================
 *
 * @file ElevationService.hpp
 * @brief Caller-facing operations of the service, independent of transport.
 *
 * Every operation takes the authenticated Caller. Policy administration and
 * audit queries require caller.isAdmin, otherwise they fail with AccessDenied.
 * Launch runs: resolve asker -> resolve target -> decide -> launch, and
 * records the launch outcome as a second audit entry next to the decision.
 * ============================================================================
 */

#include "Collaborators.hpp"
#include "ServiceTypes.hpp"
#include "../Audit/AuditLog.hpp"
#include "../Core/ServiceError.hpp"
#include "../Elevation/SessionManager.hpp"
#include "../Policy/DecisionEngine.hpp"
#include "../Policy/PolicyRepository.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace JitGuard {
    namespace Service {

        class ElevationService {
        public:
            ElevationService(Policy::PolicyRepository& repository,
                             Policy::DecisionEngine& decisionEngine,
                             Elevation::SessionManager& sessions,
                             Audit::AuditLog& auditLog,
                             IApplicationIdentityResolver& resolver,
                             ILaunchExecutor& executor) noexcept;

            ElevationService(const ElevationService&) = delete;
            ElevationService& operator=(const ElevationService&) = delete;

            // ========================================================================
            // ELEVATION
            // ========================================================================

            bool ElevateTemporary(const Caller& caller, int64_t seconds, Core::ServiceError* err = nullptr);
            bool ElevateSession(const Caller& caller, Core::ServiceError* err = nullptr);
            bool Revoke(const Caller& caller, Core::ServiceError* err = nullptr);
            std::optional<Elevation::ElevationStatus> GetStatus(const Caller& caller, Core::ServiceError* err = nullptr);

            /**
             * @brief Decides on and, when granted, starts an elevated process.
             *
             * Either executablePath or commandLine must be present. A missing
             * executable is taken from the first command-line token, a missing
             * command line becomes [executable], and a missing working directory
             * is inherited from the asker.
             */
            std::optional<LaunchResult> Launch(const Caller& caller, const LaunchRequest& request,
                                               Core::ServiceError* err = nullptr);

            /// @brief Session-change notification from the host: ends the user's elevation.
            void OnLogoff(const Policy::User& user);

            // ========================================================================
            // POLICY ADMINISTRATION
            // ========================================================================

            std::optional<std::vector<Policy::Profile>> ListProfiles(const Caller& caller, Core::ServiceError* err = nullptr);
            std::optional<Policy::Profile> GetProfile(const Caller& caller, int64_t id, Core::ServiceError* err = nullptr);
            std::optional<int64_t> CreateProfile(const Caller& caller, const Policy::Profile& profile, Core::ServiceError* err = nullptr);
            bool PutProfile(const Caller& caller, int64_t id, const Policy::Profile& profile, Core::ServiceError* err = nullptr);
            bool DeleteProfile(const Caller& caller, int64_t id, Core::ServiceError* err = nullptr);

            std::optional<std::vector<Policy::Rule>> ListRules(const Caller& caller, Core::ServiceError* err = nullptr);
            std::optional<Policy::Rule> GetRule(const Caller& caller, int64_t id, Core::ServiceError* err = nullptr);
            std::optional<int64_t> CreateRule(const Caller& caller, const Policy::Rule& rule, Core::ServiceError* err = nullptr);
            bool PutRule(const Caller& caller, int64_t id, const Policy::Rule& rule, Core::ServiceError* err = nullptr);
            bool DeleteRule(const Caller& caller, int64_t id, Core::ServiceError* err = nullptr);

            std::optional<std::vector<Policy::Assignment>> ListAssignments(const Caller& caller, Core::ServiceError* err = nullptr);
            std::optional<Policy::Assignment> GetAssignment(const Caller& caller, int64_t profileId, Core::ServiceError* err = nullptr);
            bool SetAssignment(const Caller& caller, int64_t profileId, const std::vector<Policy::User>& users,
                               Core::ServiceError* err = nullptr);

            std::optional<std::vector<Policy::User>> ListUsers(const Caller& caller, Core::ServiceError* err = nullptr);

            // === Self-service profile selection ===

            std::optional<ProfileSelection> GetMe(const Caller& caller, Core::ServiceError* err = nullptr);
            bool SetMe(const Caller& caller, int64_t profileId, Core::ServiceError* err = nullptr);

            // ========================================================================
            // AUDIT
            // ========================================================================

            std::optional<Audit::AuditPage> QueryLog(const Caller& caller, const Audit::AuditQuery& query,
                                                     Core::ServiceError* err = nullptr);
            std::optional<Audit::AuditEntry> GetLogEntry(const Caller& caller, int64_t id,
                                                         Core::ServiceError* err = nullptr);

        private:
            /// Validates the caller and records the user as seen
            bool admit(const Caller& caller, const wchar_t* operation, Core::ServiceError* err);
            bool admitAdmin(const Caller& caller, const wchar_t* operation, Core::ServiceError* err);

            void auditLaunch(const Policy::ElevationRequest& request, const Policy::Decision& decision,
                             bool succeeded, const Core::ServiceError& launchError) noexcept;

            Policy::PolicyRepository& m_repository;
            Policy::DecisionEngine& m_decisionEngine;
            Elevation::SessionManager& m_sessions;
            Audit::AuditLog& m_auditLog;
            IApplicationIdentityResolver& m_resolver;
            ILaunchExecutor& m_executor;
        };

    } // namespace Service
} // namespace JitGuard
