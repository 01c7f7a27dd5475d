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
 * JitGuard Decision Engine
 * ============================================================================
 *
 * @file DecisionEngine.hpp
 * @brief Resolves an elevation request against the requester's active profile.
 *
 * Algorithm (first match, not most specific):
 *  1. Reject requests missing target path, asker path or account SID
 *     (InvalidParameter, nothing audited)
 *  2. Active profile = explicit selection if still assigned, else the
 *     lowest assigned profile id; none => Denied / AccessDenied
 *  3. First rule in profile order whose asker AND target filters match wins
 *  4. No match => profile default kind
 *  5. Deny => Denied / AccessDenied
 *  6. Profile requires a signed target and the target is not Valid =>
 *     Denied / AccessDenied
 *  7. Repository unavailable => Denied / Internal (fail closed)
 *
 * Every request that passes step 1 produces exactly one audit entry before
 * Decide returns. Confirm and ReasonApproval are returned as granted kinds;
 * the caller runs the confirmation round-trip, the engine never blocks.
 * ============================================================================
 */

#include "PolicyTypes.hpp"
#include "PolicyRepository.hpp"
#include "../Core/ServiceError.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace JitGuard {

    namespace Audit {
        class AuditLog;
    }

    namespace Policy {

        struct ElevationRequest {
            ApplicationIdentity asker;
            ApplicationIdentity target;
            User user;
            std::chrono::system_clock::time_point timestamp{};   ///< Epoch = now
            std::string reason;                                 ///< Justification for ReasonApproval
        };

        enum class DecisionOutcome : uint8_t {
            Granted = 0,
            Denied
        };

        [[nodiscard]] std::string_view GetDecisionOutcomeName(DecisionOutcome outcome) noexcept;

        struct Decision {
            DecisionOutcome outcome = DecisionOutcome::Denied;
            ElevationKind kind = ElevationKind::Deny;
            ElevationMethod method = ElevationMethod::LocalAdmin;
            int64_t profileId = 0;                  ///< 0 when no profile was resolved
            std::optional<int64_t> ruleId;          ///< Matching rule; empty for the profile default
            bool promptSecureDesktop = true;
            int64_t auditId = -1;                   ///< -1 when nothing was audited

            [[nodiscard]] bool IsGranted() const noexcept { return outcome == DecisionOutcome::Granted; }
        };

        class DecisionEngine {
        public:
            DecisionEngine(const PolicyRepository& repository, Audit::AuditLog& auditLog) noexcept;

            DecisionEngine(const DecisionEngine&) = delete;
            DecisionEngine& operator=(const DecisionEngine&) = delete;

            /**
             * @brief Decides and audits one request.
             *
             * @param err Set on every Denied outcome (AccessDenied, or Internal
             *            when policy could not be read) and on validation failure.
             */
            Decision Decide(const ElevationRequest& request, Core::ServiceError* err = nullptr);

            /**
             * @brief Pure evaluation against one snapshot; no audit, no logging.
             */
            static Decision Evaluate(const PolicySnapshot& snapshot, const ElevationRequest& request,
                                     Core::ServiceError* err = nullptr);

            static bool ValidateRequest(const ElevationRequest& request, Core::ServiceError* err = nullptr);

        private:
            int64_t audit(const ElevationRequest& request, const Decision& decision,
                          const Core::ServiceError& error) noexcept;

            const PolicyRepository& m_repository;
            Audit::AuditLog& m_auditLog;
        };

    } // namespace Policy
} // namespace JitGuard
