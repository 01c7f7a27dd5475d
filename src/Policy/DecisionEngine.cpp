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
#include "DecisionEngine.hpp"
#include "FilterMatcher.hpp"

#include "../Audit/AuditLog.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

namespace JitGuard {
    namespace Policy {

        using Core::ErrorKind;
        using Core::ServiceError;
        using Core::SetError;

        namespace {
            constexpr const wchar_t* LOG_CATEGORY = L"DecisionEngine";
        }

        std::string_view GetDecisionOutcomeName(DecisionOutcome outcome) noexcept {
            switch (outcome) {
            case DecisionOutcome::Granted: return "Granted";
            case DecisionOutcome::Denied:  return "Denied";
            default:                       return "Unknown";
            }
        }

        DecisionEngine::DecisionEngine(const PolicyRepository& repository, Audit::AuditLog& auditLog) noexcept
            : m_repository(repository)
            , m_auditLog(auditLog) {
        }

        bool DecisionEngine::ValidateRequest(const ElevationRequest& request, ServiceError* err) {
            if (request.target.path.empty()) {
                return SetError(err, ErrorKind::InvalidParameter, L"Target path is required", L"Decide");
            }
            if (request.asker.path.empty()) {
                return SetError(err, ErrorKind::InvalidParameter, L"Asker path is required", L"Decide");
            }
            if (request.user.accountSid.empty()) {
                return SetError(err, ErrorKind::InvalidParameter, L"User account SID is required", L"Decide");
            }
            return true;
        }

        Decision DecisionEngine::Evaluate(const PolicySnapshot& snapshot, const ElevationRequest& request,
            ServiceError* err) {
            Decision decision;

            const auto activeId = snapshot.ActiveProfileId(request.user);
            const Profile* profile = activeId ? snapshot.FindProfile(*activeId) : nullptr;
            if (!profile) {
                SetError(err, ErrorKind::AccessDenied, L"No active profile for the user", L"Decide");
                return decision;
            }

            decision.profileId = profile->id;
            decision.method = profile->elevationMethod;
            decision.promptSecureDesktop = profile->promptSecureDesktop;
            decision.kind = profile->defaultElevationKind;

            for (int64_t ruleId : profile->ruleIds) {
                const Rule* rule = snapshot.FindRule(ruleId);
                if (!rule) {
                    continue;
                }
                if (FilterMatcher::Matches(rule->asker, request.asker) &&
                    FilterMatcher::Matches(rule->target, request.target)) {
                    decision.kind = rule->elevationKind;
                    decision.ruleId = rule->id;
                    break;
                }
            }

            if (decision.kind == ElevationKind::Deny) {
                SetError(err, ErrorKind::AccessDenied, L"Policy denies elevation", L"Decide");
                return decision;
            }

            if (profile->targetMustBeSigned && request.target.signature.status != SignatureStatus::Valid) {
                SetError(err, ErrorKind::AccessDenied, L"Profile requires a validly signed target", L"Decide");
                return decision;
            }

            decision.outcome = DecisionOutcome::Granted;
            return decision;
        }

        Decision DecisionEngine::Decide(const ElevationRequest& request, ServiceError* err) {
            if (!ValidateRequest(request, err)) {
                return Decision{};
            }

            ServiceError localErr;
            Decision decision;

            auto snapshot = m_repository.GetSnapshot();
            if (!snapshot) {
                SetError(&localErr, ErrorKind::Internal, L"Policy is unavailable", L"Decide");
            }
            else {
                decision = Evaluate(*snapshot, request, &localErr);
            }

            decision.auditId = audit(request, decision, localErr);

            const std::wstring account = Utils::ToWide(request.user.accountName);
            const std::wstring target = Utils::ToWide(request.target.path);
            if (decision.IsGranted()) {
                JG_LOG_INFO(LOG_CATEGORY, L"Granted %ls for %ls -> %ls (profile %lld, audit %lld)",
                    Utils::ToWide(GetElevationKindName(decision.kind)).c_str(), account.c_str(), target.c_str(),
                    static_cast<long long>(decision.profileId), static_cast<long long>(decision.auditId));
            }
            else if (localErr.kind == ErrorKind::Internal) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Denied (fail closed) for %ls -> %ls: %ls",
                    account.c_str(), target.c_str(), localErr.message.c_str());
            }
            else {
                JG_LOG_WARN(LOG_CATEGORY, L"Denied for %ls -> %ls: %ls",
                    account.c_str(), target.c_str(), localErr.message.c_str());
            }

            if (err && localErr.HasError()) {
                *err = localErr;
            }
            return decision;
        }

        int64_t DecisionEngine::audit(const ElevationRequest& request, const Decision& decision,
            const ServiceError& error) noexcept {
            try {
                Audit::AuditEntry entry;
                entry.timestamp = request.timestamp;
                entry.outcome = decision.IsGranted() ? Audit::AuditOutcome::Granted : Audit::AuditOutcome::Denied;
                entry.success = decision.IsGranted();
                entry.errorCode = error.platformCode;
                entry.user = request.user;
                entry.askerPath = request.asker.path;
                entry.targetPath = request.target.path;
                entry.targetCommandLine = request.target.commandLine;
                entry.targetWorkingDirectory = request.target.workingDirectory;
                entry.targetHash = request.target.hash;
                entry.targetSignatureStatus = request.target.signature.status;
                entry.targetSigner = request.target.signature.signer;
                entry.elevationKind = decision.kind;
                entry.elevationMethod = decision.method;
                if (decision.profileId != 0) entry.profileId = decision.profileId;
                entry.ruleId = decision.ruleId;
                entry.reason = error.HasError() ? Utils::ToNarrow(error.message) : request.reason;
                return m_auditLog.Append(entry);
            }
            catch (const std::bad_alloc&) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Audit entry could not be built: out of memory");
                return -1;
            }
        }

    } // namespace Policy
} // namespace JitGuard
