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
#include "ElevationService.hpp"

#include "../Utils/CommandLine.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <chrono>

namespace JitGuard {
    namespace Service {

        using Core::ErrorKind;
        using Core::ServiceError;
        using Core::SetError;

        namespace {
            constexpr const wchar_t* LOG_CATEGORY = L"ElevationService";
        }

        ElevationService::ElevationService(Policy::PolicyRepository& repository,
            Policy::DecisionEngine& decisionEngine,
            Elevation::SessionManager& sessions,
            Audit::AuditLog& auditLog,
            IApplicationIdentityResolver& resolver,
            ILaunchExecutor& executor) noexcept
            : m_repository(repository)
            , m_decisionEngine(decisionEngine)
            , m_sessions(sessions)
            , m_auditLog(auditLog)
            , m_resolver(resolver)
            , m_executor(executor) {
        }

        bool ElevationService::admit(const Caller& caller, const wchar_t* operation, ServiceError* err) {
            if (caller.user.accountSid.empty()) {
                return SetError(err, ErrorKind::InvalidParameter, L"Caller has no account SID", operation);
            }

            ServiceError rememberErr;
            if (!m_repository.RememberUser(caller.user, &rememberErr)) {
                // Bookkeeping only; the request itself proceeds
                JG_LOG_WARN(LOG_CATEGORY, L"Could not record user %ls: %ls",
                    Utils::ToWide(caller.user.accountName).c_str(), rememberErr.message.c_str());
            }
            return true;
        }

        bool ElevationService::admitAdmin(const Caller& caller, const wchar_t* operation, ServiceError* err) {
            if (!admit(caller, operation, err)) {
                return false;
            }
            if (!caller.isAdmin) {
                JG_LOG_WARN(LOG_CATEGORY, L"Non-admin %ls refused for %ls",
                    Utils::ToWide(caller.user.accountName).c_str(), operation);
                return SetError(err, ErrorKind::AccessDenied, L"Administrator rights required", operation);
            }
            return true;
        }

        // ============================================================================
        // ELEVATION
        // ============================================================================

        bool ElevationService::ElevateTemporary(const Caller& caller, int64_t seconds, ServiceError* err) {
            if (!admit(caller, L"ElevateTemporary", err)) {
                return false;
            }
            auto profile = m_repository.GetActiveProfile(caller.user);
            if (!profile) {
                return SetError(err, ErrorKind::AccessDenied, L"No active profile for the user", L"ElevateTemporary");
            }
            return m_sessions.GrantTemporary(caller.user, seconds, profile->temporary, profile->elevationMethod, err);
        }

        bool ElevationService::ElevateSession(const Caller& caller, ServiceError* err) {
            if (!admit(caller, L"ElevateSession", err)) {
                return false;
            }
            auto profile = m_repository.GetActiveProfile(caller.user);
            if (!profile) {
                return SetError(err, ErrorKind::AccessDenied, L"No active profile for the user", L"ElevateSession");
            }
            return m_sessions.GrantSession(caller.user, profile->session, profile->elevationMethod, err);
        }

        bool ElevationService::Revoke(const Caller& caller, ServiceError* err) {
            if (!admit(caller, L"Revoke", err)) {
                return false;
            }
            m_sessions.Revoke(caller.user);
            return true;
        }

        std::optional<Elevation::ElevationStatus> ElevationService::GetStatus(const Caller& caller, ServiceError* err) {
            if (!admit(caller, L"GetStatus", err)) {
                return std::nullopt;
            }
            // Without a profile both modes report disabled
            const auto profile = m_repository.GetActiveProfile(caller.user).value_or(Policy::Profile{});
            return m_sessions.GetStatus(caller.user, profile.temporary, profile.session);
        }

        void ElevationService::OnLogoff(const Policy::User& user) {
            m_sessions.OnLogoff(user);
        }

        // ============================================================================
        // LAUNCH
        // ============================================================================

        std::optional<LaunchResult> ElevationService::Launch(const Caller& caller, const LaunchRequest& request,
            ServiceError* err) {
            if (!admit(caller, L"Launch", err)) {
                return std::nullopt;
            }

            if (!request.executablePath && !request.commandLine) {
                SetError(err, ErrorKind::InvalidParameter, L"Executable path or command line is required", L"Launch");
                return std::nullopt;
            }

            std::vector<std::string> arguments;
            if (request.commandLine) {
                arguments = Utils::SplitCommandLine(*request.commandLine);
            }

            std::string executable;
            if (request.executablePath && !request.executablePath->empty()) {
                executable = *request.executablePath;
            }
            else if (!arguments.empty()) {
                executable = arguments.front();
            }
            if (executable.empty()) {
                SetError(err, ErrorKind::InvalidParameter, L"Cannot determine the executable to launch", L"Launch");
                return std::nullopt;
            }
            if (!request.commandLine) {
                arguments = { executable };
            }

            const StartupInfo startupInfo = request.startupInfo.value_or(StartupInfo{});
            const uint32_t parentPid = startupInfo.parentProcessId.value_or(caller.processId);

            // === Asker ===
            ProcessReference askerRef;
            askerRef.processId = parentPid;
            askerRef.user = caller.user;

            Policy::ApplicationIdentity asker;
            if (!m_resolver.Resolve(askerRef, asker, err)) {
                JG_LOG_WARN(LOG_CATEGORY, L"Cannot resolve asker process %u", parentPid);
                return std::nullopt;
            }
            if (!caller.isLocalSystem && asker.user != caller.user) {
                JG_LOG_WARN(LOG_CATEGORY, L"%ls tried to launch under process %u it does not own",
                    Utils::ToWide(caller.user.accountName).c_str(), parentPid);
                SetError(err, ErrorKind::AccessDenied, L"Parent process belongs to another user", L"Launch");
                return std::nullopt;
            }

            // === Target ===
            ProcessReference targetRef;
            targetRef.executablePath = executable;
            targetRef.commandLine = arguments;
            targetRef.workingDirectory = request.workingDirectory.value_or(asker.workingDirectory);
            targetRef.user = asker.user;

            Policy::ApplicationIdentity target;
            if (!m_resolver.Resolve(targetRef, target, err)) {
                JG_LOG_WARN(LOG_CATEGORY, L"Cannot resolve target %ls", Utils::ToWide(executable).c_str());
                return std::nullopt;
            }
            if (target.path.empty()) {
                target.path = executable;
            }
            target.commandLine = arguments;
            target.workingDirectory = targetRef.workingDirectory;
            target.user = asker.user;

            // === Decision ===
            Policy::ElevationRequest elevation;
            elevation.asker = std::move(asker);
            elevation.target = std::move(target);
            elevation.user = caller.user;
            elevation.timestamp = std::chrono::system_clock::now();
            elevation.reason = request.reason;

            const Policy::Decision decision = m_decisionEngine.Decide(elevation, err);
            if (!decision.IsGranted()) {
                return std::nullopt;
            }

            // === Launch ===
            LaunchPlan plan;
            plan.user = caller.user;
            plan.target = elevation.target;
            plan.commandLine = Utils::JoinCommandLine(elevation.target.commandLine);
            plan.kind = decision.kind;
            plan.method = decision.method;
            plan.promptSecureDesktop = decision.promptSecureDesktop;
            plan.creationFlags = request.creationFlags;
            plan.startupInfo = startupInfo;
            plan.parentProcessId = parentPid;
            plan.auditId = decision.auditId;

            LaunchResult result;
            ServiceError launchErr;
            const bool launched = m_executor.Launch(plan, result, &launchErr);
            if (!launched && !launchErr.HasError()) {
                SetError(&launchErr, ErrorKind::Internal, L"Launch executor failed", L"Launch");
            }
            auditLaunch(elevation, decision, launched, launchErr);

            if (!launched) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Launch of %ls failed: %ls (code %d)",
                    Utils::ToWide(elevation.target.path).c_str(), launchErr.message.c_str(), launchErr.platformCode);
                if (err) {
                    *err = launchErr;
                }
                return std::nullopt;
            }

            JG_LOG_INFO(LOG_CATEGORY, L"Launched %ls for %ls as pid %u",
                Utils::ToWide(elevation.target.path).c_str(),
                Utils::ToWide(caller.user.accountName).c_str(), result.processId);
            return result;
        }

        void ElevationService::auditLaunch(const Policy::ElevationRequest& request, const Policy::Decision& decision,
            bool succeeded, const ServiceError& launchError) noexcept {
            try {
                Audit::AuditEntry entry;
                entry.outcome = succeeded ? Audit::AuditOutcome::LaunchSucceeded : Audit::AuditOutcome::LaunchFailed;
                entry.success = succeeded;
                entry.errorCode = launchError.platformCode;
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
                entry.reason = succeeded ? request.reason : Utils::ToNarrow(launchError.message);
                if (m_auditLog.Append(entry) < 0) {
                    JG_LOG_ERROR(LOG_CATEGORY, L"Launch outcome was not audited");
                }
            }
            catch (const std::bad_alloc&) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Launch audit entry could not be built: out of memory");
            }
        }

        // ============================================================================
        // POLICY ADMINISTRATION
        // ============================================================================

        std::optional<std::vector<Policy::Profile>> ElevationService::ListProfiles(const Caller& caller, ServiceError* err) {
            if (!admitAdmin(caller, L"ListProfiles", err)) {
                return std::nullopt;
            }
            return m_repository.ListProfiles();
        }

        std::optional<Policy::Profile> ElevationService::GetProfile(const Caller& caller, int64_t id, ServiceError* err) {
            if (!admitAdmin(caller, L"GetProfile", err)) {
                return std::nullopt;
            }
            return m_repository.GetProfile(id, err);
        }

        std::optional<int64_t> ElevationService::CreateProfile(const Caller& caller, const Policy::Profile& profile,
            ServiceError* err) {
            if (!admitAdmin(caller, L"CreateProfile", err)) {
                return std::nullopt;
            }
            return m_repository.CreateProfile(profile, err);
        }

        bool ElevationService::PutProfile(const Caller& caller, int64_t id, const Policy::Profile& profile,
            ServiceError* err) {
            return admitAdmin(caller, L"PutProfile", err) && m_repository.PutProfile(id, profile, err);
        }

        bool ElevationService::DeleteProfile(const Caller& caller, int64_t id, ServiceError* err) {
            return admitAdmin(caller, L"DeleteProfile", err) && m_repository.DeleteProfile(id, err);
        }

        std::optional<std::vector<Policy::Rule>> ElevationService::ListRules(const Caller& caller, ServiceError* err) {
            if (!admitAdmin(caller, L"ListRules", err)) {
                return std::nullopt;
            }
            return m_repository.ListRules();
        }

        std::optional<Policy::Rule> ElevationService::GetRule(const Caller& caller, int64_t id, ServiceError* err) {
            if (!admitAdmin(caller, L"GetRule", err)) {
                return std::nullopt;
            }
            return m_repository.GetRule(id, err);
        }

        std::optional<int64_t> ElevationService::CreateRule(const Caller& caller, const Policy::Rule& rule,
            ServiceError* err) {
            if (!admitAdmin(caller, L"CreateRule", err)) {
                return std::nullopt;
            }
            return m_repository.CreateRule(rule, err);
        }

        bool ElevationService::PutRule(const Caller& caller, int64_t id, const Policy::Rule& rule, ServiceError* err) {
            return admitAdmin(caller, L"PutRule", err) && m_repository.PutRule(id, rule, err);
        }

        bool ElevationService::DeleteRule(const Caller& caller, int64_t id, ServiceError* err) {
            return admitAdmin(caller, L"DeleteRule", err) && m_repository.DeleteRule(id, err);
        }

        std::optional<std::vector<Policy::Assignment>> ElevationService::ListAssignments(const Caller& caller,
            ServiceError* err) {
            if (!admitAdmin(caller, L"ListAssignments", err)) {
                return std::nullopt;
            }
            return m_repository.ListAssignments();
        }

        std::optional<Policy::Assignment> ElevationService::GetAssignment(const Caller& caller, int64_t profileId,
            ServiceError* err) {
            if (!admitAdmin(caller, L"GetAssignment", err)) {
                return std::nullopt;
            }
            return m_repository.GetAssignment(profileId, err);
        }

        bool ElevationService::SetAssignment(const Caller& caller, int64_t profileId,
            const std::vector<Policy::User>& users, ServiceError* err) {
            return admitAdmin(caller, L"SetAssignment", err) && m_repository.SetAssignment(profileId, users, err);
        }

        std::optional<std::vector<Policy::User>> ElevationService::ListUsers(const Caller& caller, ServiceError* err) {
            if (!admitAdmin(caller, L"ListUsers", err)) {
                return std::nullopt;
            }
            return m_repository.ListUsers();
        }

        std::optional<ProfileSelection> ElevationService::GetMe(const Caller& caller, ServiceError* err) {
            if (!admit(caller, L"GetMe", err)) {
                return std::nullopt;
            }
            ProfileSelection selection;
            if (auto active = m_repository.GetActiveProfile(caller.user)) {
                selection.active = active->id;
            }
            selection.available = m_repository.GetAssignedProfiles(caller.user);
            return selection;
        }

        bool ElevationService::SetMe(const Caller& caller, int64_t profileId, ServiceError* err) {
            return admit(caller, L"SetMe", err) && m_repository.SelectProfile(caller.user, profileId, err);
        }

        // ============================================================================
        // AUDIT
        // ============================================================================

        std::optional<Audit::AuditPage> ElevationService::QueryLog(const Caller& caller, const Audit::AuditQuery& query,
            ServiceError* err) {
            if (!admitAdmin(caller, L"QueryLog", err)) {
                return std::nullopt;
            }
            return m_auditLog.Query(query, err);
        }

        std::optional<Audit::AuditEntry> ElevationService::GetLogEntry(const Caller& caller, int64_t id,
            ServiceError* err) {
            if (!admitAdmin(caller, L"GetLogEntry", err)) {
                return std::nullopt;
            }
            return m_auditLog.GetEntry(id, err);
        }

    } // namespace Service
} // namespace JitGuard
