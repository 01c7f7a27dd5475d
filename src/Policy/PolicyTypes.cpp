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
#include "PolicyTypes.hpp"

#include <stdexcept>

namespace JitGuard {
    namespace Policy {

        using nlohmann::json;

        namespace {

            bool HasValue(const json& j, const char* key) {
                auto it = j.find(key);
                return it != j.end() && !it->is_null();
            }

            template <typename T>
            void ReadOptional(const json& j, const char* key, T& out) {
                if (HasValue(j, key)) {
                    j.at(key).get_to(out);
                }
            }

            [[noreturn]] void ThrowUnknownEnum(const char* type, const json& j) {
                throw std::invalid_argument(std::string("Unknown ") + type + " value: " + j.dump());
            }

        } // anonymous namespace

        // ============================================================================
        // ENUM NAMES
        // ============================================================================

        std::string_view GetElevationKindName(ElevationKind kind) noexcept {
            switch (kind) {
            case ElevationKind::AutoApprove:    return "AutoApprove";
            case ElevationKind::Confirm:        return "Confirm";
            case ElevationKind::ReasonApproval: return "ReasonApproval";
            case ElevationKind::Deny:           return "Deny";
            default:                            return "Unknown";
            }
        }

        std::string_view GetElevationMethodName(ElevationMethod method) noexcept {
            switch (method) {
            case ElevationMethod::LocalAdmin:     return "LocalAdmin";
            case ElevationMethod::VirtualAccount: return "VirtualAccount";
            default:                              return "Unknown";
            }
        }

        std::string_view GetSignatureStatusName(SignatureStatus status) noexcept {
            switch (status) {
            case SignatureStatus::Valid:             return "Valid";
            case SignatureStatus::Incompatible:      return "Incompatible";
            case SignatureStatus::NotSigned:         return "NotSigned";
            case SignatureStatus::HashMismatch:      return "HashMismatch";
            case SignatureStatus::UnsupportedFormat: return "UnsupportedFormat";
            case SignatureStatus::NotTrusted:        return "NotTrusted";
            default:                                 return "Unknown";
            }
        }

        std::string_view GetPathFilterKindName(PathFilterKind kind) noexcept {
            switch (kind) {
            case PathFilterKind::Equals:   return "Equals";
            case PathFilterKind::FileName: return "FileName";
            case PathFilterKind::Wildcard: return "Wildcard";
            default:                       return "Unknown";
            }
        }

        std::string_view GetStringFilterKindName(StringFilterKind kind) noexcept {
            switch (kind) {
            case StringFilterKind::Equals:     return "Equals";
            case StringFilterKind::Regex:      return "Regex";
            case StringFilterKind::StartsWith: return "StartsWith";
            case StringFilterKind::EndsWith:   return "EndsWith";
            case StringFilterKind::Contains:   return "Contains";
            default:                           return "Unknown";
            }
        }

        std::string_view GetCommandLineModeName(CommandLineMode mode) noexcept {
            switch (mode) {
            case CommandLineMode::AnyToken:   return "AnyToken";
            case CommandLineMode::Positional: return "Positional";
            default:                          return "Unknown";
            }
        }

        std::optional<ElevationKind> ParseElevationKind(std::string_view name) noexcept {
            if (name == "AutoApprove")    return ElevationKind::AutoApprove;
            if (name == "Confirm")        return ElevationKind::Confirm;
            if (name == "ReasonApproval") return ElevationKind::ReasonApproval;
            if (name == "Deny")           return ElevationKind::Deny;
            return std::nullopt;
        }

        std::optional<ElevationMethod> ParseElevationMethod(std::string_view name) noexcept {
            if (name == "LocalAdmin")     return ElevationMethod::LocalAdmin;
            if (name == "VirtualAccount") return ElevationMethod::VirtualAccount;
            return std::nullopt;
        }

        std::optional<SignatureStatus> ParseSignatureStatus(std::string_view name) noexcept {
            if (name == "Valid")        return SignatureStatus::Valid;
            if (name == "Incompatible") return SignatureStatus::Incompatible;
            if (name == "NotSigned")    return SignatureStatus::NotSigned;
            if (name == "HashMismatch") return SignatureStatus::HashMismatch;
            if (name == "UnsupportedFormat" || name == "NotSupportedFileFormat") {
                return SignatureStatus::UnsupportedFormat;
            }
            if (name == "NotTrusted")   return SignatureStatus::NotTrusted;
            return std::nullopt;
        }

        std::optional<PathFilterKind> ParsePathFilterKind(std::string_view name) noexcept {
            if (name == "Equals")                           return PathFilterKind::Equals;
            if (name == "FileName" || name == "FileNameOnly") return PathFilterKind::FileName;
            if (name == "Wildcard")                         return PathFilterKind::Wildcard;
            return std::nullopt;
        }

        std::optional<StringFilterKind> ParseStringFilterKind(std::string_view name) noexcept {
            if (name == "Equals")     return StringFilterKind::Equals;
            if (name == "Regex")      return StringFilterKind::Regex;
            if (name == "StartsWith") return StringFilterKind::StartsWith;
            if (name == "EndsWith")   return StringFilterKind::EndsWith;
            if (name == "Contains")   return StringFilterKind::Contains;
            return std::nullopt;
        }

        std::optional<CommandLineMode> ParseCommandLineMode(std::string_view name) noexcept {
            if (name == "AnyToken")   return CommandLineMode::AnyToken;
            if (name == "Positional") return CommandLineMode::Positional;
            return std::nullopt;
        }

        std::string User::Key() const {
            return domainSid + "|" + accountSid;
        }

        // ============================================================================
        // ENUM JSON
        // ============================================================================

        void to_json(json& j, const ElevationKind& v) { j = std::string(GetElevationKindName(v)); }
        void from_json(const json& j, ElevationKind& v) {
            auto parsed = ParseElevationKind(j.get<std::string>());
            if (!parsed) ThrowUnknownEnum("ElevationKind", j);
            v = *parsed;
        }

        void to_json(json& j, const ElevationMethod& v) { j = std::string(GetElevationMethodName(v)); }
        void from_json(const json& j, ElevationMethod& v) {
            auto parsed = ParseElevationMethod(j.get<std::string>());
            if (!parsed) ThrowUnknownEnum("ElevationMethod", j);
            v = *parsed;
        }

        void to_json(json& j, const SignatureStatus& v) { j = std::string(GetSignatureStatusName(v)); }
        void from_json(const json& j, SignatureStatus& v) {
            auto parsed = ParseSignatureStatus(j.get<std::string>());
            if (!parsed) ThrowUnknownEnum("SignatureStatus", j);
            v = *parsed;
        }

        // ============================================================================
        // IDENTITY JSON
        // ============================================================================

        void to_json(json& j, const User& v) {
            j = json{
                {"AccountName", v.accountName},
                {"DomainName", v.domainName},
                {"AccountSid", v.accountSid},
                {"DomainSid", v.domainSid}
            };
        }

        void from_json(const json& j, User& v) {
            v = User{};
            ReadOptional(j, "AccountName", v.accountName);
            ReadOptional(j, "DomainName", v.domainName);
            j.at("AccountSid").get_to(v.accountSid);
            ReadOptional(j, "DomainSid", v.domainSid);
        }

        void to_json(json& j, const Hash& v) {
            j = json{ {"Sha1", v.sha1}, {"Sha256", v.sha256} };
        }

        void from_json(const json& j, Hash& v) {
            v = Hash{};
            ReadOptional(j, "Sha1", v.sha1);
            ReadOptional(j, "Sha256", v.sha256);
        }

        void to_json(json& j, const Signature& v) {
            j = json{ {"Status", v.status}, {"Certificates", v.certificateChain} };
            if (v.signer) {
                j["Signer"] = json{ {"Issuer", *v.signer} };
            }
        }

        void from_json(const json& j, Signature& v) {
            v = Signature{};
            j.at("Status").get_to(v.status);
            if (HasValue(j, "Signer")) {
                const auto& signer = j.at("Signer");
                if (signer.is_object()) {
                    v.signer = signer.at("Issuer").get<std::string>();
                }
                else {
                    v.signer = signer.get<std::string>();
                }
            }
            ReadOptional(j, "Certificates", v.certificateChain);
        }

        void to_json(json& j, const ApplicationIdentity& v) {
            j = json{
                {"Path", v.path},
                {"WorkingDirectory", v.workingDirectory},
                {"CommandLine", v.commandLine},
                {"User", v.user},
                {"Hash", v.hash},
                {"Signature", v.signature}
            };
        }

        void from_json(const json& j, ApplicationIdentity& v) {
            v = ApplicationIdentity{};
            j.at("Path").get_to(v.path);
            ReadOptional(j, "WorkingDirectory", v.workingDirectory);
            ReadOptional(j, "CommandLine", v.commandLine);
            ReadOptional(j, "User", v.user);
            ReadOptional(j, "Hash", v.hash);
            ReadOptional(j, "Signature", v.signature);
        }

        // ============================================================================
        // FILTER JSON
        // ============================================================================

        void to_json(json& j, const PathFilter& v) {
            j = json{ {"Kind", std::string(GetPathFilterKindName(v.kind))}, {"Data", v.pattern} };
        }

        void from_json(const json& j, PathFilter& v) {
            const auto kindName = j.at("Kind").get<std::string>();
            auto kind = ParsePathFilterKind(kindName);
            if (!kind) ThrowUnknownEnum("PathFilterKind", j.at("Kind"));
            v.kind = *kind;
            j.at("Data").get_to(v.pattern);
        }

        void to_json(json& j, const StringFilter& v) {
            j = json{ {"Kind", std::string(GetStringFilterKindName(v.kind))}, {"Data", v.pattern} };
        }

        void from_json(const json& j, StringFilter& v) {
            const auto kindName = j.at("Kind").get<std::string>();
            auto kind = ParseStringFilterKind(kindName);
            if (!kind) ThrowUnknownEnum("StringFilterKind", j.at("Kind"));
            v.kind = *kind;
            j.at("Data").get_to(v.pattern);
        }

        void to_json(json& j, const HashFilter& v) {
            j = json::object();
            if (v.sha1) j["Sha1"] = *v.sha1;
            if (v.sha256) j["Sha256"] = *v.sha256;
        }

        void from_json(const json& j, HashFilter& v) {
            v = HashFilter{};
            if (HasValue(j, "Sha1")) v.sha1 = j.at("Sha1").get<std::string>();
            if (HasValue(j, "Sha256")) v.sha256 = j.at("Sha256").get<std::string>();
        }

        void to_json(json& j, const SignatureFilter& v) {
            j = json{ {"CheckAuthenticode", v.checkAuthenticode} };
        }

        void from_json(const json& j, SignatureFilter& v) {
            j.at("CheckAuthenticode").get_to(v.checkAuthenticode);
        }

        void to_json(json& j, const ApplicationFilter& v) {
            j = json{ {"Path", v.path} };
            if (v.workingDirectory) j["WorkingDirectory"] = *v.workingDirectory;
            if (v.commandLine) {
                j["CommandLine"] = *v.commandLine;
                j["CommandLineMode"] = std::string(GetCommandLineModeName(v.commandLineMode));
            }
            if (v.hashes) j["Hashes"] = *v.hashes;
            if (v.signature) j["Signature"] = *v.signature;
        }

        void from_json(const json& j, ApplicationFilter& v) {
            v = ApplicationFilter{};
            j.at("Path").get_to(v.path);
            if (HasValue(j, "WorkingDirectory")) {
                v.workingDirectory = j.at("WorkingDirectory").get<PathFilter>();
            }
            if (HasValue(j, "CommandLine")) {
                v.commandLine = j.at("CommandLine").get<std::vector<StringFilter>>();
            }
            if (HasValue(j, "CommandLineMode")) {
                auto mode = ParseCommandLineMode(j.at("CommandLineMode").get<std::string>());
                if (!mode) ThrowUnknownEnum("CommandLineMode", j.at("CommandLineMode"));
                v.commandLineMode = *mode;
            }
            if (HasValue(j, "Hashes")) {
                v.hashes = j.at("Hashes").get<std::vector<HashFilter>>();
            }
            if (HasValue(j, "Signature")) {
                v.signature = j.at("Signature").get<SignatureFilter>();
            }
        }

        // ============================================================================
        // POLICY JSON
        // ============================================================================

        void to_json(json& j, const Rule& v) {
            j = json{
                {"Id", v.id},
                {"Name", v.name},
                {"ElevationKind", v.elevationKind},
                {"Asker", v.asker},
                {"Target", v.target}
            };
        }

        void from_json(const json& j, Rule& v) {
            v = Rule{};
            ReadOptional(j, "Id", v.id);
            j.at("Name").get_to(v.name);
            j.at("ElevationKind").get_to(v.elevationKind);
            j.at("Asker").get_to(v.asker);
            j.at("Target").get_to(v.target);
        }

        void to_json(json& j, const TemporaryElevationConfig& v) {
            j = json{
                {"Enabled", v.enabled},
                {"MaximumSeconds", v.maxSeconds},
                {"StrictMaximum", v.strictMaximum}
            };
        }

        void from_json(const json& j, TemporaryElevationConfig& v) {
            v = TemporaryElevationConfig{};
            ReadOptional(j, "Enabled", v.enabled);
            ReadOptional(j, "MaximumSeconds", v.maxSeconds);
            ReadOptional(j, "StrictMaximum", v.strictMaximum);
        }

        void to_json(json& j, const SessionElevationConfig& v) {
            j = json{ {"Enabled", v.enabled} };
        }

        void from_json(const json& j, SessionElevationConfig& v) {
            v = SessionElevationConfig{};
            ReadOptional(j, "Enabled", v.enabled);
        }

        void to_json(json& j, const Profile& v) {
            j = json{
                {"Id", v.id},
                {"Name", v.name},
                {"Description", v.description},
                {"DefaultElevationKind", v.defaultElevationKind},
                {"ElevationMethod", v.elevationMethod},
                {"TemporaryElevation", v.temporary},
                {"SessionElevation", v.session},
                {"PromptSecureDesktop", v.promptSecureDesktop},
                {"TargetMustBeSigned", v.targetMustBeSigned},
                {"Rules", v.ruleIds}
            };
        }

        void from_json(const json& j, Profile& v) {
            v = Profile{};
            ReadOptional(j, "Id", v.id);
            j.at("Name").get_to(v.name);
            ReadOptional(j, "Description", v.description);
            j.at("DefaultElevationKind").get_to(v.defaultElevationKind);
            ReadOptional(j, "ElevationMethod", v.elevationMethod);
            ReadOptional(j, "TemporaryElevation", v.temporary);
            ReadOptional(j, "SessionElevation", v.session);
            ReadOptional(j, "PromptSecureDesktop", v.promptSecureDesktop);
            ReadOptional(j, "TargetMustBeSigned", v.targetMustBeSigned);
            ReadOptional(j, "Rules", v.ruleIds);
        }

        void to_json(json& j, const Assignment& v) {
            j = json{ {"ProfileId", v.profileId}, {"Users", v.users} };
        }

        void from_json(const json& j, Assignment& v) {
            v = Assignment{};
            ReadOptional(j, "ProfileId", v.profileId);
            j.at("Users").get_to(v.users);
        }

    } // namespace Policy
} // namespace JitGuard
