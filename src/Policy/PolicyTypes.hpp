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
 * JitGuard Policy Types
 * ============================================================================
 *
 * @file PolicyTypes.hpp
 * @brief Application identity, filters, rules, profiles and assignments.
 *
 * All strings are UTF-8. Every entity has nlohmann/json to_json/from_json
 * hooks using PascalCase keys; enums serialize as their PascalCase names.
 * from_json throws nlohmann::json::exception on malformed documents and
 * std::invalid_argument on unknown enum names, so an unrecognized verdict
 * can never silently become AutoApprove.
 * ============================================================================
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace JitGuard {
    namespace Policy {

        // ============================================================================
        // ENUMERATIONS
        // ============================================================================

        /// Policy verdict for an elevation request
        enum class ElevationKind : uint8_t {
            AutoApprove = 0,    ///< No further gate
            Confirm,            ///< Caller must obtain a confirmation round-trip
            ReasonApproval,     ///< Caller must supply a justification
            Deny                ///< Hard failure
        };

        /// Mechanism used to grant rights
        enum class ElevationMethod : uint8_t {
            LocalAdmin = 0,     ///< Impersonate a local administrator token
            VirtualAccount      ///< Ephemeral privileged account
        };

        /// Authenticode-style trust classification of a binary
        enum class SignatureStatus : uint8_t {
            Valid = 0,
            Incompatible = 1,
            NotSigned = 2,
            HashMismatch = 3,
            UnsupportedFormat = 4,
            NotTrusted = 5
        };

        enum class PathFilterKind : uint8_t {
            Equals = 0,         ///< Full normalized path, case-insensitive
            FileName,           ///< Final segment only, case-insensitive
            Wildcard            ///< '*' / '?' glob over the full normalized path
        };

        enum class StringFilterKind : uint8_t {
            Equals = 0,
            Regex,
            StartsWith,
            EndsWith,
            Contains
        };

        /// How a command-line filter list is applied to the identity's tokens
        enum class CommandLineMode : uint8_t {
            AnyToken = 0,       ///< Every filter must be satisfied by at least one token
            Positional          ///< Same count, filter i matches token i
        };

        [[nodiscard]] std::string_view GetElevationKindName(ElevationKind kind) noexcept;
        [[nodiscard]] std::string_view GetElevationMethodName(ElevationMethod method) noexcept;
        [[nodiscard]] std::string_view GetSignatureStatusName(SignatureStatus status) noexcept;
        [[nodiscard]] std::string_view GetPathFilterKindName(PathFilterKind kind) noexcept;
        [[nodiscard]] std::string_view GetStringFilterKindName(StringFilterKind kind) noexcept;
        [[nodiscard]] std::string_view GetCommandLineModeName(CommandLineMode mode) noexcept;

        [[nodiscard]] std::optional<ElevationKind> ParseElevationKind(std::string_view name) noexcept;
        [[nodiscard]] std::optional<ElevationMethod> ParseElevationMethod(std::string_view name) noexcept;
        [[nodiscard]] std::optional<SignatureStatus> ParseSignatureStatus(std::string_view name) noexcept;
        [[nodiscard]] std::optional<PathFilterKind> ParsePathFilterKind(std::string_view name) noexcept;
        [[nodiscard]] std::optional<StringFilterKind> ParseStringFilterKind(std::string_view name) noexcept;
        [[nodiscard]] std::optional<CommandLineMode> ParseCommandLineMode(std::string_view name) noexcept;

        // ============================================================================
        // APPLICATION IDENTITY
        // ============================================================================

        /**
         * @brief A local or domain account.
         *
         * (accountSid, domainSid) identifies the user across renames; names are
         * display data only.
         */
        struct User {
            std::string accountName;
            std::string domainName;
            std::string accountSid;
            std::string domainSid;

            /// Stable key used for storage and session sharding
            [[nodiscard]] std::string Key() const;

            bool operator==(const User& other) const noexcept {
                return accountSid == other.accountSid && domainSid == other.domainSid;
            }
            bool operator!=(const User& other) const noexcept { return !(*this == other); }
        };

        /// Lower-case hex digests
        struct Hash {
            std::string sha1;
            std::string sha256;
        };

        struct Signature {
            SignatureStatus status = SignatureStatus::NotSigned;
            std::optional<std::string> signer;          ///< Issuer of the signing certificate
            std::vector<std::string> certificateChain;  ///< Subjects, leaf first
        };

        /// Immutable description of a program for one request
        struct ApplicationIdentity {
            std::string path;
            std::string workingDirectory;
            std::vector<std::string> commandLine;
            User user;
            Hash hash;
            Signature signature;
        };

        // ============================================================================
        // FILTERS
        // ============================================================================

        struct PathFilter {
            PathFilterKind kind = PathFilterKind::Equals;
            std::string pattern;
        };

        struct StringFilter {
            StringFilterKind kind = StringFilterKind::Equals;
            std::string pattern;
        };

        /// Every present field must equal; an entry with no fields never matches
        struct HashFilter {
            std::optional<std::string> sha1;
            std::optional<std::string> sha256;
        };

        struct SignatureFilter {
            bool checkAuthenticode = false;
        };

        /**
         * @brief Declarative filter over an ApplicationIdentity.
         *
         * An absent optional dimension always matches.
         */
        struct ApplicationFilter {
            PathFilter path;
            std::optional<PathFilter> workingDirectory;
            std::optional<std::vector<StringFilter>> commandLine;
            CommandLineMode commandLineMode = CommandLineMode::AnyToken;
            std::optional<std::vector<HashFilter>> hashes;
            std::optional<SignatureFilter> signature;
        };

        // ============================================================================
        // POLICY ENTITIES
        // ============================================================================

        struct Rule {
            int64_t id = 0;
            std::string name;
            ElevationKind elevationKind = ElevationKind::Confirm;
            ApplicationFilter asker;
            ApplicationFilter target;
        };

        /// Upper bound for TemporaryElevationConfig::maxSeconds (one leap year)
        constexpr uint64_t MAX_TEMPORARY_ELEVATION_SECONDS = 366ull * 24 * 60 * 60;

        struct TemporaryElevationConfig {
            bool enabled = false;
            uint64_t maxSeconds = 0;
            bool strictMaximum = false;     ///< Reject over-long requests instead of clamping
        };

        struct SessionElevationConfig {
            bool enabled = false;
        };

        struct Profile {
            int64_t id = 0;
            std::string name;
            std::string description;
            ElevationKind defaultElevationKind = ElevationKind::Deny;
            ElevationMethod elevationMethod = ElevationMethod::LocalAdmin;
            TemporaryElevationConfig temporary;
            SessionElevationConfig session;
            bool promptSecureDesktop = true;
            bool targetMustBeSigned = false;
            std::vector<int64_t> ruleIds;   ///< Match precedence order
        };

        struct Assignment {
            int64_t profileId = 0;
            std::vector<User> users;
        };

        // ============================================================================
        // JSON SERIALIZATION (ADL hooks)
        // ============================================================================

        void to_json(nlohmann::json& j, const ElevationKind& v);
        void from_json(const nlohmann::json& j, ElevationKind& v);
        void to_json(nlohmann::json& j, const ElevationMethod& v);
        void from_json(const nlohmann::json& j, ElevationMethod& v);
        void to_json(nlohmann::json& j, const SignatureStatus& v);
        void from_json(const nlohmann::json& j, SignatureStatus& v);

        void to_json(nlohmann::json& j, const User& v);
        void from_json(const nlohmann::json& j, User& v);
        void to_json(nlohmann::json& j, const Hash& v);
        void from_json(const nlohmann::json& j, Hash& v);
        void to_json(nlohmann::json& j, const Signature& v);
        void from_json(const nlohmann::json& j, Signature& v);
        void to_json(nlohmann::json& j, const ApplicationIdentity& v);
        void from_json(const nlohmann::json& j, ApplicationIdentity& v);

        void to_json(nlohmann::json& j, const PathFilter& v);
        void from_json(const nlohmann::json& j, PathFilter& v);
        void to_json(nlohmann::json& j, const StringFilter& v);
        void from_json(const nlohmann::json& j, StringFilter& v);
        void to_json(nlohmann::json& j, const HashFilter& v);
        void from_json(const nlohmann::json& j, HashFilter& v);
        void to_json(nlohmann::json& j, const SignatureFilter& v);
        void from_json(const nlohmann::json& j, SignatureFilter& v);
        void to_json(nlohmann::json& j, const ApplicationFilter& v);
        void from_json(const nlohmann::json& j, ApplicationFilter& v);

        void to_json(nlohmann::json& j, const Rule& v);
        void from_json(const nlohmann::json& j, Rule& v);
        void to_json(nlohmann::json& j, const TemporaryElevationConfig& v);
        void from_json(const nlohmann::json& j, TemporaryElevationConfig& v);
        void to_json(nlohmann::json& j, const SessionElevationConfig& v);
        void from_json(const nlohmann::json& j, SessionElevationConfig& v);
        void to_json(nlohmann::json& j, const Profile& v);
        void from_json(const nlohmann::json& j, Profile& v);
        void to_json(nlohmann::json& j, const Assignment& v);
        void from_json(const nlohmann::json& j, Assignment& v);

    } // namespace Policy
} // namespace JitGuard
