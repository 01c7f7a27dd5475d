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
 * JitGuard Policy Repository
 * ============================================================================
 *
 * @file PolicyRepository.hpp
 * @brief Durable store of rules, profiles, assignments and profile selections.
 *
 * Readers never touch the database: every committed write publishes a new
 * immutable PolicySnapshot, and GetSnapshot() hands out a shared reference
 * to the current one. A snapshot is never modified after publication, so a
 * decision that holds one sees a consistent rule list for its whole run.
 *
 * Writers are globally serialized on one commit lock, matching SQLite's
 * single writer: a write to one rule blocks a concurrent write to another
 * profile for the length of one transaction. Under that lock a writer
 * validates against the current snapshot, writes SQLite in one IMMEDIATE
 * transaction and then publishes, so the published snapshot always equals
 * the committed rows.
 *
 * Referential policy:
 *  - a rule referenced by any profile cannot be deleted (InvalidParameter)
 *  - deleting a profile cascades to its assignment and user selections
 * ============================================================================
 */

#include "PolicyTypes.hpp"
#include "../Core/ServiceError.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace JitGuard {

    namespace Database {
        class DatabaseManager;
        class Transaction;
    }

    namespace Policy {

        // ============================================================================
        // SNAPSHOT
        // ============================================================================

        /**
         * @brief Immutable view of every policy entity at one commit.
         */
        struct PolicySnapshot {
            uint64_t version = 0;
            std::map<int64_t, Rule> rules;
            std::map<int64_t, Profile> profiles;
            std::map<int64_t, std::vector<User>> assignments;   ///< profileId -> users
            std::map<std::string, int64_t> selections;          ///< User::Key() -> profileId
            std::map<std::string, User> users;                  ///< User::Key() -> last seen names

            [[nodiscard]] const Rule* FindRule(int64_t id) const noexcept;
            [[nodiscard]] const Profile* FindProfile(int64_t id) const noexcept;

            /// Profiles whose assignment contains the user, ascending id
            [[nodiscard]] std::vector<int64_t> AssignedProfiles(const User& user) const;

            /**
             * @brief Explicit selection if still assigned, else the lowest assigned id.
             */
            [[nodiscard]] std::optional<int64_t> ActiveProfileId(const User& user) const;

            [[nodiscard]] bool IsRuleReferenced(int64_t ruleId) const noexcept;
        };

        using PolicySnapshotPtr = std::shared_ptr<const PolicySnapshot>;

        // ============================================================================
        // REPOSITORY
        // ============================================================================

        class PolicyRepository {
        public:
            explicit PolicyRepository(Database::DatabaseManager& database) noexcept;
            ~PolicyRepository() = default;

            PolicyRepository(const PolicyRepository&) = delete;
            PolicyRepository& operator=(const PolicyRepository&) = delete;

            /**
             * @brief Creates the policy tables if needed and loads the snapshot.
             * @note The database manager must already be initialized.
             */
            bool Initialize(Core::ServiceError* err = nullptr);

            [[nodiscard]] bool IsInitialized() const noexcept;

            /// @brief Current snapshot, or nullptr before Initialize succeeds.
            [[nodiscard]] PolicySnapshotPtr GetSnapshot() const;

            // === Rules ===

            std::optional<int64_t> CreateRule(const Rule& rule, Core::ServiceError* err = nullptr);
            bool PutRule(int64_t id, const Rule& rule, Core::ServiceError* err = nullptr);
            std::optional<Rule> GetRule(int64_t id, Core::ServiceError* err = nullptr) const;
            std::vector<Rule> ListRules() const;
            bool DeleteRule(int64_t id, Core::ServiceError* err = nullptr);

            // === Profiles ===

            std::optional<int64_t> CreateProfile(const Profile& profile, Core::ServiceError* err = nullptr);
            bool PutProfile(int64_t id, const Profile& profile, Core::ServiceError* err = nullptr);
            std::optional<Profile> GetProfile(int64_t id, Core::ServiceError* err = nullptr) const;
            std::vector<Profile> ListProfiles() const;
            bool DeleteProfile(int64_t id, Core::ServiceError* err = nullptr);

            // === Assignments ===

            std::optional<Assignment> GetAssignment(int64_t profileId, Core::ServiceError* err = nullptr) const;
            std::vector<Assignment> ListAssignments() const;

            /// @brief Replaces the profile's user set; selections of removed users are dropped.
            bool SetAssignment(int64_t profileId, const std::vector<User>& users,
                               Core::ServiceError* err = nullptr);

            // === Per-user selection ===

            bool SelectProfile(const User& user, int64_t profileId, Core::ServiceError* err = nullptr);
            std::optional<Profile> GetActiveProfile(const User& user) const;
            std::vector<int64_t> GetAssignedProfiles(const User& user) const;

            // === Users ===

            std::vector<User> ListUsers() const;

            /// @brief Records (or refreshes the names of) a user seen by the service.
            bool RememberUser(const User& user, Core::ServiceError* err = nullptr);

            // === Validation (exposed for request pre-checks) ===

            static bool ValidateRule(const Rule& rule, Core::ServiceError* err = nullptr);
            static bool ValidateProfile(const Profile& profile, const PolicySnapshot& snapshot,
                                        Core::ServiceError* err = nullptr);

        private:
            bool createSchema(Core::ServiceError* err);
            bool loadSnapshot(Core::ServiceError* err);
            void publish(std::shared_ptr<PolicySnapshot> next);

            /// Copy of the current snapshot with the version bumped
            std::shared_ptr<PolicySnapshot> cloneCurrent() const;

            bool writeProfileRules(Database::Transaction& tx, int64_t profileId,
                                   const std::vector<int64_t>& ruleIds, Core::ServiceError* err);
            bool upsertUser(Database::Transaction& tx, const User& user, Core::ServiceError* err);

            Database::DatabaseManager& m_db;

            mutable std::shared_mutex m_snapshotMutex;
            PolicySnapshotPtr m_snapshot;

            std::mutex m_commitMutex;       ///< Serializes every writer
        };

    } // namespace Policy
} // namespace JitGuard
