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
#include "PolicyRepository.hpp"
#include "FilterMatcher.hpp"

#include "../Database/DatabaseManager.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace JitGuard {
    namespace Policy {

        using Core::ErrorKind;
        using Core::ServiceError;
        using Core::SetError;
        using Core::SetStorageError;
        using Database::DatabaseError;
        using Database::Transaction;

        namespace {
            constexpr const wchar_t* LOG_CATEGORY = L"PolicyRepository";

            constexpr int POLICY_SCHEMA_VERSION = 1;

            const std::vector<std::string>& SchemaStatements() {
                static const std::vector<std::string> statements = {
                    R"(CREATE TABLE IF NOT EXISTS policy_rule (
                        id      INTEGER PRIMARY KEY AUTOINCREMENT,
                        name    TEXT NOT NULL,
                        body    TEXT NOT NULL
                    ))",
                    R"(CREATE TABLE IF NOT EXISTS policy_profile (
                        id      INTEGER PRIMARY KEY AUTOINCREMENT,
                        name    TEXT NOT NULL,
                        body    TEXT NOT NULL
                    ))",
                    R"(CREATE TABLE IF NOT EXISTS policy_profile_rule (
                        profile_id  INTEGER NOT NULL REFERENCES policy_profile(id) ON DELETE CASCADE,
                        position    INTEGER NOT NULL,
                        rule_id     INTEGER NOT NULL REFERENCES policy_rule(id) ON DELETE RESTRICT,
                        PRIMARY KEY (profile_id, position)
                    ))",
                    R"(CREATE TABLE IF NOT EXISTS policy_user (
                        user_key        TEXT PRIMARY KEY,
                        account_name    TEXT NOT NULL,
                        domain_name     TEXT NOT NULL,
                        account_sid     TEXT NOT NULL,
                        domain_sid      TEXT NOT NULL
                    ))",
                    R"(CREATE TABLE IF NOT EXISTS policy_assignment (
                        profile_id  INTEGER NOT NULL REFERENCES policy_profile(id) ON DELETE CASCADE,
                        user_key    TEXT NOT NULL REFERENCES policy_user(user_key),
                        PRIMARY KEY (profile_id, user_key)
                    ))",
                    R"(CREATE TABLE IF NOT EXISTS policy_selection (
                        user_key    TEXT PRIMARY KEY REFERENCES policy_user(user_key),
                        profile_id  INTEGER NOT NULL REFERENCES policy_profile(id) ON DELETE CASCADE
                    ))",
                    "CREATE INDEX IF NOT EXISTS idx_policy_profile_rule_rule ON policy_profile_rule(rule_id)",
                    "CREATE INDEX IF NOT EXISTS idx_policy_assignment_user ON policy_assignment(user_key)"
                };
                return statements;
            }

            bool EncodeBody(const nlohmann::json& j, std::string& out) {
                return Utils::JSON::Stringify(j, out);
            }

            template <typename T>
            bool DecodeBody(const std::string& body, T& out) {
                Utils::JSON::Json j;
                Utils::JSON::Error jsonErr;
                if (!Utils::JSON::Parse(body, j, &jsonErr)) {
                    JG_LOG_ERROR(LOG_CATEGORY, L"Stored policy body is not JSON: %ls",
                        Utils::ToWide(jsonErr.message).c_str());
                    return false;
                }
                try {
                    j.get_to(out);
                    return true;
                }
                catch (const nlohmann::json::exception& e) {
                    JG_LOG_ERROR(LOG_CATEGORY, L"Stored policy body rejected: %ls", Utils::ToWide(e.what()).c_str());
                }
                catch (const std::invalid_argument& e) {
                    JG_LOG_ERROR(LOG_CATEGORY, L"Stored policy body rejected: %ls", Utils::ToWide(e.what()).c_str());
                }
                return false;
            }

            bool ValidatePathFilter(const PathFilter& filter, std::wstring_view what, ServiceError* err) {
                if (filter.pattern.empty()) {
                    return SetError(err, ErrorKind::InvalidParameter,
                        std::wstring(what) + L" path filter pattern must not be empty", L"ValidateRule");
                }
                return true;
            }

            bool ValidateApplicationFilter(const ApplicationFilter& filter, std::wstring_view what,
                ServiceError* err) {
                if (!ValidatePathFilter(filter.path, what, err)) {
                    return false;
                }
                if (filter.workingDirectory && !ValidatePathFilter(*filter.workingDirectory, what, err)) {
                    return false;
                }
                if (filter.hashes) {
                    for (const auto& entry : *filter.hashes) {
                        if (!entry.sha1 && !entry.sha256) {
                            return SetError(err, ErrorKind::InvalidParameter,
                                std::wstring(what) + L" hash filter needs Sha1 or Sha256", L"ValidateRule");
                        }
                    }
                }
                if (filter.commandLine) {
                    for (const auto& entry : *filter.commandLine) {
                        if (entry.kind != StringFilterKind::Regex) {
                            continue;
                        }
                        std::wstring reason;
                        if (!FilterMatcher::ValidateRegexPattern(entry.pattern, &reason)) {
                            return SetError(err, ErrorKind::InvalidParameter,
                                std::wstring(what) + L" command line regex " + Utils::ToWide(entry.pattern) +
                                L" refused: " + reason, L"ValidateRule");
                        }
                    }
                }
                return true;
            }

            bool IsValidUser(const User& user) noexcept {
                return !user.accountSid.empty();
            }
        } // anonymous namespace

        // ============================================================================
        // SNAPSHOT QUERIES
        // ============================================================================

        const Rule* PolicySnapshot::FindRule(int64_t id) const noexcept {
            auto it = rules.find(id);
            return it == rules.end() ? nullptr : &it->second;
        }

        const Profile* PolicySnapshot::FindProfile(int64_t id) const noexcept {
            auto it = profiles.find(id);
            return it == profiles.end() ? nullptr : &it->second;
        }

        std::vector<int64_t> PolicySnapshot::AssignedProfiles(const User& user) const {
            std::vector<int64_t> result;
            for (const auto& [profileId, members] : assignments) {
                if (std::find(members.begin(), members.end(), user) != members.end()) {
                    result.push_back(profileId);
                }
            }
            return result;  // std::map iteration is already ascending
        }

        std::optional<int64_t> PolicySnapshot::ActiveProfileId(const User& user) const {
            const auto assigned = AssignedProfiles(user);
            if (assigned.empty()) {
                return std::nullopt;
            }

            auto sel = selections.find(user.Key());
            if (sel != selections.end() &&
                std::find(assigned.begin(), assigned.end(), sel->second) != assigned.end()) {
                return sel->second;
            }
            return assigned.front();
        }

        bool PolicySnapshot::IsRuleReferenced(int64_t ruleId) const noexcept {
            for (const auto& [id, profile] : profiles) {
                if (std::find(profile.ruleIds.begin(), profile.ruleIds.end(), ruleId) != profile.ruleIds.end()) {
                    return true;
                }
            }
            return false;
        }

        // ============================================================================
        // LIFECYCLE
        // ============================================================================

        PolicyRepository::PolicyRepository(Database::DatabaseManager& database) noexcept
            : m_db(database) {
        }

        bool PolicyRepository::Initialize(ServiceError* err) {
            if (!m_db.IsInitialized()) {
                return SetError(err, ErrorKind::Internal, L"Database is not initialized", L"PolicyRepository::Initialize");
            }

            std::lock_guard<std::mutex> commit(m_commitMutex);

            if (!createSchema(err)) {
                return false;
            }
            if (!loadSnapshot(err)) {
                return false;
            }

            auto snapshot = GetSnapshot();
            JG_LOG_INFO(LOG_CATEGORY, L"Policy loaded: %zu profiles, %zu rules, %zu users",
                snapshot->profiles.size(), snapshot->rules.size(), snapshot->users.size());
            return true;
        }

        bool PolicyRepository::IsInitialized() const noexcept {
            std::shared_lock<std::shared_mutex> lock(m_snapshotMutex);
            return m_snapshot != nullptr;
        }

        PolicySnapshotPtr PolicyRepository::GetSnapshot() const {
            std::shared_lock<std::shared_mutex> lock(m_snapshotMutex);
            return m_snapshot;
        }

        bool PolicyRepository::createSchema(ServiceError* err) {
            DatabaseError dbErr;
            if (!m_db.ExecuteMany(SchemaStatements(), &dbErr)) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to create policy schema: %ls", dbErr.message.c_str());
                return SetStorageError(err, dbErr, L"PolicyRepository::createSchema");
            }

            const int version = m_db.GetSchemaVersion("policy", &dbErr);
            if (version < POLICY_SCHEMA_VERSION) {
                dbErr.Clear();
                if (!m_db.SetSchemaVersion("policy", POLICY_SCHEMA_VERSION, &dbErr)) {
                    return SetStorageError(err, dbErr, L"PolicyRepository::createSchema");
                }
            }
            return true;
        }

        bool PolicyRepository::loadSnapshot(ServiceError* err) {
            auto snapshot = std::make_shared<PolicySnapshot>();
            DatabaseError dbErr;

            try {
                {
                    auto rows = m_db.Query("SELECT id, body FROM policy_rule ORDER BY id", &dbErr);
                    if (dbErr.HasError()) {
                        return SetStorageError(err, dbErr, L"PolicyRepository::loadSnapshot");
                    }
                    while (rows.Next()) {
                        Rule rule;
                        if (!DecodeBody(rows.GetString(1), rule)) {
                            return SetError(err, ErrorKind::Internal, L"Corrupt rule row", L"PolicyRepository::loadSnapshot");
                        }
                        rule.id = rows.GetInt64(0);
                        snapshot->rules[rule.id] = std::move(rule);
                    }
                }

                {
                    auto rows = m_db.Query("SELECT id, body FROM policy_profile ORDER BY id", &dbErr);
                    if (dbErr.HasError()) {
                        return SetStorageError(err, dbErr, L"PolicyRepository::loadSnapshot");
                    }
                    while (rows.Next()) {
                        Profile profile;
                        if (!DecodeBody(rows.GetString(1), profile)) {
                            return SetError(err, ErrorKind::Internal, L"Corrupt profile row", L"PolicyRepository::loadSnapshot");
                        }
                        profile.id = rows.GetInt64(0);
                        profile.ruleIds.clear();
                        snapshot->profiles[profile.id] = std::move(profile);
                    }
                }

                {
                    auto rows = m_db.Query(
                        "SELECT profile_id, rule_id FROM policy_profile_rule ORDER BY profile_id, position", &dbErr);
                    if (dbErr.HasError()) {
                        return SetStorageError(err, dbErr, L"PolicyRepository::loadSnapshot");
                    }
                    while (rows.Next()) {
                        auto it = snapshot->profiles.find(rows.GetInt64(0));
                        if (it != snapshot->profiles.end()) {
                            it->second.ruleIds.push_back(rows.GetInt64(1));
                        }
                    }
                }

                {
                    auto rows = m_db.Query(
                        "SELECT user_key, account_name, domain_name, account_sid, domain_sid FROM policy_user", &dbErr);
                    if (dbErr.HasError()) {
                        return SetStorageError(err, dbErr, L"PolicyRepository::loadSnapshot");
                    }
                    while (rows.Next()) {
                        User user;
                        user.accountName = rows.GetString(1);
                        user.domainName = rows.GetString(2);
                        user.accountSid = rows.GetString(3);
                        user.domainSid = rows.GetString(4);
                        snapshot->users[rows.GetString(0)] = std::move(user);
                    }
                }

                {
                    auto rows = m_db.Query(
                        "SELECT profile_id, user_key FROM policy_assignment ORDER BY profile_id, rowid", &dbErr);
                    if (dbErr.HasError()) {
                        return SetStorageError(err, dbErr, L"PolicyRepository::loadSnapshot");
                    }
                    while (rows.Next()) {
                        auto user = snapshot->users.find(rows.GetString(1));
                        if (user != snapshot->users.end()) {
                            snapshot->assignments[rows.GetInt64(0)].push_back(user->second);
                        }
                    }
                    for (const auto& [profileId, profile] : snapshot->profiles) {
                        snapshot->assignments.try_emplace(profileId);
                    }
                }

                {
                    auto rows = m_db.Query("SELECT user_key, profile_id FROM policy_selection", &dbErr);
                    if (dbErr.HasError()) {
                        return SetStorageError(err, dbErr, L"PolicyRepository::loadSnapshot");
                    }
                    while (rows.Next()) {
                        snapshot->selections[rows.GetString(0)] = rows.GetInt64(1);
                    }
                }
            }
            catch (const SQLite::Exception& e) {
                return SetError(err, ErrorKind::Internal, Utils::ToWide(e.what()), L"PolicyRepository::loadSnapshot",
                    e.getErrorCode());
            }
            catch (const std::runtime_error& e) {
                return SetError(err, ErrorKind::Internal, Utils::ToWide(e.what()), L"PolicyRepository::loadSnapshot");
            }

            snapshot->version = 1;
            publish(std::move(snapshot));
            return true;
        }

        void PolicyRepository::publish(std::shared_ptr<PolicySnapshot> next) {
            std::unique_lock<std::shared_mutex> lock(m_snapshotMutex);
            m_snapshot = std::move(next);
        }

        std::shared_ptr<PolicySnapshot> PolicyRepository::cloneCurrent() const {
            auto current = GetSnapshot();
            auto next = current ? std::make_shared<PolicySnapshot>(*current) : std::make_shared<PolicySnapshot>();
            ++next->version;
            return next;
        }

        // ============================================================================
        // VALIDATION
        // ============================================================================

        bool PolicyRepository::ValidateRule(const Rule& rule, ServiceError* err) {
            if (rule.name.empty()) {
                return SetError(err, ErrorKind::InvalidParameter, L"Rule name must not be empty", L"ValidateRule");
            }
            if (!ValidateApplicationFilter(rule.asker, L"Asker", err)) {
                return false;
            }
            return ValidateApplicationFilter(rule.target, L"Target", err);
        }

        bool PolicyRepository::ValidateProfile(const Profile& profile, const PolicySnapshot& snapshot,
            ServiceError* err) {
            if (profile.name.empty()) {
                return SetError(err, ErrorKind::InvalidParameter, L"Profile name must not be empty", L"ValidateProfile");
            }
            if (profile.temporary.enabled && profile.temporary.maxSeconds == 0) {
                return SetError(err, ErrorKind::InvalidParameter,
                    L"Temporary elevation needs a positive maximum", L"ValidateProfile");
            }
            if (profile.temporary.maxSeconds > MAX_TEMPORARY_ELEVATION_SECONDS) {
                return SetError(err, ErrorKind::InvalidParameter,
                    L"Temporary maximum exceeds " + std::to_wstring(MAX_TEMPORARY_ELEVATION_SECONDS) + L"s",
                    L"ValidateProfile");
            }

            std::set<int64_t> seen;
            for (int64_t ruleId : profile.ruleIds) {
                if (!seen.insert(ruleId).second) {
                    return SetError(err, ErrorKind::InvalidParameter,
                        L"Rule " + std::to_wstring(ruleId) + L" listed twice", L"ValidateProfile");
                }
                if (!snapshot.FindRule(ruleId)) {
                    return SetError(err, ErrorKind::InvalidParameter,
                        L"Rule " + std::to_wstring(ruleId) + L" does not exist", L"ValidateProfile");
                }
            }
            return true;
        }

        // ============================================================================
        // RULES
        // ============================================================================

        std::optional<int64_t> PolicyRepository::CreateRule(const Rule& rule, ServiceError* err) {
            if (!ValidateRule(rule, err)) {
                return std::nullopt;
            }

            Rule stored = rule;
            stored.id = 0;
            std::string body;
            if (!EncodeBody(stored, body)) {
                SetError(err, ErrorKind::InvalidParameter, L"Rule is not serializable", L"CreateRule");
                return std::nullopt;
            }

            std::lock_guard<std::mutex> commit(m_commitMutex);
            if (!IsInitialized()) {
                SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"CreateRule");
                return std::nullopt;
            }

            DatabaseError dbErr;
            auto tx = m_db.BeginTransaction(Transaction::Type::Immediate, &dbErr);
            if (!tx ||
                !tx->ExecuteWithParams("INSERT INTO policy_rule (name, body) VALUES (?, ?)", &dbErr, stored.name, body)) {
                SetStorageError(err, dbErr, L"CreateRule");
                return std::nullopt;
            }
            stored.id = tx->LastInsertRowId();
            if (!tx->Commit(&dbErr)) {
                SetStorageError(err, dbErr, L"CreateRule");
                return std::nullopt;
            }

            auto next = cloneCurrent();
            next->rules[stored.id] = stored;
            publish(std::move(next));

            JG_LOG_INFO(LOG_CATEGORY, L"Rule %lld created (%ls)",
                static_cast<long long>(stored.id), Utils::ToWide(stored.name).c_str());
            return stored.id;
        }

        bool PolicyRepository::PutRule(int64_t id, const Rule& rule, ServiceError* err) {
            if (!ValidateRule(rule, err)) {
                return false;
            }

            Rule stored = rule;
            stored.id = id;
            std::string body;
            if (!EncodeBody(stored, body)) {
                return SetError(err, ErrorKind::InvalidParameter, L"Rule is not serializable", L"PutRule");
            }

            std::lock_guard<std::mutex> commit(m_commitMutex);

            auto current = GetSnapshot();
            if (!current) {
                return SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"PutRule");
            }
            if (!current->FindRule(id)) {
                return SetError(err, ErrorKind::NotFound, L"Rule " + std::to_wstring(id) + L" not found", L"PutRule");
            }

            DatabaseError dbErr;
            if (!m_db.ExecuteWithParams("UPDATE policy_rule SET name = ?, body = ? WHERE id = ?",
                &dbErr, stored.name, body, id)) {
                return SetStorageError(err, dbErr, L"PutRule");
            }

            auto next = cloneCurrent();
            next->rules[id] = std::move(stored);
            publish(std::move(next));

            JG_LOG_INFO(LOG_CATEGORY, L"Rule %lld updated", static_cast<long long>(id));
            return true;
        }

        std::optional<Rule> PolicyRepository::GetRule(int64_t id, ServiceError* err) const {
            auto snapshot = GetSnapshot();
            if (!snapshot) {
                SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"GetRule");
                return std::nullopt;
            }
            const Rule* rule = snapshot->FindRule(id);
            if (!rule) {
                SetError(err, ErrorKind::NotFound, L"Rule " + std::to_wstring(id) + L" not found", L"GetRule");
                return std::nullopt;
            }
            return *rule;
        }

        std::vector<Rule> PolicyRepository::ListRules() const {
            std::vector<Rule> result;
            if (auto snapshot = GetSnapshot()) {
                result.reserve(snapshot->rules.size());
                for (const auto& [id, rule] : snapshot->rules) {
                    result.push_back(rule);
                }
            }
            return result;
        }

        bool PolicyRepository::DeleteRule(int64_t id, ServiceError* err) {
            std::lock_guard<std::mutex> commit(m_commitMutex);

            auto current = GetSnapshot();
            if (!current) {
                return SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"DeleteRule");
            }
            if (!current->FindRule(id)) {
                return SetError(err, ErrorKind::NotFound, L"Rule " + std::to_wstring(id) + L" not found", L"DeleteRule");
            }
            if (current->IsRuleReferenced(id)) {
                JG_LOG_WARN(LOG_CATEGORY, L"Rule %lld delete rejected: still referenced", static_cast<long long>(id));
                return SetError(err, ErrorKind::InvalidParameter,
                    L"Rule " + std::to_wstring(id) + L" is referenced by a profile", L"DeleteRule");
            }

            DatabaseError dbErr;
            if (!m_db.ExecuteWithParams("DELETE FROM policy_rule WHERE id = ?", &dbErr, id)) {
                return SetStorageError(err, dbErr, L"DeleteRule");
            }

            auto next = cloneCurrent();
            next->rules.erase(id);
            publish(std::move(next));

            JG_LOG_INFO(LOG_CATEGORY, L"Rule %lld deleted", static_cast<long long>(id));
            return true;
        }

        // ============================================================================
        // PROFILES
        // ============================================================================

        bool PolicyRepository::writeProfileRules(Transaction& tx, int64_t profileId,
            const std::vector<int64_t>& ruleIds, ServiceError* err) {
            DatabaseError dbErr;
            if (!tx.ExecuteWithParams("DELETE FROM policy_profile_rule WHERE profile_id = ?", &dbErr, profileId)) {
                return SetStorageError(err, dbErr, L"writeProfileRules");
            }
            for (size_t i = 0; i < ruleIds.size(); ++i) {
                if (!tx.ExecuteWithParams(
                    "INSERT INTO policy_profile_rule (profile_id, position, rule_id) VALUES (?, ?, ?)",
                    &dbErr, profileId, static_cast<int64_t>(i), ruleIds[i])) {
                    return SetStorageError(err, dbErr, L"writeProfileRules");
                }
            }
            return true;
        }

        std::optional<int64_t> PolicyRepository::CreateProfile(const Profile& profile, ServiceError* err) {
            Profile stored = profile;
            stored.id = 0;
            std::string body;
            if (!EncodeBody(stored, body)) {
                SetError(err, ErrorKind::InvalidParameter, L"Profile is not serializable", L"CreateProfile");
                return std::nullopt;
            }

            std::lock_guard<std::mutex> commit(m_commitMutex);

            auto current = GetSnapshot();
            if (!current) {
                SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"CreateProfile");
                return std::nullopt;
            }
            if (!ValidateProfile(stored, *current, err)) {
                return std::nullopt;
            }

            DatabaseError dbErr;
            auto tx = m_db.BeginTransaction(Transaction::Type::Immediate, &dbErr);
            if (!tx ||
                !tx->ExecuteWithParams("INSERT INTO policy_profile (name, body) VALUES (?, ?)", &dbErr, stored.name, body)) {
                SetStorageError(err, dbErr, L"CreateProfile");
                return std::nullopt;
            }
            stored.id = tx->LastInsertRowId();
            if (!writeProfileRules(*tx, stored.id, stored.ruleIds, err)) {
                return std::nullopt;
            }
            if (!tx->Commit(&dbErr)) {
                SetStorageError(err, dbErr, L"CreateProfile");
                return std::nullopt;
            }

            auto next = cloneCurrent();
            next->profiles[stored.id] = stored;
            next->assignments.try_emplace(stored.id);
            publish(std::move(next));

            JG_LOG_INFO(LOG_CATEGORY, L"Profile %lld created (%ls, %zu rules)",
                static_cast<long long>(stored.id), Utils::ToWide(stored.name).c_str(), stored.ruleIds.size());
            return stored.id;
        }

        bool PolicyRepository::PutProfile(int64_t id, const Profile& profile, ServiceError* err) {
            Profile stored = profile;
            stored.id = id;
            std::string body;
            if (!EncodeBody(stored, body)) {
                return SetError(err, ErrorKind::InvalidParameter, L"Profile is not serializable", L"PutProfile");
            }

            std::lock_guard<std::mutex> commit(m_commitMutex);

            auto current = GetSnapshot();
            if (!current) {
                return SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"PutProfile");
            }
            if (!current->FindProfile(id)) {
                return SetError(err, ErrorKind::NotFound, L"Profile " + std::to_wstring(id) + L" not found", L"PutProfile");
            }
            if (!ValidateProfile(stored, *current, err)) {
                return false;
            }

            DatabaseError dbErr;
            auto tx = m_db.BeginTransaction(Transaction::Type::Immediate, &dbErr);
            if (!tx ||
                !tx->ExecuteWithParams("UPDATE policy_profile SET name = ?, body = ? WHERE id = ?",
                    &dbErr, stored.name, body, id)) {
                return SetStorageError(err, dbErr, L"PutProfile");
            }
            if (!writeProfileRules(*tx, id, stored.ruleIds, err)) {
                return false;
            }
            if (!tx->Commit(&dbErr)) {
                return SetStorageError(err, dbErr, L"PutProfile");
            }

            auto next = cloneCurrent();
            next->profiles[id] = std::move(stored);
            publish(std::move(next));

            JG_LOG_INFO(LOG_CATEGORY, L"Profile %lld updated", static_cast<long long>(id));
            return true;
        }

        std::optional<Profile> PolicyRepository::GetProfile(int64_t id, ServiceError* err) const {
            auto snapshot = GetSnapshot();
            if (!snapshot) {
                SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"GetProfile");
                return std::nullopt;
            }
            const Profile* profile = snapshot->FindProfile(id);
            if (!profile) {
                SetError(err, ErrorKind::NotFound, L"Profile " + std::to_wstring(id) + L" not found", L"GetProfile");
                return std::nullopt;
            }
            return *profile;
        }

        std::vector<Profile> PolicyRepository::ListProfiles() const {
            std::vector<Profile> result;
            if (auto snapshot = GetSnapshot()) {
                result.reserve(snapshot->profiles.size());
                for (const auto& [id, profile] : snapshot->profiles) {
                    result.push_back(profile);
                }
            }
            return result;
        }

        bool PolicyRepository::DeleteProfile(int64_t id, ServiceError* err) {
            std::lock_guard<std::mutex> commit(m_commitMutex);

            auto current = GetSnapshot();
            if (!current) {
                return SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"DeleteProfile");
            }
            if (!current->FindProfile(id)) {
                return SetError(err, ErrorKind::NotFound, L"Profile " + std::to_wstring(id) + L" not found", L"DeleteProfile");
            }

            DatabaseError dbErr;
            auto tx = m_db.BeginTransaction(Transaction::Type::Immediate, &dbErr);
            if (!tx) {
                return SetStorageError(err, dbErr, L"DeleteProfile");
            }

            // Children first so the cascade holds even with foreign keys disabled
            static constexpr const char* CASCADE[] = {
                "DELETE FROM policy_selection WHERE profile_id = ?",
                "DELETE FROM policy_assignment WHERE profile_id = ?",
                "DELETE FROM policy_profile_rule WHERE profile_id = ?",
                "DELETE FROM policy_profile WHERE id = ?"
            };
            for (const char* sql : CASCADE) {
                if (!tx->ExecuteWithParams(sql, &dbErr, id)) {
                    return SetStorageError(err, dbErr, L"DeleteProfile");
                }
            }
            if (!tx->Commit(&dbErr)) {
                return SetStorageError(err, dbErr, L"DeleteProfile");
            }

            auto next = cloneCurrent();
            next->profiles.erase(id);
            next->assignments.erase(id);
            for (auto it = next->selections.begin(); it != next->selections.end();) {
                if (it->second == id) {
                    it = next->selections.erase(it);
                }
                else {
                    ++it;
                }
            }
            publish(std::move(next));

            JG_LOG_INFO(LOG_CATEGORY, L"Profile %lld deleted", static_cast<long long>(id));
            return true;
        }

        // ============================================================================
        // ASSIGNMENTS
        // ============================================================================

        bool PolicyRepository::upsertUser(Transaction& tx, const User& user, ServiceError* err) {
            DatabaseError dbErr;
            if (!tx.ExecuteWithParams(
                "INSERT INTO policy_user (user_key, account_name, domain_name, account_sid, domain_sid) "
                "VALUES (?, ?, ?, ?, ?) "
                "ON CONFLICT(user_key) DO UPDATE SET account_name = excluded.account_name, "
                "domain_name = excluded.domain_name",
                &dbErr, user.Key(), user.accountName, user.domainName, user.accountSid, user.domainSid)) {
                return SetStorageError(err, dbErr, L"upsertUser");
            }
            return true;
        }

        std::optional<Assignment> PolicyRepository::GetAssignment(int64_t profileId, ServiceError* err) const {
            auto snapshot = GetSnapshot();
            if (!snapshot) {
                SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"GetAssignment");
                return std::nullopt;
            }
            if (!snapshot->FindProfile(profileId)) {
                SetError(err, ErrorKind::NotFound,
                    L"Profile " + std::to_wstring(profileId) + L" not found", L"GetAssignment");
                return std::nullopt;
            }

            Assignment assignment;
            assignment.profileId = profileId;
            auto it = snapshot->assignments.find(profileId);
            if (it != snapshot->assignments.end()) {
                assignment.users = it->second;
            }
            return assignment;
        }

        std::vector<Assignment> PolicyRepository::ListAssignments() const {
            std::vector<Assignment> result;
            if (auto snapshot = GetSnapshot()) {
                for (const auto& [profileId, profile] : snapshot->profiles) {
                    Assignment assignment;
                    assignment.profileId = profileId;
                    auto it = snapshot->assignments.find(profileId);
                    if (it != snapshot->assignments.end()) {
                        assignment.users = it->second;
                    }
                    result.push_back(std::move(assignment));
                }
            }
            return result;
        }

        bool PolicyRepository::SetAssignment(int64_t profileId, const std::vector<User>& users, ServiceError* err) {
            std::vector<User> members;
            std::set<std::string> keys;
            for (const auto& user : users) {
                if (!IsValidUser(user)) {
                    return SetError(err, ErrorKind::InvalidParameter, L"User is missing an account SID", L"SetAssignment");
                }
                if (keys.insert(user.Key()).second) {
                    members.push_back(user);
                }
            }

            std::lock_guard<std::mutex> commit(m_commitMutex);

            auto current = GetSnapshot();
            if (!current) {
                return SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"SetAssignment");
            }
            if (!current->FindProfile(profileId)) {
                return SetError(err, ErrorKind::NotFound,
                    L"Profile " + std::to_wstring(profileId) + L" not found", L"SetAssignment");
            }

            std::vector<std::string> droppedSelections;
            for (const auto& [userKey, selected] : current->selections) {
                if (selected == profileId && keys.count(userKey) == 0) {
                    droppedSelections.push_back(userKey);
                }
            }

            DatabaseError dbErr;
            auto tx = m_db.BeginTransaction(Transaction::Type::Immediate, &dbErr);
            if (!tx) {
                return SetStorageError(err, dbErr, L"SetAssignment");
            }
            for (const auto& user : members) {
                if (!upsertUser(*tx, user, err)) {
                    return false;
                }
            }
            if (!tx->ExecuteWithParams("DELETE FROM policy_assignment WHERE profile_id = ?", &dbErr, profileId)) {
                return SetStorageError(err, dbErr, L"SetAssignment");
            }
            for (const auto& user : members) {
                if (!tx->ExecuteWithParams("INSERT INTO policy_assignment (profile_id, user_key) VALUES (?, ?)",
                    &dbErr, profileId, user.Key())) {
                    return SetStorageError(err, dbErr, L"SetAssignment");
                }
            }
            for (const auto& userKey : droppedSelections) {
                if (!tx->ExecuteWithParams("DELETE FROM policy_selection WHERE user_key = ?", &dbErr, userKey)) {
                    return SetStorageError(err, dbErr, L"SetAssignment");
                }
            }
            if (!tx->Commit(&dbErr)) {
                return SetStorageError(err, dbErr, L"SetAssignment");
            }

            auto next = cloneCurrent();
            for (const auto& user : members) {
                next->users[user.Key()] = user;
            }
            next->assignments[profileId] = members;
            for (const auto& userKey : droppedSelections) {
                next->selections.erase(userKey);
            }
            publish(std::move(next));

            JG_LOG_INFO(LOG_CATEGORY, L"Profile %lld assigned to %zu users",
                static_cast<long long>(profileId), members.size());
            return true;
        }

        // ============================================================================
        // SELECTION
        // ============================================================================

        bool PolicyRepository::SelectProfile(const User& user, int64_t profileId, ServiceError* err) {
            if (!IsValidUser(user)) {
                return SetError(err, ErrorKind::InvalidParameter, L"User is missing an account SID", L"SelectProfile");
            }

            std::lock_guard<std::mutex> commit(m_commitMutex);

            auto current = GetSnapshot();
            if (!current) {
                return SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"SelectProfile");
            }
            if (!current->FindProfile(profileId)) {
                return SetError(err, ErrorKind::NotFound,
                    L"Profile " + std::to_wstring(profileId) + L" not found", L"SelectProfile");
            }
            const auto assigned = current->AssignedProfiles(user);
            if (std::find(assigned.begin(), assigned.end(), profileId) == assigned.end()) {
                return SetError(err, ErrorKind::InvalidParameter,
                    L"Profile " + std::to_wstring(profileId) + L" is not assigned to the user", L"SelectProfile");
            }

            DatabaseError dbErr;
            auto tx = m_db.BeginTransaction(Transaction::Type::Immediate, &dbErr);
            if (!tx) {
                return SetStorageError(err, dbErr, L"SelectProfile");
            }
            if (!upsertUser(*tx, user, err)) {
                return false;
            }
            if (!tx->ExecuteWithParams(
                "INSERT INTO policy_selection (user_key, profile_id) VALUES (?, ?) "
                "ON CONFLICT(user_key) DO UPDATE SET profile_id = excluded.profile_id",
                &dbErr, user.Key(), profileId)) {
                return SetStorageError(err, dbErr, L"SelectProfile");
            }
            if (!tx->Commit(&dbErr)) {
                return SetStorageError(err, dbErr, L"SelectProfile");
            }

            auto next = cloneCurrent();
            next->users[user.Key()] = user;
            next->selections[user.Key()] = profileId;
            publish(std::move(next));

            JG_LOG_INFO(LOG_CATEGORY, L"User %ls selected profile %lld",
                Utils::ToWide(user.accountName).c_str(), static_cast<long long>(profileId));
            return true;
        }

        std::optional<Profile> PolicyRepository::GetActiveProfile(const User& user) const {
            auto snapshot = GetSnapshot();
            if (!snapshot) {
                return std::nullopt;
            }
            const auto active = snapshot->ActiveProfileId(user);
            if (!active) {
                return std::nullopt;
            }
            const Profile* profile = snapshot->FindProfile(*active);
            if (!profile) {
                return std::nullopt;
            }
            return *profile;
        }

        std::vector<int64_t> PolicyRepository::GetAssignedProfiles(const User& user) const {
            auto snapshot = GetSnapshot();
            return snapshot ? snapshot->AssignedProfiles(user) : std::vector<int64_t>{};
        }

        // ============================================================================
        // USERS
        // ============================================================================

        std::vector<User> PolicyRepository::ListUsers() const {
            std::vector<User> result;
            if (auto snapshot = GetSnapshot()) {
                result.reserve(snapshot->users.size());
                for (const auto& [key, user] : snapshot->users) {
                    result.push_back(user);
                }
            }
            return result;
        }

        bool PolicyRepository::RememberUser(const User& user, ServiceError* err) {
            if (!IsValidUser(user)) {
                return SetError(err, ErrorKind::InvalidParameter, L"User is missing an account SID", L"RememberUser");
            }

            {
                auto snapshot = GetSnapshot();
                if (!snapshot) {
                    return SetError(err, ErrorKind::Internal, L"Policy repository is not initialized", L"RememberUser");
                }
                auto it = snapshot->users.find(user.Key());
                if (it != snapshot->users.end() &&
                    it->second.accountName == user.accountName &&
                    it->second.domainName == user.domainName) {
                    return true;
                }
            }

            std::lock_guard<std::mutex> commit(m_commitMutex);

            DatabaseError dbErr;
            auto tx = m_db.BeginTransaction(Transaction::Type::Immediate, &dbErr);
            if (!tx) {
                return SetStorageError(err, dbErr, L"RememberUser");
            }
            if (!upsertUser(*tx, user, err)) {
                return false;
            }
            if (!tx->Commit(&dbErr)) {
                return SetStorageError(err, dbErr, L"RememberUser");
            }

            auto next = cloneCurrent();
            next->users[user.Key()] = user;
            // Assignment copies carry display names too
            for (auto& [profileId, members] : next->assignments) {
                for (auto& member : members) {
                    if (member == user) {
                        member.accountName = user.accountName;
                        member.domainName = user.domainName;
                    }
                }
            }
            publish(std::move(next));
            return true;
        }

    } // namespace Policy
} // namespace JitGuard
