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

#include <gtest/gtest.h>

#include "../src/Database/DatabaseManager.hpp"
#include "../src/Elevation/SessionManager.hpp"
#include "../src/Policy/PolicyTypes.hpp"
#include "../src/Service/Collaborators.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace JitGuard {
    namespace Testing {

        // ============================================================================
        // TEMPORARY STORAGE
        // ============================================================================

        /// Unique path under the system temp directory; nothing is created.
        inline std::filesystem::path UniqueTempPath(const std::string& prefix, const std::string& extension) {
            static std::atomic<uint64_t> counter{ 0 };
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            const std::string name = prefix + "_" + std::to_string(stamp) + "_" +
                std::to_string(counter.fetch_add(1)) + extension;
            return std::filesystem::temp_directory_path() / name;
        }

        inline void RemoveDatabaseFiles(const std::filesystem::path& path) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            std::filesystem::remove(std::filesystem::path(path.string() + "-wal"), ec);
            std::filesystem::remove(std::filesystem::path(path.string() + "-shm"), ec);
            std::filesystem::remove(std::filesystem::path(path.string() + "-journal"), ec);
        }

        /**
         * Brings the shared DatabaseManager up on a fresh file for every test
         * and tears it down afterwards.
         */
        class DatabaseTest : public ::testing::Test {
        protected:
            void SetUp() override {
                m_dbPath = UniqueTempPath("jitguard_test", ".db");
                ASSERT_TRUE(OpenDatabase());
            }

            void TearDown() override {
                Database::DatabaseManager::Instance().Shutdown();
                RemoveDatabaseFiles(m_dbPath);
            }

            bool OpenDatabase() {
                Database::DatabaseConfig config;
                config.databasePath = m_dbPath.wstring();
                config.maxConnections = 4;
                Database::DatabaseError dbErr;
                return Database::DatabaseManager::Instance().Initialize(config, &dbErr);
            }

            /// Simulates a service restart against the same file.
            bool ReopenDatabase() {
                Database::DatabaseManager::Instance().Shutdown();
                return OpenDatabase();
            }

            Database::DatabaseManager& Db() { return Database::DatabaseManager::Instance(); }

            std::filesystem::path m_dbPath;
        };

        // ============================================================================
        // BUILDERS
        // ============================================================================

        inline Policy::User MakeUser(const std::string& name, const std::string& sid) {
            Policy::User user;
            user.accountName = name;
            user.domainName = "WORKSTATION";
            user.accountSid = sid;
            user.domainSid = "S-1-5-21-1000";
            return user;
        }

        inline Policy::ApplicationIdentity MakeIdentity(const std::string& path, const Policy::User& user,
            std::vector<std::string> commandLine = {}) {
            Policy::ApplicationIdentity identity;
            identity.path = path;
            identity.workingDirectory = "C:\\Users\\" + user.accountName;
            identity.commandLine = commandLine.empty() ? std::vector<std::string>{ path } : std::move(commandLine);
            identity.user = user;
            identity.hash.sha1 = "da39a3ee5e6b4b0d3255bfef95601890afd80709";
            identity.hash.sha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
            identity.signature.status = Policy::SignatureStatus::Valid;
            identity.signature.signer = "Microsoft Windows Production PCA 2011";
            return identity;
        }

        inline Policy::ApplicationFilter FileNameFilter(const std::string& fileName) {
            Policy::ApplicationFilter filter;
            filter.path.kind = Policy::PathFilterKind::FileName;
            filter.path.pattern = fileName;
            return filter;
        }

        inline Policy::ApplicationFilter AnyPathFilter() {
            Policy::ApplicationFilter filter;
            filter.path.kind = Policy::PathFilterKind::Wildcard;
            filter.path.pattern = "*";
            return filter;
        }

        inline Policy::Rule MakeRule(const std::string& name, Policy::ElevationKind kind,
            Policy::ApplicationFilter asker, Policy::ApplicationFilter target) {
            Policy::Rule rule;
            rule.name = name;
            rule.elevationKind = kind;
            rule.asker = std::move(asker);
            rule.target = std::move(target);
            return rule;
        }

        inline Policy::Profile MakeProfile(const std::string& name, Policy::ElevationKind defaultKind,
            std::vector<int64_t> ruleIds = {}) {
            Policy::Profile profile;
            profile.name = name;
            profile.description = name + " profile";
            profile.defaultElevationKind = defaultKind;
            profile.ruleIds = std::move(ruleIds);
            return profile;
        }

        // ============================================================================
        // FAKES
        // ============================================================================

        class ManualClock final : public Elevation::IClock {
        public:
            Elevation::Clock::time_point Now() const noexcept override {
                std::lock_guard<std::mutex> lock(m_mutex);
                return m_now;
            }

            void Advance(std::chrono::milliseconds delta) {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_now += delta;
            }

        private:
            mutable std::mutex m_mutex;
            Elevation::Clock::time_point m_now{ std::chrono::hours(1) };
        };

        /**
         * Resolves processes from a pid table; targets get their path echoed
         * back plus whatever per-path identity was registered.
         */
        class FakeResolver final : public Service::IApplicationIdentityResolver {
        public:
            void AddProcess(uint32_t pid, Policy::ApplicationIdentity identity) {
                m_processes[pid] = std::move(identity);
            }

            void SetTarget(const std::string& path, Policy::ApplicationIdentity identity) {
                m_targets[path] = std::move(identity);
            }

            bool Resolve(const Service::ProcessReference& process, Policy::ApplicationIdentity& out,
                Core::ServiceError* err) override {
                resolved.push_back(process);
                if (process.executablePath.empty()) {
                    auto it = m_processes.find(process.processId);
                    if (it == m_processes.end()) {
                        return Core::SetError(err, Core::ErrorKind::NotFound,
                            L"No such process", L"FakeResolver", 87);
                    }
                    out = it->second;
                    return true;
                }

                auto it = m_targets.find(process.executablePath);
                if (it != m_targets.end()) {
                    out = it->second;
                }
                else {
                    out = Policy::ApplicationIdentity{};
                    out.path = process.executablePath;
                }
                return true;
            }

            std::vector<Service::ProcessReference> resolved;

        private:
            std::map<uint32_t, Policy::ApplicationIdentity> m_processes;
            std::map<std::string, Policy::ApplicationIdentity> m_targets;
        };

        class FakeExecutor final : public Service::ILaunchExecutor {
        public:
            bool Launch(const Service::LaunchPlan& plan, Service::LaunchResult& result,
                Core::ServiceError* err) override {
                plans.push_back(plan);
                if (failWithCode != 0) {
                    return Core::SetError(err, Core::ErrorKind::Internal,
                        L"CreateProcess failed", L"FakeExecutor", failWithCode);
                }
                result.processId = nextProcessId++;
                result.threadId = 1000 + result.processId;
                return true;
            }

            std::vector<Service::LaunchPlan> plans;
            int32_t failWithCode = 0;
            uint32_t nextProcessId = 4200;
        };

    } // namespace Testing
} // namespace JitGuard
