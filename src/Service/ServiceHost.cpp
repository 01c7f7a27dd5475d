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
#include "ServiceHost.hpp"

#include "../Database/DatabaseManager.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <nlohmann/json.hpp>

namespace JitGuard {
    namespace Service {

        using Core::ServiceError;
        using Core::SetStorageError;

        namespace {
            constexpr const wchar_t* LOG_CATEGORY = L"ServiceHost";
        }

        ServiceHost::ServiceHost(IApplicationIdentityResolver& resolver, ILaunchExecutor& executor,
            std::shared_ptr<const Elevation::IClock> clock)
            : m_resolver(resolver)
            , m_executor(executor)
            , m_clock(clock ? std::move(clock) : std::make_shared<Elevation::SystemClock>()) {
        }

        ServiceHost::~ServiceHost() {
            Stop();
        }

        bool ServiceHost::Start(const Config::ServiceConfig& config, std::string_view endpoint, ServiceError* err) {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            if (m_running.load()) {
                return true;
            }
            if (!config.IsValid(err)) {
                return false;
            }

            // Ignored when the embedding process already configured logging
            Utils::Logger::Instance().Initialize(config.ToLoggerConfig());
            JG_LOG_INFO(LOG_CATEGORY, L"Starting %ls", Utils::ToWide(ServiceConstants::SERVICE_NAME).c_str());

            auto& db = Database::DatabaseManager::Instance();
            if (!db.IsInitialized()) {
                Database::DatabaseError dbErr;
                if (!db.Initialize(config.ToDatabaseConfig(), &dbErr)) {
                    JG_LOG_ERROR(LOG_CATEGORY, L"Database initialization failed: %ls", dbErr.message.c_str());
                    return SetStorageError(err, dbErr, L"ServiceHost::Start");
                }
                m_ownsDatabase = true;
            }

            auto repository = std::make_unique<Policy::PolicyRepository>(db);
            auto auditLog = std::make_unique<Audit::AuditLog>(db, config.audit.maxPageSize);
            auto journal = std::make_unique<RequestJournal>(db);

            if (!repository->Initialize(err) || !auditLog->Initialize(err) || !journal->Initialize(endpoint, err)) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Service start aborted");
                if (m_ownsDatabase) {
                    db.Shutdown();
                    m_ownsDatabase = false;
                }
                return false;
            }

            auto decisionEngine = std::make_unique<Policy::DecisionEngine>(*repository, *auditLog);
            auto sessions = std::make_unique<Elevation::SessionManager>(m_clock);
            auto service = std::make_unique<ElevationService>(*repository, *decisionEngine, *sessions, *auditLog,
                m_resolver, m_executor);
            auto router = std::make_unique<RequestRouter>(*service, journal.get());

            if (config.elevation.sweeperEnabled && !sessions->StartSweeper()) {
                // Lazy expiry on every read still holds without the sweeper
                JG_LOG_WARN(LOG_CATEGORY, L"Continuing without the expiry sweeper");
            }

            m_repository = std::move(repository);
            m_auditLog = std::move(auditLog);
            m_journal = std::move(journal);
            m_decisionEngine = std::move(decisionEngine);
            m_sessions = std::move(sessions);
            m_service = std::move(service);
            m_router = std::move(router);
            m_running.store(true);

            JG_LOG_INFO(LOG_CATEGORY, L"Service running (run %lld)", static_cast<long long>(m_journal->RunId()));
            return true;
        }

        void ServiceHost::Stop() {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            if (!m_running.exchange(false)) {
                return;
            }

            if (m_sessions) {
                m_sessions->StopSweeper();
            }
            m_router.reset();
            m_service.reset();
            m_sessions.reset();
            m_decisionEngine.reset();
            m_journal.reset();
            m_auditLog.reset();
            m_repository.reset();

            if (m_ownsDatabase) {
                Database::DatabaseManager::Instance().Shutdown();
                m_ownsDatabase = false;
            }

            JG_LOG_INFO(LOG_CATEGORY, L"Service stopped");
        }

        void ServiceHost::OnSessionLogoff(const Policy::User& user) {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);
            if (m_service) {
                m_service->OnLogoff(user);
            }
        }

        std::string ServiceHost::GetStatusReport() const {
            std::lock_guard<std::mutex> lock(m_lifecycleMutex);

            nlohmann::json report{
                {"Service", ServiceConstants::SERVICE_NAME},
                {"Running", m_running.load()}
            };
            if (m_running.load()) {
                const auto snapshot = m_repository->GetSnapshot();
                const auto& stats = m_router->Stats();
                report["RunId"] = m_journal->RunId();
                report["PolicyVersion"] = snapshot ? snapshot->version : 0;
                report["SweeperRunning"] = m_sessions->IsSweeperRunning();
                report["Requests"] = {
                    {"Handled", stats.requestsHandled.load()},
                    {"ClientErrors", stats.clientErrors.load()},
                    {"ServerErrors", stats.serverErrors.load()},
                    {"LastId", m_journal->LastRequestId()}
                };
            }
            return report.dump();
        }

    } // namespace Service
} // namespace JitGuard
