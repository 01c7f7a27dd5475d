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
#include "SessionManager.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <functional>
#include <system_error>

namespace JitGuard {
    namespace Elevation {

        using Core::ErrorKind;
        using Core::ServiceError;
        using Core::SetError;

        namespace {
            constexpr const wchar_t* LOG_CATEGORY = L"SessionManager";

            /// Upper bound on one sweeper sleep so a stopped clock cannot park it forever
            constexpr auto MAX_SWEEP_INTERVAL = std::chrono::seconds(60);

            uint64_t SecondsLeftRoundedUp(Clock::time_point now, Clock::time_point expiresAt) noexcept {
                if (expiresAt <= now) {
                    return 0;
                }
                const auto left = std::chrono::duration_cast<std::chrono::nanoseconds>(expiresAt - now).count();
                constexpr int64_t NS_PER_SECOND = 1'000'000'000;
                return static_cast<uint64_t>(left / NS_PER_SECOND + (left % NS_PER_SECOND != 0 ? 1 : 0));
            }
        }

        std::string_view GetSessionStateName(SessionState state) noexcept {
            switch (state) {
            case SessionState::None:      return "None";
            case SessionState::Temporary: return "Temporary";
            case SessionState::Session:   return "Session";
            default:                      return "Unknown";
            }
        }

        SessionManager::SessionManager(std::shared_ptr<const IClock> clock)
            : m_clock(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
        }

        SessionManager::~SessionManager() {
            StopSweeper();
        }

        SessionManager::Shard& SessionManager::shardFor(const std::string& key) noexcept {
            return m_shards[std::hash<std::string>{}(key) % SHARD_COUNT];
        }

        bool SessionManager::expireIfDue(Shard& shard, const std::string& key, Clock::time_point now) {
            auto it = shard.sessions.find(key);
            if (it == shard.sessions.end()) {
                return false;
            }
            if (it->second.state == SessionState::Temporary && now >= it->second.expiresAt) {
                JG_LOG_INFO(LOG_CATEGORY, L"Temporary elevation expired for %ls",
                    Utils::ToWide(it->second.user.accountName).c_str());
                shard.sessions.erase(it);
                return true;
            }
            return false;
        }

        // ============================================================================
        // TRANSITIONS
        // ============================================================================

        bool SessionManager::GrantTemporary(const Policy::User& user, int64_t seconds,
            const Policy::TemporaryElevationConfig& config,
            Policy::ElevationMethod method,
            ServiceError* err) {
            if (!config.enabled) {
                return SetError(err, ErrorKind::AccessDenied, L"Temporary elevation is disabled", L"GrantTemporary");
            }
            if (seconds <= 0) {
                return SetError(err, ErrorKind::InvalidParameter, L"Seconds must be positive", L"GrantTemporary");
            }
            if (config.maxSeconds == 0) {
                return SetError(err, ErrorKind::InvalidParameter, L"Profile has no temporary maximum", L"GrantTemporary");
            }

            uint64_t granted = static_cast<uint64_t>(seconds);
            if (granted > config.maxSeconds) {
                if (config.strictMaximum) {
                    return SetError(err, ErrorKind::InvalidParameter,
                        L"Requested " + std::to_wstring(seconds) + L"s exceeds the maximum of " +
                        std::to_wstring(config.maxSeconds) + L"s", L"GrantTemporary");
                }
                JG_LOG_DEBUG(LOG_CATEGORY, L"Clamping temporary request %lld -> %llu",
                    static_cast<long long>(seconds), static_cast<unsigned long long>(config.maxSeconds));
                granted = config.maxSeconds;
            }

            const auto now = m_clock->Now();
            ElevationSession session;
            session.user = user;
            session.state = SessionState::Temporary;
            session.grantedAt = now;
            // Saturate at the clock's range instead of wrapping
            const auto headroom = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now);
            const auto lifetime = granted < static_cast<uint64_t>(headroom.count())
                ? std::chrono::seconds(static_cast<int64_t>(granted))
                : headroom;
            session.expiresAt = now + std::chrono::duration_cast<Clock::duration>(lifetime);
            session.method = method;

            const std::string key = user.Key();
            {
                Shard& shard = shardFor(key);
                std::lock_guard<std::mutex> lock(shard.mutex);
                shard.sessions[key] = std::move(session);
            }
            wakeSweeper();

            JG_LOG_INFO(LOG_CATEGORY, L"Temporary elevation granted to %ls for %llus",
                Utils::ToWide(user.accountName).c_str(), static_cast<unsigned long long>(granted));
            return true;
        }

        bool SessionManager::GrantSession(const Policy::User& user,
            const Policy::SessionElevationConfig& config,
            Policy::ElevationMethod method,
            ServiceError* err) {
            if (!config.enabled) {
                return SetError(err, ErrorKind::AccessDenied, L"Session elevation is disabled", L"GrantSession");
            }

            ElevationSession session;
            session.user = user;
            session.state = SessionState::Session;
            session.grantedAt = m_clock->Now();
            session.method = method;

            const std::string key = user.Key();
            {
                Shard& shard = shardFor(key);
                std::lock_guard<std::mutex> lock(shard.mutex);
                shard.sessions[key] = std::move(session);
            }

            JG_LOG_INFO(LOG_CATEGORY, L"Session elevation granted to %ls", Utils::ToWide(user.accountName).c_str());
            return true;
        }

        void SessionManager::Revoke(const Policy::User& user) {
            const std::string key = user.Key();
            Shard& shard = shardFor(key);
            std::lock_guard<std::mutex> lock(shard.mutex);
            if (shard.sessions.erase(key) > 0) {
                JG_LOG_INFO(LOG_CATEGORY, L"Elevation revoked for %ls", Utils::ToWide(user.accountName).c_str());
            }
        }

        void SessionManager::OnLogoff(const Policy::User& user) {
            const std::string key = user.Key();
            Shard& shard = shardFor(key);
            std::lock_guard<std::mutex> lock(shard.mutex);
            if (shard.sessions.erase(key) > 0) {
                JG_LOG_INFO(LOG_CATEGORY, L"Elevation ended by logoff for %ls", Utils::ToWide(user.accountName).c_str());
            }
        }

        // ============================================================================
        // READS
        // ============================================================================

        std::optional<ElevationSession> SessionManager::GetSession(const Policy::User& user) {
            const std::string key = user.Key();
            Shard& shard = shardFor(key);
            std::lock_guard<std::mutex> lock(shard.mutex);

            expireIfDue(shard, key, m_clock->Now());
            auto it = shard.sessions.find(key);
            if (it == shard.sessions.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        bool SessionManager::IsElevated(const Policy::User& user) {
            return GetSession(user).has_value();
        }

        ElevationStatus SessionManager::GetStatus(const Policy::User& user,
            const Policy::TemporaryElevationConfig& temporary,
            const Policy::SessionElevationConfig& session) {
            ElevationStatus status;
            status.sessionEnabled = session.enabled;
            status.temporaryEnabled = temporary.enabled;
            status.temporaryMaxSeconds = temporary.maxSeconds;

            const std::string key = user.Key();
            Shard& shard = shardFor(key);
            std::lock_guard<std::mutex> lock(shard.mutex);

            const auto now = m_clock->Now();
            expireIfDue(shard, key, now);

            auto it = shard.sessions.find(key);
            if (it == shard.sessions.end()) {
                return status;
            }

            status.elevated = true;
            if (it->second.state == SessionState::Temporary) {
                status.temporaryTimeLeft = SecondsLeftRoundedUp(now, it->second.expiresAt);
            }
            return status;
        }

        size_t SessionManager::SweepExpired() {
            const auto now = m_clock->Now();
            size_t dropped = 0;
            for (auto& shard : m_shards) {
                std::lock_guard<std::mutex> lock(shard.mutex);
                for (auto it = shard.sessions.begin(); it != shard.sessions.end();) {
                    if (it->second.state == SessionState::Temporary && now >= it->second.expiresAt) {
                        JG_LOG_INFO(LOG_CATEGORY, L"Temporary elevation expired for %ls",
                            Utils::ToWide(it->second.user.accountName).c_str());
                        it = shard.sessions.erase(it);
                        ++dropped;
                    }
                    else {
                        ++it;
                    }
                }
            }
            return dropped;
        }

        // ============================================================================
        // SWEEPER
        // ============================================================================

        std::optional<Clock::time_point> SessionManager::soonestExpiry() {
            std::optional<Clock::time_point> soonest;
            for (auto& shard : m_shards) {
                std::lock_guard<std::mutex> lock(shard.mutex);
                for (const auto& [key, session] : shard.sessions) {
                    if (session.state == SessionState::Temporary &&
                        (!soonest || session.expiresAt < *soonest)) {
                        soonest = session.expiresAt;
                    }
                }
            }
            return soonest;
        }

        bool SessionManager::StartSweeper() {
            std::lock_guard<std::mutex> lock(m_sweeperMutex);
            if (m_sweeperRunning.load()) {
                return true;
            }

            m_stopSweeper = false;
            try {
                m_sweeper = std::thread(&SessionManager::sweeperLoop, this);
            }
            catch (const std::system_error& e) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Failed to start expiry sweeper: %ls", Utils::ToWide(e.what()).c_str());
                return false;
            }

            m_sweeperRunning.store(true);
            JG_LOG_INFO(LOG_CATEGORY, L"Expiry sweeper started");
            return true;
        }

        void SessionManager::StopSweeper() {
            {
                std::lock_guard<std::mutex> lock(m_sweeperMutex);
                if (!m_sweeperRunning.load()) {
                    return;
                }
                m_stopSweeper = true;
            }
            m_sweeperCv.notify_all();

            if (m_sweeper.joinable()) {
                m_sweeper.join();
            }
            m_sweeperRunning.store(false);
            JG_LOG_INFO(LOG_CATEGORY, L"Expiry sweeper stopped");
        }

        void SessionManager::wakeSweeper() {
            {
                std::lock_guard<std::mutex> lock(m_sweeperMutex);
                ++m_sweeperGeneration;
            }
            m_sweeperCv.notify_all();
        }

        void SessionManager::sweeperLoop() {
            std::unique_lock<std::mutex> lock(m_sweeperMutex);
            while (!m_stopSweeper) {
                const uint64_t generation = m_sweeperGeneration;

                lock.unlock();
                SweepExpired();
                const auto soonest = soonestExpiry();
                const auto now = m_clock->Now();
                lock.lock();

                auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(MAX_SWEEP_INTERVAL);
                if (soonest) {
                    const auto untilExpiry = std::chrono::duration_cast<std::chrono::milliseconds>(*soonest - now);
                    // +1ms so the wake lands at or after expiresAt
                    wait = std::max(std::chrono::milliseconds(1),
                        std::min(wait, untilExpiry + std::chrono::milliseconds(1)));
                }

                m_sweeperCv.wait_for(lock, wait, [&] {
                    return m_stopSweeper || m_sweeperGeneration != generation;
                });
            }
        }

    } // namespace Elevation
} // namespace JitGuard
