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
 * JitGuard Elevation Session Manager
 * ============================================================================
 *
 * @file SessionManager.hpp
 * @brief Per-user elevation state machine with expiry.
 *
 * States and transitions:
 *   None -> Temporary{grantedAt, expiresAt} -> None   (expiry, revoke, logoff)
 *   None -> Session{grantedAt}              -> None   (revoke, logoff)
 *
 * A temporary grant is inactive from expiresAt on. Every read performs the
 * expiry check itself, so no caller ever observes an expired grant; the
 * optional sweeper thread only reclaims state early and logs the expiry.
 *
 * State is sharded by User::Key(): two users never contend on the same
 * lock unless their keys hash to the same shard.
 * ============================================================================
 */

#include "../Core/ServiceError.hpp"
#include "../Policy/PolicyTypes.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace JitGuard {
    namespace Elevation {

        using Clock = std::chrono::steady_clock;

        /**
         * @brief Time source for expiry decisions; tests substitute a manual clock.
         */
        class IClock {
        public:
            virtual ~IClock() = default;
            [[nodiscard]] virtual Clock::time_point Now() const noexcept = 0;
        };

        class SystemClock final : public IClock {
        public:
            [[nodiscard]] Clock::time_point Now() const noexcept override { return Clock::now(); }
        };

        enum class SessionState : uint8_t {
            None = 0,
            Temporary,
            Session
        };

        [[nodiscard]] std::string_view GetSessionStateName(SessionState state) noexcept;

        struct ElevationSession {
            Policy::User user;
            SessionState state = SessionState::None;
            Clock::time_point grantedAt{};
            Clock::time_point expiresAt{};      ///< Temporary only
            Policy::ElevationMethod method = Policy::ElevationMethod::LocalAdmin;
        };

        struct ElevationStatus {
            bool elevated = false;
            bool sessionEnabled = false;
            bool temporaryEnabled = false;
            uint64_t temporaryMaxSeconds = 0;
            uint64_t temporaryTimeLeft = 0;     ///< Whole seconds, rounded up; 0 when inactive
        };

        class SessionManager {
        public:
            static constexpr size_t SHARD_COUNT = 32;

            explicit SessionManager(std::shared_ptr<const IClock> clock = std::make_shared<SystemClock>());
            ~SessionManager();

            SessionManager(const SessionManager&) = delete;
            SessionManager& operator=(const SessionManager&) = delete;

            /**
             * @brief Grants temporary elevation.
             *
             * Over-long requests are clamped to config.maxSeconds, or rejected
             * with InvalidParameter when config.strictMaximum is set.
             */
            bool GrantTemporary(const Policy::User& user, int64_t seconds,
                                const Policy::TemporaryElevationConfig& config,
                                Policy::ElevationMethod method,
                                Core::ServiceError* err = nullptr);

            bool GrantSession(const Policy::User& user,
                              const Policy::SessionElevationConfig& config,
                              Policy::ElevationMethod method,
                              Core::ServiceError* err = nullptr);

            /// @brief Returns to None; a no-op from None.
            void Revoke(const Policy::User& user);

            /// @brief Logoff ends Session and Temporary grants alike.
            void OnLogoff(const Policy::User& user);

            [[nodiscard]] ElevationStatus GetStatus(const Policy::User& user,
                                                    const Policy::TemporaryElevationConfig& temporary,
                                                    const Policy::SessionElevationConfig& session);

            /// @brief Current state after the expiry check; nullopt when None.
            [[nodiscard]] std::optional<ElevationSession> GetSession(const Policy::User& user);

            [[nodiscard]] bool IsElevated(const Policy::User& user);

            /// @brief Drops every expired temporary grant. Returns how many were dropped.
            size_t SweepExpired();

            // === Background sweeper ===

            bool StartSweeper();
            void StopSweeper();
            [[nodiscard]] bool IsSweeperRunning() const noexcept { return m_sweeperRunning.load(); }

        private:
            struct Shard {
                std::mutex mutex;
                std::unordered_map<std::string, ElevationSession> sessions;
            };

            Shard& shardFor(const std::string& key) noexcept;

            /// Removes the entry if it is an expired temporary grant. Caller holds the shard lock.
            bool expireIfDue(Shard& shard, const std::string& key, Clock::time_point now);

            std::optional<Clock::time_point> soonestExpiry();
            void sweeperLoop();
            void wakeSweeper();

            std::shared_ptr<const IClock> m_clock;
            std::array<Shard, SHARD_COUNT> m_shards;

            std::thread m_sweeper;
            std::mutex m_sweeperMutex;
            std::condition_variable m_sweeperCv;
            std::atomic<bool> m_sweeperRunning{ false };
            bool m_stopSweeper = false;
            uint64_t m_sweeperGeneration = 0;
        };

    } // namespace Elevation
} // namespace JitGuard
