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
 * @file ServiceTypes.hpp
 * @brief Request and response contracts of the elevation service.
 *
 * Wire names are PascalCase, like the policy entities.
 */

#include "../Policy/PolicyTypes.hpp"
#include "../Elevation/SessionManager.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace JitGuard {
    namespace Service {

        /**
         * @brief Authenticated identity of the client on the other end of the transport.
         */
        struct Caller {
            Policy::User user;
            uint32_t processId = 0;         ///< Client process; default parent of launched processes
            bool isAdmin = false;           ///< May administer policy and read the audit log
            bool isLocalSystem = false;     ///< May launch under processes it does not own
        };

        /// Mirrors the fields of a Win32 STARTUPINFOW the client may choose
        struct StartupInfo {
            std::optional<std::string> desktop;
            std::optional<std::string> title;
            uint32_t x = 0;
            uint32_t y = 0;
            uint32_t xSize = 0;
            uint32_t ySize = 0;
            uint32_t xCountChars = 0;
            uint32_t yCountChars = 0;
            uint32_t fillAttribute = 0;
            uint32_t flags = 0;
            uint16_t showWindow = 0;
            std::optional<uint32_t> parentProcessId;
        };

        struct LaunchRequest {
            std::optional<std::string> executablePath;
            std::optional<std::string> commandLine;     ///< Single string, Windows quoting rules
            std::optional<std::string> workingDirectory;
            uint32_t creationFlags = 0;
            std::optional<StartupInfo> startupInfo;
            std::string reason;                         ///< Justification for ReasonApproval rules
        };

        struct LaunchResult {
            uint32_t processId = 0;
            uint32_t threadId = 0;
        };

        /// Active profile id (0 when none) and every profile assigned to the caller
        struct ProfileSelection {
            int64_t active = 0;
            std::vector<int64_t> available;
        };

        void to_json(nlohmann::json& j, const StartupInfo& v);
        void from_json(const nlohmann::json& j, StartupInfo& v);
        void from_json(const nlohmann::json& j, LaunchRequest& v);
        void to_json(nlohmann::json& j, const LaunchResult& v);
        void to_json(nlohmann::json& j, const ProfileSelection& v);

        /// {"Elevated", "Session":{"Enabled"}, "Temporary":{"Enabled","MaxSeconds","TimeLeft"}}
        [[nodiscard]] nlohmann::json StatusToJson(const Elevation::ElevationStatus& status);

    } // namespace Service
} // namespace JitGuard
