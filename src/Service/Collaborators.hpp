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
 * JitGuard Platform Collaborators
 * ============================================================================
 *
 * @file Collaborators.hpp
 * @brief Interfaces to the platform code the service core relies on.
 *
 * The core never inspects binaries or creates processes itself:
 *  - IApplicationIdentityResolver turns a process reference into an
 *    ApplicationIdentity (canonical path, hashes, signature verdict)
 *  - ILaunchExecutor creates the elevated process once a decision granted it
 *
 * Implementations report failures through ServiceError, with the OS error
 * code in platformCode.
 * ============================================================================
 */

#include "ServiceTypes.hpp"
#include "../Core/ServiceError.hpp"
#include "../Policy/PolicyTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace JitGuard {
    namespace Service {

        /**
         * @brief A running process (processId != 0) or an executable about to be started.
         */
        struct ProcessReference {
            uint32_t processId = 0;
            std::string executablePath;
            std::vector<std::string> commandLine;
            std::string workingDirectory;
            Policy::User user;
        };

        class IApplicationIdentityResolver {
        public:
            virtual ~IApplicationIdentityResolver() = default;

            virtual bool Resolve(const ProcessReference& process,
                                 Policy::ApplicationIdentity& out,
                                 Core::ServiceError* err = nullptr) = 0;
        };

        /**
         * @brief Everything the executor needs to start an authorized process.
         *
         * kind tells the executor whether a consent prompt (Confirm) or a
         * justification (ReasonApproval) still has to be collected from the user.
         */
        struct LaunchPlan {
            Policy::User user;
            Policy::ApplicationIdentity target;
            std::string commandLine;        ///< Rebuilt from target.commandLine, the tokens policy matched
            Policy::ElevationKind kind = Policy::ElevationKind::Deny;
            Policy::ElevationMethod method = Policy::ElevationMethod::LocalAdmin;
            bool promptSecureDesktop = true;
            uint32_t creationFlags = 0;
            StartupInfo startupInfo;
            uint32_t parentProcessId = 0;
            int64_t auditId = -1;           ///< Decision entry this launch belongs to
        };

        class ILaunchExecutor {
        public:
            virtual ~ILaunchExecutor() = default;

            virtual bool Launch(const LaunchPlan& plan,
                                LaunchResult& result,
                                Core::ServiceError* err = nullptr) = 0;
        };

    } // namespace Service
} // namespace JitGuard
