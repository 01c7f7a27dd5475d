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
 * JitGuard Request Router
 * ============================================================================
 *
 * @file RequestRouter.hpp
 * @brief Maps method + path requests with JSON bodies onto ElevationService.
 *
 * The router is transport-agnostic: whatever accepts connections (named
 * pipe, local socket) authenticates the peer, fills Request::caller and
 * hands the request to Handle(). Handle() never throws.
 *
 * Status codes:
 *   200 success          400 InvalidParameter / malformed JSON
 *   403 AccessDenied     404 NotFound / unknown route
 *   405 wrong method     499 Cancelled        500 Internal
 *
 * Error bodies: {"Kind": "...", "Code": <platform code>, "Message": "..."}
 * ============================================================================
 */

#include "ElevationService.hpp"
#include "ServiceTypes.hpp"
#include "../Core/ServiceError.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace JitGuard {
    namespace Service {

        class RequestJournal;

        struct Request {
            std::string method;                             ///< GET, POST, PUT, DELETE
            std::string path;                               ///< May carry a ?query suffix
            Caller caller;
            std::string body;
            std::map<std::string, std::string> query;       ///< Merged with any ?query in path
        };

        struct Response {
            int status = 200;
            std::string body;
            int64_t requestId = 0;
        };

        struct RouterStats {
            std::atomic<uint64_t> requestsHandled{ 0 };
            std::atomic<uint64_t> clientErrors{ 0 };
            std::atomic<uint64_t> serverErrors{ 0 };
        };

        [[nodiscard]] int StatusForErrorKind(Core::ErrorKind kind) noexcept;

        class RequestRouter {
        public:
            /// @param journal Optional; when set every handled request is recorded there.
            explicit RequestRouter(ElevationService& service, RequestJournal* journal = nullptr);

            RequestRouter(const RequestRouter&) = delete;
            RequestRouter& operator=(const RequestRouter&) = delete;

            Response Handle(const Request& request) noexcept;

            [[nodiscard]] const RouterStats& Stats() const noexcept { return m_stats; }

        private:
            using Params = std::vector<std::string>;
            using Handler = std::function<Response(const Request&, const Params&)>;

            struct Route {
                std::string method;
                std::vector<std::string> segments;          ///< "{}" captures one segment
                Handler handler;
            };

            void addRoute(std::string method, std::string_view pattern, Handler handler);
            void registerRoutes();

            Response dispatch(const Request& request);

            ElevationService& m_service;
            RequestJournal* m_journal;
            std::vector<Route> m_routes;
            RouterStats m_stats;
        };

    } // namespace Service
} // namespace JitGuard
