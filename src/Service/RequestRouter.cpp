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
#include "RequestRouter.hpp"
#include "RequestJournal.hpp"

#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

#include <charconv>
#include <optional>
#include <stdexcept>

namespace JitGuard {
    namespace Service {

        using Core::ErrorKind;
        using Core::ServiceError;
        using Core::SetError;
        using nlohmann::json;

        namespace {
            constexpr const wchar_t* LOG_CATEGORY = L"RequestRouter";

            constexpr const char* CAPTURE = "{}";

            // ============================================================================
            // PATH / QUERY HELPERS
            // ============================================================================

            std::vector<std::string> SplitPath(std::string_view path) {
                std::vector<std::string> segments;
                size_t start = 0;
                while (start <= path.size()) {
                    size_t end = path.find('/', start);
                    if (end == std::string_view::npos) end = path.size();
                    if (end > start) {
                        segments.emplace_back(path.substr(start, end - start));
                    }
                    start = end + 1;
                }
                return segments;
            }

            int HexValue(char c) noexcept {
                if (c >= '0' && c <= '9') return c - '0';
                if (c >= 'a' && c <= 'f') return c - 'a' + 10;
                if (c >= 'A' && c <= 'F') return c - 'A' + 10;
                return -1;
            }

            std::string PercentDecode(std::string_view text) {
                std::string out;
                out.reserve(text.size());
                for (size_t i = 0; i < text.size(); ++i) {
                    const char c = text[i];
                    if (c == '+') {
                        out.push_back(' ');
                    }
                    else if (c == '%' && i + 2 < text.size() &&
                             HexValue(text[i + 1]) >= 0 && HexValue(text[i + 2]) >= 0) {
                        out.push_back(static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2])));
                        i += 2;
                    }
                    else {
                        out.push_back(c);
                    }
                }
                return out;
            }

            void ParseQueryString(std::string_view query, std::map<std::string, std::string>& out) {
                size_t start = 0;
                while (start < query.size()) {
                    size_t end = query.find('&', start);
                    if (end == std::string_view::npos) end = query.size();
                    const std::string_view pair = query.substr(start, end - start);
                    if (!pair.empty()) {
                        const size_t eq = pair.find('=');
                        if (eq == std::string_view::npos) {
                            out[PercentDecode(pair)] = std::string();
                        }
                        else {
                            out[PercentDecode(pair.substr(0, eq))] = PercentDecode(pair.substr(eq + 1));
                        }
                    }
                    start = end + 1;
                }
            }

            template <typename T>
            std::optional<T> ParseInteger(std::string_view text) noexcept {
                T value{};
                const char* first = text.data();
                const char* last = text.data() + text.size();
                auto [ptr, ec] = std::from_chars(first, last, value);
                if (ec != std::errc() || ptr != last || text.empty()) {
                    return std::nullopt;
                }
                return value;
            }

            std::optional<bool> ParseBool(std::string_view text) noexcept {
                if (text == "true" || text == "1") return true;
                if (text == "false" || text == "0") return false;
                return std::nullopt;
            }

            // ============================================================================
            // RESPONSE HELPERS
            // ============================================================================

            Response JsonResponse(const json& body, int status = 200) {
                Response response;
                response.status = status;
                response.body = body.dump();
                return response;
            }

            Response Ok() {
                return JsonResponse(json::object());
            }

            Response ErrorResponse(const ServiceError& error) {
                const ErrorKind kind = error.HasError() ? error.kind : ErrorKind::Internal;
                return JsonResponse(json{
                    {"Kind", std::string(Core::GetErrorKindName(kind))},
                    {"Code", error.platformCode},
                    {"Message", Utils::ToNarrow(error.message)}
                }, StatusForErrorKind(kind));
            }

            Response ErrorResponse(ErrorKind kind, std::wstring_view message) {
                ServiceError error;
                SetError(&error, kind, message, L"RequestRouter");
                return ErrorResponse(error);
            }

            bool ParseBody(const Request& request, json& out, ServiceError* err) {
                if (request.body.empty()) {
                    out = json::object();
                    return true;
                }
                Utils::JSON::Error jsonErr;
                if (!Utils::JSON::Parse(request.body, out, &jsonErr)) {
                    return SetError(err, ErrorKind::InvalidParameter,
                        L"Malformed JSON body: " + Utils::ToWide(jsonErr.message), L"RequestRouter");
                }
                return true;
            }

            std::optional<int64_t> ParseId(const std::string& segment, ServiceError* err) {
                auto id = ParseInteger<int64_t>(segment);
                if (!id || *id <= 0) {
                    SetError(err, ErrorKind::InvalidParameter, L"Invalid id: " + Utils::ToWide(segment), L"RequestRouter");
                    return std::nullopt;
                }
                return id;
            }

            bool BuildAuditQuery(const std::map<std::string, std::string>& params, Audit::AuditQuery& query,
                ServiceError* err) {
                auto bad = [err](const std::string& name) {
                    return SetError(err, ErrorKind::InvalidParameter,
                        L"Invalid query parameter: " + Utils::ToWide(name), L"RequestRouter");
                };

                for (const auto& [name, value] : params) {
                    if (name == "page") {
                        auto v = ParseInteger<uint32_t>(value);
                        if (!v) return bad(name);
                        query.pageNumber = *v;
                    }
                    else if (name == "page_size") {
                        auto v = ParseInteger<uint32_t>(value);
                        if (!v) return bad(name);
                        query.pageSize = *v;
                    }
                    else if (name == "sort_column") {
                        query.sortColumn = value;
                    }
                    else if (name == "sort_descending") {
                        auto v = ParseBool(value);
                        if (!v) return bad(name);
                        query.sortDescending = *v;
                    }
                    else if (name == "user") {
                        if (!value.empty()) query.accountSid = value;
                    }
                    else if (name == "start_time" || name == "end_time") {
                        auto v = ParseInteger<int64_t>(value);
                        if (!v || *v < Audit::MIN_UNIX_MICROS || *v > Audit::MAX_UNIX_MICROS) return bad(name);
                        (name == "start_time" ? query.startTime : query.endTime) = Audit::FromUnixMicros(*v);
                    }
                    else if (name == "snapshot") {
                        auto v = ParseInteger<int64_t>(value);
                        if (!v || *v < 0) return bad(name);
                        query.snapshotId = *v;
                    }
                    else if (name == "outcome") {
                        auto v = Audit::ParseAuditOutcome(value);
                        if (!v) return bad(name);
                        query.outcome = *v;
                    }
                }
                return true;
            }

            std::vector<Policy::User> ReadUserList(const json& body) {
                if (body.is_object() && body.contains("Users")) {
                    return body.at("Users").get<std::vector<Policy::User>>();
                }
                return body.get<std::vector<Policy::User>>();
            }
        }

        int StatusForErrorKind(ErrorKind kind) noexcept {
            switch (kind) {
            case ErrorKind::None:             return 200;
            case ErrorKind::AccessDenied:     return 403;
            case ErrorKind::NotFound:         return 404;
            case ErrorKind::InvalidParameter: return 400;
            case ErrorKind::Cancelled:        return 499;
            case ErrorKind::Internal:
            default:                          return 500;
            }
        }

        // ============================================================================
        // ROUTER
        // ============================================================================

        RequestRouter::RequestRouter(ElevationService& service, RequestJournal* journal)
            : m_service(service)
            , m_journal(journal) {
            registerRoutes();
        }

        void RequestRouter::addRoute(std::string method, std::string_view pattern, Handler handler) {
            Route route;
            route.method = std::move(method);
            for (auto& segment : SplitPath(pattern)) {
                route.segments.push_back(segment.front() == '{' ? std::string(CAPTURE) : std::move(segment));
            }
            route.handler = std::move(handler);
            m_routes.push_back(std::move(route));
        }

        Response RequestRouter::Handle(const Request& request) noexcept {
            const int64_t requestId = m_journal ? m_journal->NextRequestId() : 0;
            std::string path;

            Response response;
            try {
                const size_t queryStart = request.path.find('?');
                path = request.path.substr(0, queryStart);

                if (queryStart != std::string::npos) {
                    Request withQuery = request;
                    ParseQueryString(std::string_view(request.path).substr(queryStart + 1), withQuery.query);
                    withQuery.path = path;
                    response = dispatch(withQuery);
                }
                else {
                    response = dispatch(request);
                }
            }
            catch (const json::exception& e) {
                response = ErrorResponse(ErrorKind::InvalidParameter, L"Invalid request body: " + Utils::ToWide(e.what()));
            }
            catch (const std::invalid_argument& e) {
                response = ErrorResponse(ErrorKind::InvalidParameter, Utils::ToWide(e.what()));
            }
            catch (const std::bad_alloc&) {
                response.status = 500;
                response.body = R"({"Kind":"Internal","Code":0,"Message":"Out of memory"})";
            }
            catch (const std::exception& e) {
                JG_LOG_ERROR(LOG_CATEGORY, L"Unhandled error in %ls: %ls",
                    Utils::ToWide(request.path).c_str(), Utils::ToWide(e.what()).c_str());
                response = ErrorResponse(ErrorKind::Internal, Utils::ToWide(e.what()));
            }

            response.requestId = requestId;
            m_stats.requestsHandled.fetch_add(1, std::memory_order_relaxed);
            if (response.status >= 500) {
                m_stats.serverErrors.fetch_add(1, std::memory_order_relaxed);
            }
            else if (response.status >= 400) {
                m_stats.clientErrors.fetch_add(1, std::memory_order_relaxed);
            }

            JG_LOG_DEBUG(LOG_CATEGORY, L"Request %lld %ls %ls -> %d", static_cast<long long>(requestId),
                Utils::ToWide(request.method).c_str(), Utils::ToWide(path).c_str(), response.status);

            if (m_journal) {
                m_journal->Record(requestId, request.method, path, response.status);
            }
            return response;
        }

        Response RequestRouter::dispatch(const Request& request) {
            const auto segments = SplitPath(request.path);
            bool pathMatched = false;

            for (const auto& route : m_routes) {
                if (route.segments.size() != segments.size()) {
                    continue;
                }
                Params params;
                bool match = true;
                for (size_t i = 0; i < segments.size(); ++i) {
                    if (route.segments[i] == CAPTURE) {
                        params.push_back(segments[i]);
                    }
                    else if (route.segments[i] != segments[i]) {
                        match = false;
                        break;
                    }
                }
                if (!match) {
                    continue;
                }
                pathMatched = true;
                if (route.method == request.method) {
                    return route.handler(request, params);
                }
            }

            if (pathMatched) {
                return JsonResponse(json{ {"Kind", "InvalidParameter"}, {"Code", 0},
                                          {"Message", "Method " + request.method + " not allowed"} }, 405);
            }
            return JsonResponse(json{ {"Kind", "NotFound"}, {"Code", 0},
                                      {"Message", "No route for " + request.path} }, 404);
        }

        // ============================================================================
        // ROUTE TABLE
        // ============================================================================

        void RequestRouter::registerRoutes() {
            addRoute("GET", "/health", [](const Request&, const Params&) {
                return JsonResponse(json("OK"));
            });

            // === Elevation ===

            addRoute("POST", "/elevate/temporary", [this](const Request& request, const Params&) {
                ServiceError err;
                json body;
                if (!ParseBody(request, body, &err)) return ErrorResponse(err);
                const int64_t seconds = body.at("Seconds").get<int64_t>();
                if (!m_service.ElevateTemporary(request.caller, seconds, &err)) return ErrorResponse(err);
                return Ok();
            });

            addRoute("POST", "/elevate/session", [this](const Request& request, const Params&) {
                ServiceError err;
                if (!m_service.ElevateSession(request.caller, &err)) return ErrorResponse(err);
                return Ok();
            });

            addRoute("POST", "/revoke", [this](const Request& request, const Params&) {
                ServiceError err;
                if (!m_service.Revoke(request.caller, &err)) return ErrorResponse(err);
                return Ok();
            });

            addRoute("GET", "/status", [this](const Request& request, const Params&) {
                ServiceError err;
                auto status = m_service.GetStatus(request.caller, &err);
                if (!status) return ErrorResponse(err);
                return JsonResponse(StatusToJson(*status));
            });

            addRoute("POST", "/launch", [this](const Request& request, const Params&) {
                ServiceError err;
                json body;
                if (!ParseBody(request, body, &err)) return ErrorResponse(err);
                const auto launch = body.get<LaunchRequest>();
                auto result = m_service.Launch(request.caller, launch, &err);
                if (!result) return ErrorResponse(err);
                return JsonResponse(*result);
            });

            // === Self-service selection ===

            addRoute("GET", "/policy/me", [this](const Request& request, const Params&) {
                ServiceError err;
                auto selection = m_service.GetMe(request.caller, &err);
                if (!selection) return ErrorResponse(err);
                return JsonResponse(*selection);
            });

            addRoute("PUT", "/policy/me/{id}", [this](const Request& request, const Params& params) {
                ServiceError err;
                auto id = ParseId(params[0], &err);
                if (!id) return ErrorResponse(err);
                if (!m_service.SetMe(request.caller, *id, &err)) return ErrorResponse(err);
                return Ok();
            });

            // === Profiles ===

            addRoute("GET", "/policy/profiles", [this](const Request& request, const Params&) {
                ServiceError err;
                auto profiles = m_service.ListProfiles(request.caller, &err);
                if (!profiles) return ErrorResponse(err);
                return JsonResponse(*profiles);
            });

            addRoute("POST", "/policy/profiles", [this](const Request& request, const Params&) {
                ServiceError err;
                json body;
                if (!ParseBody(request, body, &err)) return ErrorResponse(err);
                auto id = m_service.CreateProfile(request.caller, body.get<Policy::Profile>(), &err);
                if (!id) return ErrorResponse(err);
                return JsonResponse(json{ {"Id", *id} });
            });

            addRoute("GET", "/policy/profiles/{id}", [this](const Request& request, const Params& params) {
                ServiceError err;
                auto id = ParseId(params[0], &err);
                if (!id) return ErrorResponse(err);
                auto profile = m_service.GetProfile(request.caller, *id, &err);
                if (!profile) return ErrorResponse(err);
                return JsonResponse(*profile);
            });

            addRoute("PUT", "/policy/profiles/{id}", [this](const Request& request, const Params& params) {
                ServiceError err;
                auto id = ParseId(params[0], &err);
                if (!id) return ErrorResponse(err);
                json body;
                if (!ParseBody(request, body, &err)) return ErrorResponse(err);
                if (!m_service.PutProfile(request.caller, *id, body.get<Policy::Profile>(), &err)) return ErrorResponse(err);
                return Ok();
            });

            addRoute("DELETE", "/policy/profiles/{id}", [this](const Request& request, const Params& params) {
                ServiceError err;
                auto id = ParseId(params[0], &err);
                if (!id) return ErrorResponse(err);
                if (!m_service.DeleteProfile(request.caller, *id, &err)) return ErrorResponse(err);
                return Ok();
            });

            // === Rules ===

            addRoute("GET", "/policy/rules", [this](const Request& request, const Params&) {
                ServiceError err;
                auto rules = m_service.ListRules(request.caller, &err);
                if (!rules) return ErrorResponse(err);
                return JsonResponse(*rules);
            });

            addRoute("POST", "/policy/rules", [this](const Request& request, const Params&) {
                ServiceError err;
                json body;
                if (!ParseBody(request, body, &err)) return ErrorResponse(err);
                auto id = m_service.CreateRule(request.caller, body.get<Policy::Rule>(), &err);
                if (!id) return ErrorResponse(err);
                return JsonResponse(json{ {"Id", *id} });
            });

            addRoute("GET", "/policy/rules/{id}", [this](const Request& request, const Params& params) {
                ServiceError err;
                auto id = ParseId(params[0], &err);
                if (!id) return ErrorResponse(err);
                auto rule = m_service.GetRule(request.caller, *id, &err);
                if (!rule) return ErrorResponse(err);
                return JsonResponse(*rule);
            });

            addRoute("PUT", "/policy/rules/{id}", [this](const Request& request, const Params& params) {
                ServiceError err;
                auto id = ParseId(params[0], &err);
                if (!id) return ErrorResponse(err);
                json body;
                if (!ParseBody(request, body, &err)) return ErrorResponse(err);
                if (!m_service.PutRule(request.caller, *id, body.get<Policy::Rule>(), &err)) return ErrorResponse(err);
                return Ok();
            });

            addRoute("DELETE", "/policy/rules/{id}", [this](const Request& request, const Params& params) {
                ServiceError err;
                auto id = ParseId(params[0], &err);
                if (!id) return ErrorResponse(err);
                if (!m_service.DeleteRule(request.caller, *id, &err)) return ErrorResponse(err);
                return Ok();
            });

            // === Assignments and users ===

            addRoute("GET", "/policy/assignments", [this](const Request& request, const Params&) {
                ServiceError err;
                auto assignments = m_service.ListAssignments(request.caller, &err);
                if (!assignments) return ErrorResponse(err);
                return JsonResponse(*assignments);
            });

            addRoute("GET", "/policy/assignments/{id}", [this](const Request& request, const Params& params) {
                ServiceError err;
                auto id = ParseId(params[0], &err);
                if (!id) return ErrorResponse(err);
                auto assignment = m_service.GetAssignment(request.caller, *id, &err);
                if (!assignment) return ErrorResponse(err);
                return JsonResponse(*assignment);
            });

            addRoute("PUT", "/policy/assignments/{id}", [this](const Request& request, const Params& params) {
                ServiceError err;
                auto id = ParseId(params[0], &err);
                if (!id) return ErrorResponse(err);
                json body;
                if (!ParseBody(request, body, &err)) return ErrorResponse(err);
                if (!m_service.SetAssignment(request.caller, *id, ReadUserList(body), &err)) return ErrorResponse(err);
                return Ok();
            });

            addRoute("GET", "/policy/users", [this](const Request& request, const Params&) {
                ServiceError err;
                auto users = m_service.ListUsers(request.caller, &err);
                if (!users) return ErrorResponse(err);
                return JsonResponse(*users);
            });

            // === Audit ===

            addRoute("GET", "/log/jit", [this](const Request& request, const Params&) {
                ServiceError err;
                Audit::AuditQuery query;
                if (!BuildAuditQuery(request.query, query, &err)) return ErrorResponse(err);
                auto page = m_service.QueryLog(request.caller, query, &err);
                if (!page) return ErrorResponse(err);
                return JsonResponse(*page);
            });

            addRoute("GET", "/log/jit/{id}", [this](const Request& request, const Params& params) {
                ServiceError err;
                auto id = ParseId(params[0], &err);
                if (!id) return ErrorResponse(err);
                auto entry = m_service.GetLogEntry(request.caller, *id, &err);
                if (!entry) return ErrorResponse(err);
                return JsonResponse(*entry);
            });
        }

    } // namespace Service
} // namespace JitGuard
