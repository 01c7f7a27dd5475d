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
#include "ServiceTypes.hpp"

namespace JitGuard {
    namespace Service {

        using nlohmann::json;

        namespace {

            bool HasValue(const json& j, const char* key) {
                auto it = j.find(key);
                return it != j.end() && !it->is_null();
            }

            template <typename T>
            void ReadOptional(const json& j, const char* key, std::optional<T>& out) {
                if (HasValue(j, key)) {
                    out = j.at(key).get<T>();
                }
                else {
                    out.reset();
                }
            }

            template <typename T>
            void ReadOr(const json& j, const char* key, T& out) {
                if (HasValue(j, key)) {
                    j.at(key).get_to(out);
                }
            }

        } // anonymous namespace

        void to_json(json& j, const StartupInfo& v) {
            j = json{
                {"X", v.x}, {"Y", v.y},
                {"XSize", v.xSize}, {"YSize", v.ySize},
                {"XCountChars", v.xCountChars}, {"YCountChars", v.yCountChars},
                {"FillAttribute", v.fillAttribute},
                {"Flags", v.flags},
                {"ShowWindow", v.showWindow}
            };
            if (v.desktop) j["Desktop"] = *v.desktop;
            if (v.title) j["Title"] = *v.title;
            if (v.parentProcessId) j["ParentPid"] = *v.parentProcessId;
        }

        void from_json(const json& j, StartupInfo& v) {
            v = StartupInfo{};
            ReadOptional(j, "Desktop", v.desktop);
            ReadOptional(j, "Title", v.title);
            ReadOr(j, "X", v.x);
            ReadOr(j, "Y", v.y);
            ReadOr(j, "XSize", v.xSize);
            ReadOr(j, "YSize", v.ySize);
            ReadOr(j, "XCountChars", v.xCountChars);
            ReadOr(j, "YCountChars", v.yCountChars);
            ReadOr(j, "FillAttribute", v.fillAttribute);
            ReadOr(j, "Flags", v.flags);
            ReadOr(j, "ShowWindow", v.showWindow);
            ReadOptional(j, "ParentPid", v.parentProcessId);
        }

        void from_json(const json& j, LaunchRequest& v) {
            v = LaunchRequest{};
            ReadOptional(j, "ExecutablePath", v.executablePath);
            ReadOptional(j, "CommandLine", v.commandLine);
            ReadOptional(j, "WorkingDirectory", v.workingDirectory);
            ReadOr(j, "CreationFlags", v.creationFlags);
            ReadOptional(j, "StartupInfo", v.startupInfo);
            ReadOr(j, "Reason", v.reason);
        }

        void to_json(json& j, const LaunchResult& v) {
            j = json{ {"ProcessId", v.processId}, {"ThreadId", v.threadId} };
        }

        void to_json(json& j, const ProfileSelection& v) {
            j = json{ {"Active", v.active}, {"Available", v.available} };
        }

        json StatusToJson(const Elevation::ElevationStatus& status) {
            return json{
                {"Elevated", status.elevated},
                {"Session", { {"Enabled", status.sessionEnabled} }},
                {"Temporary", {
                    {"Enabled", status.temporaryEnabled},
                    {"MaxSeconds", status.temporaryMaxSeconds},
                    {"TimeLeft", status.temporaryTimeLeft}
                }}
            };
        }

    } // namespace Service
} // namespace JitGuard
