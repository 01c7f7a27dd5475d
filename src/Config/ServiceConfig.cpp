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
#include "ServiceConfig.hpp"

#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <system_error>

namespace JitGuard {
	namespace Config {

		using Core::ErrorKind;
		using Core::SetError;

		namespace {
			constexpr const wchar_t* LOG_CATEGORY = L"ServiceConfig";

			constexpr uint32_t MAX_PAGE_SIZE_LIMIT = 10000;

			std::string_view GetLogLevelName(Utils::LogLevel level) noexcept {
				switch (level) {
				case Utils::LogLevel::Trace: return "trace";
				case Utils::LogLevel::Debug: return "debug";
				case Utils::LogLevel::Info:  return "info";
				case Utils::LogLevel::Warn:  return "warn";
				case Utils::LogLevel::Error: return "error";
				case Utils::LogLevel::Fatal: return "fatal";
				default:                     return "info";
				}
			}

			/// Present-but-wrongly-typed is an error; absent keeps the default
			template <typename T>
			bool ReadKey(const Utils::JSON::Json& j, std::string_view key, T& out, Core::ServiceError* err) {
				if (!Utils::JSON::Contains(j, key)) {
					return true;
				}
				if (!Utils::JSON::Get<T>(j, key, out)) {
					return SetError(err, ErrorKind::InvalidParameter,
						L"Config key " + Utils::ToWide(key) + L" has the wrong type", L"ServiceConfig");
				}
				return true;
			}

			std::filesystem::path Resolve(const std::string& dataDirectory, const std::string& path) {
				std::filesystem::path p(path);
				if (p.is_absolute()) {
					return p;
				}
				return std::filesystem::path(dataDirectory) / p;
			}
		}

		bool ServiceConfig::IsValid(Core::ServiceError* err) const {
			if (dataDirectory.empty()) {
				return SetError(err, ErrorKind::InvalidParameter, L"DataDirectory must not be empty", L"ServiceConfig");
			}
			if (database.path.empty()) {
				return SetError(err, ErrorKind::InvalidParameter, L"Database.Path must not be empty", L"ServiceConfig");
			}
			if (database.busyTimeoutMs < 0) {
				return SetError(err, ErrorKind::InvalidParameter, L"Database.BusyTimeoutMs must not be negative", L"ServiceConfig");
			}
			if (database.maxConnections == 0) {
				return SetError(err, ErrorKind::InvalidParameter, L"Database.MaxConnections must be positive", L"ServiceConfig");
			}
			if (logging.toFile && logging.directory.empty()) {
				return SetError(err, ErrorKind::InvalidParameter, L"Logging.Directory must not be empty", L"ServiceConfig");
			}
			if (audit.maxPageSize == 0 || audit.maxPageSize > MAX_PAGE_SIZE_LIMIT) {
				return SetError(err, ErrorKind::InvalidParameter,
					L"Audit.MaxPageSize must be within 1.." + std::to_wstring(MAX_PAGE_SIZE_LIMIT), L"ServiceConfig");
			}
			return true;
		}

		std::filesystem::path ServiceConfig::ResolvedDatabasePath() const {
			return Resolve(dataDirectory, database.path);
		}

		std::filesystem::path ServiceConfig::ResolvedLogDirectory() const {
			return Resolve(dataDirectory, logging.directory);
		}

		Database::DatabaseConfig ServiceConfig::ToDatabaseConfig() const {
			Database::DatabaseConfig cfg;
			cfg.databasePath = ResolvedDatabasePath().wstring();
			cfg.enableWAL = database.enableWAL;
			cfg.busyTimeoutMs = database.busyTimeoutMs;
			cfg.maxConnections = database.maxConnections;
			cfg.minConnections = std::min<size_t>(cfg.minConnections, database.maxConnections);
			return cfg;
		}

		Utils::LoggerConfig ServiceConfig::ToLoggerConfig() const {
			Utils::LoggerConfig cfg;
			cfg.logDirectory = ResolvedLogDirectory().wstring();
			cfg.minimalLevel = logging.minimalLevel;
			cfg.toConsole = logging.toConsole;
			cfg.toFile = logging.toFile;
			cfg.async = logging.async;
			return cfg;
		}

		bool FromJson(const Utils::JSON::Json& j, ServiceConfig& out, Core::ServiceError* err) {
			if (!j.is_object()) {
				return SetError(err, ErrorKind::InvalidParameter, L"Config root must be an object", L"ServiceConfig");
			}

			ServiceConfig cfg;
			std::string level = std::string(GetLogLevelName(cfg.logging.minimalLevel));

			if (!ReadKey(j, "DataDirectory", cfg.dataDirectory, err) ||
				!ReadKey(j, "Database.Path", cfg.database.path, err) ||
				!ReadKey(j, "Database.EnableWAL", cfg.database.enableWAL, err) ||
				!ReadKey(j, "Database.BusyTimeoutMs", cfg.database.busyTimeoutMs, err) ||
				!ReadKey(j, "Database.MaxConnections", cfg.database.maxConnections, err) ||
				!ReadKey(j, "Logging.Directory", cfg.logging.directory, err) ||
				!ReadKey(j, "Logging.MinimalLevel", level, err) ||
				!ReadKey(j, "Logging.ToConsole", cfg.logging.toConsole, err) ||
				!ReadKey(j, "Logging.ToFile", cfg.logging.toFile, err) ||
				!ReadKey(j, "Logging.Async", cfg.logging.async, err) ||
				!ReadKey(j, "Elevation.SweeperEnabled", cfg.elevation.sweeperEnabled, err) ||
				!ReadKey(j, "Audit.MaxPageSize", cfg.audit.maxPageSize, err)) {
				return false;
			}

			cfg.logging.minimalLevel = Utils::ParseLogLevel(level, Utils::LogLevel::Info);

			if (!cfg.IsValid(err)) {
				return false;
			}
			out = std::move(cfg);
			return true;
		}

		Utils::JSON::Json ToJson(const ServiceConfig& config) {
			return Utils::JSON::Json{
				{"DataDirectory", config.dataDirectory},
				{"Database", {
					{"Path", config.database.path},
					{"EnableWAL", config.database.enableWAL},
					{"BusyTimeoutMs", config.database.busyTimeoutMs},
					{"MaxConnections", config.database.maxConnections}
				}},
				{"Logging", {
					{"Directory", config.logging.directory},
					{"MinimalLevel", std::string(GetLogLevelName(config.logging.minimalLevel))},
					{"ToConsole", config.logging.toConsole},
					{"ToFile", config.logging.toFile},
					{"Async", config.logging.async}
				}},
				{"Elevation", {
					{"SweeperEnabled", config.elevation.sweeperEnabled}
				}},
				{"Audit", {
					{"MaxPageSize", config.audit.maxPageSize}
				}}
			};
		}

		bool LoadOrCreate(const std::filesystem::path& path, ServiceConfig& out, Core::ServiceError* err) {
			std::error_code ec;
			const bool exists = std::filesystem::exists(path, ec);
			if (ec) {
				return SetError(err, ErrorKind::Internal, Utils::ToWide(ec.message()), L"LoadOrCreate", ec.value());
			}

			if (!exists) {
				ServiceConfig defaults;
				Utils::JSON::Error jsonErr;
				Utils::JSON::SaveOptions opts;
				opts.pretty = true;
				if (!Utils::JSON::SaveToFile(path, ToJson(defaults), &jsonErr, opts)) {
					return SetError(err, ErrorKind::Internal,
						L"Cannot write default config: " + Utils::ToWide(jsonErr.message), L"LoadOrCreate");
				}
				JG_LOG_INFO(LOG_CATEGORY, L"Default configuration written to %ls", path.wstring().c_str());
				out = std::move(defaults);
				return true;
			}

			Utils::JSON::Json j;
			Utils::JSON::Error jsonErr;
			if (!Utils::JSON::LoadFromFile(path, j, &jsonErr)) {
				std::wstring message = L"Config is not valid JSON: " + Utils::ToWide(jsonErr.message);
				if (jsonErr.line > 0) {
					message += L" (line " + std::to_wstring(jsonErr.line) + L", column " + std::to_wstring(jsonErr.column) + L")";
				}
				return SetError(err, ErrorKind::InvalidParameter, message, L"LoadOrCreate");
			}

			if (!FromJson(j, out, err)) {
				return false;
			}
			JG_LOG_INFO(LOG_CATEGORY, L"Configuration loaded from %ls", path.wstring().c_str());
			return true;
		}

	}  // namespace Config
}  // namespace JitGuard
