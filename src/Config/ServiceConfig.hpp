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
 * @file ServiceConfig.hpp
 * @brief JSON service configuration.
 *
 * Example (every key optional):
 * @code
 * {
 *   "DataDirectory": "/var/lib/jitguard",
 *   "Database": { "Path": "jitguard.db", "EnableWAL": true, "BusyTimeoutMs": 5000, "MaxConnections": 8 },
 *   "Logging":  { "Directory": "logs", "MinimalLevel": "info", "ToConsole": false, "ToFile": true, "Async": true },
 *   "Elevation": { "SweeperEnabled": true },
 *   "Audit": { "MaxPageSize": 1000 }
 * }
 * @endcode
 *
 * Relative database and log paths resolve against DataDirectory.
 */

#include "../Core/ServiceError.hpp"
#include "../Database/DatabaseManager.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace JitGuard {
	namespace Config {

		struct DatabaseSettings {
			std::string path = "jitguard.db";
			bool enableWAL = true;
			int busyTimeoutMs = 5000;
			size_t maxConnections = 8;
		};

		struct LoggingSettings {
			std::string directory = "logs";
			Utils::LogLevel minimalLevel = Utils::LogLevel::Info;
			bool toConsole = false;
			bool toFile = true;
			bool async = true;
		};

		struct ElevationSettings {
			bool sweeperEnabled = true;
		};

		struct AuditSettings {
			uint32_t maxPageSize = 1000;
		};

		struct ServiceConfig {
			std::string dataDirectory = ".";
			DatabaseSettings database;
			LoggingSettings logging;
			ElevationSettings elevation;
			AuditSettings audit;

			[[nodiscard]] bool IsValid(Core::ServiceError* err = nullptr) const;

			/// @brief Database path with DataDirectory applied.
			[[nodiscard]] std::filesystem::path ResolvedDatabasePath() const;
			[[nodiscard]] std::filesystem::path ResolvedLogDirectory() const;

			[[nodiscard]] Database::DatabaseConfig ToDatabaseConfig() const;
			[[nodiscard]] Utils::LoggerConfig ToLoggerConfig() const;
		};

		/// @brief Reads every known key; unknown keys are ignored, wrongly typed ones rejected.
		bool FromJson(const Utils::JSON::Json& j, ServiceConfig& out, Core::ServiceError* err = nullptr);
		[[nodiscard]] Utils::JSON::Json ToJson(const ServiceConfig& config);

		/**
		 * @brief Loads the config file, or writes the defaults there when it does not exist.
		 */
		bool LoadOrCreate(const std::filesystem::path& path, ServiceConfig& out, Core::ServiceError* err = nullptr);

	}  // namespace Config
}  // namespace JitGuard
