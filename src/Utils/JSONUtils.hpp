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
 * @file JSONUtils.hpp
 * @brief JSON parsing, serialization and file helpers for JitGuard.
 *
 * Provides:
 * - Safe parsing with depth limits to prevent stack overflow attacks
 * - File I/O with atomic write support
 * - JSON Pointer and dot/bracket path navigation
 *
 * Implementation uses nlohmann/json with hardened wrappers.
 *
 * @note All functions are noexcept and return success/failure status.
 */

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <cstdint>
#include <optional>
#include <algorithm>

#include <nlohmann/json.hpp>

namespace JitGuard {
	namespace Utils {
		namespace JSON {

			using Json = nlohmann::json;

			// ============================================================================
			// Security Constants
			// ============================================================================

			/// Maximum nesting depth to prevent stack overflow attacks
			inline constexpr size_t MAX_JSON_DEPTH = 1000;

			/// Default file size limit for LoadFromFile (32MB)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 32ULL * 1024 * 1024;

			// ============================================================================
			// Error Handling
			// ============================================================================

			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)
				size_t line = 0;                  ///< Approximate line number (1-based, 0 = unknown)
				size_t column = 0;                ///< Approximate column number (1-based, 0 = unknown)

				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
					line = 0;
					column = 0;
				}
			};

			// ============================================================================
			// Parse/Stringify Options
			// ============================================================================

			struct ParseOptions {
				bool allowComments = true;         ///< Allow // and /* */ comments
				size_t maxDepth = MAX_JSON_DEPTH;  ///< Maximum nesting depth
			};

			struct StringifyOptions {
				bool pretty = false;
				int indentSpaces = 2;
				bool ensureAscii = false;
			};

			struct SaveOptions : StringifyOptions {
				bool atomicReplace = true;         ///< Write to temp file, then rename
			};

			// ============================================================================
			// Text Parsing Functions
			// ============================================================================

			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			[[nodiscard]] bool Stringify(const Json& j, std::string& out,
			                             const StringifyOptions& opt = {}) noexcept;

			// ============================================================================
			// File I/O Functions
			// ============================================================================

			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			[[nodiscard]] bool SaveToFile(const std::filesystem::path& path, const Json& j,
			                              Error* err = nullptr, const SaveOptions& opt = {}) noexcept;

			// ============================================================================
			// JSON Pointer / Path Helpers
			// ============================================================================

			/**
			 * @brief Converts "a.b[2].c" or "/a/b/2/c" to an RFC 6901 JSON Pointer.
			 */
			[[nodiscard]] std::string ToJsonPointer(std::string_view pathLike) noexcept;

			[[nodiscard]] bool Contains(const Json& j, std::string_view pathLike) noexcept;

			// ============================================================================
			// Typed Getters
			// ============================================================================

			/**
			 * @brief Reads a typed value at a path; false if missing or of the wrong type.
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pathLike, T& out) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp.empty()) {
						return false;
					}
					if (jp == "/") {
						out = j.template get<T>();
						return true;
					}

					const nlohmann::json::json_pointer ptr(jp);
					if (!j.contains(ptr)) {
						return false;
					}

					out = j.at(ptr).template get<T>();
					return true;
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
			}

			template <typename T>
			[[nodiscard]] T GetOr(const Json& j, std::string_view pathLike, T defaultValue) noexcept {
				T val{};
				if (Get<T>(j, pathLike, val)) {
					return val;
				}
				return defaultValue;
			}

			/**
			 * @brief Validates that an object at path contains all required keys.
			 */
			[[nodiscard]] bool RequireKeys(const Json& j, std::string_view objectPathLike,
			                               const std::vector<std::string>& requiredKeys,
			                               Error* err = nullptr) noexcept;

		}  // namespace JSON
	}  // namespace Utils
}  // namespace JitGuard
