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
 * @file PathUtils.hpp
 * @brief Windows-semantics path normalization and glob matching.
 *
 * Paths are UTF-8. Normalized form:
 *  - ASCII letters lower-cased (Windows paths are case-insensitive)
 *  - '\' converted to '/'
 *  - empty and "." segments dropped, ".." resolved
 *  - no leading or trailing separator ("C:\Windows\" -> "c:/windows")
 */

#include <string>
#include <string_view>

namespace JitGuard {
	namespace Utils {
		namespace Path {

			/// Longest path accepted for normalization (Windows extended-length limit)
			inline constexpr size_t MAX_PATH_INPUT = 32767;

			/**
			 * @brief Normalizes a path for comparison.
			 *
			 * @param path   Input path (UTF-8)
			 * @param output Normalized result; cleared on failure
			 * @return false if the path is too long or ".." climbs above the
			 *         root or a drive letter
			 */
			[[nodiscard]] bool NormalizePath(std::string_view path, std::string& output) noexcept;

			/**
			 * @brief Final segment of a normalized path ("c:/a/b.exe" -> "b.exe").
			 */
			[[nodiscard]] std::string_view FileNameOf(std::string_view normalizedPath) noexcept;

			/**
			 * @brief Glob match where '*' and '?' also match path separators.
			 *
			 * Both arguments are compared byte-for-byte; normalize them first
			 * for case-insensitive path semantics.
			 */
			[[nodiscard]] bool GlobMatch(std::string_view pattern, std::string_view text) noexcept;

		}  // namespace Path
	}  // namespace Utils
}  // namespace JitGuard
