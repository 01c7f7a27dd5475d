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
 * @file StringUtils.hpp
 * @brief UTF-8 / wide-string conversion and ASCII case helpers.
 *
 * Storage and JSON work in UTF-8; the logger and error messages are wide.
 * Invalid UTF-8 sequences decode to U+FFFD instead of failing.
 */

#include <string>
#include <string_view>

namespace JitGuard {
	namespace Utils {

		/// @brief UTF-8 to wide (UTF-32 or UTF-16 depending on wchar_t width).
		[[nodiscard]] std::wstring ToWide(std::string_view str);

		/// @brief Wide to UTF-8.
		[[nodiscard]] std::string ToNarrow(std::wstring_view str);

		[[nodiscard]] std::string ToLowerAscii(std::string_view str);

		[[nodiscard]] bool EqualsIgnoreCaseAscii(std::string_view a, std::string_view b) noexcept;

	}  // namespace Utils
}  // namespace JitGuard
