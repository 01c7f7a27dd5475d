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
 * @file CommandLine.hpp
 * @brief Windows command-line tokenization and quoting.
 *
 * SplitCommandLine follows the CommandLineToArgvW rules:
 *  - the first token (program name) ends at the next whitespace, or at the
 *    closing quote if it starts with one; backslashes are literal
 *  - afterwards, 2n backslashes + '"' -> n backslashes and a quote toggle,
 *    2n+1 backslashes + '"' -> n backslashes and a literal quote
 *  - inside quotes, "" yields a literal quote
 *
 * JoinCommandLine is the inverse for any argument list.
 */

#include <string>
#include <string_view>
#include <vector>

namespace JitGuard {
	namespace Utils {

		[[nodiscard]] std::vector<std::string> SplitCommandLine(std::string_view commandLine);

		/// @brief Quotes a single argument so SplitCommandLine returns it unchanged.
		[[nodiscard]] std::string QuoteArgument(std::string_view argument);

		[[nodiscard]] std::string JoinCommandLine(const std::vector<std::string>& arguments);

	}  // namespace Utils
}  // namespace JitGuard
