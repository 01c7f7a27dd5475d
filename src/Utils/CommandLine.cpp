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
#include "CommandLine.hpp"

namespace JitGuard {
	namespace Utils {

		namespace {
			bool IsBlank(char c) noexcept {
				return c == ' ' || c == '\t';
			}
		}

		std::vector<std::string> SplitCommandLine(std::string_view commandLine) {
			std::vector<std::string> args;

			size_t i = 0;
			const size_t n = commandLine.size();

			while (i < n && IsBlank(commandLine[i])) ++i;
			if (i >= n) {
				return args;
			}

			// Program name: no escape processing
			{
				std::string program;
				if (commandLine[i] == '"') {
					++i;
					while (i < n && commandLine[i] != '"') {
						program.push_back(commandLine[i++]);
					}
					if (i < n) ++i;  // closing quote
				}
				else {
					while (i < n && !IsBlank(commandLine[i])) {
						program.push_back(commandLine[i++]);
					}
				}
				args.push_back(std::move(program));
			}

			while (true) {
				while (i < n && IsBlank(commandLine[i])) ++i;
				if (i >= n) {
					break;
				}

				std::string current;
				bool inQuotes = false;

				while (i < n) {
					const char c = commandLine[i];

					if (c == '\\') {
						size_t backslashes = 0;
						while (i < n && commandLine[i] == '\\') {
							++backslashes;
							++i;
						}
						if (i < n && commandLine[i] == '"') {
							current.append(backslashes / 2, '\\');
							if (backslashes % 2 == 1) {
								current.push_back('"');
								++i;
							}
							// even count: leave the quote for the next iteration
						}
						else {
							current.append(backslashes, '\\');
						}
						continue;
					}

					if (c == '"') {
						if (inQuotes && i + 1 < n && commandLine[i + 1] == '"') {
							current.push_back('"');
							i += 2;
							continue;
						}
						inQuotes = !inQuotes;
						++i;
						continue;
					}

					if (IsBlank(c) && !inQuotes) {
						break;
					}

					current.push_back(c);
					++i;
				}

				args.push_back(std::move(current));
			}

			return args;
		}

		std::string QuoteArgument(std::string_view argument) {
			if (!argument.empty() &&
				argument.find_first_of(" \t\n\v\"") == std::string_view::npos) {
				return std::string(argument);
			}

			std::string quoted;
			quoted.reserve(argument.size() + 2);
			quoted.push_back('"');

			for (size_t i = 0; ; ++i) {
				size_t backslashes = 0;
				while (i < argument.size() && argument[i] == '\\') {
					++i;
					++backslashes;
				}

				if (i == argument.size()) {
					// Double trailing backslashes so the closing quote stays a quote
					quoted.append(backslashes * 2, '\\');
					break;
				}
				if (argument[i] == '"') {
					quoted.append(backslashes * 2 + 1, '\\');
					quoted.push_back('"');
				}
				else {
					quoted.append(backslashes, '\\');
					quoted.push_back(argument[i]);
				}
			}

			quoted.push_back('"');
			return quoted;
		}

		std::string JoinCommandLine(const std::vector<std::string>& arguments) {
			std::string result;
			for (size_t i = 0; i < arguments.size(); ++i) {
				if (i > 0) {
					result.push_back(' ');
				}
				if (i == 0 && arguments[i].find('"') == std::string::npos) {
					// Program name is never escape-processed; plain quoting suffices
					if (!arguments[i].empty() && arguments[i].find_first_of(" \t") == std::string::npos) {
						result.append(arguments[i]);
					}
					else {
						result.push_back('"');
						result.append(arguments[i]);
						result.push_back('"');
					}
					continue;
				}
				result.append(QuoteArgument(arguments[i]));
			}
			return result;
		}

	}  // namespace Utils
}  // namespace JitGuard
