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
#include "PathUtils.hpp"
#include "Logger.hpp"

#include <vector>

namespace JitGuard {
	namespace Utils {
		namespace Path {

			namespace {
				constexpr const wchar_t* LOG_CATEGORY = L"Path";

				bool IsDriveSegment(std::string_view segment) noexcept {
					return segment.size() == 2 && segment[1] == ':';
				}
			}

			bool NormalizePath(std::string_view path, std::string& output) noexcept {
				try {
					output.clear();

					if (path.empty()) {
						return true;
					}
					if (path.size() > MAX_PATH_INPUT) {
						return false;
					}

					std::string lowered;
					lowered.reserve(path.size());
					for (char c : path) {
						if (c >= 'A' && c <= 'Z') {
							c = static_cast<char>(c + 32);
						}
						else if (c == '\\') {
							c = '/';
						}
						lowered.push_back(c);
					}

					// Resolve "." and ".." instead of pattern-matching them, then
					// reject anything that would climb above the root.
					std::vector<std::string_view> segments;
					segments.reserve(16);

					const std::string_view view(lowered);
					size_t start = 0;
					while (start <= view.size()) {
						size_t end = view.find('/', start);
						if (end == std::string_view::npos) {
							end = view.size();
						}

						const std::string_view segment = view.substr(start, end - start);

						if (segment == "..") {
							if (segments.empty() || IsDriveSegment(segments.back())) {
								JG_LOG_DEBUG(LOG_CATEGORY, L"NormalizePath: traversal above root rejected");
								output.clear();
								return false;
							}
							segments.pop_back();
						}
						else if (!segment.empty() && segment != ".") {
							segments.push_back(segment);
						}

						start = end + 1;
					}

					for (size_t i = 0; i < segments.size(); ++i) {
						if (i > 0) {
							output.push_back('/');
						}
						output.append(segments[i]);
					}
					return true;
				}
				catch (const std::bad_alloc&) {
					output.clear();
					return false;
				}
			}

			std::string_view FileNameOf(std::string_view normalizedPath) noexcept {
				const size_t slash = normalizedPath.find_last_of('/');
				if (slash == std::string_view::npos) {
					return normalizedPath;
				}
				return normalizedPath.substr(slash + 1);
			}

			// '*' matches zero or more characters INCLUDING separators,
			// '?' exactly one. Iterative with single-star backtracking.
			bool GlobMatch(std::string_view pattern, std::string_view text) noexcept {
				size_t pi = 0, ti = 0;
				size_t starIdx = std::string_view::npos;
				size_t matchIdx = 0;

				while (ti < text.length()) {
					if (pi < pattern.length() &&
						(pattern[pi] == '?' || pattern[pi] == text[ti])) {
						++pi;
						++ti;
					}
					else if (pi < pattern.length() && pattern[pi] == '*') {
						starIdx = pi;
						matchIdx = ti;
						++pi;
					}
					else if (starIdx != std::string_view::npos) {
						pi = starIdx + 1;
						++matchIdx;
						ti = matchIdx;
					}
					else {
						return false;
					}
				}

				while (pi < pattern.length() && pattern[pi] == '*') {
					++pi;
				}

				return pi == pattern.length();
			}

		}  // namespace Path
	}  // namespace Utils
}  // namespace JitGuard
