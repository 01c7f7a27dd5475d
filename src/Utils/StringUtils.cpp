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
#include "StringUtils.hpp"

#include <cstdint>

namespace JitGuard {
	namespace Utils {

		namespace {
			constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

			void AppendCodePoint(std::wstring& out, char32_t cp) {
				if constexpr (sizeof(wchar_t) >= 4) {
					out.push_back(static_cast<wchar_t>(cp));
				}
				else {
					if (cp >= 0x10000) {
						cp -= 0x10000;
						out.push_back(static_cast<wchar_t>(0xD800 + (cp >> 10)));
						out.push_back(static_cast<wchar_t>(0xDC00 + (cp & 0x3FF)));
					}
					else {
						out.push_back(static_cast<wchar_t>(cp));
					}
				}
			}

			void AppendUtf8(std::string& out, char32_t cp) {
				if (cp < 0x80) {
					out.push_back(static_cast<char>(cp));
				}
				else if (cp < 0x800) {
					out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
					out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
				}
				else if (cp < 0x10000) {
					out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
					out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
					out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
				}
				else {
					out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
					out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
					out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
					out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
				}
			}
		}

		std::wstring ToWide(std::string_view str) {
			std::wstring result;
			if (str.empty()) return result;
			result.reserve(str.size());

			size_t i = 0;
			while (i < str.size()) {
				const auto lead = static_cast<uint8_t>(str[i]);
				char32_t cp = 0;
				size_t extra = 0;

				if (lead < 0x80) { cp = lead; extra = 0; }
				else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; extra = 1; }
				else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; extra = 2; }
				else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; extra = 3; }
				else {
					AppendCodePoint(result, REPLACEMENT_CHAR);
					++i;
					continue;
				}

				// Truncated sequence at end of input
				if (extra > 0 && i + extra >= str.size()) {
					AppendCodePoint(result, REPLACEMENT_CHAR);
					break;
				}

				bool valid = true;
				for (size_t k = 1; k <= extra; ++k) {
					const auto cont = static_cast<uint8_t>(str[i + k]);
					if ((cont & 0xC0) != 0x80) {
						valid = false;
						break;
					}
					cp = (cp << 6) | (cont & 0x3F);
				}

				if (!valid || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
					AppendCodePoint(result, REPLACEMENT_CHAR);
					++i;
					continue;
				}

				AppendCodePoint(result, cp);
				i += extra + 1;
			}
			return result;
		}

		std::string ToNarrow(std::wstring_view str) {
			std::string result;
			if (str.empty()) return result;
			result.reserve(str.size());

			for (size_t i = 0; i < str.size(); ++i) {
				char32_t cp = static_cast<char32_t>(str[i]);
				if constexpr (sizeof(wchar_t) < 4) {
					if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < str.size()) {
						const auto low = static_cast<char32_t>(str[i + 1]);
						if (low >= 0xDC00 && low <= 0xDFFF) {
							cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
							++i;
						}
					}
				}
				if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
					cp = REPLACEMENT_CHAR;
				}
				AppendUtf8(result, cp);
			}
			return result;
		}

		std::string ToLowerAscii(std::string_view str) {
			std::string out(str);
			for (char& c : out) {
				if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + 32);
			}
			return out;
		}

		bool EqualsIgnoreCaseAscii(std::string_view a, std::string_view b) noexcept {
			if (a.size() != b.size()) return false;
			for (size_t i = 0; i < a.size(); ++i) {
				char ca = a[i];
				char cb = b[i];
				if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca + 32);
				if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb + 32);
				if (ca != cb) return false;
			}
			return true;
		}

	}  // namespace Utils
}  // namespace JitGuard
