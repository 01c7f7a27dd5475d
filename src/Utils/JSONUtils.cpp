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
#include "JSONUtils.hpp"
#include "Logger.hpp"
#include "StringUtils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace JitGuard {
	namespace Utils {
		namespace JSON {

			namespace {
				constexpr const wchar_t* LOG_CATEGORY = L"JSON";

				void FillError(Error* err, std::string message, const std::filesystem::path& path = {}) {
					if (!err) return;
					err->message = std::move(message);
					err->path = path;
				}

				/// Translates a byte offset into 1-based line/column.
				void FillPosition(Error* err, std::string_view text, size_t byteOffset) {
					if (!err) return;
					err->byteOffset = byteOffset;
					size_t line = 1;
					size_t column = 1;
					const size_t end = std::min(byteOffset, text.size());
					for (size_t i = 0; i < end; ++i) {
						if (text[i] == '\n') {
							++line;
							column = 1;
						}
						else {
							++column;
						}
					}
					err->line = line;
					err->column = column;
				}

				size_t Depth(const Json& j, size_t current, size_t limit) {
					if (current > limit) return current;
					size_t maxDepth = current;
					if (j.is_object() || j.is_array()) {
						for (const auto& child : j) {
							maxDepth = std::max(maxDepth, Depth(child, current + 1, limit));
							if (maxDepth > limit) break;
						}
					}
					return maxDepth;
				}
			}

			// ============================================================================
			// Text Parsing
			// ============================================================================

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				if (err) err->clear();
				try {
					out = Json::parse(jsonText.begin(), jsonText.end(), nullptr, true, opt.allowComments);

					if (Depth(out, 1, opt.maxDepth) > opt.maxDepth) {
						FillError(err, "JSON nesting exceeds maximum depth");
						out = Json();
						return false;
					}
					return true;
				}
				catch (const nlohmann::json::parse_error& ex) {
					FillError(err, ex.what());
					FillPosition(err, jsonText, ex.byte);
					return false;
				}
				catch (const nlohmann::json::exception& ex) {
					FillError(err, ex.what());
					return false;
				}
				catch (const std::bad_alloc&) {
					FillError(err, "Out of memory while parsing JSON");
					return false;
				}
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					const int indent = opt.pretty ? std::max(0, opt.indentSpaces) : -1;
					out = j.dump(indent, ' ', opt.ensureAscii, Json::error_handler_t::replace);
					return true;
				}
				catch (const nlohmann::json::exception& ex) {
					JG_LOG_ERROR(LOG_CATEGORY, L"Stringify failed: %ls", ToWide(ex.what()).c_str());
					return false;
				}
				catch (const std::bad_alloc&) {
					return false;
				}
			}

			// ============================================================================
			// File I/O
			// ============================================================================

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
				const ParseOptions& opt, size_t maxBytes) noexcept {
				if (err) err->clear();
				try {
					std::error_code ec;
					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						FillError(err, "Cannot stat file: " + ec.message(), path);
						return false;
					}
					if (size > maxBytes) {
						FillError(err, "File exceeds maximum allowed size", path);
						return false;
					}

					std::ifstream in(path, std::ios::binary);
					if (!in) {
						FillError(err, "Cannot open file for reading", path);
						return false;
					}

					std::string content(static_cast<size_t>(size), '\0');
					if (size > 0 && !in.read(content.data(), static_cast<std::streamsize>(size))) {
						FillError(err, "Failed to read file", path);
						return false;
					}

					// Skip UTF-8 BOM
					std::string_view text(content);
					if (text.size() >= 3 &&
						static_cast<unsigned char>(text[0]) == 0xEF &&
						static_cast<unsigned char>(text[1]) == 0xBB &&
						static_cast<unsigned char>(text[2]) == 0xBF) {
						text.remove_prefix(3);
					}

					if (!Parse(text, out, err, opt)) {
						if (err) err->path = path;
						return false;
					}
					return true;
				}
				catch (const std::exception& ex) {
					FillError(err, ex.what(), path);
					return false;
				}
			}

			bool SaveToFile(const std::filesystem::path& path, const Json& j, Error* err,
				const SaveOptions& opt) noexcept {
				if (err) err->clear();
				try {
					std::string text;
					if (!Stringify(j, text, opt)) {
						FillError(err, "Failed to serialize JSON", path);
						return false;
					}

					std::error_code ec;
					if (path.has_parent_path()) {
						std::filesystem::create_directories(path.parent_path(), ec);
						if (ec) {
							FillError(err, "Cannot create directory: " + ec.message(), path);
							return false;
						}
					}

					const std::filesystem::path target = opt.atomicReplace
						? std::filesystem::path(path.string() + ".tmp")
						: path;

					{
						std::ofstream outFile(target, std::ios::binary | std::ios::trunc);
						if (!outFile) {
							FillError(err, "Cannot open file for writing", target);
							return false;
						}
						outFile.write(text.data(), static_cast<std::streamsize>(text.size()));
						outFile.flush();
						if (!outFile) {
							FillError(err, "Failed to write file", target);
							return false;
						}
					}

					if (opt.atomicReplace) {
						std::filesystem::rename(target, path, ec);
						if (ec) {
							std::error_code ignored;
							std::filesystem::remove(target, ignored);
							FillError(err, "Atomic replace failed: " + ec.message(), path);
							return false;
						}
					}
					return true;
				}
				catch (const std::exception& ex) {
					FillError(err, ex.what(), path);
					return false;
				}
			}

			// ============================================================================
			// Path Helpers
			// ============================================================================

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty() || pathLike == "/") {
						return "/";
					}
					if (pathLike.front() == '/') {
						return std::string(pathLike);
					}

					// dot/bracket notation: a.b[2].c -> /a/b/2/c
					std::string out;
					out.reserve(pathLike.size() + 8);
					std::string token;

					auto flush = [&]() {
						out.push_back('/');
						for (char c : token) {
							if (c == '~') out += "~0";
							else if (c == '/') out += "~1";
							else out.push_back(c);
						}
						token.clear();
					};

					for (size_t i = 0; i < pathLike.size(); ++i) {
						const char c = pathLike[i];
						if (c == '.') {
							if (!token.empty()) flush();
						}
						else if (c == '[') {
							if (!token.empty()) flush();
							const size_t close = pathLike.find(']', i);
							if (close == std::string_view::npos) {
								return std::string();
							}
							token.assign(pathLike.substr(i + 1, close - i - 1));
							flush();
							i = close;
						}
						else {
							token.push_back(c);
						}
					}
					if (!token.empty()) flush();
					return out.empty() ? "/" : out;
				}
				catch (const std::bad_alloc&) {
					return std::string();
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp.empty()) return false;
					if (jp == "/") return true;
					return j.contains(nlohmann::json::json_pointer(jp));
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
			}

			bool RequireKeys(const Json& j, std::string_view objectPathLike,
				const std::vector<std::string>& requiredKeys, Error* err) noexcept {
				if (err) err->clear();
				try {
					const Json* obj = &j;
					const auto jp = ToJsonPointer(objectPathLike);
					if (jp.empty()) {
						FillError(err, "Invalid path");
						return false;
					}
					if (jp != "/") {
						const nlohmann::json::json_pointer ptr(jp);
						if (!j.contains(ptr)) {
							FillError(err, "Missing object: " + std::string(objectPathLike));
							return false;
						}
						obj = &j.at(ptr);
					}
					if (!obj->is_object()) {
						FillError(err, "Not an object: " + std::string(objectPathLike));
						return false;
					}
					for (const auto& key : requiredKeys) {
						if (!obj->contains(key)) {
							FillError(err, "Missing required key: " + key);
							return false;
						}
					}
					return true;
				}
				catch (const nlohmann::json::exception& ex) {
					FillError(err, ex.what());
					return false;
				}
				catch (const std::bad_alloc&) {
					FillError(err, "Out of memory");
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace JitGuard
