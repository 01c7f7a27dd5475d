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
#include "FilterMatcher.hpp"

#include "../Utils/Logger.hpp"
#include "../Utils/PathUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <unordered_map>

namespace JitGuard {
    namespace Policy {
        namespace FilterMatcher {

            namespace {
                constexpr const wchar_t* LOG_CATEGORY = L"FilterMatcher";

                bool StartsWith(std::string_view value, std::string_view prefix) noexcept {
                    return value.size() >= prefix.size() &&
                        value.compare(0, prefix.size(), prefix) == 0;
                }

                bool EndsWith(std::string_view value, std::string_view suffix) noexcept {
                    return value.size() >= suffix.size() &&
                        value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
                }

                constexpr size_t MAX_REGEX_PATTERN_LENGTH = 512;
                constexpr size_t MAX_REGEX_QUANTIFIERS = 5;
                constexpr size_t MAX_REGEX_NESTING = 3;
                constexpr size_t MAX_REGEX_CACHE_ENTRIES = 256;

                bool Reject(std::wstring* reason, const wchar_t* why) {
                    if (reason) {
                        *reason = why;
                    }
                    return false;
                }

                bool IsQuantifier(char c) noexcept {
                    return c == '*' || c == '+' || c == '?' || c == '{';
                }

                /// Compiled patterns shared by every thread; a null entry marks a rejected pattern.
                class RegexCache {
                public:
                    static RegexCache& Instance() {
                        static RegexCache cache;
                        return cache;
                    }

                    std::shared_ptr<const std::regex> Get(std::string_view pattern) {
                        std::string key(pattern);
                        {
                            std::lock_guard<std::mutex> lock(m_mutex);
                            auto it = m_entries.find(key);
                            if (it != m_entries.end()) {
                                return it->second;
                            }
                        }

                        std::shared_ptr<const std::regex> compiled;
                        std::wstring reason;
                        if (!ValidateRegexPattern(pattern, &reason)) {
                            JG_LOG_WARN(LOG_CATEGORY, L"Regex filter rejected (%ls): %ls",
                                Utils::ToWide(pattern).c_str(), reason.c_str());
                        }
                        else {
                            compiled = std::make_shared<const std::regex>(key,
                                std::regex::ECMAScript | std::regex::nosubs | std::regex::optimize);
                        }

                        std::lock_guard<std::mutex> lock(m_mutex);
                        if (m_entries.size() >= MAX_REGEX_CACHE_ENTRIES) {
                            m_entries.clear();
                        }
                        m_entries.emplace(std::move(key), compiled);
                        return compiled;
                    }

                private:
                    std::mutex m_mutex;
                    std::unordered_map<std::string, std::shared_ptr<const std::regex>> m_entries;
                };

                bool RegexSearch(std::string_view pattern, std::string_view value) noexcept {
                    if (value.size() > MAX_REGEX_SUBJECT_LENGTH) {
                        JG_LOG_WARN(LOG_CATEGORY, L"Regex filter skipped: value of %zu bytes exceeds %zu",
                            value.size(), MAX_REGEX_SUBJECT_LENGTH);
                        return false;
                    }
                    try {
                        const auto re = RegexCache::Instance().Get(pattern);
                        if (!re) {
                            return false;
                        }
                        return std::regex_search(value.begin(), value.end(), *re);
                    }
                    catch (const std::regex_error& e) {
                        JG_LOG_DEBUG(LOG_CATEGORY, L"Regex filter failed (%ls): %ls",
                            Utils::ToWide(pattern).c_str(), Utils::ToWide(e.what()).c_str());
                        return false;
                    }
                    catch (const std::bad_alloc&) {
                        return false;
                    }
                }

                bool MatchesAnyToken(const StringFilter& filter,
                    const std::vector<std::string>& tokens) noexcept {
                    for (const auto& token : tokens) {
                        if (MatchesString(filter, token)) {
                            return true;
                        }
                    }
                    return false;
                }
            } // anonymous namespace

            bool ValidateRegexPattern(std::string_view pattern, std::wstring* reason) {
                if (pattern.size() > MAX_REGEX_PATTERN_LENGTH) {
                    return Reject(reason, L"pattern longer than 512 bytes");
                }

                // Per open group: whether it holds a quantifier or an alternation
                struct Group {
                    bool quantified = false;
                    bool alternation = false;
                };
                std::vector<Group> groups;
                size_t quantifiers = 0;
                bool prevWasQuantifier = false;
                bool lazyTaken = false;
                std::optional<Group> justClosed;

                for (size_t i = 0; i < pattern.size(); ++i) {
                    const char c = pattern[i];

                    if (IsQuantifier(c)) {
                        if (prevWasQuantifier) {
                            if (c == '?' && !lazyTaken) {
                                lazyTaken = true;   // lazy modifier
                                continue;
                            }
                            return Reject(reason, L"consecutive quantifiers");
                        }
                        if (justClosed && (justClosed->quantified || justClosed->alternation)) {
                            return Reject(reason, L"quantified group containing a quantifier or alternation");
                        }
                        if (++quantifiers > MAX_REGEX_QUANTIFIERS) {
                            return Reject(reason, L"more than 5 quantifiers");
                        }
                        if (!groups.empty()) {
                            groups.back().quantified = true;
                        }
                        if (c == '{') {
                            const size_t close = pattern.find('}', i);
                            if (close == std::string_view::npos) {
                                return Reject(reason, L"unterminated repetition");
                            }
                            i = close;
                        }
                        prevWasQuantifier = true;
                        lazyTaken = false;
                        justClosed.reset();
                        continue;
                    }

                    prevWasQuantifier = false;
                    justClosed.reset();

                    switch (c) {
                    case '\\':
                        ++i;
                        break;
                    case '[': {
                        // Character class is one atom; its contents are literal
                        size_t j = i + 1;
                        if (j < pattern.size() && pattern[j] == '^') ++j;
                        if (j < pattern.size() && pattern[j] == ']') ++j;
                        for (; j < pattern.size() && pattern[j] != ']'; ++j) {
                            if (pattern[j] == '\\') ++j;
                        }
                        if (j >= pattern.size()) {
                            return Reject(reason, L"unterminated character class");
                        }
                        i = j;
                        break;
                    }
                    case '(':
                        groups.emplace_back();
                        if (groups.size() > MAX_REGEX_NESTING) {
                            return Reject(reason, L"groups nested deeper than 3");
                        }
                        if (i + 1 < pattern.size() && pattern[i + 1] == '?') {
                            i += 2;     // (?: (?= (?!
                        }
                        break;
                    case ')': {
                        if (groups.empty()) {
                            return Reject(reason, L"unbalanced parenthesis");
                        }
                        const Group closed = groups.back();
                        groups.pop_back();
                        if (!groups.empty()) {
                            groups.back().quantified |= closed.quantified;
                            groups.back().alternation |= closed.alternation;
                        }
                        justClosed = closed;
                        break;
                    }
                    case '|':
                        if (!groups.empty()) {
                            groups.back().alternation = true;
                        }
                        break;
                    default:
                        break;
                    }
                }

                if (!groups.empty()) {
                    return Reject(reason, L"unbalanced parenthesis");
                }

                try {
                    const std::regex re(pattern.begin(), pattern.end(), std::regex::ECMAScript | std::regex::nosubs);
                }
                catch (const std::regex_error&) {
                    return Reject(reason, L"invalid syntax");
                }
                return true;
            }

            bool MatchesPath(const PathFilter& filter, std::string_view path) noexcept {
                if (filter.pattern.empty()) {
                    return false;
                }

                try {
                    std::string normalized;
                    if (!Utils::Path::NormalizePath(path, normalized)) {
                        return false;
                    }

                    switch (filter.kind) {
                    case PathFilterKind::Equals: {
                        std::string pattern;
                        if (!Utils::Path::NormalizePath(filter.pattern, pattern)) {
                            return false;
                        }
                        return normalized == pattern;
                    }
                    case PathFilterKind::FileName:
                        return Utils::EqualsIgnoreCaseAscii(Utils::Path::FileNameOf(normalized),
                            filter.pattern);
                    case PathFilterKind::Wildcard: {
                        std::string pattern;
                        if (!Utils::Path::NormalizePath(filter.pattern, pattern)) {
                            return false;
                        }
                        return Utils::Path::GlobMatch(pattern, normalized);
                    }
                    }
                }
                catch (const std::bad_alloc&) {
                    JG_LOG_WARN(LOG_CATEGORY, L"MatchesPath: out of memory");
                }
                return false;
            }

            bool MatchesString(const StringFilter& filter, std::string_view value) noexcept {
                switch (filter.kind) {
                case StringFilterKind::Equals:     return value == filter.pattern;
                case StringFilterKind::StartsWith: return StartsWith(value, filter.pattern);
                case StringFilterKind::EndsWith:   return EndsWith(value, filter.pattern);
                case StringFilterKind::Contains:   return value.find(filter.pattern) != std::string_view::npos;
                case StringFilterKind::Regex:      return RegexSearch(filter.pattern, value);
                }
                return false;
            }

            bool MatchesCommandLine(const std::vector<StringFilter>& filters,
                CommandLineMode mode,
                const std::vector<std::string>& tokens) noexcept {
                if (mode == CommandLineMode::Positional) {
                    if (filters.size() != tokens.size()) {
                        return false;
                    }
                    for (size_t i = 0; i < filters.size(); ++i) {
                        if (!MatchesString(filters[i], tokens[i])) {
                            return false;
                        }
                    }
                    return true;
                }

                for (const auto& filter : filters) {
                    if (!MatchesAnyToken(filter, tokens)) {
                        return false;
                    }
                }
                return true;
            }

            bool MatchesHash(const std::vector<HashFilter>& filters, const Hash& hash) noexcept {
                for (const auto& entry : filters) {
                    if (!entry.sha1 && !entry.sha256) {
                        continue;
                    }
                    if (entry.sha1 && !Utils::EqualsIgnoreCaseAscii(*entry.sha1, hash.sha1)) {
                        continue;
                    }
                    if (entry.sha256 && !Utils::EqualsIgnoreCaseAscii(*entry.sha256, hash.sha256)) {
                        continue;
                    }
                    return true;
                }
                return false;
            }

            bool MatchesSignature(const SignatureFilter& filter, const Signature& signature) noexcept {
                if (!filter.checkAuthenticode) {
                    return true;
                }
                return signature.status == SignatureStatus::Valid;
            }

            bool Matches(const ApplicationFilter& filter, const ApplicationIdentity& identity) noexcept {
                if (!MatchesPath(filter.path, identity.path)) {
                    return false;
                }
                if (filter.workingDirectory &&
                    !MatchesPath(*filter.workingDirectory, identity.workingDirectory)) {
                    return false;
                }
                if (filter.commandLine &&
                    !MatchesCommandLine(*filter.commandLine, filter.commandLineMode, identity.commandLine)) {
                    return false;
                }
                if (filter.hashes && !MatchesHash(*filter.hashes, identity.hash)) {
                    return false;
                }
                if (filter.signature && !MatchesSignature(*filter.signature, identity.signature)) {
                    return false;
                }
                return true;
            }

        } // namespace FilterMatcher
    } // namespace Policy
} // namespace JitGuard
