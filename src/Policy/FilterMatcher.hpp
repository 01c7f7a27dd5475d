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
 * ============================================================================
 * JitGuard Filter Matcher
 * ============================================================================
 *
 * @file FilterMatcher.hpp
 * @brief Evaluates an ApplicationFilter against an ApplicationIdentity.
 *
 * Every function is pure and total: malformed paths, invalid regular
 * expressions and allocation failures all produce "no match", never an
 * exception.
 *
 * Dimension semantics:
 *  - Path / WorkingDirectory: normalized, case-insensitive
 *  - CommandLine (AnyToken): each filter needs at least one satisfying token
 *  - CommandLine (Positional): counts equal, filter i matches token i
 *  - Hashes: OR across entries, AND across the fields present in one entry
 *  - Signature: CheckAuthenticode requires status Valid
 *
 * Regex filters run through a compiled-pattern cache. Patterns prone to
 * catastrophic backtracking are refused (see ValidateRegexPattern), and a
 * value longer than MAX_REGEX_SUBJECT_LENGTH never matches a regex filter.
 * ============================================================================
 */

#include "PolicyTypes.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace JitGuard {
    namespace Policy {
        namespace FilterMatcher {

            constexpr size_t MAX_REGEX_SUBJECT_LENGTH = 1024;

            [[nodiscard]] bool Matches(const ApplicationFilter& filter,
                                       const ApplicationIdentity& identity) noexcept;

            [[nodiscard]] bool MatchesPath(const PathFilter& filter, std::string_view path) noexcept;

            [[nodiscard]] bool MatchesString(const StringFilter& filter, std::string_view value) noexcept;

            [[nodiscard]] bool MatchesCommandLine(const std::vector<StringFilter>& filters,
                                                  CommandLineMode mode,
                                                  const std::vector<std::string>& tokens) noexcept;

            /**
             * @brief Accepts a regex filter pattern only when it is safe to run on caller input.
             *
             * Refuses patterns over 512 bytes, more than 5 quantifiers, groups nested deeper
             * than 3, consecutive quantifiers, a quantified group that itself contains a
             * quantifier or an alternation, and anything std::regex cannot compile.
             *
             * @param reason Receives a short description of the refusal.
             */
            [[nodiscard]] bool ValidateRegexPattern(std::string_view pattern, std::wstring* reason = nullptr);

            [[nodiscard]] bool MatchesHash(const std::vector<HashFilter>& filters, const Hash& hash) noexcept;

            [[nodiscard]] bool MatchesSignature(const SignatureFilter& filter,
                                                const Signature& signature) noexcept;

        } // namespace FilterMatcher
    } // namespace Policy
} // namespace JitGuard
