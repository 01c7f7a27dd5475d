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
#include <gtest/gtest.h>

#include <string>

#include "../src/Policy/FilterMatcher.hpp"
#include "TestSupport.hpp"

using namespace JitGuard::Policy;
using JitGuard::Testing::MakeIdentity;
using JitGuard::Testing::MakeUser;

namespace {
    PathFilter Path(PathFilterKind kind, std::string pattern) {
        PathFilter filter;
        filter.kind = kind;
        filter.pattern = std::move(pattern);
        return filter;
    }

    StringFilter Str(StringFilterKind kind, std::string pattern) {
        StringFilter filter;
        filter.kind = kind;
        filter.pattern = std::move(pattern);
        return filter;
    }
}

// ============================================================================
// PATH
// ============================================================================

TEST(FilterMatcherTests, PathEqualsIsCaseAndSeparatorInsensitive) {
    const auto filter = Path(PathFilterKind::Equals, "C:\\Windows\\regedit.exe");
    EXPECT_TRUE(FilterMatcher::MatchesPath(filter, "c:/WINDOWS/regedit.exe"));
    EXPECT_TRUE(FilterMatcher::MatchesPath(filter, "C:\\Windows\\Temp\\..\\regedit.exe"));
    EXPECT_FALSE(FilterMatcher::MatchesPath(filter, "C:\\Windows\\System32\\regedit.exe"));
}

TEST(FilterMatcherTests, PathFileNameComparesLastSegmentOnly) {
    const auto filter = Path(PathFilterKind::FileName, "REGEDIT.EXE");
    EXPECT_TRUE(FilterMatcher::MatchesPath(filter, "C:\\Windows\\regedit.exe"));
    EXPECT_TRUE(FilterMatcher::MatchesPath(filter, "D:\\Portable\\RegEdit.exe"));
    EXPECT_FALSE(FilterMatcher::MatchesPath(filter, "C:\\Windows\\regedit.exe.bak"));
}

TEST(FilterMatcherTests, PathWildcardCrossesSeparators) {
    const auto filter = Path(PathFilterKind::Wildcard, "C:\\Program Files\\*\\setup?.exe");
    EXPECT_TRUE(FilterMatcher::MatchesPath(filter, "C:\\Program Files\\Vendor\\Tool\\setup1.exe"));
    EXPECT_FALSE(FilterMatcher::MatchesPath(filter, "C:\\Program Files\\Vendor\\setup.exe"));
}

TEST(FilterMatcherTests, PathTraversalAboveRootNeverMatches) {
    EXPECT_FALSE(FilterMatcher::MatchesPath(Path(PathFilterKind::Wildcard, "*"), "C:\\..\\evil.exe"));
    EXPECT_FALSE(FilterMatcher::MatchesPath(Path(PathFilterKind::FileName, "evil.exe"), "C:\\..\\evil.exe"));
}

TEST(FilterMatcherTests, EmptyPathPatternNeverMatches) {
    EXPECT_FALSE(FilterMatcher::MatchesPath(Path(PathFilterKind::Equals, ""), ""));
    EXPECT_FALSE(FilterMatcher::MatchesPath(Path(PathFilterKind::FileName, ""), "C:\\x.exe"));
}

// ============================================================================
// STRINGS / COMMAND LINE
// ============================================================================

TEST(FilterMatcherTests, StringFilterKinds) {
    EXPECT_TRUE(FilterMatcher::MatchesString(Str(StringFilterKind::Equals, "/s"), "/s"));
    EXPECT_FALSE(FilterMatcher::MatchesString(Str(StringFilterKind::Equals, "/s"), "/S"));
    EXPECT_TRUE(FilterMatcher::MatchesString(Str(StringFilterKind::StartsWith, "--out="), "--out=C:\\x"));
    EXPECT_TRUE(FilterMatcher::MatchesString(Str(StringFilterKind::EndsWith, ".reg"), "import.reg"));
    EXPECT_FALSE(FilterMatcher::MatchesString(Str(StringFilterKind::EndsWith, ".reg"), "reg"));
    EXPECT_TRUE(FilterMatcher::MatchesString(Str(StringFilterKind::Contains, "admin"), "sysadmin-tool"));
    EXPECT_TRUE(FilterMatcher::MatchesString(Str(StringFilterKind::Regex, "^-[a-z]$"), "-v"));
    EXPECT_FALSE(FilterMatcher::MatchesString(Str(StringFilterKind::Regex, "^-[a-z]$"), "-vv"));
}

TEST(FilterMatcherTests, InvalidRegexMatchesNothing) {
    EXPECT_FALSE(FilterMatcher::MatchesString(Str(StringFilterKind::Regex, "(["), "(["));
    EXPECT_FALSE(FilterMatcher::MatchesString(Str(StringFilterKind::Regex, "(["), ""));
}

TEST(FilterMatcherTests, BacktrackingRegexPatternsAreRefused) {
    std::wstring reason;
    EXPECT_FALSE(FilterMatcher::ValidateRegexPattern("^(a|b)*$", &reason));
    EXPECT_FALSE(reason.empty());
    EXPECT_FALSE(FilterMatcher::ValidateRegexPattern("(a+)+$"));
    EXPECT_FALSE(FilterMatcher::ValidateRegexPattern("^([a-z]+)*x"));
    EXPECT_FALSE(FilterMatcher::ValidateRegexPattern("((a)+)+"));
    EXPECT_FALSE(FilterMatcher::ValidateRegexPattern("a**"));
    EXPECT_FALSE(FilterMatcher::ValidateRegexPattern("a*b*c*d*e*f*"));
    EXPECT_FALSE(FilterMatcher::ValidateRegexPattern("((((a))))"));
    EXPECT_FALSE(FilterMatcher::ValidateRegexPattern(std::string(513, 'a')));
    EXPECT_FALSE(FilterMatcher::ValidateRegexPattern("(["));

    EXPECT_TRUE(FilterMatcher::ValidateRegexPattern("^-[a-z]$"));
    EXPECT_TRUE(FilterMatcher::ValidateRegexPattern("^(/s|/v)$"));
    EXPECT_TRUE(FilterMatcher::ValidateRegexPattern("^--out=[^|*+]+\\.reg$"));
    EXPECT_TRUE(FilterMatcher::ValidateRegexPattern("^(?:ab)+c{2,3}?$"));
    EXPECT_TRUE(FilterMatcher::ValidateRegexPattern("^\\d+\\.\\d+$"));
}

TEST(FilterMatcherTests, RefusedRegexMatchesNothing) {
    const auto filter = Str(StringFilterKind::Regex, "^(a|b)*$");
    EXPECT_FALSE(FilterMatcher::MatchesString(filter, "abba"));
    EXPECT_FALSE(FilterMatcher::MatchesString(filter, std::string(200000, 'a')));
}

TEST(FilterMatcherTests, OverlongValueNeverMatchesRegex) {
    const auto filter = Str(StringFilterKind::Regex, "^a+$");
    EXPECT_TRUE(FilterMatcher::MatchesString(filter, "aaa"));
    EXPECT_TRUE(FilterMatcher::MatchesString(filter, std::string(FilterMatcher::MAX_REGEX_SUBJECT_LENGTH, 'a')));
    EXPECT_FALSE(FilterMatcher::MatchesString(filter, std::string(FilterMatcher::MAX_REGEX_SUBJECT_LENGTH + 1, 'a')));
    EXPECT_FALSE(FilterMatcher::MatchesString(filter, std::string(200000, 'a')));

    // Other string kinds are unaffected by the cap
    EXPECT_TRUE(FilterMatcher::MatchesString(Str(StringFilterKind::StartsWith, "aa"), std::string(200000, 'a')));
}

TEST(FilterMatcherTests, AnyTokenModeNeedsEveryFilterSatisfied) {
    const std::vector<StringFilter> filters{
        Str(StringFilterKind::Equals, "-a"),
        Str(StringFilterKind::StartsWith, "--out=")
    };
    EXPECT_TRUE(FilterMatcher::MatchesCommandLine(filters, CommandLineMode::AnyToken,
        { "tool.exe", "--out=log.txt", "-a" }));
    EXPECT_FALSE(FilterMatcher::MatchesCommandLine(filters, CommandLineMode::AnyToken,
        { "tool.exe", "-a" }));
    EXPECT_TRUE(FilterMatcher::MatchesCommandLine({}, CommandLineMode::AnyToken, { "tool.exe" }));
}

TEST(FilterMatcherTests, PositionalModeMatchesTokenByToken) {
    const std::vector<StringFilter> filters{
        Str(StringFilterKind::EndsWith, "tool.exe"),
        Str(StringFilterKind::Equals, "-a")
    };
    EXPECT_TRUE(FilterMatcher::MatchesCommandLine(filters, CommandLineMode::Positional,
        { "C:\\bin\\tool.exe", "-a" }));
    EXPECT_FALSE(FilterMatcher::MatchesCommandLine(filters, CommandLineMode::Positional,
        { "-a", "C:\\bin\\tool.exe" }));
    EXPECT_FALSE(FilterMatcher::MatchesCommandLine(filters, CommandLineMode::Positional,
        { "C:\\bin\\tool.exe", "-a", "-b" }));
}

// ============================================================================
// HASH / SIGNATURE
// ============================================================================

TEST(FilterMatcherTests, HashFilterSemantics) {
    Hash hash;
    hash.sha1 = "da39a3ee5e6b4b0d3255bfef95601890afd80709";
    hash.sha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    HashFilter upperSha1;
    upperSha1.sha1 = "DA39A3EE5E6B4B0D3255BFEF95601890AFD80709";
    EXPECT_TRUE(FilterMatcher::MatchesHash({ upperSha1 }, hash));

    HashFilter bothWrong256 = upperSha1;
    bothWrong256.sha256 = std::string(64, '0');
    EXPECT_FALSE(FilterMatcher::MatchesHash({ bothWrong256 }, hash));

    // OR across entries; an entry with no fields is ignored
    EXPECT_TRUE(FilterMatcher::MatchesHash({ HashFilter{}, bothWrong256, upperSha1 }, hash));
    EXPECT_FALSE(FilterMatcher::MatchesHash({ HashFilter{} }, hash));
    EXPECT_FALSE(FilterMatcher::MatchesHash({}, hash));
}

TEST(FilterMatcherTests, SignatureCheckRequiresValidStatus) {
    Signature signature;
    signature.status = SignatureStatus::NotTrusted;
    EXPECT_TRUE(FilterMatcher::MatchesSignature(SignatureFilter{ false }, signature));
    EXPECT_FALSE(FilterMatcher::MatchesSignature(SignatureFilter{ true }, signature));
    signature.status = SignatureStatus::Valid;
    EXPECT_TRUE(FilterMatcher::MatchesSignature(SignatureFilter{ true }, signature));
}

// ============================================================================
// COMPOSITE
// ============================================================================

TEST(FilterMatcherTests, AbsentDimensionsAlwaysMatch) {
    const auto identity = MakeIdentity("C:\\Windows\\regedit.exe", MakeUser("alice", "S-1-5-21-1000-1001"));
    ApplicationFilter filter;
    filter.path = Path(PathFilterKind::FileName, "regedit.exe");
    EXPECT_TRUE(FilterMatcher::Matches(filter, identity));
}

TEST(FilterMatcherTests, EveryPresentDimensionMustMatch) {
    auto identity = MakeIdentity("C:\\Windows\\regedit.exe", MakeUser("alice", "S-1-5-21-1000-1001"),
        { "regedit.exe", "/s", "import.reg" });
    identity.workingDirectory = "C:\\Users\\alice\\Documents";

    ApplicationFilter filter;
    filter.path = Path(PathFilterKind::FileName, "regedit.exe");
    filter.workingDirectory = Path(PathFilterKind::Wildcard, "C:\\Users\\*");
    filter.commandLine = std::vector<StringFilter>{ Str(StringFilterKind::Equals, "/s") };
    HashFilter sha;
    sha.sha256 = identity.hash.sha256;
    filter.hashes = std::vector<HashFilter>{ sha };
    filter.signature = SignatureFilter{ true };
    EXPECT_TRUE(FilterMatcher::Matches(filter, identity));

    auto otherDir = identity;
    otherDir.workingDirectory = "D:\\Shared";
    EXPECT_FALSE(FilterMatcher::Matches(filter, otherDir));

    auto unsignedTarget = identity;
    unsignedTarget.signature.status = SignatureStatus::NotSigned;
    EXPECT_FALSE(FilterMatcher::Matches(filter, unsignedTarget));

    auto noSwitch = identity;
    noSwitch.commandLine = { "regedit.exe", "import.reg" };
    EXPECT_FALSE(FilterMatcher::Matches(filter, noSwitch));
}
