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

#include "../src/Utils/PathUtils.hpp"

#include <string>

using namespace JitGuard::Utils::Path;

TEST(PathUtilsTests, NormalizeLowersAndUnifiesSeparators) {
    std::string out;
    ASSERT_TRUE(NormalizePath("C:\\Windows\\System32\\Notepad.EXE", out));
    EXPECT_EQ(out, "c:/windows/system32/notepad.exe");
}

TEST(PathUtilsTests, NormalizeStripsTrailingAndRepeatedSeparators) {
    std::string out;
    ASSERT_TRUE(NormalizePath("C:\\Windows\\\\System32\\", out));
    EXPECT_EQ(out, "c:/windows/system32");
}

TEST(PathUtilsTests, NormalizeResolvesDotSegments) {
    std::string out;
    ASSERT_TRUE(NormalizePath("C:\\Program Files\\.\\Vendor\\..\\Tool\\tool.exe", out));
    EXPECT_EQ(out, "c:/program files/tool/tool.exe");
}

TEST(PathUtilsTests, NormalizeRejectsTraversalAboveRoot) {
    std::string out = "stale";
    EXPECT_FALSE(NormalizePath("C:\\..\\Windows", out));
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(NormalizePath("..\\secret", out));
}

TEST(PathUtilsTests, NormalizeEmptyIsEmpty) {
    std::string out = "x";
    EXPECT_TRUE(NormalizePath("", out));
    EXPECT_TRUE(out.empty());
}

TEST(PathUtilsTests, FileNameOfReturnsLastSegment) {
    EXPECT_EQ(FileNameOf("c:/windows/regedit.exe"), "regedit.exe");
    EXPECT_EQ(FileNameOf("regedit.exe"), "regedit.exe");
}

TEST(PathUtilsTests, GlobMatchSemantics) {
    EXPECT_TRUE(GlobMatch("c:/windows/*.exe", "c:/windows/system32/cmd.exe"));
    EXPECT_TRUE(GlobMatch("*", "anything/at/all"));
    EXPECT_TRUE(GlobMatch("c:/tools/app?.exe", "c:/tools/app1.exe"));
    EXPECT_FALSE(GlobMatch("c:/tools/app?.exe", "c:/tools/app12.exe"));
    EXPECT_FALSE(GlobMatch("c:/windows/*.exe", "d:/windows/cmd.exe"));
    EXPECT_TRUE(GlobMatch("", ""));
    EXPECT_FALSE(GlobMatch("", "x"));
}
