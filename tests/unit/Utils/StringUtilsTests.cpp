/*
 * TrackShield - Tracker Blocking Engine
 * Copyright (C) 2026 TrackShield Project
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
#include "../../../src/Utils/StringUtils.hpp"
#include "../../../src/Utils/HashUtils.hpp"

#include <string>
#include <vector>

using namespace TrackShield::Utils;

class StringUtilsTest : public ::testing::Test {
};

// ============================================================================
// Case and trimming
// ============================================================================

TEST_F(StringUtilsTest, ToLower_AsciiOnly) {
    std::string s = "HTTPS://Tracker.COM/Path";
    StringUtils::ToLower(s);
    EXPECT_EQ(s, "https://tracker.com/path");
    EXPECT_EQ(StringUtils::ToLowerCopy("MiXeD-123"), "mixed-123");

    // Bytes outside ASCII pass through untouched
    EXPECT_EQ(StringUtils::ToLowerCopy("\xC3\x84"), "\xC3\x84");
}

TEST_F(StringUtilsTest, Trim_Variants) {
    std::string s = " \t value \r\n";
    StringUtils::Trim(s);
    EXPECT_EQ(s, "value");

    std::string left = "  left  ";
    StringUtils::TrimLeft(left);
    EXPECT_EQ(left, "left  ");

    std::string right = "  right  ";
    StringUtils::TrimRight(right);
    EXPECT_EQ(right, "  right");

    EXPECT_EQ(StringUtils::TrimCopy("\f x \v"), "x");
    EXPECT_EQ(StringUtils::TrimView("   "), "");
    EXPECT_EQ(StringUtils::TrimView(""), "");
}

TEST_F(StringUtilsTest, Compare) {
    EXPECT_TRUE(StringUtils::IEquals("Example.COM", "example.com"));
    EXPECT_FALSE(StringUtils::IEquals("example.com", "example.co"));
    EXPECT_TRUE(StringUtils::StartsWith("||tracker.com^", "||"));
    EXPECT_FALSE(StringUtils::StartsWith("|", "||"));
    EXPECT_TRUE(StringUtils::EndsWith("||tracker.com^", "^"));
    EXPECT_FALSE(StringUtils::EndsWith("", "^"));
}

// ============================================================================
// Split / Join / Truncate
// ============================================================================

TEST_F(StringUtilsTest, Split_KeepsEmptyPieces) {
    const auto parts = StringUtils::Split("a,,b,", ",");
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
    EXPECT_EQ(parts[3], "");

    EXPECT_TRUE(StringUtils::Split("", ",").empty());
    EXPECT_EQ(StringUtils::Split("abc", "").size(), 1u);
}

TEST_F(StringUtilsTest, Join) {
    EXPECT_EQ(StringUtils::Join({ "a", "b", "c" }, ", "), "a, b, c");
    EXPECT_EQ(StringUtils::Join({}, ","), "");
    EXPECT_EQ(StringUtils::Join({ "only" }, ","), "only");
}

TEST_F(StringUtilsTest, Truncate_PlainCut) {
    const std::string url = "https://example.com/" + std::string(200, 'x');
    const std::string cut = StringUtils::Truncate(url, 100);
    EXPECT_EQ(cut.size(), 100u);
    EXPECT_EQ(cut, url.substr(0, 100));
    EXPECT_EQ(StringUtils::Truncate("short", 100), "short");
}

TEST_F(StringUtilsTest, Truncate_KeepsUtf8SequencesWhole) {
    // U+00E9 is C3 A9, U+20AC is E2 82 AC
    const std::string text = "ab\xC3\xA9" "cd\xE2\x82\xAC";
    EXPECT_EQ(StringUtils::Truncate(text, 3), "ab");
    EXPECT_EQ(StringUtils::Truncate(text, 4), "ab\xC3\xA9");
    EXPECT_EQ(StringUtils::Truncate(text, 7), "ab\xC3\xA9" "cd");
    EXPECT_EQ(StringUtils::Truncate(text, 8), "ab\xC3\xA9" "cd");
    EXPECT_EQ(StringUtils::Truncate(text, 9), text);
    EXPECT_EQ(StringUtils::Truncate("\xC3\xA9", 1), "");
}

// ============================================================================
// Hashing
// ============================================================================

TEST_F(StringUtilsTest, Fnv1a_KnownVectors) {
    EXPECT_EQ(HashUtils::Fnv1a64(std::string_view("")), 0xCBF29CE484222325ULL);
    EXPECT_EQ(HashUtils::Fnv1a64(std::string_view("a")), 0xAF63DC4C8601EC8CULL);
    EXPECT_EQ(HashUtils::Fnv1a32("a", 1), 0xE40C292Cu);
    EXPECT_NE(HashUtils::Mix64(1), HashUtils::Mix64(2));
}
