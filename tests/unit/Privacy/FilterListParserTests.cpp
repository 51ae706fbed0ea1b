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
#include "../../../src/Privacy/FilterListParser.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace TrackShield::Privacy;
namespace fs = std::filesystem;

class FilterListParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = fs::temp_directory_path() /
            ("trackshield_filterlist_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        std::error_code ec;
        fs::create_directories(testDir, ec);
        ASSERT_FALSE(ec) << "Failed to create test directory: " << ec.message();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    fs::path WriteFile(const std::string& name, const std::string& content) {
        const fs::path path = testDir / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    fs::path testDir;
};

// ============================================================================
// EasyList syntax
// ============================================================================

TEST_F(FilterListParserTest, Parse_EasyListRules) {
    const auto result = ParseFilterList(
        "[Adblock Plus 2.0]\n"
        "! Title: EasyPrivacy\n"
        "||google-analytics.com^\n"
        "*://*.hotjar.com/*\n"
        "/pixel.gif\n");

    ASSERT_EQ(result.patterns.size(), 3u);
    EXPECT_EQ(result.patterns[0], "||google-analytics.com^");
    EXPECT_EQ(result.patterns[1], "*://*.hotjar.com/*");
    EXPECT_EQ(result.patterns[2], "/pixel.gif");
    EXPECT_EQ(result.stats.totalLines, 5u);
    EXPECT_EQ(result.stats.comments, 2u);
    EXPECT_EQ(result.stats.rules, 3u);
}

TEST_F(FilterListParserTest, Parse_SkipsExceptionsCosmeticAndOptions) {
    const auto result = ParseFilterList(
        "@@||allowed.com^\n"
        "example.com##.ad-banner\n"
        "example.com#@#.sponsor\n"
        "example.com#?#div:-abp-has(.ad)\n"
        "example.com#$#abort-on-property-read ads\n"
        "||ads.net^$third-party\n"
        "/banner[0-9]+/\n"
        "||kept.com^\n");

    ASSERT_EQ(result.patterns.size(), 1u);
    EXPECT_EQ(result.patterns[0], "||kept.com^");
    EXPECT_EQ(result.stats.exceptions, 1u);
    EXPECT_EQ(result.stats.cosmetic, 4u);
    EXPECT_EQ(result.stats.unsupported, 2u);
}

TEST_F(FilterListParserTest, Parse_TrimsAndHandlesCrLf) {
    const auto result = ParseFilterList("  ||a.com^  \r\n\r\n\t||b.com^\r\n");
    ASSERT_EQ(result.patterns.size(), 2u);
    EXPECT_EQ(result.patterns[0], "||a.com^");
    EXPECT_EQ(result.patterns[1], "||b.com^");
}

TEST_F(FilterListParserTest, Parse_EmptyInput) {
    const auto result = ParseFilterList("");
    EXPECT_TRUE(result.patterns.empty());
    EXPECT_EQ(result.stats.totalLines, 0u);
}

// ============================================================================
// Hosts files
// ============================================================================

TEST_F(FilterListParserTest, Parse_HostsFile) {
    const auto result = ParseFilterList(
        "# hosts blocklist\n"
        "127.0.0.1 localhost\n"
        "::1 ip6-localhost ip6-loopback\n"
        "0.0.0.0 Tracker.Example.com\n"
        "0.0.0.0\tads.one.net ads.two.net # inline comment\n"
        "127.0.0.1 metrics.site.org\n");

    ASSERT_EQ(result.patterns.size(), 4u);
    EXPECT_EQ(result.patterns[0], "||tracker.example.com^");
    EXPECT_EQ(result.patterns[1], "||ads.one.net^");
    EXPECT_EQ(result.patterns[2], "||ads.two.net^");
    EXPECT_EQ(result.patterns[3], "||metrics.site.org^");
    EXPECT_EQ(result.stats.hostsEntries, 4u);
    EXPECT_EQ(result.stats.comments, 3u);
}

TEST_F(FilterListParserTest, Parse_HostsInvalidNamesSkipped) {
    const auto result = ParseFilterList("0.0.0.0 bad_host-.com -lead.com good.com\n");
    ASSERT_EQ(result.patterns.size(), 1u);
    EXPECT_EQ(result.patterns[0], "||good.com^");
}

// ============================================================================
// Files
// ============================================================================

TEST_F(FilterListParserTest, LoadFile_Success) {
    const auto path = WriteFile("easyprivacy.txt", "! comment\n||tracker.com^\n0.0.0.0 ads.net\n");

    FilterListParseResult result;
    FilterListError err;
    ASSERT_TRUE(LoadFilterListFile(path, result, &err)) << err.message;
    ASSERT_EQ(result.patterns.size(), 2u);
    EXPECT_EQ(result.patterns[1], "||ads.net^");
    EXPECT_TRUE(err.message.empty());
}

TEST_F(FilterListParserTest, LoadFile_MissingFile) {
    FilterListParseResult result;
    FilterListError err;
    EXPECT_FALSE(LoadFilterListFile(testDir / "missing.txt", result, &err));
    EXPECT_FALSE(err.message.empty());
    EXPECT_EQ(err.path, testDir / "missing.txt");
    EXPECT_TRUE(result.patterns.empty());
}

TEST_F(FilterListParserTest, LoadFile_Directory) {
    FilterListParseResult result;
    EXPECT_FALSE(LoadFilterListFile(testDir, result));
}

TEST_F(FilterListParserTest, Stats_ToJson) {
    const auto result = ParseFilterList("||a.com^\n! c\n");
    const std::string json = result.stats.ToJson();
    EXPECT_NE(json.find("\"rules\":1"), std::string::npos);
    EXPECT_NE(json.find("\"comments\":1"), std::string::npos);
}
