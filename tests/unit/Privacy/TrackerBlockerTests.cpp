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
#include "../../../src/Privacy/TrackerBlocker.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace TrackShield::Privacy;
using TrackShield::Matcher::PatternKind;
namespace fs = std::filesystem;

class TrackerBlockerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = fs::temp_directory_path() /
            ("trackshield_blocker_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        std::error_code ec;
        fs::create_directories(testDir, ec);
        ASSERT_FALSE(ec) << "Failed to create test directory: " << ec.message();
    }

    void TearDown() override {
        blocker.Shutdown();
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    fs::path WriteList(const std::string& name, const std::string& content) {
        const fs::path path = testDir / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    TrackerBlocker blocker;
    fs::path testDir;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(TrackerBlockerTest, Initialize_Defaults) {
    EXPECT_EQ(blocker.GetStatus(), ModuleStatus::Uninitialized);
    ASSERT_TRUE(blocker.Initialize());
    EXPECT_TRUE(blocker.IsInitialized());
    EXPECT_TRUE(blocker.IsEnabled());
    EXPECT_EQ(blocker.GetStatus(), ModuleStatus::Running);
    EXPECT_EQ(blocker.GetStatistics().matcher.patterns, blocker.GetBlocklist().size());

    // Second call is a no-op
    EXPECT_TRUE(blocker.Initialize());
}

TEST_F(TrackerBlockerTest, Initialize_InvalidConfig) {
    TrackerBlockerConfiguration config;
    config.maxCustomRuleLength = 0;
    EXPECT_FALSE(blocker.Initialize(config));
    EXPECT_EQ(blocker.GetStatus(), ModuleStatus::Error);
    EXPECT_FALSE(blocker.ShouldBlock("https://google-analytics.com/collect"));

    config = {};
    config.matcher.falsePositiveRate = 0.9;
    EXPECT_FALSE(blocker.Initialize(config));
}

TEST_F(TrackerBlockerTest, Uninitialized_AllowsEverything) {
    const auto result = blocker.CheckRequest("https://google-analytics.com/collect");
    EXPECT_FALSE(result.IsBlocked());
    EXPECT_EQ(result.reason, "Blocker not initialized");
    EXPECT_FALSE(blocker.AddCustomRule("||tracker.com^"));
    EXPECT_FALSE(blocker.AddToBlocklist("||tracker.com^"));
    EXPECT_EQ(blocker.GetStatistics().totalRequests, 0u);
}

TEST_F(TrackerBlockerTest, Shutdown_StopsBlocking) {
    ASSERT_TRUE(blocker.Initialize());
    ASSERT_TRUE(blocker.AddCustomRule("||custom-tracker.io^"));
    blocker.Shutdown();

    EXPECT_EQ(blocker.GetStatus(), ModuleStatus::Stopped);
    EXPECT_FALSE(blocker.IsInitialized());
    EXPECT_FALSE(blocker.ShouldBlock("https://google-analytics.com/collect"));
    EXPECT_TRUE(blocker.GetCustomRules().empty());

    // Restartable
    ASSERT_TRUE(blocker.Initialize());
    EXPECT_TRUE(blocker.ShouldBlock("https://google-analytics.com/collect"));
    EXPECT_FALSE(blocker.ShouldBlock("https://cdn.custom-tracker.io/t.js"));
}

// ============================================================================
// Default patterns
// ============================================================================

TEST_F(TrackerBlockerTest, Defaults_BlockKnownTrackers) {
    ASSERT_TRUE(blocker.Initialize());

    const auto ga = blocker.CheckRequest("https://www.google-analytics.com/collect?v=1");
    ASSERT_TRUE(ga.IsBlocked());
    EXPECT_EQ(ga.matchedPattern, "||google-analytics.com^");
    EXPECT_EQ(ga.kind, PatternKind::DomainAnchor);
    EXPECT_EQ(ga.reason, "Matched DomainAnchor pattern");

    EXPECT_TRUE(blocker.ShouldBlock("https://static.hotjar.com/c/hotjar-123.js"));
    EXPECT_TRUE(blocker.ShouldBlock("https://securepubads.g.doubleclick.net/tag/js/gpt.js"));
    EXPECT_TRUE(blocker.ShouldBlock("https://connect.facebook.net/en_US/sdk.js"));
    EXPECT_TRUE(blocker.ShouldBlock("https://b.scorecardresearch.com/beacon.js"));
}

TEST_F(TrackerBlockerTest, Defaults_AllowOrdinarySites) {
    ASSERT_TRUE(blocker.Initialize());

    const auto result = blocker.CheckRequest("https://github.com/");
    EXPECT_FALSE(result.IsBlocked());
    EXPECT_EQ(result.reason, "No pattern matched");
    EXPECT_TRUE(result.matchedPattern.empty());

    EXPECT_FALSE(blocker.ShouldBlock("https://www.google.com/search?q=analytics"));
    EXPECT_FALSE(blocker.ShouldBlock("https://facebook.net.example.org/"));
    EXPECT_FALSE(blocker.ShouldBlock("https://nothotjar.com/"));
}

TEST_F(TrackerBlockerTest, Defaults_Disabled) {
    TrackerBlockerConfiguration config;
    config.useDefaultPatterns = false;
    ASSERT_TRUE(blocker.Initialize(config));
    EXPECT_FALSE(blocker.ShouldBlock("https://google-analytics.com/collect"));
    EXPECT_EQ(blocker.GetStatistics().matcher.patterns, 0u);
}

TEST_F(TrackerBlockerTest, GetBlocklist) {
    const auto list = TrackerBlocker::GetDefaultPatterns();
    EXPECT_EQ(list.size(), 33u);
    EXPECT_EQ(blocker.GetBlocklist(), list);
    EXPECT_NE(std::find(list.begin(), list.end(), "||doubleclick.net^"), list.end());
    EXPECT_NE(std::find(list.begin(), list.end(), "*://*.hotjar.com/*"), list.end());
}

TEST_F(TrackerBlockerTest, SetEnabled) {
    ASSERT_TRUE(blocker.Initialize());
    blocker.SetEnabled(false);
    EXPECT_FALSE(blocker.IsEnabled());

    const auto result = blocker.CheckRequest("https://google-analytics.com/collect");
    EXPECT_FALSE(result.IsBlocked());
    EXPECT_EQ(result.reason, "Blocking disabled");

    blocker.SetEnabled(true);
    EXPECT_TRUE(blocker.ShouldBlock("https://google-analytics.com/collect"));
}

TEST_F(TrackerBlockerTest, Initialize_StartsDisabled) {
    TrackerBlockerConfiguration config;
    config.enabled = false;
    ASSERT_TRUE(blocker.Initialize(config));
    EXPECT_FALSE(blocker.IsEnabled());
    EXPECT_FALSE(blocker.ShouldBlock("https://google-analytics.com/collect"));
}

// ============================================================================
// Custom rules
// ============================================================================

TEST_F(TrackerBlockerTest, CustomRule_AddAndRemove) {
    ASSERT_TRUE(blocker.Initialize());
    EXPECT_FALSE(blocker.ShouldBlock("https://cdn.custom-tracker.io/t.js"));

    ASSERT_TRUE(blocker.AddCustomRule("||custom-tracker.io^"));
    EXPECT_TRUE(blocker.ShouldBlock("https://cdn.custom-tracker.io/t.js"));
    ASSERT_EQ(blocker.GetCustomRules().size(), 1u);
    EXPECT_EQ(blocker.GetCustomRules()[0], "||custom-tracker.io^");

    EXPECT_TRUE(blocker.RemoveCustomRule("||custom-tracker.io^"));
    EXPECT_FALSE(blocker.ShouldBlock("https://cdn.custom-tracker.io/t.js"));
    EXPECT_TRUE(blocker.GetCustomRules().empty());
    EXPECT_FALSE(blocker.RemoveCustomRule("||custom-tracker.io^"));
}

TEST_F(TrackerBlockerTest, CustomRule_LengthLimit) {
    ASSERT_TRUE(blocker.Initialize());

    const std::string atLimit = "/track/" + std::string(193, 'x');
    const std::string overLimit = "/track/" + std::string(194, 'x');
    ASSERT_EQ(atLimit.size(), 200u);
    ASSERT_EQ(overLimit.size(), 201u);

    EXPECT_TRUE(blocker.AddCustomRule(atLimit));
    EXPECT_FALSE(blocker.AddCustomRule(overLimit));
    EXPECT_FALSE(blocker.AddCustomRule(""));
    EXPECT_FALSE(blocker.AddCustomRule("   "));
    EXPECT_EQ(blocker.GetCustomRules().size(), 1u);
}

TEST_F(TrackerBlockerTest, CustomRule_Duplicate) {
    ASSERT_TRUE(blocker.Initialize());
    EXPECT_TRUE(blocker.AddCustomRule("/beacon/"));
    EXPECT_FALSE(blocker.AddCustomRule("/beacon/"));
    EXPECT_EQ(blocker.GetCustomRules().size(), 1u);
}

TEST_F(TrackerBlockerTest, CustomRule_RejectedByCompiler) {
    ASSERT_TRUE(blocker.Initialize());
    EXPECT_FALSE(blocker.AddCustomRule("***"));
    EXPECT_TRUE(blocker.GetCustomRules().empty());
}

TEST_F(TrackerBlockerTest, CustomRule_SameAsDefaultKeepsDefault) {
    ASSERT_TRUE(blocker.Initialize());
    EXPECT_TRUE(blocker.AddCustomRule("||hotjar.com^"));
    EXPECT_TRUE(blocker.RemoveCustomRule("||hotjar.com^"));
    EXPECT_TRUE(blocker.ShouldBlock("https://static.hotjar.com/c/hotjar.js"));
}

TEST_F(TrackerBlockerTest, CustomRule_DifferentSpellingOfDefaultKeepsDefault) {
    ASSERT_TRUE(blocker.Initialize());
    const size_t before = blocker.GetStatistics().matcher.patterns;

    EXPECT_TRUE(blocker.AddCustomRule("||GOOGLE-ANALYTICS.COM^"));
    EXPECT_FALSE(blocker.AddCustomRule("  ||google-analytics.com^"));
    EXPECT_EQ(blocker.GetStatistics().matcher.patterns, before);

    EXPECT_TRUE(blocker.RemoveCustomRule("||GOOGLE-ANALYTICS.COM^"));
    EXPECT_TRUE(blocker.GetCustomRules().empty());
    EXPECT_EQ(blocker.GetStatistics().matcher.patterns, before);

    const auto result = blocker.CheckRequest("https://www.google-analytics.com/collect");
    EXPECT_TRUE(result.IsBlocked());
    EXPECT_EQ(result.matchedPattern, "||google-analytics.com^");
}

TEST_F(TrackerBlockerTest, CustomRule_RemovalKeepsBlocklistPattern) {
    TrackerBlockerConfiguration config;
    config.useDefaultPatterns = false;
    ASSERT_TRUE(blocker.Initialize(config));

    ASSERT_TRUE(blocker.AddToBlocklist("||tracker.com^"));
    EXPECT_TRUE(blocker.AddCustomRule(" ||tracker.com^"));
    EXPECT_TRUE(blocker.RemoveCustomRule(" ||tracker.com^"));
    EXPECT_TRUE(blocker.ShouldBlock("https://tracker.com/"));

    EXPECT_TRUE(blocker.RemoveFromBlocklist("||tracker.com^"));
    EXPECT_FALSE(blocker.ShouldBlock("https://tracker.com/"));
}

TEST_F(TrackerBlockerTest, CustomRule_SharedWithFilterList) {
    TrackerBlockerConfiguration config;
    config.useDefaultPatterns = false;
    config.customRules = { "||shared-tracker.net^" };
    ASSERT_TRUE(blocker.Initialize(config));

    const auto path = WriteList("shared.txt", "||shared-tracker.net^\n");
    ASSERT_TRUE(blocker.LoadFilterListFile(path));

    EXPECT_TRUE(blocker.RemoveCustomRule("||shared-tracker.net^"));
    EXPECT_TRUE(blocker.ShouldBlock("https://cdn.shared-tracker.net/t.js"));
}

TEST_F(TrackerBlockerTest, CustomRule_OutlivesBlocklistRemoval) {
    TrackerBlockerConfiguration config;
    config.useDefaultPatterns = false;
    ASSERT_TRUE(blocker.Initialize(config));

    ASSERT_TRUE(blocker.AddToBlocklist("||tracker.com^"));
    ASSERT_TRUE(blocker.AddCustomRule("||tracker.com^"));

    EXPECT_TRUE(blocker.RemoveFromBlocklist("||tracker.com^"));
    EXPECT_TRUE(blocker.ShouldBlock("https://tracker.com/"));

    EXPECT_TRUE(blocker.RemoveCustomRule("||tracker.com^"));
    EXPECT_FALSE(blocker.ShouldBlock("https://tracker.com/"));
    EXPECT_EQ(blocker.GetStatistics().matcher.patterns, 0u);
}

TEST_F(TrackerBlockerTest, CustomRule_FromConfiguration) {
    TrackerBlockerConfiguration config;
    config.useDefaultPatterns = false;
    config.customRules = { "||cfg-tracker.com^", "||cfg-tracker.com^", "   ", "*/pixel.gif?*" };
    ASSERT_TRUE(blocker.Initialize(config));

    const auto rules = blocker.GetCustomRules();
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0], "||cfg-tracker.com^");
    EXPECT_EQ(rules[1], "*/pixel.gif?*");

    EXPECT_TRUE(blocker.ShouldBlock("https://a.cfg-tracker.com/"));
    EXPECT_TRUE(blocker.ShouldBlock("https://shop.example.org/pixel.gif?id=7"));
    EXPECT_EQ(blocker.GetConfiguration().customRules, rules);
}

// ============================================================================
// Blocklist management
// ============================================================================

TEST_F(TrackerBlockerTest, Blocklist_AddAndRemove) {
    ASSERT_TRUE(blocker.Initialize());

    EXPECT_TRUE(blocker.AddToBlocklist("||newtracker.com^"));
    EXPECT_FALSE(blocker.AddToBlocklist("||newtracker.com^"));
    EXPECT_TRUE(blocker.ShouldBlock("https://px.newtracker.com/p"));

    EXPECT_TRUE(blocker.RemoveFromBlocklist("||newtracker.com^"));
    EXPECT_FALSE(blocker.RemoveFromBlocklist("||newtracker.com^"));
    EXPECT_FALSE(blocker.ShouldBlock("https://px.newtracker.com/p"));
    EXPECT_TRUE(blocker.GetCustomRules().empty());
}

TEST_F(TrackerBlockerTest, LoadFilterListFile) {
    const auto path = WriteList("easyprivacy.txt",
        "! Title: test list\n"
        "||filter-tracker.net^\n"
        "@@||filter-tracker.net/allowed^\n"
        "example.com##.banner\n"
        "||ads.*.example^\n");

    EXPECT_FALSE(blocker.LoadFilterListFile(path));

    ASSERT_TRUE(blocker.Initialize());
    ASSERT_TRUE(blocker.LoadFilterListFile(path));
    EXPECT_TRUE(blocker.ShouldBlock("https://x.filter-tracker.net/a.js"));
    EXPECT_TRUE(blocker.ShouldBlock("https://ads.cdn.example/t"));

    EXPECT_FALSE(blocker.LoadFilterListFile(testDir / "missing.txt"));
}

TEST_F(TrackerBlockerTest, FilterLists_FromConfiguration) {
    TrackerBlockerConfiguration config;
    config.useDefaultPatterns = false;
    config.filterLists = {
        WriteList("hosts", "127.0.0.1 localhost\n0.0.0.0 hosts-tracker.org\n"),
        testDir / "missing.txt"
    };
    ASSERT_TRUE(blocker.Initialize(config));
    EXPECT_TRUE(blocker.ShouldBlock("https://hosts-tracker.org/"));
    EXPECT_FALSE(blocker.ShouldBlock("https://google-analytics.com/"));
}

// ============================================================================
// Callbacks
// ============================================================================

TEST_F(TrackerBlockerTest, Callback_ReceivesRecord) {
    ASSERT_TRUE(blocker.Initialize());

    std::vector<BlockRecord> records;
    blocker.RegisterBlockCallback([&records](const BlockRecord& record) {
        records.push_back(record);
    });

    const std::string url = "https://ad.doubleclick.net/ddm/" + std::string(200, 'q');
    EXPECT_TRUE(blocker.ShouldBlock(url));
    EXPECT_FALSE(blocker.ShouldBlock("https://github.com/"));

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].url.size(), TrackerBlockerConstants::MAX_RECORD_URL_LENGTH);
    EXPECT_EQ(records[0].url, url.substr(0, 100));
    EXPECT_EQ(records[0].host, "ad.doubleclick.net");
    EXPECT_EQ(records[0].matchedPattern, "||doubleclick.net^");

    const auto j = nlohmann::json::parse(records[0].ToJson());
    EXPECT_EQ(j["kind"], "DomainAnchor");
    EXPECT_EQ(j["host"], "ad.doubleclick.net");
    EXPECT_EQ(j["timestamp"].get<std::string>().back(), 'Z');
}

TEST_F(TrackerBlockerTest, Callback_RecordCutsAtCharacterBoundary) {
    ASSERT_TRUE(blocker.Initialize());

    std::vector<BlockRecord> records;
    blocker.RegisterBlockCallback([&records](const BlockRecord& record) {
        records.push_back(record);
    });

    // U+00E9 (C3 A9) occupies bytes 99 and 100, straddling the record limit
    std::string url = "https://ad.doubleclick.net/ddm/";
    url += std::string(TrackerBlockerConstants::MAX_RECORD_URL_LENGTH - 1 - url.size(), 'q');
    url += "\xC3\xA9/x.gif";
    ASSERT_EQ(static_cast<unsigned char>(url[99]), 0xC3u);

    EXPECT_TRUE(blocker.ShouldBlock(url));
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].url.size(), 99u);
    EXPECT_EQ(records[0].url, url.substr(0, 99));

    std::string text;
    EXPECT_NO_THROW(text = records[0].ToJson());
    const auto j = nlohmann::json::parse(text);
    EXPECT_EQ(j["url"], url.substr(0, 99));
}

TEST_F(TrackerBlockerTest, Callback_ThrowingIsContained) {
    ASSERT_TRUE(blocker.Initialize());

    int calls = 0;
    blocker.RegisterBlockCallback([](const BlockRecord&) {
        throw std::runtime_error("callback failure");
    });
    blocker.RegisterBlockCallback([&calls](const BlockRecord&) { ++calls; });

    EXPECT_NO_THROW({
        EXPECT_TRUE(blocker.ShouldBlock("https://google-analytics.com/collect"));
    });
    EXPECT_EQ(calls, 1);

    blocker.UnregisterCallbacks();
    EXPECT_TRUE(blocker.ShouldBlock("https://google-analytics.com/collect"));
    EXPECT_EQ(calls, 1);
}

// ============================================================================
// Statistics
// ============================================================================

TEST_F(TrackerBlockerTest, Statistics_CountByKind) {
    TrackerBlockerConfiguration config;
    config.customRules = { "*/pixel.gif?*", "/beacon/" };
    ASSERT_TRUE(blocker.Initialize(config));

    EXPECT_TRUE(blocker.ShouldBlock("https://google-analytics.com/collect"));
    EXPECT_TRUE(blocker.ShouldBlock("https://example.org/pixel.gif?id=1"));
    EXPECT_TRUE(blocker.ShouldBlock("https://example.org/beacon/track"));
    EXPECT_FALSE(blocker.ShouldBlock("https://example.org/"));

    const auto stats = blocker.GetStatistics();
    EXPECT_EQ(stats.totalRequests, 4u);
    EXPECT_EQ(stats.blockedRequests, 3u);
    EXPECT_EQ(stats.allowedRequests, 1u);
    EXPECT_EQ(stats.blockedByDomain, 1u);
    EXPECT_EQ(stats.blockedByWildcard, 1u);
    EXPECT_EQ(stats.blockedByLiteral, 1u);
    EXPECT_EQ(stats.customRules, 2u);
    EXPECT_DOUBLE_EQ(stats.GetBlockRatio(), 0.75);

    const auto j = nlohmann::json::parse(stats.ToJson());
    EXPECT_EQ(j["blockedRequests"], 3);
    EXPECT_EQ(j["blockedByKind"]["wildcard"], 1);
    EXPECT_TRUE(j["matcher"].contains("patterns"));

    blocker.ResetStatistics();
    EXPECT_EQ(blocker.GetStatistics().totalRequests, 0u);
    EXPECT_DOUBLE_EQ(blocker.GetStatistics().GetBlockRatio(), 0.0);
}

TEST_F(TrackerBlockerTest, BlockResult_ToJson) {
    ASSERT_TRUE(blocker.Initialize());

    const auto blocked = nlohmann::json::parse(
        blocker.CheckRequest("https://platform.twitter.com/widgets.js").ToJson());
    EXPECT_EQ(blocked["decision"], "Block");
    EXPECT_EQ(blocked["matchedPattern"], "||platform.twitter.com^");

    const auto allowed = nlohmann::json::parse(blocker.CheckRequest("https://github.com/").ToJson());
    EXPECT_EQ(allowed["decision"], "Allow");
    EXPECT_FALSE(allowed.contains("matchedPattern"));
}

TEST_F(TrackerBlockerTest, BlockResult_ToJsonWithUrl) {
    ASSERT_TRUE(blocker.Initialize());

    const std::string url = "https://platform.twitter.com/widgets.js";
    const auto j = nlohmann::json::parse(blocker.CheckRequest(url).ToJson(url));
    EXPECT_EQ(j["url"], url);
    EXPECT_EQ(j["decision"], "Block");
    EXPECT_EQ(j["kind"], "DomainAnchor");
}

TEST_F(TrackerBlockerTest, BlockResult_ToJsonReplacesInvalidUtf8) {
    ASSERT_TRUE(blocker.Initialize());
    ASSERT_TRUE(blocker.AddCustomRule("/px\xFF/"));

    const std::string url = "https://cdn.site.org/px\xFF/1.gif?r=\xC3";
    const auto result = blocker.CheckRequest(url);
    ASSERT_TRUE(result.IsBlocked());
    EXPECT_EQ(result.matchedPattern, "/px\xFF/");

    std::string plain;
    std::string withUrl;
    EXPECT_NO_THROW(plain = result.ToJson());
    EXPECT_NO_THROW(withUrl = result.ToJson(url));

    const auto j = nlohmann::json::parse(withUrl);
    const std::string replacement = "\xEF\xBF\xBD";
    EXPECT_NE(j["url"].get<std::string>().find(replacement), std::string::npos);
    EXPECT_NE(j["matchedPattern"].get<std::string>().find(replacement), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(plain)["decision"], "Block");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(TrackerBlockerTest, Concurrent_ChecksAndEdits) {
    ASSERT_TRUE(blocker.Initialize());

    std::atomic<int> blocked{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([this, &blocked]() {
            for (int i = 0; i < 500; ++i) {
                if (blocker.ShouldBlock("https://google-analytics.com/collect")) {
                    blocked.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    for (int i = 0; i < 50; ++i) {
        const std::string rule = "||edit" + std::to_string(i) + ".com^";
        EXPECT_TRUE(blocker.AddCustomRule(rule));
    }

    for (auto& th : readers) th.join();

    EXPECT_EQ(blocked.load(), 2000);
    EXPECT_EQ(blocker.GetCustomRules().size(), 50u);
    EXPECT_EQ(blocker.GetStatistics().totalRequests, 2000u);
}

TEST_F(TrackerBlockerTest, Names) {
    EXPECT_STREQ(GetBlockDecisionName(BlockDecision::Block), "Block");
    EXPECT_STREQ(GetModuleStatusName(ModuleStatus::Running), "Running");
    EXPECT_EQ(TrackerBlocker::GetVersionString(), "1.0.0");
}
