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
#include "../../../src/Matcher/DomainIndex.hpp"

#include <string>

using namespace TrackShield::Matcher;

class DomainIndexTest : public ::testing::Test {
protected:
    DomainIndex index;
};

// ============================================================================
// Insertion
// ============================================================================

TEST_F(DomainIndexTest, Insert_SharesSuffixNodes) {
    ASSERT_TRUE(index.Insert("example.com"));
    EXPECT_EQ(index.GetEntryCount(), 1u);
    EXPECT_EQ(index.GetNodeCount(), 3u);  // root, com, example

    ASSERT_TRUE(index.Insert("tracker.com"));
    EXPECT_EQ(index.GetEntryCount(), 2u);
    EXPECT_EQ(index.GetNodeCount(), 4u);
}

TEST_F(DomainIndexTest, Insert_DuplicateCountsOnce) {
    ASSERT_TRUE(index.Insert("example.com"));
    ASSERT_TRUE(index.Insert("example.com"));
    EXPECT_EQ(index.GetEntryCount(), 1u);
}

TEST_F(DomainIndexTest, Insert_RejectsMalformedDomains) {
    EXPECT_FALSE(index.Insert(""));
    EXPECT_FALSE(index.Insert("a..com"));
    EXPECT_FALSE(index.Insert(".com"));
    EXPECT_FALSE(index.Insert(std::string(64, 'a') + ".com"));
    EXPECT_FALSE(index.Insert(std::string(250, 'a') + ".com"));
    EXPECT_EQ(index.GetEntryCount(), 0u);
    EXPECT_EQ(index.GetNodeCount(), 1u);
}

// ============================================================================
// Label-boundary queries
// ============================================================================

TEST_F(DomainIndexTest, Query_MatchesDomainAndSubdomains) {
    ASSERT_TRUE(index.Insert("example.com"));

    EXPECT_TRUE(index.Query("example.com"));
    EXPECT_TRUE(index.Query("sub.example.com"));
    EXPECT_TRUE(index.Query("deep.sub.example.com"));
}

TEST_F(DomainIndexTest, Query_NeverMatchesAcrossLabelBoundary) {
    ASSERT_TRUE(index.Insert("example.com"));

    EXPECT_FALSE(index.Query("notexample.com"));
    EXPECT_FALSE(index.Query("example.com.evil.net"));
    EXPECT_FALSE(index.Query("com"));
    EXPECT_FALSE(index.Query(""));
}

TEST_F(DomainIndexTest, Query_SiblingSubdomainNotMatched) {
    ASSERT_TRUE(index.Insert("sub.example.com"));

    EXPECT_TRUE(index.Query("sub.example.com"));
    EXPECT_TRUE(index.Query("a.sub.example.com"));
    EXPECT_FALSE(index.Query("other.example.com"));
    EXPECT_FALSE(index.Query("example.com"));
}

TEST_F(DomainIndexTest, Query_ReportsShortestMatchingEntry) {
    ASSERT_TRUE(index.Insert("example.com"));
    ASSERT_TRUE(index.Insert("ads.example.com"));

    std::string matched;
    ASSERT_TRUE(index.Query("x.ads.example.com", matched));
    EXPECT_EQ(matched, "example.com");

    matched.clear();
    ASSERT_TRUE(index.Query("example.com", matched));
    EXPECT_EQ(matched, "example.com");
}

TEST_F(DomainIndexTest, Query_EmptyIndex) {
    std::string matched;
    EXPECT_FALSE(index.Query("example.com"));
    EXPECT_FALSE(index.Query("example.com", matched));
    EXPECT_TRUE(matched.empty());
}

// ============================================================================
// Removal
// ============================================================================

TEST_F(DomainIndexTest, Contains_ExactEntriesOnly) {
    ASSERT_TRUE(index.Insert("example.com"));
    EXPECT_TRUE(index.Contains("example.com"));
    EXPECT_FALSE(index.Contains("sub.example.com"));
    EXPECT_FALSE(index.Contains("com"));
}

TEST_F(DomainIndexTest, Remove_StopsMatching) {
    ASSERT_TRUE(index.Insert("example.com"));
    ASSERT_TRUE(index.Insert("tracker.net"));

    EXPECT_TRUE(index.Remove("example.com"));
    EXPECT_FALSE(index.Query("sub.example.com"));
    EXPECT_TRUE(index.Query("cdn.tracker.net"));
    EXPECT_EQ(index.GetEntryCount(), 1u);

    EXPECT_FALSE(index.Remove("example.com"));
    EXPECT_FALSE(index.Remove("unknown.org"));
}

TEST_F(DomainIndexTest, Remove_KeepsDeeperEntries) {
    ASSERT_TRUE(index.Insert("example.com"));
    ASSERT_TRUE(index.Insert("ads.example.com"));

    ASSERT_TRUE(index.Remove("example.com"));
    EXPECT_FALSE(index.Query("www.example.com"));
    EXPECT_TRUE(index.Query("x.ads.example.com"));
}

TEST_F(DomainIndexTest, Clear_EmptiesIndex) {
    ASSERT_TRUE(index.Insert("example.com"));
    ASSERT_TRUE(index.Insert("tracker.net"));

    index.Clear();
    EXPECT_EQ(index.GetEntryCount(), 0u);
    EXPECT_EQ(index.GetNodeCount(), 1u);
    EXPECT_FALSE(index.Query("example.com"));

    ASSERT_TRUE(index.Insert("example.com"));
    EXPECT_TRUE(index.Query("a.example.com"));
}
