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
/**
 * ============================================================================
 * TrackShield - PATTERN MATCHER
 * ============================================================================
 *
 * @file PatternMatcher.hpp
 * @brief Compiled URL blocklist matcher without a regular expression engine.
 *
 * Every pattern is compiled once into one of three structures:
 *
 * 1. DOMAIN INDEX
 *    - "||tracker.com^" and bare domain literals
 *    - label-boundary matching, subdomains included
 *
 * 2. BLOOM FILTER
 *    - fast rejection of hosts whose domain keys were never inserted
 *
 * 3. SCAN LIST
 *    - glob patterns and substring literals, checked in registration order
 *      with a forward-only cursor (no backtracking, bounded time)
 *
 * @note Not internally synchronized. Matches() and Evaluate() are const and
 *       may run concurrently with each other but not with mutations.
 * ============================================================================
 */

#pragma once

#include "PatternCompiler.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace TrackShield {
namespace Matcher {

class PatternMatcherImpl;

// ============================================================================
// CONSTANTS
// ============================================================================

namespace PatternMatcherConstants {

    inline constexpr size_t DEFAULT_EXPECTED_PATTERNS = 100'000;
    inline constexpr double DEFAULT_FALSE_POSITIVE_RATE = 0.01;
    inline constexpr size_t DEFAULT_MAX_PATTERNS = 100'000;

    /// @brief Fill ratio above which the Bloom filter stops rejecting much
    inline constexpr double BLOOM_SATURATION_THRESHOLD = 0.5;

}  // namespace PatternMatcherConstants

// ============================================================================
// STRUCTURES
// ============================================================================

struct MatcherConfig {
    /// @brief Bloom filter sizing hint
    size_t expectedPatterns = PatternMatcherConstants::DEFAULT_EXPECTED_PATTERNS;

    /// @brief Target Bloom filter false positive rate
    double falsePositiveRate = PatternMatcherConstants::DEFAULT_FALSE_POSITIVE_RATE;

    /// @brief Hard cap on registered patterns
    size_t maxPatterns = PatternMatcherConstants::DEFAULT_MAX_PATTERNS;

    [[nodiscard]] bool IsValid() const noexcept;
};

struct MatcherStats {
    size_t patterns = 0;
    size_t domains = 0;
    double bloomFilterUsage = 0.0;

    size_t wildcardPatterns = 0;
    size_t literalPatterns = 0;
    size_t bloomFilterBits = 0;
    size_t bloomFilterHashes = 0;

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Outcome of a lookup, with the pattern responsible for a match.
 */
struct MatchResult {
    bool matched = false;
    PatternKind kind = PatternKind::Literal;

    /// @brief Trimmed text of the matching pattern (empty when not matched)
    std::string pattern;
};

// ============================================================================
// PATTERN MATCHER CLASS
// ============================================================================

class PatternMatcher final {
public:
    explicit PatternMatcher(const MatcherConfig& config = {});
    ~PatternMatcher();

    PatternMatcher(const PatternMatcher&) = delete;
    PatternMatcher& operator=(const PatternMatcher&) = delete;
    PatternMatcher(PatternMatcher&&) noexcept;
    PatternMatcher& operator=(PatternMatcher&&) noexcept;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    /**
     * @brief Bulk-compile patterns and mark the matcher initialized.
     *
     * Adds to whatever is already registered. Patterns past maxPatterns are
     * skipped with a warning.
     *
     * @return false only if memory ran out; the matcher is then cleared
     */
    [[nodiscard]] bool Initialize(const std::vector<std::string>& patterns);

    /// @brief Drop every pattern and return to the uninitialized state
    void Clear() noexcept;

    [[nodiscard]] bool IsInitialized() const noexcept;

    // ========================================================================
    // MATCHING
    // ========================================================================

    /// @brief False for empty or unparseable URLs and while uninitialized
    [[nodiscard]] bool Matches(std::string_view url) const noexcept;
    [[nodiscard]] bool Matches(const char* url) const noexcept;

    [[nodiscard]] MatchResult Evaluate(std::string_view url) const;

    // ========================================================================
    // PATTERN MANAGEMENT
    // ========================================================================

    /// @return true if a new pattern was registered
    bool AddPattern(std::string_view pattern);

    /// @return true if a registered pattern was removed
    bool RemovePattern(std::string_view pattern);

    /// @brief True if a pattern compiling to the same rule is registered
    [[nodiscard]] bool HasPattern(std::string_view pattern) const;

    // ========================================================================
    // STATISTICS
    // ========================================================================

    [[nodiscard]] MatcherStats GetStats() const noexcept;
    [[nodiscard]] const MatcherConfig& GetConfig() const noexcept;

private:
    std::unique_ptr<PatternMatcherImpl> m_impl;
};

}  // namespace Matcher
}  // namespace TrackShield
