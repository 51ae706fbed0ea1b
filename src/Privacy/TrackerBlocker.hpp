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
 * TrackShield - TRACKER BLOCKER MODULE
 * ============================================================================
 *
 * @file TrackerBlocker.hpp
 * @brief Privacy layer deciding whether outgoing requests are blocked.
 *
 * PROTECTION CAPABILITIES:
 * ========================
 *
 * 1. TRACKER BLOCKING
 *    - Built-in analytics, social and ad network patterns
 *    - EasyList / EasyPrivacy / hosts filter list files
 *    - User custom rules
 *
 * 2. ACTIVITY REPORTING
 *    - Block callbacks receiving one record per blocked request
 *    - Request statistics
 *
 * The blocker owns its PatternMatcher exclusively. Lookups take a shared
 * lock; rule changes take an exclusive lock.
 * ============================================================================
 */

#pragma once

#include "../Matcher/PatternMatcher.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace TrackShield {
namespace Privacy {

class TrackerBlockerImpl;

// ============================================================================
// COMPILE-TIME CONSTANTS
// ============================================================================

namespace TrackerBlockerConstants {

    inline constexpr uint32_t VERSION_MAJOR = 1;
    inline constexpr uint32_t VERSION_MINOR = 0;
    inline constexpr uint32_t VERSION_PATCH = 0;

    /// @brief Longest accepted custom rule
    inline constexpr size_t MAX_CUSTOM_RULE_LENGTH = 200;

    /// @brief URLs in block records are cut to this many characters
    inline constexpr size_t MAX_RECORD_URL_LENGTH = 100;

}  // namespace TrackerBlockerConstants

// ============================================================================
// TYPE ALIASES
// ============================================================================

using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// ENUMERATIONS
// ============================================================================

enum class BlockDecision : uint8_t {
    Allow = 0,
    Block = 1
};

/**
 * @brief Module status
 */
enum class ModuleStatus : uint8_t {
    Uninitialized   = 0,
    Initializing    = 1,
    Running         = 2,
    Stopped         = 3,
    Error           = 4
};

[[nodiscard]] const char* GetBlockDecisionName(BlockDecision decision) noexcept;
[[nodiscard]] const char* GetModuleStatusName(ModuleStatus status) noexcept;

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief Verdict for one request
 */
struct BlockResult {
    BlockDecision decision = BlockDecision::Allow;

    /// @brief Pattern that caused the block (empty for Allow)
    std::string matchedPattern;

    Matcher::PatternKind kind = Matcher::PatternKind::Literal;

    /// @brief Short human-readable explanation
    std::string reason;

    uint64_t processingTimeUs = 0;

    [[nodiscard]] bool IsBlocked() const noexcept { return decision == BlockDecision::Block; }
    [[nodiscard]] std::string ToJson() const;

    /// @brief As ToJson(), with the checked URL under "url"
    [[nodiscard]] std::string ToJson(std::string_view url) const;
};

/**
 * @brief Activity record handed to block callbacks
 */
struct BlockRecord {
    /// @brief Request URL, at most MAX_RECORD_URL_LENGTH bytes
    std::string url;
    std::string host;
    std::string matchedPattern;
    Matcher::PatternKind kind = Matcher::PatternKind::Literal;
    SystemTimePoint timestamp;

    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Statistics snapshot
 */
struct TrackerBlockerStatistics {
    uint64_t totalRequests = 0;
    uint64_t blockedRequests = 0;
    uint64_t allowedRequests = 0;
    uint64_t blockedByDomain = 0;
    uint64_t blockedByWildcard = 0;
    uint64_t blockedByLiteral = 0;
    uint64_t totalProcessingTimeUs = 0;
    size_t customRules = 0;
    Matcher::MatcherStats matcher;

    [[nodiscard]] double GetBlockRatio() const noexcept;
    [[nodiscard]] std::string ToJson() const;
};

/**
 * @brief Configuration
 */
struct TrackerBlockerConfiguration {
    /// @brief Blocking active after Initialize
    bool enabled = true;

    /// @brief Compile the built-in tracker patterns
    bool useDefaultPatterns = true;

    /// @brief Longest accepted custom rule
    size_t maxCustomRuleLength = TrackerBlockerConstants::MAX_CUSTOM_RULE_LENGTH;

    /// @brief User rules compiled at startup
    std::vector<std::string> customRules;

    /// @brief Filter list files compiled at startup
    std::vector<std::filesystem::path> filterLists;

    /// @brief Matcher sizing
    Matcher::MatcherConfig matcher;

    [[nodiscard]] bool IsValid() const noexcept;
};

// ============================================================================
// CALLBACK TYPES
// ============================================================================

using BlockCallback = std::function<void(const BlockRecord&)>;

// ============================================================================
// TRACKER BLOCKER CLASS
// ============================================================================

class TrackerBlocker final {
public:
    TrackerBlocker();
    ~TrackerBlocker();

    TrackerBlocker(const TrackerBlocker&) = delete;
    TrackerBlocker& operator=(const TrackerBlocker&) = delete;
    TrackerBlocker(TrackerBlocker&&) = delete;
    TrackerBlocker& operator=(TrackerBlocker&&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    [[nodiscard]] bool Initialize(const TrackerBlockerConfiguration& config = {});
    void Shutdown();
    [[nodiscard]] bool IsInitialized() const noexcept;
    [[nodiscard]] ModuleStatus GetStatus() const noexcept;
    [[nodiscard]] TrackerBlockerConfiguration GetConfiguration() const;

    // ========================================================================
    // REQUEST CHECKING
    // ========================================================================

    /// @brief Full verdict. A disabled or uninitialized blocker allows everything.
    [[nodiscard]] BlockResult CheckRequest(std::string_view url);

    [[nodiscard]] bool ShouldBlock(std::string_view url);

    // ========================================================================
    // RULE MANAGEMENT
    // ========================================================================

    /// @brief Add a user rule (at most maxCustomRuleLength characters)
    [[nodiscard]] bool AddCustomRule(const std::string& rule);
    bool RemoveCustomRule(const std::string& rule);
    [[nodiscard]] std::vector<std::string> GetCustomRules() const;

    [[nodiscard]] bool AddToBlocklist(const std::string& pattern);
    bool RemoveFromBlocklist(const std::string& pattern);

    /// @brief The built-in patterns
    [[nodiscard]] std::vector<std::string> GetBlocklist() const;

    /// @brief Compile the rules of a filter list file into the running blocker
    [[nodiscard]] bool LoadFilterListFile(const std::filesystem::path& path);

    void SetEnabled(bool enabled) noexcept;
    [[nodiscard]] bool IsEnabled() const noexcept;

    // ========================================================================
    // CALLBACKS
    // ========================================================================

    void RegisterBlockCallback(BlockCallback callback);
    void UnregisterCallbacks();

    // ========================================================================
    // STATISTICS
    // ========================================================================

    [[nodiscard]] TrackerBlockerStatistics GetStatistics() const;
    void ResetStatistics() noexcept;

    [[nodiscard]] static std::vector<std::string> GetDefaultPatterns();
    [[nodiscard]] static std::string GetVersionString();

private:
    std::unique_ptr<TrackerBlockerImpl> m_impl;
};

}  // namespace Privacy
}  // namespace TrackShield
