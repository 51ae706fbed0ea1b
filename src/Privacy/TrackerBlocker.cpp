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
 * TrackShield - TRACKER BLOCKER IMPLEMENTATION
 * ============================================================================
 *
 * @file TrackerBlocker.cpp
 * @brief Request blocking on top of the compiled pattern matcher.
 *
 * ARCHITECTURE:
 * =============
 * - PIMPL pattern
 * - std::shared_mutex: CheckRequest runs under a shared lock, rule changes
 *   under an exclusive one
 * - Callbacks are copied out and invoked with no blocker lock held
 * - Lock-free atomic request counters
 * ============================================================================
 */

#include "pch.h"
#include "TrackerBlocker.hpp"
#include "FilterListParser.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/NetworkUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <mutex>
#include <shared_mutex>

#include <nlohmann/json.hpp>

namespace TrackShield {
namespace Privacy {

using namespace Utils;
using json = nlohmann::json;

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define TB_LOG_DEBUG(fmt, ...)  TS_LOG_DEBUG("TrackerBlocker", fmt, ##__VA_ARGS__)
#define TB_LOG_INFO(fmt, ...)   TS_LOG_INFO("TrackerBlocker", fmt, ##__VA_ARGS__)
#define TB_LOG_WARN(fmt, ...)   TS_LOG_WARN("TrackerBlocker", fmt, ##__VA_ARGS__)
#define TB_LOG_ERROR(fmt, ...)  TS_LOG_ERROR("TrackerBlocker", fmt, ##__VA_ARGS__)

// ============================================================================
// BUILT-IN PATTERNS
// ============================================================================

namespace {

    const std::vector<std::string>& DefaultPatterns() {
        static const std::vector<std::string> patterns = {
            // Analytics
            "||google-analytics.com^",
            "||googletagmanager.com^",
            "||analytics.google.com^",
            "*://google-analytics.com/*",
            "*://*.google-analytics.com/*",
            "*://googletagmanager.com/*",
            "*://*.googletagmanager.com/*",
            "*://analytics.google.com/*",

            // Social widgets
            "||connect.facebook.net^",
            "||platform.twitter.com^",
            "||platform.linkedin.com^",
            "*://connect.facebook.net/*",
            "*://platform.twitter.com/*",
            "*://platform.linkedin.com/*",

            // Ad networks
            "||doubleclick.net^",
            "||googlesyndication.com^",
            "||adservice.google.com^",
            "*://doubleclick.net/*",
            "*://*.doubleclick.net/*",
            "*://googlesyndication.com/*",
            "*://*.googlesyndication.com/*",
            "*://adservice.google.com/*",

            // Audience measurement and session recording
            "||scorecardresearch.com^",
            "||quantserve.com^",
            "||hotjar.com^",
            "||mouseflow.com^",
            "||crazyegg.com^",
            "*://scorecardresearch.com/*",
            "*://quantserve.com/*",
            "*://hotjar.com/*",
            "*://*.hotjar.com/*",
            "*://mouseflow.com/*",
            "*://crazyegg.com/*"
        };
        return patterns;
    }

    std::string FormatTimestamp(SystemTimePoint tp) {
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32] = {};
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }

}  // anonymous namespace

// ============================================================================
// ENUM NAME FUNCTIONS
// ============================================================================

const char* GetBlockDecisionName(BlockDecision decision) noexcept {
    switch (decision) {
        case BlockDecision::Allow: return "Allow";
        case BlockDecision::Block: return "Block";
        default: return "Unknown";
    }
}

const char* GetModuleStatusName(ModuleStatus status) noexcept {
    switch (status) {
        case ModuleStatus::Uninitialized: return "Uninitialized";
        case ModuleStatus::Initializing:  return "Initializing";
        case ModuleStatus::Running:       return "Running";
        case ModuleStatus::Stopped:       return "Stopped";
        case ModuleStatus::Error:         return "Error";
        default: return "Unknown";
    }
}

// ============================================================================
// STRUCTURE IMPLEMENTATIONS
// ============================================================================

namespace {

    json BlockResultToJson(const BlockResult& result) {
        json j;
        j["decision"] = GetBlockDecisionName(result.decision);
        if (result.IsBlocked()) {
            j["matchedPattern"] = result.matchedPattern;
            j["kind"] = Matcher::GetPatternKindName(result.kind);
        }
        j["reason"] = result.reason;
        j["processingTimeUs"] = result.processingTimeUs;
        return j;
    }

}  // anonymous namespace

std::string BlockResult::ToJson() const {
    return BlockResultToJson(*this).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string BlockResult::ToJson(std::string_view url) const {
    json j = BlockResultToJson(*this);
    j["url"] = std::string(url);
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string BlockRecord::ToJson() const {
    json j;
    j["url"] = url;
    j["host"] = host;
    j["matchedPattern"] = matchedPattern;
    j["kind"] = Matcher::GetPatternKindName(kind);
    j["timestamp"] = FormatTimestamp(timestamp);
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

double TrackerBlockerStatistics::GetBlockRatio() const noexcept {
    if (totalRequests == 0) return 0.0;
    return static_cast<double>(blockedRequests) / static_cast<double>(totalRequests);
}

std::string TrackerBlockerStatistics::ToJson() const {
    json j;
    j["totalRequests"] = totalRequests;
    j["blockedRequests"] = blockedRequests;
    j["allowedRequests"] = allowedRequests;
    j["blockRatio"] = GetBlockRatio();
    j["blockedByKind"] = {
        {"domainAnchor", blockedByDomain},
        {"wildcard", blockedByWildcard},
        {"literal", blockedByLiteral}
    };
    j["totalProcessingTimeUs"] = totalProcessingTimeUs;
    j["customRules"] = customRules;
    j["matcher"] = json::parse(matcher.ToJson());
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool TrackerBlockerConfiguration::IsValid() const noexcept {
    return maxCustomRuleLength > 0 &&
           maxCustomRuleLength <= Matcher::MAX_PATTERN_LENGTH &&
           matcher.IsValid();
}

// ============================================================================
// PIMPL IMPLEMENTATION CLASS
// ============================================================================

class TrackerBlockerImpl final {
public:
    TrackerBlockerImpl() = default;
    ~TrackerBlockerImpl() = default;

    TrackerBlockerImpl(const TrackerBlockerImpl&) = delete;
    TrackerBlockerImpl& operator=(const TrackerBlockerImpl&) = delete;
    TrackerBlockerImpl(TrackerBlockerImpl&&) = delete;
    TrackerBlockerImpl& operator=(TrackerBlockerImpl&&) = delete;

    // ========================================================================
    // STATE
    // ========================================================================

    mutable std::shared_mutex m_mutex;
    std::atomic<ModuleStatus> m_status{ModuleStatus::Uninitialized};
    std::atomic<bool> m_enabled{false};
    TrackerBlockerConfiguration m_config;

    Matcher::PatternMatcher m_matcher;

    struct CustomRule {
        std::string text;            ///< as supplied
        std::string key;             ///< compiled pattern key
        bool ownsPattern = false;    ///< registered the matcher pattern itself
    };

    /// User rules in insertion order
    std::vector<CustomRule> m_customRules;

    std::vector<BlockCallback> m_blockCallbacks;
    mutable std::mutex m_callbackMutex;

    std::atomic<uint64_t> m_totalRequests{0};
    std::atomic<uint64_t> m_blockedRequests{0};
    std::atomic<uint64_t> m_allowedRequests{0};
    std::atomic<uint64_t> m_blockedByDomain{0};
    std::atomic<uint64_t> m_blockedByWildcard{0};
    std::atomic<uint64_t> m_blockedByLiteral{0};
    std::atomic<uint64_t> m_totalProcessingTimeUs{0};

    // ========================================================================
    // HELPER METHODS
    // ========================================================================

    [[nodiscard]] bool IsRunning() const noexcept {
        return m_status.load(std::memory_order_acquire) == ModuleStatus::Running;
    }

    void RecordDecision(const BlockResult& result) noexcept {
        m_totalRequests.fetch_add(1, std::memory_order_relaxed);
        m_totalProcessingTimeUs.fetch_add(result.processingTimeUs, std::memory_order_relaxed);

        if (!result.IsBlocked()) {
            m_allowedRequests.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        m_blockedRequests.fetch_add(1, std::memory_order_relaxed);
        switch (result.kind) {
            case Matcher::PatternKind::DomainAnchor:
                m_blockedByDomain.fetch_add(1, std::memory_order_relaxed);
                break;
            case Matcher::PatternKind::Wildcard:
                m_blockedByWildcard.fetch_add(1, std::memory_order_relaxed);
                break;
            case Matcher::PatternKind::Literal:
                m_blockedByLiteral.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    }

    void NotifyBlockCallbacks(const BlockRecord& record) {
        std::vector<BlockCallback> callbacks;
        {
            std::lock_guard lock(m_callbackMutex);
            callbacks = m_blockCallbacks;
        }

        for (const auto& callback : callbacks) {
            if (!callback) continue;
            try {
                callback(record);
            }
            catch (const std::exception& e) {
                TB_LOG_WARN("Block callback threw: %s", e.what());
            }
        }
    }

    [[nodiscard]] bool IsValidCustomRule(const std::string& rule) const {
        const std::string_view trimmed = StringUtils::TrimView(rule);
        if (trimmed.empty()) {
            TB_LOG_WARN("Rejected empty custom rule");
            return false;
        }
        if (trimmed.size() > m_config.maxCustomRuleLength) {
            TB_LOG_WARN("Rejected custom rule longer than %zu characters", m_config.maxCustomRuleLength);
            return false;
        }
        return true;
    }

    [[nodiscard]] std::vector<CustomRule>::iterator FindCustomRule(const std::string& key) {
        return std::find_if(m_customRules.begin(), m_customRules.end(),
            [&key](const CustomRule& entry) { return entry.key == key; });
    }

    /// Custom rule with the same compiled key, or failing that the same text
    [[nodiscard]] std::vector<CustomRule>::iterator LocateCustomRule(const std::string& rule) {
        Matcher::CompiledPattern compiled;
        if (Matcher::CompilePattern(rule, compiled) == Matcher::CompileStatus::Ok) {
            return FindCustomRule(compiled.Key());
        }
        return std::find_if(m_customRules.begin(), m_customRules.end(),
            [&rule](const CustomRule& entry) { return entry.text == rule; });
    }

    /**
     * Records a custom rule and makes sure its pattern is registered. A pattern
     * that another source registered first stays with that source, so removing
     * the custom rule later leaves it in place.
     *
     * @return false for invalid rules and rules already recorded as custom
     */
    bool RegisterCustomRule(const std::string& rule) {
        if (!IsValidCustomRule(rule)) {
            return false;
        }

        Matcher::CompiledPattern compiled;
        const auto status = Matcher::CompilePattern(rule, compiled);
        if (status != Matcher::CompileStatus::Ok) {
            TB_LOG_WARN("Custom rule rejected by pattern compiler (%s)", Matcher::GetCompileStatusName(status));
            return false;
        }

        CustomRule entry;
        entry.key = compiled.Key();
        if (FindCustomRule(entry.key) != m_customRules.end()) {
            return false;
        }

        entry.ownsPattern = m_matcher.AddPattern(rule);
        if (!entry.ownsPattern && !m_matcher.HasPattern(rule)) {
            TB_LOG_WARN("Custom rule could not be registered with the matcher");
            return false;
        }

        entry.text = rule;
        m_customRules.push_back(std::move(entry));
        return true;
    }

    /// A blocklist source registered a custom rule's pattern again and now shares it
    void ReleaseCustomOwnership(std::string_view pattern) {
        if (m_customRules.empty()) {
            return;
        }
        Matcher::CompiledPattern compiled;
        if (Matcher::CompilePattern(pattern, compiled) != Matcher::CompileStatus::Ok) {
            return;
        }
        const auto it = FindCustomRule(compiled.Key());
        if (it != m_customRules.end()) {
            it->ownsPattern = false;
        }
    }

    [[nodiscard]] std::vector<std::string> CustomRuleTexts() const {
        std::vector<std::string> texts;
        texts.reserve(m_customRules.size());
        for (const auto& entry : m_customRules) {
            texts.push_back(entry.text);
        }
        return texts;
    }

    void ResetCounters() noexcept {
        m_totalRequests.store(0, std::memory_order_relaxed);
        m_blockedRequests.store(0, std::memory_order_relaxed);
        m_allowedRequests.store(0, std::memory_order_relaxed);
        m_blockedByDomain.store(0, std::memory_order_relaxed);
        m_blockedByWildcard.store(0, std::memory_order_relaxed);
        m_blockedByLiteral.store(0, std::memory_order_relaxed);
        m_totalProcessingTimeUs.store(0, std::memory_order_relaxed);
    }
};

// ============================================================================
// LIFECYCLE
// ============================================================================

TrackerBlocker::TrackerBlocker()
    : m_impl(std::make_unique<TrackerBlockerImpl>()) {
}

TrackerBlocker::~TrackerBlocker() = default;

bool TrackerBlocker::Initialize(const TrackerBlockerConfiguration& config) {
    std::unique_lock lock(m_impl->m_mutex);

    if (m_impl->IsRunning()) {
        TB_LOG_WARN("Already initialized");
        return true;
    }

    if (!config.IsValid()) {
        TB_LOG_ERROR("Invalid configuration");
        m_impl->m_status.store(ModuleStatus::Error, std::memory_order_release);
        return false;
    }

    m_impl->m_status.store(ModuleStatus::Initializing, std::memory_order_release);
    TB_LOG_INFO("Initializing TrackerBlocker v%s", GetVersionString().c_str());

    try {
        m_impl->m_config = config;
        m_impl->m_customRules.clear();

        std::vector<std::string> patterns;
        if (config.useDefaultPatterns) {
            patterns = DefaultPatterns();
        }

        for (const auto& path : config.filterLists) {
            FilterListParseResult list;
            if (!Privacy::LoadFilterListFile(path, list)) {
                TB_LOG_WARN("Skipping filter list %s", path.string().c_str());
                continue;
            }
            patterns.insert(patterns.end(),
                std::make_move_iterator(list.patterns.begin()),
                std::make_move_iterator(list.patterns.end()));
        }

        m_impl->m_matcher = Matcher::PatternMatcher(config.matcher);
        if (!m_impl->m_matcher.Initialize(patterns)) {
            TB_LOG_ERROR("Pattern matcher initialization failed");
            m_impl->m_status.store(ModuleStatus::Error, std::memory_order_release);
            return false;
        }

        // After the lists, so rules repeating a list pattern do not own it
        for (const auto& rule : config.customRules) {
            (void)m_impl->RegisterCustomRule(rule);
        }

        m_impl->m_enabled.store(config.enabled, std::memory_order_release);
        m_impl->m_status.store(ModuleStatus::Running, std::memory_order_release);

        const auto stats = m_impl->m_matcher.GetStats();
        TB_LOG_INFO("TrackerBlocker initialized (%zu patterns, %zu domains, %zu custom rules)",
            stats.patterns, stats.domains, m_impl->m_customRules.size());
        return true;
    }
    catch (const std::exception& e) {
        TB_LOG_ERROR("Initialization failed: %s", e.what());
        m_impl->m_matcher.Clear();
        m_impl->m_customRules.clear();
        m_impl->m_status.store(ModuleStatus::Error, std::memory_order_release);
        return false;
    }
}

void TrackerBlocker::Shutdown() {
    std::unique_lock lock(m_impl->m_mutex);

    if (m_impl->m_status.load(std::memory_order_acquire) == ModuleStatus::Uninitialized) {
        return;
    }

    m_impl->m_matcher.Clear();
    m_impl->m_customRules.clear();
    m_impl->m_enabled.store(false, std::memory_order_release);
    m_impl->m_status.store(ModuleStatus::Stopped, std::memory_order_release);

    {
        std::lock_guard cbLock(m_impl->m_callbackMutex);
        m_impl->m_blockCallbacks.clear();
    }

    TB_LOG_INFO("TrackerBlocker shut down");
}

bool TrackerBlocker::IsInitialized() const noexcept {
    return m_impl->IsRunning();
}

ModuleStatus TrackerBlocker::GetStatus() const noexcept {
    return m_impl->m_status.load(std::memory_order_acquire);
}

TrackerBlockerConfiguration TrackerBlocker::GetConfiguration() const {
    std::shared_lock lock(m_impl->m_mutex);
    auto config = m_impl->m_config;
    config.enabled = m_impl->m_enabled.load(std::memory_order_acquire);
    config.customRules = m_impl->CustomRuleTexts();
    return config;
}

// ============================================================================
// REQUEST CHECKING
// ============================================================================

BlockResult TrackerBlocker::CheckRequest(std::string_view url) {
    const auto start = std::chrono::steady_clock::now();
    BlockResult result;

    {
        std::shared_lock lock(m_impl->m_mutex);

        if (!m_impl->IsRunning()) {
            result.reason = "Blocker not initialized";
            return result;
        }
        if (!m_impl->m_enabled.load(std::memory_order_acquire)) {
            result.reason = "Blocking disabled";
            return result;
        }

        try {
            const auto match = m_impl->m_matcher.Evaluate(url);
            if (match.matched) {
                result.decision = BlockDecision::Block;
                result.matchedPattern = match.pattern;
                result.kind = match.kind;
                result.reason = std::string("Matched ") + Matcher::GetPatternKindName(match.kind) + " pattern";
            }
            else {
                result.reason = "No pattern matched";
            }
        }
        catch (const std::bad_alloc&) {
            TB_LOG_ERROR("Out of memory while checking request, allowing");
            result = BlockResult{};
            result.reason = "Out of memory";
        }
    }

    result.processingTimeUs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count());
    m_impl->RecordDecision(result);

    if (result.IsBlocked()) {
        BlockRecord record;
        record.url = StringUtils::Truncate(url, TrackerBlockerConstants::MAX_RECORD_URL_LENGTH);
        record.host = NetworkUtils::ExtractHostname(url);
        record.matchedPattern = result.matchedPattern;
        record.kind = result.kind;
        record.timestamp = std::chrono::system_clock::now();

        TB_LOG_DEBUG("Blocked %s (pattern %s)", record.url.c_str(), record.matchedPattern.c_str());
        m_impl->NotifyBlockCallbacks(record);
    }

    return result;
}

bool TrackerBlocker::ShouldBlock(std::string_view url) {
    return CheckRequest(url).IsBlocked();
}

// ============================================================================
// RULE MANAGEMENT
// ============================================================================

bool TrackerBlocker::AddCustomRule(const std::string& rule) {
    std::unique_lock lock(m_impl->m_mutex);

    if (!m_impl->IsRunning()) {
        TB_LOG_WARN("AddCustomRule called before Initialize");
        return false;
    }
    if (!m_impl->RegisterCustomRule(rule)) {
        return false;
    }

    TB_LOG_INFO("Added custom rule (%zu total)", m_impl->m_customRules.size());
    return true;
}

bool TrackerBlocker::RemoveCustomRule(const std::string& rule) {
    std::unique_lock lock(m_impl->m_mutex);

    auto& rules = m_impl->m_customRules;
    const auto it = m_impl->LocateCustomRule(rule);
    if (it == rules.end()) {
        return false;
    }

    if (it->ownsPattern) {
        (void)m_impl->m_matcher.RemovePattern(it->text);
    }
    rules.erase(it);

    TB_LOG_INFO("Removed custom rule (%zu remaining)", rules.size());
    return true;
}

std::vector<std::string> TrackerBlocker::GetCustomRules() const {
    std::shared_lock lock(m_impl->m_mutex);
    return m_impl->CustomRuleTexts();
}

bool TrackerBlocker::AddToBlocklist(const std::string& pattern) {
    std::unique_lock lock(m_impl->m_mutex);

    if (!m_impl->IsRunning()) {
        TB_LOG_WARN("AddToBlocklist called before Initialize");
        return false;
    }
    if (m_impl->m_matcher.AddPattern(pattern)) {
        return true;
    }
    m_impl->ReleaseCustomOwnership(pattern);
    return false;
}

bool TrackerBlocker::RemoveFromBlocklist(const std::string& pattern) {
    std::unique_lock lock(m_impl->m_mutex);

    // A custom rule still needs the pattern; it becomes the only holder
    const auto it = m_impl->LocateCustomRule(pattern);
    if (it != m_impl->m_customRules.end()) {
        if (it->ownsPattern || !m_impl->m_matcher.HasPattern(pattern)) {
            return false;
        }
        it->ownsPattern = true;
        return true;
    }
    return m_impl->m_matcher.RemovePattern(pattern);
}

std::vector<std::string> TrackerBlocker::GetBlocklist() const {
    return DefaultPatterns();
}

bool TrackerBlocker::LoadFilterListFile(const std::filesystem::path& path) {
    TS_LOG_SCOPE("TrackerBlocker");

    if (!IsInitialized()) {
        TB_LOG_WARN("LoadFilterListFile called before Initialize");
        return false;
    }

    // Parse outside the lock; lookups continue meanwhile
    FilterListParseResult list;
    if (!Privacy::LoadFilterListFile(path, list)) {
        return false;
    }

    std::unique_lock lock(m_impl->m_mutex);
    size_t added = 0;
    for (const auto& pattern : list.patterns) {
        if (m_impl->m_matcher.AddPattern(pattern)) {
            ++added;
        }
        else {
            m_impl->ReleaseCustomOwnership(pattern);
        }
    }

    TB_LOG_INFO("Filter list %s: %zu new patterns", path.string().c_str(), added);
    return true;
}

void TrackerBlocker::SetEnabled(bool enabled) noexcept {
    m_impl->m_enabled.store(enabled, std::memory_order_release);
    TB_LOG_INFO("Blocking %s", enabled ? "enabled" : "disabled");
}

bool TrackerBlocker::IsEnabled() const noexcept {
    return m_impl->m_enabled.load(std::memory_order_acquire);
}

// ============================================================================
// CALLBACKS
// ============================================================================

void TrackerBlocker::RegisterBlockCallback(BlockCallback callback) {
    std::lock_guard lock(m_impl->m_callbackMutex);
    m_impl->m_blockCallbacks.push_back(std::move(callback));
}

void TrackerBlocker::UnregisterCallbacks() {
    std::lock_guard lock(m_impl->m_callbackMutex);
    m_impl->m_blockCallbacks.clear();
}

// ============================================================================
// STATISTICS
// ============================================================================

TrackerBlockerStatistics TrackerBlocker::GetStatistics() const {
    TrackerBlockerStatistics stats;
    stats.totalRequests = m_impl->m_totalRequests.load(std::memory_order_relaxed);
    stats.blockedRequests = m_impl->m_blockedRequests.load(std::memory_order_relaxed);
    stats.allowedRequests = m_impl->m_allowedRequests.load(std::memory_order_relaxed);
    stats.blockedByDomain = m_impl->m_blockedByDomain.load(std::memory_order_relaxed);
    stats.blockedByWildcard = m_impl->m_blockedByWildcard.load(std::memory_order_relaxed);
    stats.blockedByLiteral = m_impl->m_blockedByLiteral.load(std::memory_order_relaxed);
    stats.totalProcessingTimeUs = m_impl->m_totalProcessingTimeUs.load(std::memory_order_relaxed);

    std::shared_lock lock(m_impl->m_mutex);
    stats.customRules = m_impl->m_customRules.size();
    stats.matcher = m_impl->m_matcher.GetStats();
    return stats;
}

void TrackerBlocker::ResetStatistics() noexcept {
    m_impl->ResetCounters();
}

std::vector<std::string> TrackerBlocker::GetDefaultPatterns() {
    return DefaultPatterns();
}

std::string TrackerBlocker::GetVersionString() {
    return std::to_string(TrackerBlockerConstants::VERSION_MAJOR) + "." +
           std::to_string(TrackerBlockerConstants::VERSION_MINOR) + "." +
           std::to_string(TrackerBlockerConstants::VERSION_PATCH);
}

}  // namespace Privacy
}  // namespace TrackShield
