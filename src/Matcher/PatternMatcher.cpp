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
 * TrackShield - PATTERN MATCHER IMPLEMENTATION
 * ============================================================================
 *
 * @file PatternMatcher.cpp
 * @brief Bloom pre-check, domain label trie and forward-scan glob list
 *        behind one lookup.
 * ============================================================================
 */

#include "pch.h"
#include "PatternMatcher.hpp"
#include "BloomFilter.hpp"
#include "DomainIndex.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/NetworkUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace TrackShield {
namespace Matcher {

using namespace Utils;
using json = nlohmann::json;

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define PM_LOG_DEBUG(fmt, ...)  TS_LOG_DEBUG("PatternMatcher", fmt, ##__VA_ARGS__)
#define PM_LOG_INFO(fmt, ...)   TS_LOG_INFO("PatternMatcher", fmt, ##__VA_ARGS__)
#define PM_LOG_WARN(fmt, ...)   TS_LOG_WARN("PatternMatcher", fmt, ##__VA_ARGS__)
#define PM_LOG_FATAL(fmt, ...)  TS_LOG_FATAL("PatternMatcher", fmt, ##__VA_ARGS__)

// ============================================================================
// STRUCTURE IMPLEMENTATIONS
// ============================================================================

bool MatcherConfig::IsValid() const noexcept {
    return expectedPatterns > 0 &&
           maxPatterns > 0 &&
           falsePositiveRate > 0.0 &&
           falsePositiveRate <= 0.5;
}

std::string MatcherStats::ToJson() const {
    json j;
    j["patterns"] = patterns;
    j["domains"] = domains;
    j["bloomFilterUsage"] = bloomFilterUsage;
    j["wildcardPatterns"] = wildcardPatterns;
    j["literalPatterns"] = literalPatterns;
    j["bloomFilterBits"] = bloomFilterBits;
    j["bloomFilterHashes"] = bloomFilterHashes;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

namespace {

    /**
     * Rebuilds the URL from its parsed parts so scans see one spelling of it:
     * lowercase, no userinfo, no trailing host dot, "/" for an empty path.
     */
    std::string CanonicalizeForScan(const NetworkUtils::UrlComponents& url) {
        std::string out;
        out.reserve(url.scheme.size() + url.host.size() + url.path.size() +
                    url.query.size() + url.fragment.size() + 16);
        out += url.scheme;
        out += "://";
        if (url.host.find(':') != std::string::npos) {
            out += '[';
            out += url.host;
            out += ']';
        }
        else {
            out += url.host;
        }
        if (url.port != 0) {
            out += ':';
            out += std::to_string(url.port);
        }
        out += url.path.empty() ? std::string_view("/") : std::string_view(url.path);
        if (!url.query.empty()) {
            out += '?';
            out += url.query;
        }
        if (!url.fragment.empty()) {
            out += '#';
            out += url.fragment;
        }
        StringUtils::ToLower(out);
        return out;
    }

    const WildcardAutomaton* GetScanAutomaton(const CompiledPattern& pattern) noexcept {
        if (const auto* wildcard = std::get_if<WildcardRule>(&pattern.rule)) {
            return &wildcard->automaton;
        }
        if (const auto* literal = std::get_if<LiteralRule>(&pattern.rule)) {
            return &literal->automaton;
        }
        return nullptr;
    }

    const std::string* GetIndexedDomain(const CompiledPattern& pattern) noexcept {
        if (const auto* anchor = std::get_if<DomainAnchorRule>(&pattern.rule)) {
            return &anchor->domain;
        }
        if (const auto* literal = std::get_if<LiteralRule>(&pattern.rule)) {
            return literal->isDomain ? &literal->text : nullptr;
        }
        return nullptr;
    }

}  // anonymous namespace

// ============================================================================
// IMPLEMENTATION CLASS
// ============================================================================

class PatternMatcherImpl {
public:
    explicit PatternMatcherImpl(const MatcherConfig& config)
        : m_config(config)
        , m_bloom(config.expectedPatterns, config.falsePositiveRate) {
    }

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    [[nodiscard]] bool Initialize(const std::vector<std::string>& patterns) {
        const auto start = std::chrono::steady_clock::now();

        try {
            if (m_patterns.empty()) {
                const size_t expected = std::max(m_config.expectedPatterns, patterns.size());
                BloomFilter fresh(expected, m_config.falsePositiveRate);
                if (!fresh.IsValid()) {
                    throw std::bad_alloc();
                }
                m_bloom = std::move(fresh);
                m_saturationWarned = false;
            }

            size_t added = 0;
            size_t rejected = 0;
            for (size_t i = 0; i < patterns.size(); ++i) {
                if (m_patterns.size() >= m_config.maxPatterns) {
                    PM_LOG_WARN("Max patterns (%zu) reached, skipping %zu remaining",
                        m_config.maxPatterns, patterns.size() - i);
                    break;
                }

                CompiledPattern compiled;
                const CompileStatus status = CompilePattern(patterns[i], compiled);
                if (status != CompileStatus::Ok) {
                    ++rejected;
                    PM_LOG_DEBUG("Pattern rejected (%s)", GetCompileStatusName(status));
                    continue;
                }
                if (Register(std::move(compiled))) {
                    ++added;
                }
            }

            m_initialized = true;
            CheckSaturation();

            const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            PM_LOG_INFO("Initialized with %zu patterns (%zu new, %zu rejected) in %lld ms",
                m_patterns.size(), added, rejected, static_cast<long long>(elapsedMs));
            return true;
        }
        catch (const std::bad_alloc&) {
            PM_LOG_FATAL("Out of memory while compiling %zu patterns, matcher cleared", patterns.size());
            Clear();
            return false;
        }
    }

    void Clear() noexcept {
        m_patterns.clear();
        m_scanList.clear();
        m_domainOwners.clear();
        m_domainIndex.Clear();
        m_bloom.Clear();
        m_wildcardCount = 0;
        m_literalCount = 0;
        m_saturationWarned = false;
        m_initialized = false;
    }

    [[nodiscard]] bool IsInitialized() const noexcept {
        return m_initialized;
    }

    // ========================================================================
    // MATCHING
    // ========================================================================

    [[nodiscard]] MatchResult Evaluate(std::string_view url) const {
        MatchResult result;
        if (!m_initialized || url.empty() || m_patterns.empty()) {
            return result;
        }

        NetworkUtils::UrlComponents components;
        if (!NetworkUtils::ParseUrl(url, components, nullptr)) {
            // Fail open: an unparseable URL is never blocked
            return result;
        }

        bool bloomHit = false;
        for (const std::string_view key : NetworkUtils::GetDomainSuffixes(components.host)) {
            if (m_bloom.MightContain(key)) {
                bloomHit = true;
                break;
            }
        }

        if (!bloomHit && m_scanList.empty()) {
            return result;
        }

        if (bloomHit) {
            std::string matchedDomain;
            if (m_domainIndex.Query(components.host, matchedDomain)) {
                const auto owners = m_domainOwners.find(matchedDomain);
                if (owners != m_domainOwners.end() && !owners->second.empty()) {
                    const CompiledPattern& pattern = *owners->second.front();
                    result.matched = true;
                    result.kind = pattern.kind;
                    result.pattern = pattern.original;
                    return result;
                }
            }
        }

        if (m_scanList.empty()) {
            return result;
        }

        const std::string canonical = CanonicalizeForScan(components);
        for (const CompiledPattern* pattern : m_scanList) {
            const WildcardAutomaton* automaton = GetScanAutomaton(*pattern);
            if (automaton != nullptr && automaton->Match(canonical)) {
                result.matched = true;
                result.kind = pattern->kind;
                result.pattern = pattern->original;
                return result;
            }
        }

        return result;
    }

    // ========================================================================
    // PATTERN MANAGEMENT
    // ========================================================================

    bool AddPattern(std::string_view raw) {
        CompiledPattern compiled;
        const CompileStatus status = CompilePattern(raw, compiled);
        if (status != CompileStatus::Ok) {
            PM_LOG_DEBUG("Pattern rejected (%s)", GetCompileStatusName(status));
            return false;
        }

        if (m_patterns.size() >= m_config.maxPatterns &&
            m_patterns.find(compiled.Key()) == m_patterns.end()) {
            PM_LOG_WARN("Max patterns (%zu) reached, pattern not added", m_config.maxPatterns);
            return false;
        }

        const std::string key = compiled.Key();
        try {
            if (!Register(std::move(compiled))) {
                return false;
            }
        }
        catch (const std::bad_alloc&) {
            PM_LOG_WARN("Out of memory while adding a pattern");
            Unregister(key);
            return false;
        }

        CheckSaturation();
        return true;
    }

    bool RemovePattern(std::string_view raw) {
        CompiledPattern compiled;
        if (CompilePattern(raw, compiled) != CompileStatus::Ok) {
            return false;
        }
        return Unregister(compiled.Key());
    }

    [[nodiscard]] bool HasPattern(std::string_view raw) const {
        CompiledPattern compiled;
        if (CompilePattern(raw, compiled) != CompileStatus::Ok) {
            return false;
        }
        return m_patterns.find(compiled.Key()) != m_patterns.end();
    }

    // ========================================================================
    // STATISTICS
    // ========================================================================

    [[nodiscard]] MatcherStats GetStats() const noexcept {
        MatcherStats stats;
        stats.patterns = m_patterns.size();
        stats.domains = m_domainOwners.size();
        stats.bloomFilterUsage = m_bloom.GetFillRatio();
        stats.wildcardPatterns = m_wildcardCount;
        stats.literalPatterns = m_literalCount;
        stats.bloomFilterBits = m_bloom.GetBitCount();
        stats.bloomFilterHashes = m_bloom.GetHashFunctions();
        return stats;
    }

    [[nodiscard]] const MatcherConfig& GetConfig() const noexcept {
        return m_config;
    }

private:
    /**
     * @brief Insert a compiled pattern into the structures its rule needs.
     * @return false for duplicates
     */
    bool Register(CompiledPattern compiled) {
        std::string key = compiled.Key();
        auto [it, inserted] = m_patterns.try_emplace(std::move(key), std::move(compiled));
        if (!inserted) {
            return false;
        }

        const CompiledPattern& pattern = it->second;

        if (const std::string* domain = GetIndexedDomain(pattern)) {
            if (!m_domainIndex.Insert(*domain)) {
                PM_LOG_DEBUG("Domain refused by index, pattern dropped");
                m_patterns.erase(it);
                return false;
            }
            m_domainOwners[*domain].push_back(&pattern);
            m_bloom.Add(std::string_view(*domain));
        }
        // Domain-shaped literals sit in both structures
        if (GetScanAutomaton(pattern) != nullptr) {
            m_scanList.push_back(&pattern);
        }

        if (pattern.kind == PatternKind::Wildcard) ++m_wildcardCount;
        if (pattern.kind == PatternKind::Literal) ++m_literalCount;
        return true;
    }

    /// Removes a pattern from whichever structures hold it. Tolerates partial registration.
    bool Unregister(const std::string& key) {
        const auto it = m_patterns.find(key);
        if (it == m_patterns.end()) {
            return false;
        }
        const CompiledPattern* pattern = &it->second;

        if (const std::string* domain = GetIndexedDomain(*pattern)) {
            const auto owners = m_domainOwners.find(*domain);
            if (owners != m_domainOwners.end()) {
                auto& list = owners->second;
                list.erase(std::remove(list.begin(), list.end(), pattern), list.end());
                if (list.empty()) {
                    // Last pattern for this domain; Bloom bits stay set
                    (void)m_domainIndex.Remove(*domain);
                    m_domainOwners.erase(owners);
                }
            }
        }
        if (GetScanAutomaton(*pattern) != nullptr) {
            m_scanList.erase(std::remove(m_scanList.begin(), m_scanList.end(), pattern), m_scanList.end());
        }

        if (pattern->kind == PatternKind::Wildcard && m_wildcardCount > 0) --m_wildcardCount;
        if (pattern->kind == PatternKind::Literal && m_literalCount > 0) --m_literalCount;

        m_patterns.erase(it);
        return true;
    }

    void CheckSaturation() {
        const double fill = m_bloom.GetFillRatio();
        if (fill > PatternMatcherConstants::BLOOM_SATURATION_THRESHOLD) {
            if (!m_saturationWarned) {
                PM_LOG_WARN("Bloom filter saturated (%.1f%% of %zu bits set), expect more index lookups",
                    fill * 100.0, m_bloom.GetBitCount());
                m_saturationWarned = true;
            }
        }
        else {
            m_saturationWarned = false;
        }
    }

    MatcherConfig m_config;
    BloomFilter m_bloom;
    DomainIndex m_domainIndex;

    /// Pattern key -> compiled pattern. Node-based, so element addresses are stable.
    std::unordered_map<std::string, CompiledPattern> m_patterns;

    /// Indexed domain -> patterns that put it there, oldest first
    std::map<std::string, std::vector<const CompiledPattern*>, std::less<>> m_domainOwners;

    /// Glob and substring patterns in registration order
    std::vector<const CompiledPattern*> m_scanList;

    size_t m_wildcardCount = 0;
    size_t m_literalCount = 0;
    bool m_saturationWarned = false;
    bool m_initialized = false;
};

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

PatternMatcher::PatternMatcher(const MatcherConfig& config)
    : m_impl(std::make_unique<PatternMatcherImpl>(config)) {
}

PatternMatcher::~PatternMatcher() = default;
PatternMatcher::PatternMatcher(PatternMatcher&&) noexcept = default;
PatternMatcher& PatternMatcher::operator=(PatternMatcher&&) noexcept = default;

bool PatternMatcher::Initialize(const std::vector<std::string>& patterns) {
    return m_impl->Initialize(patterns);
}

void PatternMatcher::Clear() noexcept {
    m_impl->Clear();
}

bool PatternMatcher::IsInitialized() const noexcept {
    return m_impl->IsInitialized();
}

bool PatternMatcher::Matches(std::string_view url) const noexcept {
    try {
        return m_impl->Evaluate(url).matched;
    }
    catch (const std::bad_alloc&) {
        return false;
    }
}

bool PatternMatcher::Matches(const char* url) const noexcept {
    if (url == nullptr) {
        return false;
    }
    return Matches(std::string_view(url));
}

MatchResult PatternMatcher::Evaluate(std::string_view url) const {
    return m_impl->Evaluate(url);
}

bool PatternMatcher::AddPattern(std::string_view pattern) {
    return m_impl->AddPattern(pattern);
}

bool PatternMatcher::RemovePattern(std::string_view pattern) {
    return m_impl->RemovePattern(pattern);
}

bool PatternMatcher::HasPattern(std::string_view pattern) const {
    return m_impl->HasPattern(pattern);
}

MatcherStats PatternMatcher::GetStats() const noexcept {
    return m_impl->GetStats();
}

const MatcherConfig& PatternMatcher::GetConfig() const noexcept {
    return m_impl->GetConfig();
}

}  // namespace Matcher
}  // namespace TrackShield
