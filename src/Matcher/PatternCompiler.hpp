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
#pragma once
/**
 * @file PatternCompiler.hpp
 * @brief Parses raw blocklist patterns into a typed rule.
 *
 * Accepted syntax:
 *   ||domain^            domain anchor: the domain and all of its subdomains
 *   *://*.host/path*     glob over the full URL, '*' matches any run
 *   anything else        literal: a bare domain, or a URL substring
 *
 * Compilation never throws on malformed input; the status says why a
 * pattern was refused.
 */

#include "WildcardAutomaton.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace TrackShield {
    namespace Matcher {

        inline constexpr size_t MAX_PATTERN_LENGTH = 512;

        enum class PatternKind : uint8_t {
            DomainAnchor = 0,
            Wildcard     = 1,
            Literal      = 2
        };

        enum class CompileStatus : uint8_t {
            Ok                = 0,
            Empty             = 1,    ///< Null, empty or whitespace only
            TooLong           = 2,    ///< Longer than MAX_PATTERN_LENGTH after trimming
            NoLiteralFragment = 3     ///< Nothing but '*' (or an empty "||^" body)
        };

        [[nodiscard]] const char* GetPatternKindName(PatternKind kind) noexcept;
        [[nodiscard]] const char* GetCompileStatusName(CompileStatus status) noexcept;

        // ============================================================================
        // Rule payloads
        // ============================================================================

        struct DomainAnchorRule {
            std::string domain;              ///< lowercase, no leading "*."
        };

        struct WildcardRule {
            WildcardAutomaton automaton;     ///< built from the lowercased glob
        };

        struct LiteralRule {
            std::string text;                ///< lowercase
            bool isDomain = false;           ///< also indexed by domain
            WildcardAutomaton automaton;     ///< substring scanner over the whole URL
        };

        using PatternRule = std::variant<DomainAnchorRule, WildcardRule, LiteralRule>;

        struct CompiledPattern {
            std::string original;            ///< trimmed input
            PatternKind kind = PatternKind::Literal;
            std::string normalized;          ///< lowercase canonical form
            PatternRule rule;

            /// @brief Identity used for duplicate detection and removal
            [[nodiscard]] std::string Key() const;
        };

        /**
         * @brief Compile one raw pattern.
         *
         * @param raw Pattern text; surrounding ASCII whitespace is ignored
         * @param out Filled only when the result is CompileStatus::Ok
         */
        [[nodiscard]] CompileStatus CompilePattern(std::string_view raw, CompiledPattern& out);

    }  // namespace Matcher
}  // namespace TrackShield
