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
#include "pch.h"
#include "PatternCompiler.hpp"
#include "../Utils/NetworkUtils.hpp"
#include "../Utils/StringUtils.hpp"

namespace TrackShield {
    namespace Matcher {

        using namespace Utils;

        const char* GetPatternKindName(PatternKind kind) noexcept {
            switch (kind) {
                case PatternKind::DomainAnchor: return "DomainAnchor";
                case PatternKind::Wildcard:     return "Wildcard";
                case PatternKind::Literal:      return "Literal";
                default:                        return "Unknown";
            }
        }

        const char* GetCompileStatusName(CompileStatus status) noexcept {
            switch (status) {
                case CompileStatus::Ok:                return "Ok";
                case CompileStatus::Empty:             return "Empty";
                case CompileStatus::TooLong:           return "TooLong";
                case CompileStatus::NoLiteralFragment: return "NoLiteralFragment";
                default:                               return "Unknown";
            }
        }

        std::string CompiledPattern::Key() const {
            const char* tag = "l:";
            switch (kind) {
                case PatternKind::DomainAnchor: tag = "d:"; break;
                case PatternKind::Wildcard:     tag = "w:"; break;
                case PatternKind::Literal:      tag = "l:"; break;
            }
            return tag + normalized;
        }

        namespace {

            // A bare literal is also indexed by domain if it looks like a real
            // host name; single labels ("ads") are substring scans only.
            bool IsIndexableDomain(std::string_view text) noexcept {
                return text.find('.') != std::string_view::npos &&
                    NetworkUtils::IsValidDomain(text);
            }

            CompileStatus MakeWildcard(std::string original, std::string glob, CompiledPattern& out) {
                WildcardAutomaton automaton(glob);
                if (!automaton.HasLiteral()) {
                    return CompileStatus::NoLiteralFragment;
                }
                out.original = std::move(original);
                out.kind = PatternKind::Wildcard;
                out.normalized = std::move(glob);
                out.rule = WildcardRule{ std::move(automaton) };
                return CompileStatus::Ok;
            }

            CompileStatus MakeLiteral(std::string original, std::string text, CompiledPattern& out) {
                if (text.empty()) {
                    return CompileStatus::NoLiteralFragment;
                }
                LiteralRule rule;
                rule.isDomain = IsIndexableDomain(text);
                rule.automaton = WildcardAutomaton::Substring(text);
                rule.text = text;

                out.original = std::move(original);
                out.kind = PatternKind::Literal;
                out.normalized = std::move(text);
                out.rule = std::move(rule);
                return CompileStatus::Ok;
            }
        }

        CompileStatus CompilePattern(std::string_view raw, CompiledPattern& out) {
            const std::string_view trimmed = StringUtils::TrimView(raw);
            if (trimmed.empty()) {
                return CompileStatus::Empty;
            }
            if (trimmed.size() > MAX_PATTERN_LENGTH) {
                return CompileStatus::TooLong;
            }

            std::string original(trimmed);
            std::string lower = StringUtils::ToLowerCopy(trimmed);

            if (StringUtils::StartsWith(lower, "||")) {
                std::string_view body(lower);
                body.remove_prefix(2);
                const bool caretTerminated = !body.empty() && body.back() == '^';
                if (caretTerminated) {
                    body.remove_suffix(1);
                }

                if (caretTerminated) {
                    std::string_view domain = body;
                    if (StringUtils::StartsWith(domain, "*.")) {
                        domain.remove_prefix(2);
                    }
                    if (NetworkUtils::IsValidDomain(domain)) {
                        out.original = std::move(original);
                        out.kind = PatternKind::DomainAnchor;
                        out.normalized.assign(domain);
                        out.rule = DomainAnchorRule{ std::string(domain) };
                        return CompileStatus::Ok;
                    }
                }

                // Not a clean domain anchor ("||host/path^", "||ads.*.net^"): the
                // body may sit anywhere in the URL
                if (body.find('*') != std::string_view::npos) {
                    std::string glob;
                    glob.reserve(body.size() + 2);
                    glob += '*';
                    glob.append(body);
                    glob += '*';
                    return MakeWildcard(std::move(original), std::move(glob), out);
                }
                return MakeLiteral(std::move(original), std::string(body), out);
            }

            if (lower.find('*') != std::string::npos) {
                return MakeWildcard(std::move(original), std::move(lower), out);
            }

            return MakeLiteral(std::move(original), std::move(lower), out);
        }

    }  // namespace Matcher
}  // namespace TrackShield
