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

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace TrackShield {
    namespace Matcher {

        /**
         * @brief Glob matcher for patterns where '*' matches any run of characters.
         *
         * The pattern is reduced to its ordered literal fragments plus two anchor
         * flags. Matching scans the input once with a forward-only cursor, so the
         * cost is bounded by O(|input| x fragments) whatever the pattern looks
         * like. Every character other than '*' is literal: "(a+)+" matches the
         * five characters "(a+)+" and nothing else.
         */
        class WildcardAutomaton {
        public:
            WildcardAutomaton() = default;

            /// @brief Build from a glob. Fragments are stored as given (no case folding).
            explicit WildcardAutomaton(std::string_view glob);

            /// @brief Build a plain substring matcher (both ends open)
            [[nodiscard]] static WildcardAutomaton Substring(std::string_view literal);

            [[nodiscard]] bool Match(std::string_view input) const noexcept;

            [[nodiscard]] const std::vector<std::string>& GetFragments() const noexcept { return m_fragments; }
            [[nodiscard]] bool IsLeadingOpen() const noexcept { return m_leadingOpen; }
            [[nodiscard]] bool IsTrailingOpen() const noexcept { return m_trailingOpen; }

            /// @brief False for globs made only of '*' (or empty)
            [[nodiscard]] bool HasLiteral() const noexcept { return !m_fragments.empty(); }

        private:
            std::vector<std::string> m_fragments;
            bool m_leadingOpen = false;    // pattern starts with '*'
            bool m_trailingOpen = false;   // pattern ends with '*'
        };

    }  // namespace Matcher
}  // namespace TrackShield
