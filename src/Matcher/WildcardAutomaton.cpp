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
#include "WildcardAutomaton.hpp"

namespace TrackShield {
    namespace Matcher {

        WildcardAutomaton::WildcardAutomaton(std::string_view glob) {
            if (glob.empty()) {
                return;
            }

            m_leadingOpen = glob.front() == '*';
            m_trailingOpen = glob.back() == '*';

            size_t start = 0;
            while (start <= glob.size()) {
                const size_t star = glob.find('*', start);
                const size_t end = (star == std::string_view::npos) ? glob.size() : star;
                if (end > start) {
                    m_fragments.emplace_back(glob.substr(start, end - start));
                }
                if (star == std::string_view::npos) break;
                start = star + 1;
            }
        }

        WildcardAutomaton WildcardAutomaton::Substring(std::string_view literal) {
            WildcardAutomaton automaton;
            if (!literal.empty()) {
                automaton.m_fragments.emplace_back(literal);
            }
            automaton.m_leadingOpen = true;
            automaton.m_trailingOpen = true;
            return automaton;
        }

        bool WildcardAutomaton::Match(std::string_view input) const noexcept {
            if (m_fragments.empty()) {
                return false;
            }

            // No wildcard at all: exact comparison
            if (m_fragments.size() == 1 && !m_leadingOpen && !m_trailingOpen) {
                return input == m_fragments.front();
            }

            size_t cursor = 0;
            size_t first = 0;
            size_t last = m_fragments.size();

            if (!m_leadingOpen) {
                const std::string& prefix = m_fragments.front();
                if (input.substr(0, prefix.size()) != prefix) {
                    return false;
                }
                cursor = prefix.size();
                first = 1;
            }

            // The closing fragment is checked as a suffix, not searched for
            if (!m_trailingOpen && last > first) {
                --last;
            }

            for (size_t i = first; i < last; ++i) {
                const std::string& fragment = m_fragments[i];
                const size_t pos = input.find(fragment, cursor);
                if (pos == std::string_view::npos) {
                    return false;
                }
                cursor = pos + fragment.size();
            }

            if (!m_trailingOpen && last < m_fragments.size()) {
                const std::string& suffix = m_fragments.back();
                if (suffix.size() > input.size() - cursor) {
                    return false;
                }
                return input.substr(input.size() - suffix.size()) == suffix;
            }

            return true;
        }

    }  // namespace Matcher
}  // namespace TrackShield
