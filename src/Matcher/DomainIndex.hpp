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
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace TrackShield {
    namespace Matcher {

        // ============================================================================
        // DomainIndex Declaration
        // ============================================================================

        /**
         * @brief Label trie keyed top-level label first ("com" -> "example" -> "ads").
         *
         * Domains sharing a suffix share a path from the root, so a host lookup
         * walks its labels right to left and stops at the first terminal node:
         * an entry for "example.com" covers "example.com" and every subdomain of
         * it, but never "notexample.com".
         *
         * Not internally synchronized.
         */
        class DomainIndex {
        public:
            DomainIndex();
            ~DomainIndex();

            DomainIndex(const DomainIndex&) = delete;
            DomainIndex& operator=(const DomainIndex&) = delete;
            DomainIndex(DomainIndex&&) noexcept;
            DomainIndex& operator=(DomainIndex&&) noexcept;

            /// @brief Insert a lowercase domain
            /// @return false for an empty domain, an empty label, a label over 63
            ///         characters or a domain over 253 characters
            [[nodiscard]] bool Insert(std::string_view domain);

            /// @brief True if host or one of its parent domains was inserted
            [[nodiscard]] bool Query(std::string_view host) const noexcept;

            /**
             * @brief Like Query, also reporting the matching entry.
             *
             * The shortest (closest to the root) terminal wins, so with both
             * "example.com" and "ads.example.com" present, "x.ads.example.com"
             * reports "example.com".
             */
            [[nodiscard]] bool Query(std::string_view host, std::string& matchedDomain) const;

            /// @brief True only for an exact terminal entry
            [[nodiscard]] bool Contains(std::string_view domain) const noexcept;

            /// @brief Clear the terminal flag of an entry. Nodes are not pruned.
            /// @return true if the entry existed
            [[nodiscard]] bool Remove(std::string_view domain) noexcept;

            void Clear() noexcept;

            [[nodiscard]] size_t GetEntryCount() const noexcept { return m_entryCount; }
            [[nodiscard]] size_t GetNodeCount() const noexcept { return m_nodeCount; }

        private:
            struct Node;

            [[nodiscard]] const Node* FindNode(std::string_view domain) const noexcept;

            std::unique_ptr<Node> m_root;
            size_t m_nodeCount = 0;
            size_t m_entryCount = 0;
        };

    }  // namespace Matcher
}  // namespace TrackShield
