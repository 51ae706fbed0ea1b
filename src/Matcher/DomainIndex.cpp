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
#include "DomainIndex.hpp"
#include "../Utils/NetworkUtils.hpp"

namespace TrackShield {
    namespace Matcher {

        namespace {

            /**
             * @brief Iterates the labels of a domain from the top level down.
             *
             * "ads.example.com" yields "com", "example", "ads". Empty labels are
             * yielded as empty views so callers can reject them.
             */
            class ReverseLabelCursor {
            public:
                explicit ReverseLabelCursor(std::string_view domain) noexcept
                    : m_domain(domain), m_end(domain.size()), m_done(domain.empty()) {}

                [[nodiscard]] bool Next(std::string_view& label) noexcept {
                    if (m_done) return false;

                    const size_t dot = (m_end == 0) ? std::string_view::npos : m_domain.rfind('.', m_end - 1);
                    if (dot == std::string_view::npos) {
                        label = m_domain.substr(0, m_end);
                        m_done = true;
                    }
                    else {
                        label = m_domain.substr(dot + 1, m_end - dot - 1);
                        m_end = dot;
                    }
                    return true;
                }

                /// Offset of the last yielded label within the domain
                [[nodiscard]] size_t Offset() const noexcept {
                    return m_done ? 0 : m_end + 1;
                }

            private:
                std::string_view m_domain;
                size_t m_end;
                bool m_done;
            };
        }

        struct DomainIndex::Node {
            std::string label;
            std::map<std::string, std::unique_ptr<Node>, std::less<>> children;
            bool terminal = false;
        };

        DomainIndex::DomainIndex()
            : m_root(std::make_unique<Node>()) {
            m_nodeCount = 1;
        }

        DomainIndex::~DomainIndex() = default;
        DomainIndex::DomainIndex(DomainIndex&&) noexcept = default;
        DomainIndex& DomainIndex::operator=(DomainIndex&&) noexcept = default;

        bool DomainIndex::Insert(std::string_view domain) {
            if (domain.empty() || domain.size() > Utils::NetworkUtils::MAX_DOMAIN_LENGTH) {
                return false;
            }

            // Validate every label before touching the tree
            {
                ReverseLabelCursor cursor(domain);
                std::string_view label;
                while (cursor.Next(label)) {
                    if (label.empty() || label.size() > Utils::NetworkUtils::MAX_LABEL_LENGTH) {
                        return false;
                    }
                }
            }

            if (!m_root) {
                m_root = std::make_unique<Node>();
                m_nodeCount = 1;
            }

            Node* node = m_root.get();
            ReverseLabelCursor cursor(domain);
            std::string_view label;
            while (cursor.Next(label)) {
                auto it = node->children.find(label);
                if (it == node->children.end()) {
                    auto child = std::make_unique<Node>();
                    child->label.assign(label);
                    it = node->children.emplace(child->label, std::move(child)).first;
                    ++m_nodeCount;
                }
                node = it->second.get();
            }

            if (!node->terminal) {
                node->terminal = true;
                ++m_entryCount;
            }
            return true;
        }

        bool DomainIndex::Query(std::string_view host) const noexcept {
            if (!m_root || host.empty() || m_entryCount == 0) return false;

            const Node* node = m_root.get();
            ReverseLabelCursor cursor(host);
            std::string_view label;
            while (cursor.Next(label)) {
                const auto it = node->children.find(label);
                if (it == node->children.end()) {
                    return false;
                }
                node = it->second.get();
                if (node->terminal) {
                    return true;
                }
            }
            return false;
        }

        bool DomainIndex::Query(std::string_view host, std::string& matchedDomain) const {
            if (!m_root || host.empty() || m_entryCount == 0) return false;

            const Node* node = m_root.get();
            ReverseLabelCursor cursor(host);
            std::string_view label;
            while (cursor.Next(label)) {
                const auto it = node->children.find(label);
                if (it == node->children.end()) {
                    return false;
                }
                node = it->second.get();
                if (node->terminal) {
                    matchedDomain.assign(host.substr(cursor.Offset()));
                    return true;
                }
            }
            return false;
        }

        const DomainIndex::Node* DomainIndex::FindNode(std::string_view domain) const noexcept {
            if (!m_root || domain.empty()) return nullptr;

            const Node* node = m_root.get();
            ReverseLabelCursor cursor(domain);
            std::string_view label;
            while (cursor.Next(label)) {
                const auto it = node->children.find(label);
                if (it == node->children.end()) {
                    return nullptr;
                }
                node = it->second.get();
            }
            return node;
        }

        bool DomainIndex::Contains(std::string_view domain) const noexcept {
            const Node* node = FindNode(domain);
            return node != nullptr && node->terminal;
        }

        bool DomainIndex::Remove(std::string_view domain) noexcept {
            // FindNode only hands out const nodes; the tree itself is owned here
            Node* node = const_cast<Node*>(FindNode(domain));
            if (node == nullptr || !node->terminal) {
                return false;
            }
            node->terminal = false;
            --m_entryCount;
            return true;
        }

        void DomainIndex::Clear() noexcept {
            if (m_root) {
                m_root->children.clear();
                m_root->terminal = false;
            }
            m_nodeCount = m_root ? 1 : 0;
            m_entryCount = 0;
        }

    }  // namespace Matcher
}  // namespace TrackShield
