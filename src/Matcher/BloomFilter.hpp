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
#include <cstdint>
#include <string_view>
#include <vector>

namespace TrackShield {
    namespace Matcher {

        // ============================================================================
        // BLOOM FILTER
        // ============================================================================

        /**
         * @brief Fast-reject set over domain keys.
         *
         * Sized from the expected element count and the target false positive rate
         * (m = -n ln p / (ln 2)^2, k = round(m/n ln 2) clamped to [1, 16]). The k
         * bit positions of a key are derived by double hashing from one 64-bit
         * FNV-1a hash. There is no deletion: bits stay set until Clear().
         *
         * Not internally synchronized.
         */
        class BloomFilter {
        public:
            static constexpr size_t DEFAULT_EXPECTED_ELEMENTS = 100'000;
            static constexpr double DEFAULT_FALSE_POSITIVE_RATE = 0.01;

            explicit BloomFilter(size_t expectedElements = DEFAULT_EXPECTED_ELEMENTS,
                                 double falsePositiveRate = DEFAULT_FALSE_POSITIVE_RATE);
            ~BloomFilter() = default;

            BloomFilter(const BloomFilter&) = default;
            BloomFilter& operator=(const BloomFilter&) = default;
            BloomFilter(BloomFilter&&) noexcept = default;
            BloomFilter& operator=(BloomFilter&&) noexcept = default;

            // Add element
            void Add(std::string_view key) noexcept;
            void Add(uint64_t hash) noexcept;

            // Check if element might exist (false positives possible)
            [[nodiscard]] bool MightContain(std::string_view key) const noexcept;
            [[nodiscard]] bool MightContain(uint64_t hash) const noexcept;

            // Clear all bits
            void Clear() noexcept;

            /// @brief False when the bit array could not be allocated
            [[nodiscard]] bool IsValid() const noexcept { return !m_bits.empty(); }

            // Statistics
            [[nodiscard]] size_t GetBitCount() const noexcept { return m_size; }
            [[nodiscard]] size_t GetHashFunctions() const noexcept { return m_numHashes; }
            [[nodiscard]] size_t GetSetBitCount() const noexcept;
            [[nodiscard]] double GetFillRatio() const noexcept;

        private:
            std::vector<uint64_t> m_bits;    // Bit array
            size_t m_numHashes{0};           // Number of hash functions
            size_t m_size{0};                // Bit array size

            [[nodiscard]] size_t BitIndex(uint64_t hash, size_t i) const noexcept;
        };

    }  // namespace Matcher
}  // namespace TrackShield
