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
#include "BloomFilter.hpp"
#include "../Utils/HashUtils.hpp"
#include "../Utils/Logger.hpp"

#include <bit>
#include <cmath>

namespace TrackShield {
    namespace Matcher {

        BloomFilter::BloomFilter(size_t expectedElements, double falsePositiveRate) {
            // Input validation - prevent DoS and division by zero
            constexpr size_t MIN_EXPECTED_ELEMENTS = 1;
            constexpr size_t MAX_EXPECTED_ELEMENTS = 100'000'000;
            constexpr double MIN_FPR = 0.0001;
            constexpr double MAX_FPR = 0.5;

            if (expectedElements < MIN_EXPECTED_ELEMENTS) {
                expectedElements = MIN_EXPECTED_ELEMENTS;
                TS_LOG_WARN("BloomFilter",
                    "Expected elements too low, clamped to %zu", MIN_EXPECTED_ELEMENTS);
            }
            if (expectedElements > MAX_EXPECTED_ELEMENTS) {
                expectedElements = MAX_EXPECTED_ELEMENTS;
                TS_LOG_WARN("BloomFilter",
                    "Expected elements too high, clamped to %zu", MAX_EXPECTED_ELEMENTS);
            }

            if (!(falsePositiveRate >= MIN_FPR)) {
                falsePositiveRate = MIN_FPR;
                TS_LOG_WARN("BloomFilter", "FPR too low, clamped to %.4f", MIN_FPR);
            }
            if (falsePositiveRate > MAX_FPR) {
                falsePositiveRate = MAX_FPR;
                TS_LOG_WARN("BloomFilter", "FPR too high, clamped to %.2f", MAX_FPR);
            }

            const double ln2 = std::log(2.0);
            const double ln2Squared = ln2 * ln2;

            // m = -n * ln(p) / (ln2)^2
            const double rawSize = -static_cast<double>(expectedElements) *
                std::log(falsePositiveRate) / ln2Squared;

            constexpr size_t MAX_BIT_SIZE = 1'000'000'000;  // ~125MB
            if (rawSize <= 0.0 || std::isnan(rawSize) || std::isinf(rawSize)) {
                m_size = 64;
            }
            else if (rawSize > static_cast<double>(MAX_BIT_SIZE)) {
                m_size = MAX_BIT_SIZE;
                TS_LOG_WARN("BloomFilter", "Size clamped to maximum: %zu bits", MAX_BIT_SIZE);
            }
            else {
                m_size = static_cast<size_t>(std::ceil(rawSize));
            }

            if (m_size < 64) {
                m_size = 64;
            }

            // k = (m/n) * ln2
            const double rawHashes = (static_cast<double>(m_size) /
                static_cast<double>(expectedElements)) * ln2;
            m_numHashes = static_cast<size_t>(std::lround(rawHashes));

            constexpr size_t MIN_HASHES = 1;
            constexpr size_t MAX_HASHES = 16;
            if (m_numHashes < MIN_HASHES) {
                m_numHashes = MIN_HASHES;
            }
            else if (m_numHashes > MAX_HASHES) {
                m_numHashes = MAX_HASHES;
            }

            const size_t wordCount = (m_size + 63) / 64;
            try {
                m_bits.assign(wordCount, 0ULL);
            }
            catch (const std::bad_alloc& ex) {
                TS_LOG_ERROR("BloomFilter",
                    "Memory allocation failed for %zu words: %s", wordCount, ex.what());
                m_bits.clear();
                m_size = 0;
                m_numHashes = 0;
                return;
            }

            TS_LOG_DEBUG("BloomFilter",
                "Initialized: size=%zu bits (%zu words), hashes=%zu, expectedElements=%zu, FPR=%.4f",
                m_size, m_bits.size(), m_numHashes, expectedElements, falsePositiveRate);
        }

        size_t BloomFilter::BitIndex(uint64_t hash, size_t i) const noexcept {
            // Kirsch-Mitzenmacher: g_i(x) = h1(x) + i * h2(x). h2 is forced odd so
            // the hash sequence never degenerates to a single position.
            const uint64_t h1 = hash;
            const uint64_t h2 = Utils::HashUtils::Mix64(hash) | 1ULL;
            return static_cast<size_t>((h1 + static_cast<uint64_t>(i) * h2) % m_size);
        }

        void BloomFilter::Add(std::string_view key) noexcept {
            Add(Utils::HashUtils::Fnv1a64(key));
        }

        void BloomFilter::Add(uint64_t hash) noexcept {
            if (m_bits.empty() || m_size == 0) {
                return;
            }

            for (size_t i = 0; i < m_numHashes; ++i) {
                const size_t bit = BitIndex(hash, i);
                m_bits[bit / 64] |= (1ULL << (bit % 64));
            }
        }

        bool BloomFilter::MightContain(std::string_view key) const noexcept {
            return MightContain(Utils::HashUtils::Fnv1a64(key));
        }

        bool BloomFilter::MightContain(uint64_t hash) const noexcept {
            if (m_bits.empty() || m_size == 0) {
                return false;
            }

            for (size_t i = 0; i < m_numHashes; ++i) {
                const size_t bit = BitIndex(hash, i);
                if ((m_bits[bit / 64] & (1ULL << (bit % 64))) == 0) {
                    return false;  // Definitely not present
                }
            }
            return true;
        }

        void BloomFilter::Clear() noexcept {
            std::fill(m_bits.begin(), m_bits.end(), 0ULL);
        }

        size_t BloomFilter::GetSetBitCount() const noexcept {
            size_t setBits = 0;
            for (const uint64_t word : m_bits) {
                setBits += static_cast<size_t>(std::popcount(word));
            }
            return setBits;
        }

        double BloomFilter::GetFillRatio() const noexcept {
            if (m_bits.empty() || m_size == 0) {
                return 0.0;
            }
            return static_cast<double>(GetSetBitCount()) / static_cast<double>(m_size);
        }

    }  // namespace Matcher
}  // namespace TrackShield
