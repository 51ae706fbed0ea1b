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
 * @file HashUtils.hpp
 * @brief Non-cryptographic hashing utilities for TrackShield.
 *
 * Provides the fast hashes used by in-memory indexes:
 * - FNV-1a 32/64-bit
 * - 64-bit finalizer (avalanche mixing) for deriving secondary hashes
 *
 * @warning None of these functions are suitable for security purposes.
 */

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace TrackShield {
	namespace Utils {
		namespace HashUtils {

			inline constexpr uint32_t FNV1A32_OFFSET_BASIS = 0x811C9DC5u;
			inline constexpr uint32_t FNV1A32_PRIME = 0x01000193u;
			inline constexpr uint64_t FNV1A64_OFFSET_BASIS = 0xCBF29CE484222325ULL;
			inline constexpr uint64_t FNV1A64_PRIME = 0x100000001B3ULL;

			/**
			 * @brief Compute FNV-1a 32-bit hash.
			 *
			 * @param data Input data
			 * @param len Length of input data
			 * @return 32-bit hash value
			 */
			[[nodiscard]] uint32_t Fnv1a32(const void* data, size_t len) noexcept;

			/**
			 * @brief Compute FNV-1a 64-bit hash.
			 *
			 * @param data Input data
			 * @param len Length of input data
			 * @return 64-bit hash value
			 */
			[[nodiscard]] uint64_t Fnv1a64(const void* data, size_t len) noexcept;

			[[nodiscard]] inline uint64_t Fnv1a64(std::string_view str) noexcept {
				return Fnv1a64(str.data(), str.size());
			}

			/// @brief MurmurHash3 fmix64 finalizer
			[[nodiscard]] uint64_t Mix64(uint64_t value) noexcept;

		}  // namespace HashUtils
	}  // namespace Utils
}  // namespace TrackShield
