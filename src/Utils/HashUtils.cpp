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
#include "HashUtils.hpp"

namespace TrackShield {
	namespace Utils {
		namespace HashUtils {

			uint32_t Fnv1a32(const void* data, size_t len) noexcept {
				uint32_t hash = FNV1A32_OFFSET_BASIS;
				if (!data) return hash;

				const auto* p = static_cast<const uint8_t*>(data);
				for (size_t i = 0; i < len; ++i) {
					hash ^= p[i];
					hash *= FNV1A32_PRIME;
				}
				return hash;
			}

			uint64_t Fnv1a64(const void* data, size_t len) noexcept {
				uint64_t hash = FNV1A64_OFFSET_BASIS;
				if (!data) return hash;

				const auto* p = static_cast<const uint8_t*>(data);
				for (size_t i = 0; i < len; ++i) {
					hash ^= p[i];
					hash *= FNV1A64_PRIME;
				}
				return hash;
			}

			uint64_t Mix64(uint64_t value) noexcept {
				value ^= value >> 33;
				value *= 0xFF51AFD7ED558CCDULL;
				value ^= value >> 33;
				value *= 0xC4CEB9FE1A85EC53ULL;
				value ^= value >> 33;
				return value;
			}

		}  // namespace HashUtils
	}  // namespace Utils
}  // namespace TrackShield
