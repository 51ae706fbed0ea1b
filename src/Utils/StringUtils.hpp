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

#include <string>
#include <string_view>
#include <vector>

namespace TrackShield {
	namespace Utils {
		namespace StringUtils {

			// ASCII-only case folding; URLs and blocklist rules are ASCII on the wire.
			void ToLower(std::string& str) noexcept;
			[[nodiscard]] std::string ToLowerCopy(std::string_view str);

			//Trimming functions
			void TrimLeft(std::string& str);
			void TrimRight(std::string& str);
			void Trim(std::string& str);
			[[nodiscard]] std::string TrimCopy(std::string_view str);

			/// @brief Whitespace-trimmed view into the caller's buffer (no copy)
			[[nodiscard]] std::string_view TrimView(std::string_view str) noexcept;

			//Comparing
			[[nodiscard]] bool IEquals(std::string_view s1, std::string_view s2) noexcept;
			[[nodiscard]] bool StartsWith(std::string_view str, std::string_view prefix) noexcept;
			[[nodiscard]] bool EndsWith(std::string_view str, std::string_view suffix) noexcept;

			//splitting and joining

			/**
			 * @brief Split on a delimiter, keeping empty pieces.
			 *
			 * "a..b" split on "." gives {"a", "", "b"}. An empty input yields an
			 * empty vector.
			 */
			[[nodiscard]] std::vector<std::string> Split(std::string_view str, std::string_view delimiter);
			[[nodiscard]] std::string Join(const std::vector<std::string>& elements, std::string_view delimiter);

			/// @brief At most maxLength bytes of str, cut before any UTF-8 sequence that would not fit whole
			[[nodiscard]] std::string Truncate(std::string_view str, size_t maxLength);

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace TrackShield
