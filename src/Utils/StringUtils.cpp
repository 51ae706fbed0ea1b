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
#include "StringUtils.hpp"

#include <algorithm>

namespace TrackShield {
	namespace Utils {
		namespace StringUtils {

			namespace {
				constexpr char ToLowerAscii(char c) noexcept {
					return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
				}

				constexpr const char* WHITESPACE = " \t\n\r\f\v";
			}

			//lower case transformations
			void ToLower(std::string& str) noexcept {
				for (char& c : str) {
					c = ToLowerAscii(c);
				}
			}

			std::string ToLowerCopy(std::string_view str) {
				std::string result(str);
				ToLower(result);
				return result;
			}

			void TrimLeft(std::string& str) {
				const size_t pos = str.find_first_not_of(WHITESPACE);
				if (pos == std::string::npos) {
					// String is all whitespace - clear it
					str.clear();
				} else {
					str.erase(0, pos);
				}
			}

			void TrimRight(std::string& str) {
				const size_t pos = str.find_last_not_of(WHITESPACE);
				if (pos == std::string::npos) {
					str.clear();
				} else {
					str.erase(pos + 1);
				}
			}

			void Trim(std::string& str) {
				TrimRight(str);
				TrimLeft(str);
			}

			std::string TrimCopy(std::string_view str) {
				return std::string(TrimView(str));
			}

			std::string_view TrimView(std::string_view str) noexcept {
				const size_t first = str.find_first_not_of(WHITESPACE);
				if (first == std::string_view::npos) {
					return {};
				}
				const size_t last = str.find_last_not_of(WHITESPACE);
				return str.substr(first, last - first + 1);
			}

			bool IEquals(std::string_view s1, std::string_view s2) noexcept {
				if (s1.size() != s2.size()) return false;
				for (size_t i = 0; i < s1.size(); ++i) {
					if (ToLowerAscii(s1[i]) != ToLowerAscii(s2[i])) return false;
				}
				return true;
			}

			bool StartsWith(std::string_view str, std::string_view prefix) noexcept {
				return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
			}

			bool EndsWith(std::string_view str, std::string_view suffix) noexcept {
				return str.size() >= suffix.size() &&
					str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
			}

			std::vector<std::string> Split(std::string_view str, std::string_view delimiter) {
				std::vector<std::string> result;
				if (str.empty()) {
					return result;
				}
				if (delimiter.empty()) {
					result.emplace_back(str);
					return result;
				}
				size_t last = 0;
				size_t next = 0;
				while ((next = str.find(delimiter, last)) != std::string_view::npos) {
					result.emplace_back(str.substr(last, next - last));
					last = next + delimiter.length();
				}
				result.emplace_back(str.substr(last));
				return result;
			}

			std::string Join(const std::vector<std::string>& elements, std::string_view delimiter) {
				std::string result;
				if (elements.empty()) {
					return result;
				}
				size_t total_size = (elements.size() - 1) * delimiter.size();
				for (const auto& s : elements) {
					total_size += s.size();
				}
				result.reserve(total_size);
				result += elements[0];
				for (size_t i = 1; i < elements.size(); ++i) {
					result += delimiter;
					result += elements[i];
				}
				return result;
			}

			std::string Truncate(std::string_view str, size_t maxLength) {
				if (str.size() <= maxLength) {
					return std::string(str);
				}
				size_t cut = maxLength;
				// Back off over continuation bytes so a multi-byte sequence is never split
				while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
					--cut;
				}
				return std::string(str.substr(0, cut));
			}

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace TrackShield
