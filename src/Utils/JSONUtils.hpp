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
 * @file JSONUtils.hpp
 * @brief JSON parsing, serialization, and lookup utilities for TrackShield.
 *
 * Used by the configuration loader and by the JSON reports of the matcher,
 * filter list and blocker statistics. Parsing is bounded in depth and input
 * size; lookups take "section.key" or "list[3]" paths.
 *
 * @note Nothing here throws. Failures come back as false plus an Error.
 */

#include <string>
#include <string_view>
#include <filesystem>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace TrackShield {
	namespace Utils {
		namespace JSON {

			using Json = nlohmann::json;

			// ============================================================================
			// Limits
			// ============================================================================

			/// Deeper documents are rejected before the parser recurses further
			inline constexpr size_t MAX_JSON_DEPTH = 1000;

			/// LoadFromFile refuses larger files unless told otherwise
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 32ULL * 1024 * 1024;

			// ============================================================================
			// Errors
			// ============================================================================

			/**
			 * @brief What went wrong and where.
			 *
			 * line/column are filled for syntax errors only; the config loader
			 * reports them next to the file name.
			 */
			struct Error {
				std::string message;
				std::filesystem::path path;       ///< Empty for in-memory text
				size_t byteOffset = 0;            ///< 0 when unknown
				size_t line = 0;                  ///< 1-based, 0 when unknown
				size_t column = 0;                ///< 1-based, 0 when unknown

				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
					line = 0;
					column = 0;
				}
			};

			/// @brief Config files may carry // and /* */ comments by default
			struct ParseOptions {
				bool allowComments = true;
				size_t maxDepth = MAX_JSON_DEPTH;
			};

			struct StringifyOptions {
				bool pretty = false;               ///< Multi-line output, as written by TrackShieldConfiguration::ToJson
				int indentSpaces = 2;
				bool ensureAscii = false;          ///< Escape non-ASCII text in the output
			};

			// ============================================================================
			// Parse/Stringify
			// ============================================================================

			/**
			 * @brief Parse a document.
			 *
			 * @param out  Null on failure
			 * @param err  Optional; receives the message and position of a syntax error
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			/**
			 * @brief Serialize Json object to string.
			 *
			 * Invalid UTF-8 in string values is replaced rather than reported.
			 */
			[[nodiscard]] bool Stringify(const Json& j, std::string& out,
			                             const StringifyOptions& opt = {}) noexcept;

			// ============================================================================
			// Files
			// ============================================================================

			/**
			 * @brief Read and parse a file of at most maxBytes.
			 *
			 * A leading UTF-8 byte order mark is skipped. err->path names the file
			 * on every failure.
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			// ============================================================================
			// Paths
			// ============================================================================

			/**
			 * @brief Convert a dot/bracket path ("matcher.maxPatterns", "lists[0]")
			 *        to a JSON Pointer ("/matcher/maxPatterns", "/lists/0").
			 *
			 * Strings that already start with '/' are returned unchanged. An empty
			 * path maps to "/" (the root).
			 */
			[[nodiscard]] std::string ToJsonPointer(std::string_view pathLike) noexcept;

			/// @brief Check if a path exists in a Json object
			[[nodiscard]] bool Contains(const Json& j, std::string_view pathLike) noexcept;

			/// @return false when the path is missing or holds another type; out is then untouched
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pathLike, T& out) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);

					if (jp == "/") {
						out = j.template get<T>();
						return true;
					}

					const nlohmann::json::json_pointer ptr(jp);
					if (!j.contains(ptr)) {
						return false;
					}
					out = j.at(ptr).template get<T>();
					return true;
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
			}

			template <typename T>
			[[nodiscard]] T GetOr(const Json& j, std::string_view pathLike, T defaultValue) noexcept {
				T val{};
				if (Get<T>(j, pathLike, val)) {
					return val;
				}
				return defaultValue;
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace TrackShield
