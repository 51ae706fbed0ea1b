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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace TrackShield {
	namespace Utils {
		namespace NetworkUtils {

			// ============================================================================
			// Limits
			// ============================================================================

			inline constexpr size_t MAX_DOMAIN_LENGTH = 253;
			inline constexpr size_t MAX_LABEL_LENGTH = 63;
			inline constexpr size_t MAX_URL_LENGTH = 64 * 1024;

			// ============================================================================
			// Error Structures
			// ============================================================================

			enum class ErrorCode : uint8_t {
				None = 0,
				Empty,
				TooLong,
				MissingScheme,
				MissingAuthority,
				InvalidPort,
				InvalidHost
			};

			struct Error {
				ErrorCode code = ErrorCode::None;
				std::string message;
				std::string context;
			};

			// ============================================================================
			// URL Structures
			// ============================================================================

			struct UrlComponents {
				std::string scheme;      // http, https, ftp, etc. (lowercase)
				std::string username;
				std::string password;
				std::string host;        // lowercase, no brackets, no trailing dot
				uint16_t port = 0;       // 0 when absent
				std::string path;
				std::string query;       // without leading '?'
				std::string fragment;    // without leading '#'
			};

			// --- URL Manipulation ---

			/**
			 * Parse an absolute hierarchical URL ("scheme://authority/path?query#fragment").
			 *
			 * The host is canonicalized: userinfo and port are split off, IPv6
			 * brackets and a single trailing dot are removed and ASCII letters are
			 * lowercased. Only host characters allowed in DNS names and IP literals
			 * are accepted.
			 */
			bool ParseUrl(std::string_view url, UrlComponents& components, Error* err = nullptr) noexcept;

			/// Canonical host of a URL, or an empty string when it cannot be parsed.
			std::string ExtractHostname(std::string_view url) noexcept;
			bool IsValidUrl(std::string_view url) noexcept;

			// --- Domain and Host Validation ---

			/// LDH labels (underscore tolerated), 1..63 chars each, 253 chars overall, no leading/trailing hyphen.
			bool IsValidDomain(std::string_view domain) noexcept;

			/**
			 * Host followed by each parent suffix at label boundaries:
			 * "a.b.example.com" -> {"a.b.example.com", "b.example.com", "example.com", "com"}.
			 */
			std::vector<std::string_view> GetDomainSuffixes(std::string_view host);

		}  // namespace NetworkUtils
	}  // namespace Utils
}  // namespace TrackShield
