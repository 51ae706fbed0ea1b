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
#include "NetworkUtils.hpp"
#include "StringUtils.hpp"

#include <charconv>

namespace TrackShield {
	namespace Utils {
		namespace NetworkUtils {

			namespace Internal {

				void SetError(Error* err, ErrorCode code, std::string message, std::string_view context = {}) {
					if (!err) return;
					err->code = code;
					err->message = std::move(message);
					err->context.assign(context.substr(0, 128));
				}

				constexpr bool IsAlpha(char c) noexcept {
					return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
				}

				constexpr bool IsDigit(char c) noexcept {
					return c >= '0' && c <= '9';
				}

				constexpr bool IsHostChar(char c) noexcept {
					return IsAlpha(c) || IsDigit(c) || c == '-' || c == '.' || c == '_' || c == ':';
				}

				// RFC 3986 scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
				bool IsValidScheme(std::string_view scheme) noexcept {
					if (scheme.empty() || !IsAlpha(scheme.front())) return false;
					for (char c : scheme) {
						if (!IsAlpha(c) && !IsDigit(c) && c != '+' && c != '-' && c != '.') return false;
					}
					return true;
				}
			}

			// ============================================================================
			// URL Manipulation
			// ============================================================================

			bool ParseUrl(std::string_view url, UrlComponents& components, Error* err) noexcept {
				try {
					components = UrlComponents{};

					url = StringUtils::TrimView(url);
					if (url.empty()) {
						Internal::SetError(err, ErrorCode::Empty, "Empty URL");
						return false;
					}
					if (url.size() > MAX_URL_LENGTH) {
						Internal::SetError(err, ErrorCode::TooLong, "URL exceeds maximum length", url);
						return false;
					}

					const size_t colon = url.find(':');
					if (colon == std::string_view::npos || !Internal::IsValidScheme(url.substr(0, colon))) {
						Internal::SetError(err, ErrorCode::MissingScheme, "URL has no valid scheme", url);
						return false;
					}
					if (url.substr(colon + 1, 2) != "//") {
						Internal::SetError(err, ErrorCode::MissingAuthority, "URL has no authority component", url);
						return false;
					}

					components.scheme = StringUtils::ToLowerCopy(url.substr(0, colon));

					std::string_view rest = url.substr(colon + 3);
					const size_t authorityEnd = rest.find_first_of("/?#");
					std::string_view authority = rest.substr(0, authorityEnd);
					std::string_view tail = (authorityEnd == std::string_view::npos)
						? std::string_view{} : rest.substr(authorityEnd);

					// Userinfo ends at the last '@' of the authority
					const size_t at = authority.rfind('@');
					if (at != std::string_view::npos) {
						const std::string_view userinfo = authority.substr(0, at);
						const size_t sep = userinfo.find(':');
						components.username.assign(userinfo.substr(0, sep));
						if (sep != std::string_view::npos) {
							components.password.assign(userinfo.substr(sep + 1));
						}
						authority.remove_prefix(at + 1);
					}

					std::string_view host;
					std::string_view portText;
					if (!authority.empty() && authority.front() == '[') {
						const size_t close = authority.find(']');
						if (close == std::string_view::npos) {
							Internal::SetError(err, ErrorCode::InvalidHost, "Unterminated IPv6 literal", url);
							return false;
						}
						host = authority.substr(1, close - 1);
						const std::string_view after = authority.substr(close + 1);
						if (!after.empty()) {
							if (after.front() != ':') {
								Internal::SetError(err, ErrorCode::InvalidHost, "Garbage after IPv6 literal", url);
								return false;
							}
							portText = after.substr(1);
						}
					}
					else {
						const size_t portSep = authority.rfind(':');
						host = authority.substr(0, portSep);
						if (portSep != std::string_view::npos) {
							portText = authority.substr(portSep + 1);
						}
					}

					if (!portText.empty()) {
						unsigned value = 0;
						const auto* first = portText.data();
						const auto* last = portText.data() + portText.size();
						const auto res = std::from_chars(first, last, value);
						if (res.ec != std::errc{} || res.ptr != last || value > 65535) {
							Internal::SetError(err, ErrorCode::InvalidPort, "Invalid port", url);
							return false;
						}
						components.port = static_cast<uint16_t>(value);
					}

					if (!host.empty() && host.back() == '.') {
						host.remove_suffix(1);
					}
					if (host.empty()) {
						Internal::SetError(err, ErrorCode::InvalidHost, "URL has an empty host", url);
						return false;
					}
					for (char c : host) {
						if (!Internal::IsHostChar(c)) {
							Internal::SetError(err, ErrorCode::InvalidHost, "Invalid character in host", url);
							return false;
						}
					}
					components.host = StringUtils::ToLowerCopy(host);

					const size_t hashPos = tail.find('#');
					if (hashPos != std::string_view::npos) {
						components.fragment.assign(tail.substr(hashPos + 1));
						tail = tail.substr(0, hashPos);
					}
					const size_t queryPos = tail.find('?');
					if (queryPos != std::string_view::npos) {
						components.query.assign(tail.substr(queryPos + 1));
						tail = tail.substr(0, queryPos);
					}
					components.path.assign(tail);

					return true;
				}
				catch (const std::bad_alloc&) {
					components = UrlComponents{};
					return false;
				}
			}

			std::string ExtractHostname(std::string_view url) noexcept {
				UrlComponents components;
				if (ParseUrl(url, components, nullptr)) {
					return std::move(components.host);
				}
				return {};
			}

			bool IsValidUrl(std::string_view url) noexcept {
				UrlComponents components;
				return ParseUrl(url, components, nullptr);
			}

			// ============================================================================
			// Domain and Host Validation
			// ============================================================================

			bool IsValidDomain(std::string_view domain) noexcept {
				if (domain.empty() || domain.length() > MAX_DOMAIN_LENGTH) {
					return false;
				}

				size_t pos = 0;
				while (pos <= domain.length()) {
					const size_t dotPos = domain.find('.', pos);
					const size_t labelLen = (dotPos == std::string_view::npos) ? (domain.length() - pos) : (dotPos - pos);

					if (labelLen == 0 || labelLen > MAX_LABEL_LENGTH) {
						return false;
					}

					const std::string_view label = domain.substr(pos, labelLen);
					for (char c : label) {
						if (!Internal::IsAlpha(c) && !Internal::IsDigit(c) && c != '-' && c != '_') {
							return false;
						}
					}

					if (label.front() == '-' || label.back() == '-') {
						return false;
					}

					if (dotPos == std::string_view::npos) break;
					pos = dotPos + 1;
				}

				return true;
			}

			std::vector<std::string_view> GetDomainSuffixes(std::string_view host) {
				std::vector<std::string_view> suffixes;
				if (host.empty()) return suffixes;

				suffixes.push_back(host);
				size_t pos = host.find('.');
				while (pos != std::string_view::npos && pos + 1 < host.size()) {
					suffixes.push_back(host.substr(pos + 1));
					pos = host.find('.', pos + 1);
				}
				return suffixes;
			}

		}  // namespace NetworkUtils
	}  // namespace Utils
}  // namespace TrackShield
