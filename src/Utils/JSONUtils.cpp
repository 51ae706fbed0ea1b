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
#include "JSONUtils.hpp"
#include "Logger.hpp"

#include <fstream>
#include <system_error>

namespace TrackShield {
	namespace Utils {
		namespace JSON {

			namespace {

				void SetError(Error* err, std::string message, const std::filesystem::path& path = {}) {
					if (!err) return;
					err->message = std::move(message);
					err->path = path;
				}

				// Approximate 1-based line/column for a byte offset
				void FillPosition(Error* err, std::string_view text, size_t byteOffset) {
					if (!err) return;
					err->byteOffset = byteOffset;
					size_t line = 1;
					size_t column = 1;
					const size_t end = std::min(byteOffset, text.size());
					for (size_t i = 0; i < end; ++i) {
						if (text[i] == '\n') {
							++line;
							column = 1;
						}
						else {
							++column;
						}
					}
					err->line = line;
					err->column = column;
				}

				std::string_view StripBom(std::string_view text) noexcept {
					if (text.size() >= 3 &&
						static_cast<unsigned char>(text[0]) == 0xEF &&
						static_cast<unsigned char>(text[1]) == 0xBB &&
						static_cast<unsigned char>(text[2]) == 0xBF) {
						text.remove_prefix(3);
					}
					return text;
				}
			}

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				if (err) err->clear();
				out = Json();

				bool tooDeep = false;
				const size_t maxDepth = opt.maxDepth;

				try {
					Json::parser_callback_t depthGuard =
						[&tooDeep, maxDepth](int depth, Json::parse_event_t /*event*/, Json& /*parsed*/) {
						if (static_cast<size_t>(depth) > maxDepth) {
							tooDeep = true;
							return false;
						}
						return true;
					};

					Json parsed = Json::parse(jsonText.begin(), jsonText.end(), depthGuard,
						/*allow_exceptions*/ true, /*ignore_comments*/ opt.allowComments);

					if (tooDeep) {
						SetError(err, "JSON nesting depth exceeds limit of " + std::to_string(maxDepth));
						return false;
					}

					out = std::move(parsed);
					return true;
				}
				catch (const nlohmann::json::parse_error& ex) {
					SetError(err, ex.what());
					FillPosition(err, jsonText, ex.byte > 0 ? ex.byte - 1 : 0);
					return false;
				}
				catch (const nlohmann::json::exception& ex) {
					SetError(err, ex.what());
					return false;
				}
				catch (const std::bad_alloc&) {
					SetError(err, "Out of memory while parsing JSON");
					return false;
				}
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					out = j.dump(opt.pretty ? opt.indentSpaces : -1, ' ', opt.ensureAscii,
						Json::error_handler_t::replace);
					return true;
				}
				catch (const nlohmann::json::exception& ex) {
					TS_LOG_ERROR("JSON", "Stringify failed: %s", ex.what());
					out.clear();
					return false;
				}
				catch (const std::bad_alloc&) {
					out.clear();
					return false;
				}
			}

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
				const ParseOptions& opt, size_t maxBytes) noexcept {
				if (err) err->clear();
				out = Json();

				try {
					std::error_code ec;
					if (!std::filesystem::is_regular_file(path, ec)) {
						SetError(err, "File not found or not a regular file", path);
						return false;
					}

					const auto size = std::filesystem::file_size(path, ec);
					if (ec) {
						SetError(err, "Cannot determine file size: " + ec.message(), path);
						return false;
					}
					if (size > maxBytes) {
						SetError(err, "File exceeds size limit of " + std::to_string(maxBytes) + " bytes", path);
						return false;
					}

					std::ifstream in(path, std::ios::in | std::ios::binary);
					if (!in.is_open()) {
						SetError(err, "Cannot open file", path);
						return false;
					}

					std::string text(static_cast<size_t>(size), '\0');
					if (size > 0 && !in.read(text.data(), static_cast<std::streamsize>(size))) {
						SetError(err, "Failed to read file", path);
						return false;
					}

					if (!Parse(StripBom(text), out, err, opt)) {
						if (err) err->path = path;
						return false;
					}
					return true;
				}
				catch (const std::bad_alloc&) {
					SetError(err, "Out of memory while loading JSON file", path);
					return false;
				}
				catch (const std::exception& ex) {
					SetError(err, ex.what(), path);
					return false;
				}
			}

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				try {
					if (pathLike.empty() || pathLike == "/") return "/";
					if (pathLike.front() == '/') return std::string(pathLike);

					std::string jp;
					jp.reserve(pathLike.size() + 4);

					std::string token;
					auto flush = [&]() {
						jp += '/';
						for (char c : token) {
							// RFC 6901 escaping
							if (c == '~') jp += "~0";
							else if (c == '/') jp += "~1";
							else jp += c;
						}
						token.clear();
					};

					for (size_t i = 0; i < pathLike.size(); ++i) {
						const char c = pathLike[i];
						if (c == '.') {
							if (!token.empty()) flush();
						}
						else if (c == '[') {
							if (!token.empty()) flush();
							const size_t close = pathLike.find(']', i + 1);
							if (close == std::string_view::npos) {
								token.assign(pathLike.substr(i + 1));
								i = pathLike.size();
							}
							else {
								token.assign(pathLike.substr(i + 1, close - i - 1));
								i = close;
							}
							flush();
						}
						else {
							token += c;
						}
					}
					if (!token.empty()) flush();

					return jp.empty() ? "/" : jp;
				}
				catch (const std::bad_alloc&) {
					return "/";
				}
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp == "/") return true;
					return j.contains(nlohmann::json::json_pointer(jp));
				}
				catch (const nlohmann::json::exception&) {
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace TrackShield
