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
#include "FilterListParser.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/NetworkUtils.hpp"
#include "../Utils/StringUtils.hpp"

#include <array>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace TrackShield {
namespace Privacy {

using namespace Utils;
using json = nlohmann::json;

std::string FilterListStats::ToJson() const {
    json j;
    j["totalLines"] = totalLines;
    j["rules"] = rules;
    j["hostsEntries"] = hostsEntries;
    j["comments"] = comments;
    j["exceptions"] = exceptions;
    j["cosmetic"] = cosmetic;
    j["unsupported"] = unsupported;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

namespace {

    constexpr std::array<std::string_view, 4> HOSTS_SINK_ADDRESSES = {
        "0.0.0.0", "127.0.0.1", "::1", "::"
    };

    constexpr std::array<std::string_view, 8> LOCAL_HOST_NAMES = {
        "localhost", "localhost.localdomain", "local", "broadcasthost",
        "ip6-localhost", "ip6-loopback", "ip6-localnet", "0.0.0.0"
    };

    bool IsCosmetic(std::string_view line) noexcept {
        return line.find("##") != std::string_view::npos ||
               line.find("#@#") != std::string_view::npos ||
               line.find("#?#") != std::string_view::npos ||
               line.find("#$#") != std::string_view::npos;
    }

    bool IsLocalName(std::string_view host) noexcept {
        for (const auto name : LOCAL_HOST_NAMES) {
            if (host == name) return true;
        }
        return false;
    }

    /// Next whitespace-separated token; advances pos past it
    std::string_view NextToken(std::string_view line, size_t& pos) noexcept {
        const size_t start = line.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos) {
            pos = line.size();
            return {};
        }
        size_t end = line.find_first_of(" \t", start);
        if (end == std::string_view::npos) end = line.size();
        pos = end;
        return line.substr(start, end - start);
    }

    /**
     * @return true if the line is a hosts-file entry; domains found on it are
     *         appended to out as domain anchors
     */
    bool TryParseHostsLine(std::string_view line, std::vector<std::string>& out, size_t& converted) {
        size_t pos = 0;
        const std::string_view address = NextToken(line, pos);

        bool sink = false;
        for (const auto candidate : HOSTS_SINK_ADDRESSES) {
            if (address == candidate) {
                sink = true;
                break;
            }
        }
        if (!sink || pos >= line.size()) {
            return false;
        }

        for (;;) {
            const std::string_view token = NextToken(line, pos);
            if (token.empty() || token.front() == '#') {
                break;
            }
            const std::string host = StringUtils::ToLowerCopy(token);
            if (IsLocalName(host) || !NetworkUtils::IsValidDomain(host)) {
                continue;
            }
            out.push_back("||" + host + "^");
            ++converted;
        }
        return true;
    }

}  // anonymous namespace

FilterListParseResult ParseFilterList(std::string_view text) {
    FilterListParseResult result;
    auto& stats = result.stats;

    size_t lineStart = 0;
    while (lineStart < text.size()) {
        size_t lineEnd = text.find('\n', lineStart);
        if (lineEnd == std::string_view::npos) lineEnd = text.size();

        const std::string_view line = StringUtils::TrimView(text.substr(lineStart, lineEnd - lineStart));
        lineStart = lineEnd + 1;
        ++stats.totalLines;

        if (line.empty()) {
            continue;
        }

        // Comments and list headers
        if (line.front() == '!' || line.front() == '[') {
            ++stats.comments;
            continue;
        }

        if (IsCosmetic(line)) {
            ++stats.cosmetic;
            continue;
        }

        if (line.front() == '#') {
            ++stats.comments;
            continue;
        }

        if (StringUtils::StartsWith(line, "@@")) {
            ++stats.exceptions;
            continue;
        }

        size_t converted = 0;
        if (TryParseHostsLine(line, result.patterns, converted)) {
            if (converted == 0) {
                // Sink entries for localhost and friends
                ++stats.comments;
            }
            stats.hostsEntries += converted;
            stats.rules += converted;
            continue;
        }

        // Options would change what the rule blocks; regex rules are never compiled
        if (line.find('$') != std::string_view::npos ||
            (line.size() > 2 && line.front() == '/' && line.back() == '/')) {
            ++stats.unsupported;
            continue;
        }

        result.patterns.emplace_back(line);
        ++stats.rules;
    }

    return result;
}

bool LoadFilterListFile(const std::filesystem::path& path,
                        FilterListParseResult& result,
                        FilterListError* err) noexcept {
    auto fail = [&](std::string message) {
        TS_LOG_ERROR("FilterList", "%s: %s", path.string().c_str(), message.c_str());
        if (err) {
            err->message = std::move(message);
            err->path = path;
        }
        return false;
    };

    try {
        result = FilterListParseResult{};

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return fail("File not found or not a regular file");
        }

        const auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return fail("Cannot determine file size: " + ec.message());
        }
        if (size > FilterListConstants::MAX_FILTER_LIST_SIZE) {
            return fail("File exceeds size limit of " +
                std::to_string(FilterListConstants::MAX_FILTER_LIST_SIZE) + " bytes");
        }

        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return fail("Cannot open file");
        }

        std::string text(static_cast<size_t>(size), '\0');
        if (size > 0 && !file.read(text.data(), static_cast<std::streamsize>(size))) {
            return fail("Failed to read file");
        }

        result = ParseFilterList(text);

        TS_LOG_INFO("FilterList", "Loaded %zu rules from %s (%zu lines, %zu cosmetic, %zu exceptions, %zu unsupported)",
            result.stats.rules, path.string().c_str(), result.stats.totalLines,
            result.stats.cosmetic, result.stats.exceptions, result.stats.unsupported);
        return true;
    }
    catch (const std::bad_alloc&) {
        result = FilterListParseResult{};
        if (err) {
            err->message = "Out of memory";
            err->path = path;
        }
        return false;
    }
    catch (const std::exception& e) {
        return fail(e.what());
    }
}

}  // namespace Privacy
}  // namespace TrackShield
