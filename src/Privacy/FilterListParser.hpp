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
/**
 * ============================================================================
 * TrackShield - FILTER LIST PARSER
 * ============================================================================
 *
 * @file FilterListParser.hpp
 * @brief Extracts matcher patterns from EasyList/EasyPrivacy style lists and
 *        hosts files.
 *
 * LINE HANDLING:
 * ==============
 * - "! comment", "[Adblock Plus 2.0]", "# comment"     -> comment
 * - "@@||example.com^"                                  -> exception (skipped)
 * - "example.com##.ad", "#@#", "#?#", "#$#"             -> cosmetic (skipped)
 * - "||ads.net^$third-party", "/regex/"                 -> unsupported (skipped)
 * - "0.0.0.0 tracker.com", "127.0.0.1 a.com b.com"     -> "||tracker.com^" ...
 * - anything else                                       -> passed through
 * ============================================================================
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace TrackShield {
namespace Privacy {

namespace FilterListConstants {

    /// @brief Largest list file accepted by LoadFilterListFile (32 MiB)
    inline constexpr size_t MAX_FILTER_LIST_SIZE = 32ULL * 1024 * 1024;

}  // namespace FilterListConstants

struct FilterListStats {
    size_t totalLines = 0;
    size_t rules = 0;           ///< patterns emitted
    size_t hostsEntries = 0;    ///< of which converted from hosts-file lines
    size_t comments = 0;
    size_t exceptions = 0;
    size_t cosmetic = 0;
    size_t unsupported = 0;

    [[nodiscard]] std::string ToJson() const;
};

struct FilterListParseResult {
    std::vector<std::string> patterns;
    FilterListStats stats;
};

struct FilterListError {
    std::string message;
    std::filesystem::path path;
};

/// @brief Parse list text. Never fails; unusable lines are only counted.
[[nodiscard]] FilterListParseResult ParseFilterList(std::string_view text);

/// @brief Read and parse a list file of at most MAX_FILTER_LIST_SIZE bytes
[[nodiscard]] bool LoadFilterListFile(const std::filesystem::path& path,
                                      FilterListParseResult& result,
                                      FilterListError* err = nullptr) noexcept;

}  // namespace Privacy
}  // namespace TrackShield
