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
 * TrackShield - CONFIGURATION
 * ============================================================================
 *
 * @file TrackShieldConfig.hpp
 * @brief JSON configuration file for the blocker, matcher and logger.
 *
 * FILE LAYOUT:
 * ============
 * {
 *   "matcher": { "expectedPatterns": 100000, "falsePositiveRate": 0.01,
 *                "maxPatterns": 100000 },
 *   "blocker": { "enabled": true, "useDefaultPatterns": true,
 *                "maxCustomRuleLength": 200, "customRules": [],
 *                "filterLists": ["lists/easyprivacy.txt"] },
 *   "logging": { "level": "info", "toConsole": true, "toFile": false,
 *                "logDirectory": "logs", "jsonLines": false, "async": true }
 * }
 *
 * Unknown keys are ignored and missing keys keep their defaults. A key that
 * is present with the wrong type or an out-of-range value fails the load.
 * Relative filter list paths are resolved against the config file directory.
 * ============================================================================
 */

#pragma once

#include "../Privacy/TrackerBlocker.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <filesystem>
#include <string>

namespace TrackShield {
namespace Config {

// ============================================================================
// STRUCTURES
// ============================================================================

/**
 * @brief "logging" section
 */
struct LoggingSettings {
    /// @brief trace, debug, info, warn, error or fatal
    std::string level = "info";
    bool toConsole = true;
    bool toFile = false;
    std::string logDirectory = "logs";
    bool jsonLines = false;
    bool async = true;

    [[nodiscard]] bool IsValid() const noexcept;

    /// @brief Logger settings with the remaining fields at their defaults
    [[nodiscard]] Utils::LoggerConfig ToLoggerConfig() const;
};

/**
 * @brief Whole configuration file
 */
struct TrackShieldConfiguration {
    /// @brief "blocker" section; its matcher member holds the "matcher" section
    Privacy::TrackerBlockerConfiguration blocker;

    LoggingSettings logging;

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] std::string ToJson() const;
};

// ============================================================================
// LOADING
// ============================================================================

/**
 * @brief Read a configuration from parsed JSON.
 *
 * @param j    Root object
 * @param out  Receives the configuration; unchanged on failure
 * @param err  Optional; message names the offending key
 */
[[nodiscard]] bool FromJson(const Utils::JSON::Json& j,
                            TrackShieldConfiguration& out,
                            Utils::JSON::Error* err = nullptr) noexcept;

/// @brief Load and validate a configuration file
[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path,
                                TrackShieldConfiguration& out,
                                Utils::JSON::Error* err = nullptr) noexcept;

}  // namespace Config
}  // namespace TrackShield
