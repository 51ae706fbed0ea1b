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
 * TrackShield - CONFIGURATION IMPLEMENTATION
 * ============================================================================
 *
 * @file TrackShieldConfig.cpp
 * @brief Typed, validated reads of the JSON configuration file.
 * ============================================================================
 */

#include "pch.h"
#include "TrackShieldConfig.hpp"

#include <utility>

namespace TrackShield {
namespace Config {

using namespace Utils;
using JSON::Json;

// ============================================================================
// FIELD READERS
// ============================================================================

namespace {

    bool Fail(JSON::Error* err, std::string message) {
        TS_LOG_ERROR("Config", "%s", message.c_str());
        if (err) {
            err->message = std::move(message);
        }
        return false;
    }

    std::string KeyName(const char* section, const char* key) {
        return std::string(section) + "." + key;
    }

    bool ReadBool(const Json& obj, const char* section, const char* key, bool& out, JSON::Error* err) {
        const auto it = obj.find(key);
        if (it == obj.end()) return true;
        if (!it->is_boolean()) {
            return Fail(err, "Expected boolean for " + KeyName(section, key));
        }
        out = it->get<bool>();
        return true;
    }

    bool ReadSize(const Json& obj, const char* section, const char* key, size_t& out, JSON::Error* err) {
        const auto it = obj.find(key);
        if (it == obj.end()) return true;
        if (!it->is_number_unsigned()) {
            return Fail(err, "Expected non-negative integer for " + KeyName(section, key));
        }
        out = it->get<size_t>();
        return true;
    }

    bool ReadDouble(const Json& obj, const char* section, const char* key, double& out, JSON::Error* err) {
        const auto it = obj.find(key);
        if (it == obj.end()) return true;
        if (!it->is_number()) {
            return Fail(err, "Expected number for " + KeyName(section, key));
        }
        out = it->get<double>();
        return true;
    }

    bool ReadString(const Json& obj, const char* section, const char* key, std::string& out, JSON::Error* err) {
        const auto it = obj.find(key);
        if (it == obj.end()) return true;
        if (!it->is_string()) {
            return Fail(err, "Expected string for " + KeyName(section, key));
        }
        out = it->get<std::string>();
        return true;
    }

    bool ReadStringArray(const Json& obj, const char* section, const char* key,
                         std::vector<std::string>& out, JSON::Error* err) {
        const auto it = obj.find(key);
        if (it == obj.end()) return true;
        if (!it->is_array()) {
            return Fail(err, "Expected array for " + KeyName(section, key));
        }

        std::vector<std::string> values;
        values.reserve(it->size());
        for (const auto& element : *it) {
            if (!element.is_string()) {
                return Fail(err, "Expected array of strings for " + KeyName(section, key));
            }
            values.push_back(element.get<std::string>());
        }
        out = std::move(values);
        return true;
    }

    /// Returns the section object, or nullptr when absent
    bool GetSection(const Json& root, const char* name, const Json*& section, JSON::Error* err) {
        section = nullptr;
        const auto it = root.find(name);
        if (it == root.end()) return true;
        if (!it->is_object()) {
            return Fail(err, std::string("Section '") + name + "' must be an object");
        }
        section = &*it;
        return true;
    }

}  // anonymous namespace

// ============================================================================
// STRUCTURE IMPLEMENTATIONS
// ============================================================================

bool LoggingSettings::IsValid() const noexcept {
    LogLevel parsed;
    if (!ParseLogLevel(level, parsed)) {
        return false;
    }
    return !toFile || !logDirectory.empty();
}

LoggerConfig LoggingSettings::ToLoggerConfig() const {
    LoggerConfig cfg;
    cfg.async = async;
    cfg.toConsole = toConsole;
    cfg.toFile = toFile;
    cfg.jsonLines = jsonLines;
    cfg.logDirectory = logDirectory;

    LogLevel parsed = LogLevel::Info;
    if (ParseLogLevel(level, parsed)) {
        cfg.minimalLevel = parsed;
    }
    return cfg;
}

bool TrackShieldConfiguration::IsValid() const noexcept {
    return blocker.IsValid() && logging.IsValid();
}

std::string TrackShieldConfiguration::ToJson() const {
    Json j;
    j["matcher"] = {
        {"expectedPatterns", blocker.matcher.expectedPatterns},
        {"falsePositiveRate", blocker.matcher.falsePositiveRate},
        {"maxPatterns", blocker.matcher.maxPatterns}
    };

    Json lists = Json::array();
    for (const auto& path : blocker.filterLists) {
        lists.push_back(path.string());
    }
    j["blocker"] = {
        {"enabled", blocker.enabled},
        {"useDefaultPatterns", blocker.useDefaultPatterns},
        {"maxCustomRuleLength", blocker.maxCustomRuleLength},
        {"customRules", blocker.customRules},
        {"filterLists", lists}
    };

    j["logging"] = {
        {"level", logging.level},
        {"toConsole", logging.toConsole},
        {"toFile", logging.toFile},
        {"logDirectory", logging.logDirectory},
        {"jsonLines", logging.jsonLines},
        {"async", logging.async}
    };

    std::string out;
    JSON::StringifyOptions opt;
    opt.pretty = true;
    if (!JSON::Stringify(j, out, opt)) {
        return "{}";
    }
    return out;
}

// ============================================================================
// LOADING
// ============================================================================

bool FromJson(const Json& j, TrackShieldConfiguration& out, JSON::Error* err) noexcept {
    try {
        if (!j.is_object()) {
            return Fail(err, "Configuration root must be an object");
        }

        TrackShieldConfiguration cfg;
        const Json* section = nullptr;

        if (!GetSection(j, "matcher", section, err)) return false;
        if (section) {
            auto& m = cfg.blocker.matcher;
            if (!ReadSize(*section, "matcher", "expectedPatterns", m.expectedPatterns, err) ||
                !ReadDouble(*section, "matcher", "falsePositiveRate", m.falsePositiveRate, err) ||
                !ReadSize(*section, "matcher", "maxPatterns", m.maxPatterns, err)) {
                return false;
            }
        }

        if (!GetSection(j, "blocker", section, err)) return false;
        if (section) {
            auto& b = cfg.blocker;
            std::vector<std::string> lists;
            if (!ReadBool(*section, "blocker", "enabled", b.enabled, err) ||
                !ReadBool(*section, "blocker", "useDefaultPatterns", b.useDefaultPatterns, err) ||
                !ReadSize(*section, "blocker", "maxCustomRuleLength", b.maxCustomRuleLength, err) ||
                !ReadStringArray(*section, "blocker", "customRules", b.customRules, err) ||
                !ReadStringArray(*section, "blocker", "filterLists", lists, err)) {
                return false;
            }
            b.filterLists.assign(lists.begin(), lists.end());
        }

        if (!GetSection(j, "logging", section, err)) return false;
        if (section) {
            auto& l = cfg.logging;
            if (!ReadString(*section, "logging", "level", l.level, err) ||
                !ReadBool(*section, "logging", "toConsole", l.toConsole, err) ||
                !ReadBool(*section, "logging", "toFile", l.toFile, err) ||
                !ReadString(*section, "logging", "logDirectory", l.logDirectory, err) ||
                !ReadBool(*section, "logging", "jsonLines", l.jsonLines, err) ||
                !ReadBool(*section, "logging", "async", l.async, err)) {
                return false;
            }
        }

        if (!cfg.blocker.matcher.IsValid()) {
            return Fail(err, "Invalid matcher settings (falsePositiveRate must be in (0, 0.5], sizes non-zero)");
        }
        if (!cfg.blocker.IsValid()) {
            return Fail(err, "Invalid blocker settings (maxCustomRuleLength must be in 1..512)");
        }
        if (!cfg.logging.IsValid()) {
            return Fail(err, "Invalid logging settings (unknown level '" + cfg.logging.level + "')");
        }

        out = std::move(cfg);
        return true;
    }
    catch (const std::bad_alloc&) {
        if (err) err->message = "Out of memory";
        return false;
    }
    catch (const std::exception& e) {
        return Fail(err, std::string("Configuration error: ") + e.what());
    }
}

bool LoadFromFile(const std::filesystem::path& path, TrackShieldConfiguration& out, JSON::Error* err) noexcept {
    try {
        Json j;
        if (!JSON::LoadFromFile(path, j, err)) {
            TS_LOG_ERROR("Config", "Cannot load %s: %s", path.string().c_str(),
                err ? err->message.c_str() : "parse error");
            return false;
        }

        TrackShieldConfiguration cfg;
        if (!FromJson(j, cfg, err)) {
            if (err) err->path = path;
            return false;
        }

        const auto baseDir = path.parent_path();
        for (auto& list : cfg.blocker.filterLists) {
            if (list.is_relative()) {
                list = baseDir / list;
            }
        }

        out = std::move(cfg);
        TS_LOG_INFO("Config", "Loaded configuration from %s", path.string().c_str());
        return true;
    }
    catch (const std::bad_alloc&) {
        if (err) err->message = "Out of memory";
        return false;
    }
    catch (const std::exception& e) {
        if (err) err->path = path;
        return Fail(err, std::string("Configuration error: ") + e.what());
    }
}

}  // namespace Config
}  // namespace TrackShield
