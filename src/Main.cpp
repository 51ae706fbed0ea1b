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
 * TrackShield - trackshield-check
 * ============================================================================
 *
 * Usage:
 *   trackshield-check [--config FILE] [--list FILE]... [--no-defaults]
 *                     [--json] [URL...]
 *
 * URLs come from the arguments, or from stdin one per line when none are
 * given. Prints one verdict per URL. Exit code 0, or 2 on usage and
 * configuration errors.
 * ============================================================================
 */

#include "pch.h"
#include "Config/TrackShieldConfig.hpp"
#include "Privacy/TrackerBlocker.hpp"
#include "Utils/Logger.hpp"
#include "Utils/StringUtils.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace TrackShield;

namespace {

    constexpr int EXIT_USAGE = 2;

    struct CommandLine {
        std::filesystem::path configPath;
        std::vector<std::filesystem::path> lists;
        std::vector<std::string> urls;
        bool noDefaults = false;
        bool json = false;
        bool help = false;
    };

    void PrintUsage(std::ostream& os) {
        os << "Usage: trackshield-check [--config FILE] [--list FILE]... [--no-defaults] [--json] [URL...]\n"
           << "\n"
           << "  --config FILE   JSON configuration file\n"
           << "  --list FILE     EasyList/EasyPrivacy or hosts file (repeatable)\n"
           << "  --no-defaults   do not load the built-in tracker patterns\n"
           << "  --json          print one JSON object per URL\n"
           << "\n"
           << "Reads URLs from stdin, one per line, when none are given.\n";
    }

    bool ParseCommandLine(int argc, char** argv, CommandLine& cmd, std::string& error) {
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                cmd.help = true;
            }
            else if (arg == "--config" || arg == "--list") {
                if (i + 1 >= argc) {
                    error = std::string(arg) + " requires a file argument";
                    return false;
                }
                if (arg == "--config") {
                    cmd.configPath = argv[++i];
                }
                else {
                    cmd.lists.emplace_back(argv[++i]);
                }
            }
            else if (arg == "--no-defaults") {
                cmd.noDefaults = true;
            }
            else if (arg == "--json") {
                cmd.json = true;
            }
            else if (arg.size() > 1 && arg.front() == '-') {
                error = "unknown option " + std::string(arg);
                return false;
            }
            else {
                cmd.urls.emplace_back(arg);
            }
        }
        return true;
    }

    void PrintVerdict(std::string_view url, const Privacy::BlockResult& result, bool asJson) {
        if (asJson) {
            std::cout << result.ToJson(url) << '\n';
            return;
        }

        if (result.IsBlocked()) {
            std::cout << "BLOCK\t" << url << '\t' << result.matchedPattern << '\n';
        }
        else {
            std::cout << "ALLOW\t" << url << '\n';
        }
    }

}  // anonymous namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    std::string error;
    if (!ParseCommandLine(argc, argv, cmd, error)) {
        std::cerr << "trackshield-check: " << error << "\n\n";
        PrintUsage(std::cerr);
        return EXIT_USAGE;
    }
    if (cmd.help) {
        PrintUsage(std::cout);
        return 0;
    }

    Config::TrackShieldConfiguration config;
    // Diagnostics only; verdicts go to stdout
    config.logging.level = "warn";
    config.logging.async = false;

    if (!cmd.configPath.empty()) {
        Utils::JSON::Error jsonError;
        if (!Config::LoadFromFile(cmd.configPath, config, &jsonError)) {
            std::cerr << "trackshield-check: " << cmd.configPath.string() << ": " << jsonError.message;
            if (jsonError.line != 0) {
                std::cerr << " (line " << jsonError.line << ", column " << jsonError.column << ")";
            }
            std::cerr << '\n';
            return EXIT_USAGE;
        }
    }

    for (const auto& list : cmd.lists) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(list, ec)) {
            std::cerr << "trackshield-check: filter list not found: " << list.string() << '\n';
            return EXIT_USAGE;
        }
        config.blocker.filterLists.push_back(list);
    }
    if (cmd.noDefaults) {
        config.blocker.useDefaultPatterns = false;
    }

    Utils::Logger::Instance().Initialize(config.logging.ToLoggerConfig());

    int exitCode = 0;
    {
        Privacy::TrackerBlocker blocker;
        if (!blocker.Initialize(config.blocker)) {
            std::cerr << "trackshield-check: blocker initialization failed\n";
            exitCode = EXIT_USAGE;
        }
        else if (!cmd.urls.empty()) {
            for (const auto& url : cmd.urls) {
                PrintVerdict(url, blocker.CheckRequest(url), cmd.json);
            }
        }
        else {
            std::string line;
            while (std::getline(std::cin, line)) {
                const std::string_view url = Utils::StringUtils::TrimView(line);
                if (url.empty()) continue;
                PrintVerdict(url, blocker.CheckRequest(url), cmd.json);
            }
        }
    }

    Utils::Logger::Instance().ShutDown();
    return exitCode;
}
