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
/*
 * ============================================================================
 * TrackShield - PRECOMPILED HEADER
 * ============================================================================
 * Includes: Stable STL and the JSON library used across every module.
 * ============================================================================
 */

#ifndef PCH_H
#define PCH_H

#pragma once

// C++20 Standard Library - Core & Containers
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <map>
#include <unordered_map>
#include <optional>
#include <variant>
#include <cstdint>
#include <algorithm>
#include <iterator>
#include <type_traits>

// C++20 - Concurrency & Time
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <chrono>

// Performance & Memory
#include <limits>
#include <bit>
#include <cmath>

// JSON
#include <nlohmann/json.hpp>

#endif // PCH_H
