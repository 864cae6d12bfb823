// Copyright 2025 PlugPoll Contributors
// SPDX-License-Identifier: Apache-2.0
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

/// @file time_utils.hpp
/// @brief Wall-clock helpers shared by the collector and its sinks

#include <chrono>
#include <cstdint>
#include <ctime>

namespace utils {

/// Nanoseconds since the Unix epoch (system clock).
inline int64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/// Milliseconds since the Unix epoch. Device protocols stamp requests with this.
inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/// Local calendar date as (year, month, day).
inline void local_date(int& year, int& month, int& day) {
    std::time_t t = std::time(nullptr);
    std::tm tm_local{};
    localtime_r(&t, &tm_local);
    year = tm_local.tm_year + 1900;
    month = tm_local.tm_mon + 1;
    day = tm_local.tm_mday;
}

}  // namespace utils
