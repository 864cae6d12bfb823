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

/// @file types.hpp
/// @brief Data model shared by the polling pipeline and the sinks

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace plugpoll {

/// Device ecosystems. Tapo is the family whose firmware generations speak
/// incompatible authentication schemes.
enum class Vendor {
    Kasa,
    Tapo,
};

/// Which Tapo schemes to try, and in what order.
enum class AuthMode {
    All,          // default scheme, then legacy
    DefaultOnly,
    LegacyOnly,
};

const char* to_string(Vendor vendor);
const char* to_string(AuthMode mode);

/// Parse "all" / "default_only" / "legacy_only". Empty string yields All.
/// @return std::nullopt for anything else
std::optional<AuthMode> parse_auth_mode(const std::string& text);

struct Credentials {
    std::string username;
    std::string password;

    bool empty() const { return username.empty() && password.empty(); }
};

struct DeviceConfig {
    std::string name;
    std::string address;
    Vendor vendor = Vendor::Kasa;
    AuthMode auth_mode = AuthMode::All;
};

/// One normalized measurement from one device in one cycle.
struct Reading {
    std::string device_name;
    double now_watts = 0.0;
    /// Absent when the device did not report cumulative usage. Never 0 as a
    /// stand-in for "unknown".
    std::optional<double> today_watt_hours;
    int64_t captured_at_ns = 0;
};

/// A single-field point ready for a time-series sink.
struct MetricPoint {
    std::string measurement;
    std::map<std::string, std::string> tags;
    std::string field;
    double value = 0.0;
    int64_t timestamp_ns = 0;
};

bool operator==(const Reading& a, const Reading& b);
bool operator==(const MetricPoint& a, const MetricPoint& b);

}  // namespace plugpoll
