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

#include "plugpoll/types.hpp"

namespace plugpoll {

const char* to_string(Vendor vendor) {
    switch (vendor) {
        case Vendor::Kasa:
            return "kasa";
        case Vendor::Tapo:
            return "tapo";
    }
    return "unknown";
}

const char* to_string(AuthMode mode) {
    switch (mode) {
        case AuthMode::All:
            return "all";
        case AuthMode::DefaultOnly:
            return "default_only";
        case AuthMode::LegacyOnly:
            return "legacy_only";
    }
    return "unknown";
}

std::optional<AuthMode> parse_auth_mode(const std::string& text) {
    if (text.empty() || text == "all") {
        return AuthMode::All;
    } else if (text == "default_only") {
        return AuthMode::DefaultOnly;
    } else if (text == "legacy_only") {
        return AuthMode::LegacyOnly;
    }
    return std::nullopt;
}

bool operator==(const Reading& a, const Reading& b) {
    return a.device_name == b.device_name &&
           a.now_watts == b.now_watts &&
           a.today_watt_hours == b.today_watt_hours &&
           a.captured_at_ns == b.captured_at_ns;
}

bool operator==(const MetricPoint& a, const MetricPoint& b) {
    return a.measurement == b.measurement &&
           a.tags == b.tags &&
           a.field == b.field &&
           a.value == b.value &&
           a.timestamp_ns == b.timestamp_ns;
}

}  // namespace plugpoll
