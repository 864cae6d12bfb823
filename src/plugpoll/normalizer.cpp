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

#include "plugpoll/normalizer.hpp"

#include <glog/logging.h>

#include <cmath>

namespace plugpoll {

namespace {

// A finite JSON number (booleans excluded).
std::optional<double> as_number(const nlohmann::json& value) {
    if (!value.is_number()) {
        return std::nullopt;
    }
    double number = value.get<double>();
    if (!std::isfinite(number)) {
        return std::nullopt;
    }
    return number;
}

}  // namespace

std::optional<Reading> ReadingNormalizer::normalize(Vendor vendor,
                                                    const std::string& device_name,
                                                    const nlohmann::json& raw,
                                                    int64_t captured_at_ns) const {
    switch (vendor) {
        case Vendor::Kasa:
            return normalize_kasa(device_name, raw, captured_at_ns);
        case Vendor::Tapo:
            return normalize_tapo(device_name, raw, captured_at_ns);
    }
    return std::nullopt;
}

std::optional<Reading> ReadingNormalizer::normalize_kasa(const std::string& device_name,
                                                         const nlohmann::json& raw,
                                                         int64_t captured_at_ns) const {
    if (!raw.is_object()) {
        VLOG(1) << device_name << ": kasa usage is not an object";
        return std::nullopt;
    }

    auto it = raw.find("power_mw");
    if (it == raw.end()) {
        VLOG(1) << device_name << ": kasa usage has no power_mw";
        return std::nullopt;
    }
    auto milliwatts = as_number(*it);
    if (!milliwatts) {
        VLOG(1) << device_name << ": kasa power_mw is not numeric: " << it->dump();
        return std::nullopt;
    }

    Reading reading;
    reading.device_name = device_name;
    reading.now_watts = *milliwatts / 1000.0;
    reading.captured_at_ns = captured_at_ns;

    it = raw.find("today");
    if (it != raw.end()) {
        auto kilowatt_hours = as_number(*it);
        if (kilowatt_hours && *kilowatt_hours != 0.0) {
            reading.today_watt_hours = *kilowatt_hours * 1000.0;
            // kWh -> Wh is not exact in binary (1.001 * 1000 != 1001).
            auto exact = raw.find("today_wh");
            if (exact != raw.end()) {
                if (auto watt_hours = as_number(*exact)) {
                    reading.today_watt_hours = *watt_hours;
                }
            }
        }
    }
    return reading;
}

nlohmann::json ReadingNormalizer::wrap_tapo_result(const nlohmann::json& raw) {
    if (raw.is_object() && !raw.contains("result") && raw.contains("current_power")) {
        return nlohmann::json{{"result", raw}};
    }
    return raw;
}

std::optional<Reading> ReadingNormalizer::normalize_tapo(const std::string& device_name,
                                                         const nlohmann::json& raw,
                                                         int64_t captured_at_ns) const {
    const nlohmann::json wrapped = wrap_tapo_result(raw);
    if (!wrapped.is_object()) {
        VLOG(1) << device_name << ": tapo usage is not an object";
        return std::nullopt;
    }

    auto result = wrapped.find("result");
    if (result == wrapped.end() || !result->is_object()) {
        VLOG(1) << device_name << ": tapo usage has no result object";
        return std::nullopt;
    }

    auto it = result->find("current_power");
    if (it == result->end()) {
        VLOG(1) << device_name << ": tapo usage has no current_power";
        return std::nullopt;
    }
    auto milliwatts = as_number(*it);
    if (!milliwatts) {
        VLOG(1) << device_name << ": tapo current_power is not numeric: " << it->dump();
        return std::nullopt;
    }

    Reading reading;
    reading.device_name = device_name;
    reading.now_watts = *milliwatts / 1000.0;
    reading.captured_at_ns = captured_at_ns;

    it = result->find("today_energy");
    if (it != result->end()) {
        auto watt_hours = as_number(*it);
        if (!watt_hours) {
            VLOG(1) << device_name << ": tapo today_energy is not numeric: " << it->dump();
            return std::nullopt;
        }
        reading.today_watt_hours = *watt_hours;
    }
    return reading;
}

}  // namespace plugpoll
