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

/// @file normalizer.hpp
/// @brief Raw vendor usage responses to canonical Readings
///
/// Every conversion fails closed: if a value cannot be extracted
/// unambiguously no Reading is produced.

#include "plugpoll/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace plugpoll {

/// Stateless; safe to share between poll workers.
class ReadingNormalizer {
public:
    /// Dispatch on vendor.
    std::optional<Reading> normalize(Vendor vendor,
                                     const std::string& device_name,
                                     const nlohmann::json& raw,
                                     int64_t captured_at_ns) const;

    /// Kasa shape: {"power_mw": <mW>, "today": <kWh or falsy>}.
    ///
    /// A falsy or zero "today" is treated as not reported: these plugs do
    /// not distinguish "no usage yet" from "not available". An optional
    /// numeric "today_wh" is taken as the exact Wh figure when "today" is
    /// reported.
    std::optional<Reading> normalize_kasa(const std::string& device_name,
                                          const nlohmann::json& raw,
                                          int64_t captured_at_ns) const;

    /// Tapo shape, either {"result": {...}} or the same fields at top level.
    /// current_power is mW, today_energy is already Wh.
    std::optional<Reading> normalize_tapo(const std::string& device_name,
                                          const nlohmann::json& raw,
                                          int64_t captured_at_ns) const;

    /// Re-wrap a top-level Tapo response into the {"result": ...} shape.
    /// Anything else is returned unchanged.
    static nlohmann::json wrap_tapo_result(const nlohmann::json& raw);
};

}  // namespace plugpoll
