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

/// @file batch_builder.hpp
/// @brief Readings to metric points

#include "plugpoll/reading_set.hpp"
#include "plugpoll/types.hpp"

#include <vector>

namespace plugpoll {

/// Turns one cycle's readings into the points written downstream.
///
/// Per Reading: one "consumption" point, then one "watts_today" point only if
/// the device reported today's usage. Output follows ReadingSet order.
class MetricBatchBuilder {
public:
    static constexpr const char* kMeasurement = "power_watts";
    static constexpr const char* kHostTag = "host";
    static constexpr const char* kConsumptionField = "consumption";
    static constexpr const char* kTodayField = "watts_today";

    std::vector<MetricPoint> build(const ReadingSet& readings) const;
};

}  // namespace plugpoll
