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

#include "plugpoll/batch_builder.hpp"

namespace plugpoll {

namespace {

MetricPoint make_point(const Reading& reading, const char* field, double value) {
    MetricPoint point;
    point.measurement = MetricBatchBuilder::kMeasurement;
    point.tags[MetricBatchBuilder::kHostTag] = reading.device_name;
    point.field = field;
    point.value = value;
    point.timestamp_ns = reading.captured_at_ns;
    return point;
}

}  // namespace

std::vector<MetricPoint> MetricBatchBuilder::build(const ReadingSet& readings) const {
    std::vector<MetricPoint> points;
    points.reserve(readings.size() * 2);

    for (const Reading& reading : readings) {
        points.push_back(make_point(reading, kConsumptionField, reading.now_watts));
        if (reading.today_watt_hours) {
            points.push_back(make_point(reading, kTodayField, *reading.today_watt_hours));
        }
    }
    return points;
}

}  // namespace plugpoll
