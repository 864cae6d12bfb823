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

#include "plugpoll/collector.hpp"

#include <glog/logging.h>

namespace plugpoll {

Collector::Collector(PollCycle& cycle, const FanoutWriter& writer, Clock clock)
    : cycle_(cycle)
    , writer_(writer)
    , clock_(std::move(clock)) {}

PassSummary Collector::run_once() {
    PassSummary summary;
    summary.captured_at_ns = clock_();
    summary.devices = cycle_.device_count();

    ReadingSet readings = cycle_.run(summary.captured_at_ns);
    summary.readings = readings.size();

    std::vector<MetricPoint> points = builder_.build(readings);
    summary.points = points.size();

    if (points.empty()) {
        LOG(WARNING) << "No readings from " << summary.devices
                     << " device(s), nothing to write";
        return summary;
    }
    if (writer_.targets().empty()) {
        LOG(INFO) << "No destinations configured, " << points.size()
                  << " points not written";
        return summary;
    }

    summary.fanout = writer_.write(points);
    return summary;
}

}  // namespace plugpoll
