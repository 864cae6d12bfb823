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

/// @file collector.hpp
/// @brief One collection pass: poll, build points, fan out

#include "plugpoll/batch_builder.hpp"
#include "plugpoll/fanout_writer.hpp"
#include "plugpoll/poll_cycle.hpp"

#include <cstdint>
#include <functional>

namespace plugpoll {

/// What one pass did.
struct PassSummary {
    int64_t captured_at_ns = 0;
    std::size_t devices = 0;
    std::size_t readings = 0;
    std::size_t points = 0;
    FanoutReport fanout;
};

/// Wires PollCycle, MetricBatchBuilder and FanoutWriter together.
class Collector {
public:
    using Clock = std::function<int64_t()>;

    /// @param clock cycle timestamp source, nanoseconds since epoch
    Collector(PollCycle& cycle, const FanoutWriter& writer, Clock clock);

    /// Poll all devices and write whatever succeeded. An empty batch is
    /// skipped without contacting any destination.
    PassSummary run_once();

private:
    PollCycle& cycle_;
    const FanoutWriter& writer_;
    MetricBatchBuilder builder_;
    Clock clock_;
};

}  // namespace plugpoll
