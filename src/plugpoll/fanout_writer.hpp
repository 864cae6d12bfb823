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

/// @file fanout_writer.hpp
/// @brief Write one batch to every destination independently

#include "plugpoll/metric_sink.hpp"

#include <string>
#include <vector>

namespace plugpoll {

/// Outcome of one fan-out.
struct FanoutReport {
    std::size_t attempted = 0;
    std::vector<std::string> succeeded;
    std::vector<std::string> failed;
};

/// Writes a batch to each SinkTarget with exactly one write_batch() call.
///
/// A target that fails or throws is reported by name; the others are still
/// written. Failed batches are not retried, the next cycle supersedes them.
class FanoutWriter {
public:
    /// @param parallel write targets concurrently instead of one at a time
    explicit FanoutWriter(std::vector<SinkTarget> targets, bool parallel = false);

    /// An empty batch writes nothing.
    FanoutReport write(const std::vector<MetricPoint>& points) const;

    const std::vector<SinkTarget>& targets() const { return targets_; }

private:
    static Status write_one(const SinkTarget& target,
                            const std::vector<MetricPoint>& points);

    std::vector<SinkTarget> targets_;
    bool parallel_;
};

}  // namespace plugpoll
