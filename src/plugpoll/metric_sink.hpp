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

/// @file metric_sink.hpp
/// @brief Abstract interface for time-series destinations
///
/// MetricSink defines the contract for writing metric batches. Implementations
/// can target different backends: InfluxDB, logging, test capture, etc.

#include "plugpoll/errors.hpp"
#include "plugpoll/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace plugpoll {

/// Statistics for a metric sink
struct SinkStats {
    uint64_t batches_sent = 0;
    uint64_t batches_failed = 0;
    uint64_t points_sent = 0;
    uint64_t bytes_sent = 0;
    int64_t last_write_timestamp_ns = 0;
};

/// Abstract interface for write destinations.
///
/// A sink is long-lived and shared across cycles. Implementations must be
/// thread-safe if batches are written to several sinks in parallel.
class MetricSink {
public:
    virtual ~MetricSink() = default;

    /// Initialize the sink. Called before any write_batch() calls.
    /// @return true if initialization succeeded
    virtual bool start() = 0;

    /// Shutdown the sink.
    virtual void stop() = 0;

    /// Write all points in one request.
    /// @return SinkWriteError on rejection or transport failure
    virtual Status write_batch(const std::string& bucket,
                               const std::string& org,
                               const std::vector<MetricPoint>& points) = 0;

    /// Check if sink is operational.
    virtual bool healthy() const = 0;

    /// Get sink statistics.
    virtual SinkStats stats() const = 0;

    /// Get sink name for logging/debugging.
    virtual std::string name() const = 0;
};

/// A configured destination: where to write and through which sink.
struct SinkTarget {
    std::string name;
    std::string bucket;
    std::string org;
    std::shared_ptr<MetricSink> connection;
};

}  // namespace plugpoll
