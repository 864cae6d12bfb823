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

/// @file sinks/capture_sink.hpp
/// @brief MetricSink that captures batches for test verification

#include "plugpoll/metric_sink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace plugpoll {
namespace sinks {

/// One write_batch() call as the sink saw it.
struct CapturedBatch {
    std::string bucket;
    std::string org;
    std::vector<MetricPoint> points;
};

/// MetricSink that records batches for test assertions.
/// Thread-safe. Can be told to reject or throw on writes.
class CaptureSink : public MetricSink {
public:
    explicit CaptureSink(std::string label = "CaptureSink")
        : label_(std::move(label)) {}
    ~CaptureSink() override = default;

    bool start() override { running_ = true; return true; }
    void stop() override { running_ = false; }

    Status write_batch(const std::string& bucket, const std::string& org,
                       const std::vector<MetricPoint>& points) override;

    bool healthy() const override { return running_ && !failing_; }
    SinkStats stats() const override;
    std::string name() const override { return label_; }

    /// @name Test controls
    /// @{

    /// Reject subsequent writes with SinkWriteError.
    void set_failing(bool failing) { failing_ = failing; }

    /// Throw std::runtime_error from subsequent writes.
    void set_throwing(bool throwing) { throwing_ = throwing; }

    /// @}

    /// @name Test accessors
    /// @{

    /// Accepted batches (thread-safe copy)
    std::vector<CapturedBatch> batches() const;

    /// Total write_batch() calls, accepted or not
    size_t attempts() const;

    /// Points across all accepted batches
    size_t point_count() const;

    void clear();

    /// Wait until at least `count` batches were accepted
    /// @return true if count reached, false if timeout
    bool wait_for(size_t count, std::chrono::milliseconds timeout);

    /// @}

private:
    std::string label_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failing_{false};
    std::atomic<bool> throwing_{false};

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::vector<CapturedBatch> batches_;
    size_t attempts_ = 0;
    uint64_t failed_ = 0;
};

}  // namespace sinks
}  // namespace plugpoll
