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

/// @file sinks/log_sink.hpp
/// @brief MetricSink that logs line protocol via glog

#include "plugpoll/metric_sink.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace plugpoll {
namespace sinks {

/// MetricSink that logs each batch instead of sending it anywhere.
/// Useful for dry runs. Thread-safe.
class LogSink : public MetricSink {
public:
    LogSink() = default;
    ~LogSink() override = default;

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    bool start() override;
    void stop() override;

    Status write_batch(const std::string& bucket, const std::string& org,
                       const std::vector<MetricPoint>& points) override;

    bool healthy() const override { return running_; }
    SinkStats stats() const override;
    std::string name() const override { return "LogSink"; }

private:
    std::atomic<bool> running_{false};
    mutable std::mutex stats_mutex_;
    SinkStats stats_;
};

}  // namespace sinks
}  // namespace plugpoll
