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

/// @file sinks/influx_sink.hpp
/// @brief MetricSink writing line protocol to the InfluxDB v2 HTTP API

#include "plugpoll/metric_sink.hpp"
#include "plugpoll/net/http_client.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace plugpoll {
namespace sinks {

/// Connection settings for one InfluxDB server.
struct InfluxConfig {
    std::string url = "http://localhost:8086";
    std::string token;
    std::chrono::seconds timeout{10};
};

/// MetricSink that POSTs each batch to /api/v2/write.
///
/// One request per batch, no retries and no buffering: a batch that fails is
/// reported as SinkWriteError and dropped.
///
/// Thread-safe.
class InfluxSink : public MetricSink {
public:
    explicit InfluxSink(const InfluxConfig& config);
    ~InfluxSink() override;

    InfluxSink(const InfluxSink&) = delete;
    InfluxSink& operator=(const InfluxSink&) = delete;

    bool start() override;
    void stop() override;

    Status write_batch(const std::string& bucket, const std::string& org,
                       const std::vector<MetricPoint>& points) override;

    bool healthy() const override;
    SinkStats stats() const override;
    std::string name() const override { return "InfluxSink"; }

    /// Request target for a write to bucket/org.
    std::string write_target(const std::string& bucket, const std::string& org) const;

private:
    InfluxConfig config_;
    net::HttpClient http_;
    std::optional<net::Url> base_;

    std::atomic<bool> running_{false};
    std::atomic<bool> last_write_ok_{true};

    mutable std::mutex stats_mutex_;
    SinkStats stats_;
};

/// Percent-encode a query parameter value.
std::string url_encode(const std::string& text);

}  // namespace sinks
}  // namespace plugpoll
