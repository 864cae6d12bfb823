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

#include "plugpoll/sinks/influx_sink.hpp"
#include "plugpoll/sinks/line_protocol.hpp"
#include "common/time_utils.hpp"

#include <boost/system/system_error.hpp>

#include <glog/logging.h>

#include <cctype>
#include <cstdio>

namespace plugpoll {
namespace sinks {

namespace {

// Enough of the server's reply to explain a rejection in the log.
constexpr std::size_t kMaxErrorBody = 256;

}  // namespace

std::string url_encode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

InfluxSink::InfluxSink(const InfluxConfig& config)
    : config_(config)
    , http_(config.timeout) {}

InfluxSink::~InfluxSink() {
    stop();
}

bool InfluxSink::start() {
    if (running_) {
        return true;
    }
    try {
        base_ = net::Url::parse(config_.url);
    } catch (const std::invalid_argument& e) {
        LOG(ERROR) << "InfluxSink: " << e.what();
        return false;
    }
    running_ = true;
    LOG(INFO) << "InfluxSink started for " << base_->scheme << "://" << base_->host << ":"
              << base_->port;
    return true;
}

void InfluxSink::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    std::lock_guard<std::mutex> lock(stats_mutex_);
    LOG(INFO) << "InfluxSink stopped. Stats: batches=" << stats_.batches_sent
              << " failed=" << stats_.batches_failed
              << " points=" << stats_.points_sent;
}

std::string InfluxSink::write_target(const std::string& bucket, const std::string& org) const {
    std::string prefix = base_ ? base_->target : "";
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    return prefix + "/api/v2/write?org=" + url_encode(org) + "&bucket=" + url_encode(bucket) +
           "&precision=ns";
}

Status InfluxSink::write_batch(const std::string& bucket, const std::string& org,
                               const std::vector<MetricPoint>& points) {
    if (!running_ || !base_) {
        return Error{ErrorKind::SinkWriteError, "sink not started"};
    }

    std::string body = line_protocol::encode(points);
    net::Headers headers{
        {"Authorization", "Token " + config_.token},
        {"Content-Type", "text/plain; charset=utf-8"},
        {"Accept", "application/json"},
    };

    std::optional<Error> failure;
    try {
        auto response = http_.post(base_->with_target(write_target(bucket, org)), body, headers);
        if (!response.ok()) {
            failure = Error{ErrorKind::SinkWriteError,
                            "HTTP " + std::to_string(response.status) + ": " +
                                response.body.substr(0, kMaxErrorBody)};
        }
    } catch (const boost::system::system_error& e) {
        failure = Error{ErrorKind::SinkWriteError, e.what()};
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (failure) {
        stats_.batches_failed++;
        last_write_ok_ = false;
        return *failure;
    }
    stats_.batches_sent++;
    stats_.points_sent += points.size();
    stats_.bytes_sent += body.size();
    stats_.last_write_timestamp_ns = utils::now_ns();
    last_write_ok_ = true;
    VLOG(1) << "InfluxSink: " << points.size() << " points to " << org << "/" << bucket;
    return Status::Ok();
}

bool InfluxSink::healthy() const {
    return running_ && last_write_ok_;
}

SinkStats InfluxSink::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

}  // namespace sinks
}  // namespace plugpoll
