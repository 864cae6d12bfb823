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

#include "plugpoll/sinks/log_sink.hpp"
#include "plugpoll/sinks/line_protocol.hpp"
#include "common/time_utils.hpp"

#include <glog/logging.h>

namespace plugpoll {
namespace sinks {

bool LogSink::start() {
    running_ = true;
    LOG(INFO) << "LogSink started";
    return true;
}

void LogSink::stop() {
    running_ = false;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    LOG(INFO) << "LogSink stopped. Stats: batches=" << stats_.batches_sent
              << " points=" << stats_.points_sent;
}

SinkStats LogSink::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

Status LogSink::write_batch(const std::string& bucket, const std::string& org,
                            const std::vector<MetricPoint>& points) {
    if (!running_) {
        return Error{ErrorKind::SinkWriteError, "sink not started"};
    }

    std::size_t bytes = 0;
    for (const auto& point : points) {
        std::string line = line_protocol::encode(point);
        LOG(INFO) << "[influx] org=" << org << " bucket=" << bucket << " " << line;
        bytes += line.size() + 1;
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.batches_sent++;
    stats_.points_sent += points.size();
    stats_.bytes_sent += bytes;
    stats_.last_write_timestamp_ns = utils::now_ns();
    return Status::Ok();
}

}  // namespace sinks
}  // namespace plugpoll
