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

#include "plugpoll/sinks/capture_sink.hpp"

#include <stdexcept>

namespace plugpoll {
namespace sinks {

Status CaptureSink::write_batch(const std::string& bucket, const std::string& org,
                                const std::vector<MetricPoint>& points) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
    }

    if (throwing_) {
        throw std::runtime_error(label_ + ": connection reset");
    }
    if (!running_ || failing_) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++failed_;
        return Error{ErrorKind::SinkWriteError, label_ + ": write rejected"};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        batches_.push_back(CapturedBatch{bucket, org, points});
    }
    cv_.notify_all();
    return Status::Ok();
}

SinkStats CaptureSink::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SinkStats s;
    s.batches_sent = batches_.size();
    s.batches_failed = failed_;
    for (const auto& batch : batches_) {
        s.points_sent += batch.points.size();
    }
    return s;
}

std::vector<CapturedBatch> CaptureSink::batches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_;
}

size_t CaptureSink::attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

size_t CaptureSink::point_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& batch : batches_) {
        total += batch.points.size();
    }
    return total;
}

void CaptureSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    batches_.clear();
    attempts_ = 0;
    failed_ = 0;
}

bool CaptureSink::wait_for(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, count] {
        return batches_.size() >= count;
    });
}

}  // namespace sinks
}  // namespace plugpoll
