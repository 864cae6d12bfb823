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

#include "plugpoll/fanout_writer.hpp"

#include <glog/logging.h>

#include <future>
#include <system_error>

namespace plugpoll {

FanoutWriter::FanoutWriter(std::vector<SinkTarget> targets, bool parallel)
    : targets_(std::move(targets))
    , parallel_(parallel) {}

Status FanoutWriter::write_one(const SinkTarget& target,
                               const std::vector<MetricPoint>& points) {
    if (!target.connection) {
        return Error{ErrorKind::SinkWriteError, "destination has no connection"};
    }
    try {
        return target.connection->write_batch(target.bucket, target.org, points);
    } catch (const std::exception& e) {
        return Error{ErrorKind::SinkWriteError, e.what()};
    } catch (...) {
        return Error{ErrorKind::SinkWriteError,
                     "unknown exception from " + target.connection->name()};
    }
}

FanoutReport FanoutWriter::write(const std::vector<MetricPoint>& points) const {
    FanoutReport report;
    if (points.empty()) {
        return report;
    }

    std::vector<Status> results;
    results.reserve(targets_.size());

    if (parallel_ && targets_.size() > 1) {
        std::vector<std::future<Status>> pending;
        pending.reserve(targets_.size());
        for (const auto& target : targets_) {
            try {
                pending.push_back(std::async(std::launch::async, &FanoutWriter::write_one,
                                             std::cref(target), std::cref(points)));
            } catch (const std::system_error& e) {
                LOG(WARNING) << "Writing to " << target.name
                             << " on the calling thread: " << e.what();
                std::promise<Status> inline_result;
                inline_result.set_value(write_one(target, points));
                pending.push_back(inline_result.get_future());
            }
        }
        for (auto& result : pending) {
            results.push_back(result.get());
        }
    } else {
        for (const auto& target : targets_) {
            results.push_back(write_one(target, points));
        }
    }

    for (std::size_t i = 0; i < targets_.size(); ++i) {
        const SinkTarget& target = targets_[i];
        ++report.attempted;
        if (results[i]) {
            LOG(INFO) << "Wrote " << points.size() << " points to " << target.name;
            report.succeeded.push_back(target.name);
        } else {
            LOG(ERROR) << "Failed to write to " << target.name << ": "
                       << results[i].error().message;
            report.failed.push_back(target.name);
        }
    }
    return report;
}

}  // namespace plugpoll
