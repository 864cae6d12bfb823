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

#include "plugpoll/scheduler.hpp"

#include <glog/logging.h>

namespace plugpoll {

Scheduler::Scheduler(bool persist, std::optional<int> interval_sec)
    : persist_(persist) {
    if (!persist_) {
        return;
    }
    if (!interval_sec) {
        throw IntervalMisconfiguration(
            "persistent mode requires poller.interval (seconds)");
    }
    if (*interval_sec <= 0) {
        throw IntervalMisconfiguration(
            "poller.interval must be a positive number of seconds, got " +
            std::to_string(*interval_sec));
    }
    interval_ = std::chrono::seconds(*interval_sec);
}

void Scheduler::run(const std::function<void()>& pass) {
    if (!persist_) {
        pass();
        ++passes_;
        return;
    }

    LOG(INFO) << "Polling every " << interval_.count() << " s";
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) {
                break;
            }
        }

        pass();
        ++passes_;
        LOG_EVERY_N(INFO, 60) << "Completed " << passes_.load() << " polling passes";

        std::unique_lock<std::mutex> lock(mutex_);
        if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
    }
    LOG(INFO) << "Scheduler stopped after " << passes_.load() << " passes";
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
}

}  // namespace plugpoll
