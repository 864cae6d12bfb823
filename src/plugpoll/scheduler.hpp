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

/// @file scheduler.hpp
/// @brief One-shot or fixed-interval driver for collection passes

#include "plugpoll/errors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace plugpoll {

/// Runs a pass once, or forever with a fixed sleep between passes.
///
/// The sleep is always the full interval: time spent in the pass is not
/// subtracted, so the cadence is interval plus pass duration.
class Scheduler {
public:
    /// @throws IntervalMisconfiguration if `persist` and no positive interval
    Scheduler(bool persist, std::optional<int> interval_sec);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// One-shot: call `pass` once and return. Persistent: loop until stop().
    void run(const std::function<void()>& pass);

    /// End a persistent run at its next sleep. Safe from any thread.
    void stop();

    bool persistent() const { return persist_; }
    std::chrono::seconds interval() const { return interval_; }
    uint64_t passes() const { return passes_; }

private:
    bool persist_;
    std::chrono::seconds interval_{0};

    std::atomic<uint64_t> passes_{0};
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
};

}  // namespace plugpoll
