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

/// @file test_scheduler.cpp
/// @brief Unit tests for Scheduler

#include "plugpoll/scheduler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using plugpoll::IntervalMisconfiguration;
using plugpoll::Scheduler;

using namespace std::chrono_literals;

TEST(SchedulerTest, OneShotRunsExactlyOnce) {
    Scheduler scheduler(false, std::nullopt);
    int calls = 0;

    scheduler.run([&calls] { ++calls; });

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(scheduler.passes(), 1u);
    EXPECT_FALSE(scheduler.persistent());
}

TEST(SchedulerTest, OneShotIgnoresInterval) {
    EXPECT_NO_THROW(Scheduler(false, 0));
    EXPECT_NO_THROW(Scheduler(false, -5));
}

TEST(SchedulerTest, PersistentWithoutIntervalIsMisconfigured) {
    EXPECT_THROW(Scheduler(true, std::nullopt), IntervalMisconfiguration);
    EXPECT_THROW(Scheduler(true, 0), IntervalMisconfiguration);
    EXPECT_THROW(Scheduler(true, -1), IntervalMisconfiguration);
}

TEST(SchedulerTest, MisconfigurationIsAConfigError) {
    EXPECT_THROW(Scheduler(true, std::nullopt), plugpoll::ConfigError);
}

TEST(SchedulerTest, PersistentRepeatsUntilStopped) {
    Scheduler scheduler(true, 1);
    EXPECT_TRUE(scheduler.persistent());
    EXPECT_EQ(scheduler.interval(), 1s);

    int calls = 0;
    auto started = std::chrono::steady_clock::now();
    scheduler.run([&] {
        ++calls;
        if (calls == 2) {
            scheduler.stop();
        }
    });
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(scheduler.passes(), 2u);
    // One full interval between the two passes, none after the stop.
    EXPECT_GE(elapsed, 900ms);
    EXPECT_LT(elapsed, 1900ms);
}

TEST(SchedulerTest, StopFromAnotherThreadWakesTheSleep) {
    Scheduler scheduler(true, 60);
    int calls = 0;

    std::thread stopper([&scheduler] {
        std::this_thread::sleep_for(100ms);
        scheduler.stop();
    });

    auto started = std::chrono::steady_clock::now();
    scheduler.run([&calls] { ++calls; });
    auto elapsed = std::chrono::steady_clock::now() - started;
    stopper.join();

    EXPECT_EQ(calls, 1);
    EXPECT_LT(elapsed, 5s);
}

TEST(SchedulerTest, StopBeforeRunSkipsEveryPass) {
    Scheduler scheduler(true, 1);
    scheduler.stop();

    int calls = 0;
    scheduler.run([&calls] { ++calls; });

    EXPECT_EQ(calls, 0);
}
