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

/// @file test_fanout_writer.cpp
/// @brief Unit tests for FanoutWriter

#include "plugpoll/fanout_writer.hpp"
#include "plugpoll/sinks/capture_sink.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using plugpoll::FanoutWriter;
using plugpoll::MetricPoint;
using plugpoll::SinkTarget;
using plugpoll::sinks::CaptureSink;

namespace {

/// Sink whose writes throw something that is not a std::exception.
class ThrowsIntSink : public plugpoll::MetricSink {
public:
    bool start() override { return true; }
    void stop() override {}
    plugpoll::Status write_batch(const std::string&, const std::string&,
                                 const std::vector<MetricPoint>&) override {
        throw 42;
    }
    bool healthy() const override { return true; }
    plugpoll::SinkStats stats() const override { return {}; }
    std::string name() const override { return "ThrowsIntSink"; }
};

}  // namespace

class FanoutWriterTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        MetricPoint point;
        point.measurement = "power_watts";
        point.tags["host"] = "fridge";
        point.field = "consumption";
        point.value = 1.5;
        point.timestamp_ns = 42;
        points_.push_back(point);
    }

    std::shared_ptr<CaptureSink> make_sink(const std::string& label) {
        auto sink = std::make_shared<CaptureSink>(label);
        sink->start();
        return sink;
    }

    std::vector<MetricPoint> points_;
};

TEST_P(FanoutWriterTest, EveryTargetGetsExactlyOneWrite) {
    auto a = make_sink("a");
    auto b = make_sink("b");
    FanoutWriter writer({{"a", "power", "home", a}, {"b", "energy", "lab", b}}, GetParam());

    auto report = writer.write(points_);

    EXPECT_EQ(report.attempted, 2u);
    EXPECT_EQ(report.succeeded, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(report.failed.empty());

    ASSERT_EQ(a->attempts(), 1u);
    ASSERT_EQ(b->attempts(), 1u);
    auto batch = a->batches().at(0);
    EXPECT_EQ(batch.bucket, "power");
    EXPECT_EQ(batch.org, "home");
    EXPECT_EQ(batch.points, points_);
    EXPECT_EQ(b->batches().at(0).bucket, "energy");
    EXPECT_EQ(b->batches().at(0).org, "lab");
}

TEST_P(FanoutWriterTest, FailingTargetDoesNotStopOthers) {
    auto bad = make_sink("bad");
    auto good = make_sink("good");
    bad->set_failing(true);
    FanoutWriter writer({{"bad", "b", "o", bad}, {"good", "b", "o", good}}, GetParam());

    auto report = writer.write(points_);

    EXPECT_EQ(report.attempted, 2u);
    EXPECT_EQ(report.failed, (std::vector<std::string>{"bad"}));
    EXPECT_EQ(report.succeeded, (std::vector<std::string>{"good"}));
    EXPECT_EQ(bad->attempts(), 1u);
    EXPECT_EQ(good->batches().size(), 1u);
}

TEST_P(FanoutWriterTest, ThrowingTargetIsContained) {
    auto boom = make_sink("boom");
    auto good = make_sink("good");
    boom->set_throwing(true);
    FanoutWriter writer({{"boom", "b", "o", boom}, {"good", "b", "o", good}}, GetParam());

    plugpoll::FanoutReport report;
    EXPECT_NO_THROW(report = writer.write(points_));

    EXPECT_EQ(report.failed, (std::vector<std::string>{"boom"}));
    EXPECT_EQ(report.succeeded, (std::vector<std::string>{"good"}));
}

TEST_P(FanoutWriterTest, NonStandardExceptionIsContained) {
    auto odd = std::make_shared<ThrowsIntSink>();
    auto good = make_sink("good");
    FanoutWriter writer({{"odd", "b", "o", odd}, {"good", "b", "o", good}}, GetParam());

    plugpoll::FanoutReport report;
    EXPECT_NO_THROW(report = writer.write(points_));

    EXPECT_EQ(report.attempted, 2u);
    EXPECT_EQ(report.failed, (std::vector<std::string>{"odd"}));
    EXPECT_EQ(report.succeeded, (std::vector<std::string>{"good"}));
    EXPECT_EQ(good->batches().size(), 1u);
    EXPECT_EQ(good->point_count(), 1u);
}

TEST_P(FanoutWriterTest, MissingConnectionIsAFailure) {
    auto good = make_sink("good");
    FanoutWriter writer({{"ghost", "b", "o", nullptr}, {"good", "b", "o", good}}, GetParam());

    auto report = writer.write(points_);

    EXPECT_EQ(report.failed, (std::vector<std::string>{"ghost"}));
    EXPECT_EQ(good->batches().size(), 1u);
}

TEST_P(FanoutWriterTest, EmptyBatchWritesNothing) {
    auto sink = make_sink("a");
    FanoutWriter writer({{"a", "b", "o", sink}}, GetParam());

    auto report = writer.write({});

    EXPECT_EQ(report.attempted, 0u);
    EXPECT_EQ(sink->attempts(), 0u);
}

TEST_P(FanoutWriterTest, NoTargetsIsNotAnError) {
    FanoutWriter writer({}, GetParam());

    auto report = writer.write(points_);

    EXPECT_EQ(report.attempted, 0u);
    EXPECT_TRUE(report.failed.empty());
}

INSTANTIATE_TEST_SUITE_P(Modes, FanoutWriterTest, ::testing::Values(false, true),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? "Parallel" : "Sequential";
                         });
