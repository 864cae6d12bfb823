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

/// @file test_reading_set.cpp
/// @brief Unit tests for ReadingSet

#include "plugpoll/reading_set.hpp"

#include <gtest/gtest.h>

using plugpoll::Reading;
using plugpoll::ReadingSet;

namespace {

Reading make(const std::string& name, double watts) {
    Reading r;
    r.device_name = name;
    r.now_watts = watts;
    return r;
}

}  // namespace

TEST(ReadingSetTest, KeepsInsertionOrder) {
    ReadingSet set;
    set.put(make("b", 1));
    set.put(make("a", 2));
    set.put(make("c", 3));

    std::vector<std::string> names;
    for (const auto& r : set) {
        names.push_back(r.device_name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"b", "a", "c"}));
}

TEST(ReadingSetTest, ReplaceKeepsPosition) {
    ReadingSet set;
    set.put(make("a", 1));
    set.put(make("b", 2));
    set.put(make("a", 9));

    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set.begin()->device_name, "a");
    EXPECT_DOUBLE_EQ(set.begin()->now_watts, 9);
}

TEST(ReadingSetTest, FindMissingIsNull) {
    ReadingSet set;
    EXPECT_TRUE(set.empty());
    EXPECT_EQ(set.find("nope"), nullptr);

    set.put(make("a", 1));
    ASSERT_NE(set.find("a"), nullptr);
    EXPECT_DOUBLE_EQ(set.find("a")->now_watts, 1);
}
