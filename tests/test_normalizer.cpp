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

/// @file test_normalizer.cpp
/// @brief Unit tests for ReadingNormalizer

#include "plugpoll/normalizer.hpp"

#include <gtest/gtest.h>

using plugpoll::Reading;
using plugpoll::ReadingNormalizer;
using plugpoll::Vendor;
using nlohmann::json;

class NormalizerTest : public ::testing::Test {
protected:
    static constexpr int64_t kTs = 1700000000000000000;
    ReadingNormalizer normalizer_;
};

// =============================================================================
// Kasa
// =============================================================================

TEST_F(NormalizerTest, Kasa_ConvertsMilliwattsAndKilowattHours) {
    auto reading = normalizer_.normalize_kasa("fridge", json{{"power_mw", 1500}, {"today", 0.25}}, kTs);

    ASSERT_TRUE(reading.has_value());
    EXPECT_EQ(reading->device_name, "fridge");
    EXPECT_DOUBLE_EQ(reading->now_watts, 1.5);
    ASSERT_TRUE(reading->today_watt_hours.has_value());
    EXPECT_DOUBLE_EQ(*reading->today_watt_hours, 250.0);
    EXPECT_EQ(reading->captured_at_ns, kTs);
}

TEST_F(NormalizerTest, Kasa_FalseTodayIsAbsent) {
    auto reading = normalizer_.normalize_kasa("fridge", json{{"power_mw", 1500}, {"today", false}}, kTs);

    ASSERT_TRUE(reading.has_value());
    EXPECT_FALSE(reading->today_watt_hours.has_value());
}

TEST_F(NormalizerTest, Kasa_ZeroTodayIsAbsent) {
    auto reading = normalizer_.normalize_kasa("fridge", json{{"power_mw", 0}, {"today", 0}}, kTs);

    ASSERT_TRUE(reading.has_value());
    EXPECT_DOUBLE_EQ(reading->now_watts, 0.0);
    EXPECT_FALSE(reading->today_watt_hours.has_value());
}

TEST_F(NormalizerTest, Kasa_MissingOrNullTodayIsAbsent) {
    auto missing = normalizer_.normalize_kasa("a", json{{"power_mw", 10}}, kTs);
    auto null_today = normalizer_.normalize_kasa("a", json{{"power_mw", 10}, {"today", nullptr}}, kTs);

    ASSERT_TRUE(missing.has_value());
    ASSERT_TRUE(null_today.has_value());
    EXPECT_FALSE(missing->today_watt_hours.has_value());
    EXPECT_FALSE(null_today->today_watt_hours.has_value());
}

TEST_F(NormalizerTest, Kasa_ExactWattHoursArePreferred) {
    auto reading = normalizer_.normalize_kasa(
        "fridge", json{{"power_mw", 10}, {"today", 1.001}, {"today_wh", 1001}}, kTs);

    ASSERT_TRUE(reading.has_value());
    EXPECT_EQ(*reading->today_watt_hours, 1001.0);
}

TEST_F(NormalizerTest, Kasa_WattHoursDoNotOverrideFalseToday) {
    auto reading = normalizer_.normalize_kasa(
        "fridge", json{{"power_mw", 10}, {"today", false}, {"today_wh", 5}}, kTs);

    ASSERT_TRUE(reading.has_value());
    EXPECT_FALSE(reading->today_watt_hours.has_value());
}

TEST_F(NormalizerTest, Kasa_MissingPowerProducesNothing) {
    EXPECT_FALSE(normalizer_.normalize_kasa("a", json{{"today", 0.5}}, kTs).has_value());
}

TEST_F(NormalizerTest, Kasa_NonNumericPowerProducesNothing) {
    EXPECT_FALSE(normalizer_.normalize_kasa("a", json{{"power_mw", "1500"}}, kTs).has_value());
    EXPECT_FALSE(normalizer_.normalize_kasa("a", json{{"power_mw", true}}, kTs).has_value());
    EXPECT_FALSE(normalizer_.normalize_kasa("a", json::array({1, 2}), kTs).has_value());
}

// =============================================================================
// Tapo
// =============================================================================

TEST_F(NormalizerTest, Tapo_WrappedShape) {
    json raw = {{"error_code", 0},
                {"result", {{"current_power", 12000}, {"today_energy", 340}}}};

    auto reading = normalizer_.normalize_tapo("desk", raw, kTs);

    ASSERT_TRUE(reading.has_value());
    EXPECT_DOUBLE_EQ(reading->now_watts, 12.0);
    ASSERT_TRUE(reading->today_watt_hours.has_value());
    EXPECT_DOUBLE_EQ(*reading->today_watt_hours, 340.0);
}

TEST_F(NormalizerTest, Tapo_TopLevelShapeEqualsWrappedShape) {
    json usage = {{"current_power", 7300}, {"today_energy", 55}, {"month_energy", 900}};
    json wrapped = {{"result", usage}};

    auto top = normalizer_.normalize_tapo("desk", usage, kTs);
    auto nested = normalizer_.normalize_tapo("desk", wrapped, kTs);

    ASSERT_TRUE(top.has_value());
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(*top, *nested);
}

TEST_F(NormalizerTest, Tapo_ZeroTodayIsKept) {
    json raw = {{"result", {{"current_power", 0}, {"today_energy", 0}}}};

    auto reading = normalizer_.normalize_tapo("desk", raw, kTs);

    ASSERT_TRUE(reading.has_value());
    ASSERT_TRUE(reading->today_watt_hours.has_value());
    EXPECT_DOUBLE_EQ(*reading->today_watt_hours, 0.0);
}

TEST_F(NormalizerTest, Tapo_MissingTodayIsAbsent) {
    auto reading = normalizer_.normalize_tapo("desk", json{{"current_power", 5000}}, kTs);

    ASSERT_TRUE(reading.has_value());
    EXPECT_FALSE(reading->today_watt_hours.has_value());
}

TEST_F(NormalizerTest, Tapo_NonNumericTodayProducesNothing) {
    json raw = {{"result", {{"current_power", 5000}, {"today_energy", "lots"}}}};
    EXPECT_FALSE(normalizer_.normalize_tapo("desk", raw, kTs).has_value());
}

TEST_F(NormalizerTest, Tapo_UnrecognisedShapeProducesNothing) {
    EXPECT_FALSE(normalizer_.normalize_tapo("desk", json{{"foo", 1}}, kTs).has_value());
    EXPECT_FALSE(normalizer_.normalize_tapo("desk", json{{"result", 5}}, kTs).has_value());
    EXPECT_FALSE(normalizer_.normalize_tapo("desk", json("text"), kTs).has_value());
}

TEST_F(NormalizerTest, WrapTapoResult_LeavesOtherShapesAlone) {
    json wrapped = {{"result", {{"current_power", 1}}}};
    json unrelated = {{"foo", 1}};

    EXPECT_EQ(ReadingNormalizer::wrap_tapo_result(wrapped), wrapped);
    EXPECT_EQ(ReadingNormalizer::wrap_tapo_result(unrelated), unrelated);
    EXPECT_EQ(ReadingNormalizer::wrap_tapo_result(json{{"current_power", 1}}), wrapped);
}

// =============================================================================
// Dispatch
// =============================================================================

TEST_F(NormalizerTest, Normalize_DispatchesOnVendor) {
    json kasa = {{"power_mw", 2000}, {"today", 1.0}};

    auto as_kasa = normalizer_.normalize(Vendor::Kasa, "x", kasa, kTs);
    auto as_tapo = normalizer_.normalize(Vendor::Tapo, "x", kasa, kTs);

    ASSERT_TRUE(as_kasa.has_value());
    EXPECT_DOUBLE_EQ(as_kasa->now_watts, 2.0);
    EXPECT_FALSE(as_tapo.has_value());
}

TEST_F(NormalizerTest, Normalize_IsIdempotent) {
    json raw = {{"result", {{"current_power", 4321}, {"today_energy", 99}}}};

    auto first = normalizer_.normalize(Vendor::Tapo, "desk", raw, kTs);
    auto second = normalizer_.normalize(Vendor::Tapo, "desk", raw, kTs);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}
