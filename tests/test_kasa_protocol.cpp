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

/// @file test_kasa_protocol.cpp
/// @brief Unit tests for the Kasa XOR transport and usage reduction

#include "plugpoll/crypto/crypto.hpp"
#include "plugpoll/normalizer.hpp"
#include "plugpoll/vendors/kasa_client.hpp"
#include "plugpoll/vendors/kasa_protocol.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/system_error.hpp>

#include <gtest/gtest.h>

#include <chrono>

namespace kasa = plugpoll::vendors::kasa;
namespace crypto = plugpoll::crypto;
using nlohmann::json;
using tcp = boost::asio::ip::tcp;
using Clock = std::chrono::steady_clock;

namespace {

const std::string kSysinfo = R"({"system":{"get_sysinfo":{}}})";

/// Loopback listener that completes TCP connects in the backlog but never
/// reads or answers.
class SilentPlug {
public:
    SilentPlug()
        : acceptor_(ioc_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {}

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
};

}  // namespace

TEST(KasaCipherTest, EncryptMatchesKnownVector) {
    EXPECT_EQ(crypto::hex(kasa::encrypt(kSysinfo)),
              "d0f281f88bff9af7d5ef94b6d1b4c09fec95e68fe187e8caf08bf68bf6");
}

TEST(KasaCipherTest, FramePrefixesBigEndianLength) {
    EXPECT_EQ(crypto::base64_encode(kasa::frame(kSysinfo)),
              "AAAAHdDygfiL/5r31e+UttG0wJ/sleaP4YfoyvCL9ov2");
}

TEST(KasaCipherTest, DecryptInvertsEncrypt) {
    std::string reply = R"({"emeter":{"get_realtime":{"power_mw":1500,"err_code":0}}})";
    EXPECT_EQ(kasa::decrypt(kasa::encrypt(reply)), reply);
    EXPECT_EQ(kasa::decrypt({}), "");
}

TEST(KasaUsageTest, RequestAsksForRealtimeAndMonth) {
    json request = kasa::usage_request(2024, 3);

    EXPECT_TRUE(request["emeter"]["get_realtime"].is_object());
    EXPECT_EQ(request["emeter"]["get_daystat"]["year"], 2024);
    EXPECT_EQ(request["emeter"]["get_daystat"]["month"], 3);
}

TEST(KasaUsageTest, TodayFromDayList) {
    json reply = json::parse(R"({"emeter":{
        "get_realtime":{"power_mw":1520,"err_code":0},
        "get_daystat":{"day_list":[
            {"year":2024,"month":3,"day":14,"energy_wh":900},
            {"year":2024,"month":3,"day":15,"energy_wh":250}
        ],"err_code":0}}})");

    auto usage = kasa::usage_from_emeter(reply, 15);

    ASSERT_TRUE(usage.ok());
    EXPECT_EQ(usage.value()["power_mw"], 1520);
    EXPECT_DOUBLE_EQ(usage.value()["today"].get<double>(), 0.25);
    EXPECT_EQ(usage.value()["today_wh"], 250);
}

TEST(KasaUsageTest, WattHourCountSurvivesNormalization) {
    plugpoll::ReadingNormalizer normalizer;
    for (int wh : {1001, 4097, 19999}) {
        json today = {{"day", 3}, {"energy_wh", wh}};
        json reply;
        reply["emeter"]["get_realtime"] = {{"power_mw", 1}, {"err_code", 0}};
        reply["emeter"]["get_daystat"]["day_list"] = json::array({today});
        reply["emeter"]["get_daystat"]["err_code"] = 0;

        auto usage = kasa::usage_from_emeter(reply, 3);
        ASSERT_TRUE(usage.ok());
        auto reading = normalizer.normalize_kasa("plug", usage.value(), 1);

        ASSERT_TRUE(reading.has_value());
        EXPECT_EQ(*reading->today_watt_hours, static_cast<double>(wh)) << wh;
    }
}

TEST(KasaUsageTest, OlderHardwareReportsWattsAndKilowattHours) {
    json reply = json::parse(R"({"emeter":{
        "get_realtime":{"power":1.5,"err_code":0},
        "get_daystat":{"day_list":[{"day":15,"energy":0.4}],"err_code":0}}})");

    auto usage = kasa::usage_from_emeter(reply, 15);

    ASSERT_TRUE(usage.ok());
    EXPECT_DOUBLE_EQ(usage.value()["power_mw"].get<double>(), 1500.0);
    EXPECT_DOUBLE_EQ(usage.value()["today"].get<double>(), 0.4);
}

TEST(KasaUsageTest, NoEntryForTodayIsFalse) {
    json reply = json::parse(R"({"emeter":{
        "get_realtime":{"power_mw":10,"err_code":0},
        "get_daystat":{"day_list":[],"err_code":0}}})");

    auto usage = kasa::usage_from_emeter(reply, 15);

    ASSERT_TRUE(usage.ok());
    EXPECT_EQ(usage.value()["today"], false);
}

TEST(KasaUsageTest, DaystatErrorIsFalse) {
    json reply = json::parse(R"({"emeter":{
        "get_realtime":{"power_mw":10,"err_code":0},
        "get_daystat":{"err_code":-1,"err_msg":"module not support"}}})");

    auto usage = kasa::usage_from_emeter(reply, 1);

    ASSERT_TRUE(usage.ok());
    EXPECT_EQ(usage.value()["today"], false);
}

TEST(KasaUsageTest, RealtimeErrorIsProtocolShapeError) {
    json reply = json::parse(
        R"({"emeter":{"get_realtime":{"err_code":-1,"err_msg":"module not support"}}})");

    auto usage = kasa::usage_from_emeter(reply, 1);

    ASSERT_FALSE(usage.ok());
    EXPECT_EQ(usage.error().kind, plugpoll::ErrorKind::ProtocolShapeError);
}

TEST(KasaUsageTest, MissingEmeterIsProtocolShapeError) {
    auto usage = kasa::usage_from_emeter(json{{"system", json::object()}}, 1);

    ASSERT_FALSE(usage.ok());
    EXPECT_EQ(usage.error().kind, plugpoll::ErrorKind::ProtocolShapeError);
}

TEST(KasaClientTest, UnreachablePlugWithoutCredentials) {
    plugpoll::vendors::KasaClient client(std::chrono::seconds(2));

    auto session = client.connect("127.0.0.1", plugpoll::Credentials{});

    ASSERT_FALSE(session.ok());
    EXPECT_EQ(session.error().kind, plugpoll::ErrorKind::DeviceUnreachable);
}

TEST(KasaConnectionTest, SilentPlugTimesOut) {
    SilentPlug plug;
    plugpoll::vendors::KasaConnection connection(std::chrono::seconds(1));

    connection.open("127.0.0.1", plug.port());
    ASSERT_TRUE(connection.is_open());

    auto start = Clock::now();
    EXPECT_THROW(connection.query(kSysinfo), boost::system::system_error);
    auto elapsed = Clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(900));
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    connection.close();
    EXPECT_FALSE(connection.is_open());
}

TEST(KasaClientTest, SilentPlugIsUnreachableWithinTimeout) {
    SilentPlug plug;
    plugpoll::vendors::KasaClient client(std::chrono::seconds(1), plug.port());

    auto start = Clock::now();
    auto session = client.connect("127.0.0.1", plugpoll::Credentials{});
    auto elapsed = Clock::now() - start;

    ASSERT_FALSE(session.ok());
    EXPECT_EQ(session.error().kind, plugpoll::ErrorKind::DeviceUnreachable);
    EXPECT_GE(elapsed, std::chrono::milliseconds(900));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}
