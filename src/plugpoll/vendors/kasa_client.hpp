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

/// @file vendors/kasa_client.hpp
/// @brief Kasa plug client (lookup by address)
///
/// Probes the plug over the XOR protocol first. Newer firmware closes port
/// 9999; for those the client falls back to KLAP v1 when the Kasa family has
/// credentials configured.
///
/// read_usage() returns {"power_mw": <number>, "today": <kWh number or false>},
/// plus "today_wh" when the plug counted in Wh.

#include "plugpoll/device_client.hpp"
#include "plugpoll/vendors/kasa_protocol.hpp"

#include <chrono>

namespace plugpoll {
namespace vendors {

namespace kasa {

/// Combined realtime + daily-statistics request for the given month.
nlohmann::json usage_request(int year, int month);

/// Reduce an emeter reply to {power_mw, today}.
/// @param day  day of month whose energy counts as "today"
Result<nlohmann::json> usage_from_emeter(const nlohmann::json& reply, int day);

}  // namespace kasa

class KasaClient : public DeviceClient {
public:
    /// @param timeout deadline for each network operation
    /// @param xor_port TCP port of the XOR protocol
    explicit KasaClient(std::chrono::seconds timeout = std::chrono::seconds(10),
                        uint16_t xor_port = kasa::kPort);

    Result<std::unique_ptr<DeviceSession>> connect(const std::string& address,
                                                   const Credentials& credentials) override;
    std::string name() const override { return "kasa"; }

private:
    std::chrono::seconds timeout_;
    uint16_t xor_port_;
};

}  // namespace vendors
}  // namespace plugpoll
