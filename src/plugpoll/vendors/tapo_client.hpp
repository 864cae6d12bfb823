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

/// @file vendors/tapo_client.hpp
/// @brief Tapo device clients, one per authentication scheme
///
/// TapoKlapClient is the current firmware's scheme and returns the usage
/// object itself ({"current_power":...,"today_energy":...}).
/// TapoPassthroughClient is the legacy scheme and returns the full response
/// ({"error_code":0,"result":{...}}). The normalizer accepts both shapes.

#include "plugpoll/device_client.hpp"

#include <chrono>

namespace plugpoll {
namespace vendors {

class TapoKlapClient : public DeviceClient {
public:
    explicit TapoKlapClient(std::chrono::seconds timeout = std::chrono::seconds(10));

    Result<std::unique_ptr<DeviceSession>> connect(const std::string& address,
                                                   const Credentials& credentials) override;
    std::string name() const override { return "tapo-klap"; }

private:
    std::chrono::seconds timeout_;
};

class TapoPassthroughClient : public DeviceClient {
public:
    explicit TapoPassthroughClient(std::chrono::seconds timeout = std::chrono::seconds(10));

    Result<std::unique_ptr<DeviceSession>> connect(const std::string& address,
                                                   const Credentials& credentials) override;
    std::string name() const override { return "tapo-passthrough"; }

private:
    std::chrono::seconds timeout_;
};

}  // namespace vendors
}  // namespace plugpoll
