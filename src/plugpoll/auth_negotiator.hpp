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

/// @file auth_negotiator.hpp
/// @brief Scheme fallback for devices with two incompatible auth protocols

#include "plugpoll/device_client.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace plugpoll {

/// Tries a device's authentication schemes in the order its AuthMode names
/// and returns the first raw usage response obtained.
///
/// Nothing is remembered between calls: firmware can change between polls,
/// so every cycle probes again. Failed attempts are expected when probing the
/// wrong scheme and are only logged at VLOG(1).
class AuthNegotiator {
public:
    /// @param default_scheme client for the current firmware scheme
    /// @param legacy_scheme client for the older scheme
    AuthNegotiator(DeviceClient& default_scheme, DeviceClient& legacy_scheme);

    /// @return raw usage, or the error of the last scheme attempted
    Result<nlohmann::json> negotiate(const std::string& address,
                                     const Credentials& credentials,
                                     AuthMode mode) const;

    /// One handshake, login, read sequence against one scheme.
    static Result<nlohmann::json> attempt(DeviceClient& client,
                                          const std::string& address,
                                          const Credentials& credentials);

private:
    DeviceClient& default_scheme_;
    DeviceClient& legacy_scheme_;
};

}  // namespace plugpoll
