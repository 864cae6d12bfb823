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

/// @file device_client.hpp
/// @brief Abstract interface for polling one smart plug
///
/// A DeviceClient speaks one vendor protocol (or one authentication scheme of
/// a vendor). connect() performs the handshake and login; the returned
/// session reads usage and is closed at the end of the poll attempt.

#include "plugpoll/errors.hpp"
#include "plugpoll/types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace plugpoll {

/// An authenticated connection to one device. Lives for one poll attempt;
/// implementations close themselves on destruction as well.
class DeviceSession {
public:
    virtual ~DeviceSession() = default;

    /// Request the device's energy usage in its vendor-specific shape.
    virtual Result<nlohmann::json> read_usage() = 0;

    /// Release the connection. Best effort, never throws.
    virtual void close() noexcept = 0;
};

/// Capability interface for one protocol.
///
/// Implementations keep no per-device state between connect() calls and must
/// be safe to call from several poll workers at once.
class DeviceClient {
public:
    virtual ~DeviceClient() = default;

    /// Handshake with and log in to the device at `address`.
    /// Failures come back as DeviceUnreachable or AuthFailure.
    virtual Result<std::unique_ptr<DeviceSession>> connect(
        const std::string& address, const Credentials& credentials) = 0;

    /// Protocol name for logging/debugging.
    virtual std::string name() const = 0;
};

}  // namespace plugpoll
