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

/// @file poll_cycle.hpp
/// @brief One pass over every configured device

#include "plugpoll/auth_negotiator.hpp"
#include "plugpoll/config.hpp"
#include "plugpoll/device_client.hpp"
#include "plugpoll/normalizer.hpp"
#include "plugpoll/reading_set.hpp"
#include "plugpoll/thread_pool.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace plugpoll {

/// Polls every configured device once per run().
///
/// A device that cannot be reached, refuses login or returns something that
/// cannot be normalized is logged by name and left out of the result; it
/// never stops the remaining devices from being polled. With more than one
/// worker, devices are polled concurrently and merged back in configuration
/// order on the calling thread.
class PollCycle {
public:
    /// @param kasa Kasa family, if configured
    /// @param tapo Tapo family, if configured
    /// @param kasa_client protocol client for Kasa devices
    /// @param tapo_negotiator scheme negotiator for Tapo devices
    /// @param workers concurrent polls; 1 polls sequentially
    /// @throws ConfigError if neither family is configured
    PollCycle(std::optional<FamilyConfig> kasa,
              std::optional<FamilyConfig> tapo,
              DeviceClient& kasa_client,
              const AuthNegotiator& tapo_negotiator,
              int workers = 1);

    PollCycle(const PollCycle&) = delete;
    PollCycle& operator=(const PollCycle&) = delete;

    /// Poll all devices. Every Reading is stamped with `captured_at_ns`.
    ReadingSet run(int64_t captured_at_ns);

    std::size_t device_count() const { return targets_.size(); }

private:
    struct Target {
        DeviceConfig device;
        const Credentials* credentials;
    };

    std::optional<Reading> poll_device(const Target& target, int64_t captured_at_ns) const;

    std::optional<FamilyConfig> kasa_;
    std::optional<FamilyConfig> tapo_;
    std::vector<Target> targets_;

    DeviceClient& kasa_client_;
    const AuthNegotiator& tapo_negotiator_;
    ReadingNormalizer normalizer_;

    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace plugpoll
