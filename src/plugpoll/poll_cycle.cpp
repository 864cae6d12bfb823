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

#include "plugpoll/poll_cycle.hpp"

#include <glog/logging.h>

#include <future>
#include <sstream>

namespace plugpoll {

namespace {

std::string describe(const Reading& reading) {
    std::ostringstream out;
    out << reading.device_name << ": " << reading.now_watts << " W now, ";
    if (reading.today_watt_hours) {
        out << *reading.today_watt_hours << " Wh today";
    } else {
        out << "today not supplied";
    }
    return out.str();
}

// "tapo device desk (10.0.0.3, auth all)"
std::string label(const DeviceConfig& device) {
    std::ostringstream out;
    out << to_string(device.vendor) << " device " << device.name << " (" << device.address;
    if (device.vendor == Vendor::Tapo) {
        out << ", auth " << to_string(device.auth_mode);
    }
    out << ")";
    return out.str();
}

}  // namespace

PollCycle::PollCycle(std::optional<FamilyConfig> kasa,
                     std::optional<FamilyConfig> tapo,
                     DeviceClient& kasa_client,
                     const AuthNegotiator& tapo_negotiator,
                     int workers)
    : kasa_(std::move(kasa))
    , tapo_(std::move(tapo))
    , kasa_client_(kasa_client)
    , tapo_negotiator_(tapo_negotiator) {
    if (!kasa_ && !tapo_) {
        throw ConfigError("no device family configured");
    }

    // Credentials are referenced from the owned family configs.
    if (kasa_) {
        for (const auto& device : kasa_->devices) {
            targets_.push_back({device, &kasa_->credentials});
        }
    }
    if (tapo_) {
        for (const auto& device : tapo_->devices) {
            targets_.push_back({device, &tapo_->credentials});
        }
    }

    if (workers > 1) {
        pool_ = std::make_unique<ThreadPool>(static_cast<std::size_t>(workers));
    }
}

std::optional<Reading> PollCycle::poll_device(const Target& target,
                                              int64_t captured_at_ns) const {
    const DeviceConfig& device = target.device;
    try {
        Result<nlohmann::json> raw = device.vendor == Vendor::Tapo
            ? tapo_negotiator_.negotiate(device.address, *target.credentials, device.auth_mode)
            : AuthNegotiator::attempt(kasa_client_, device.address, *target.credentials);

        if (!raw) {
            LOG(WARNING) << "Failed to poll " << label(device) << ": "
                         << to_string(raw.error().kind) << ": " << raw.error().message;
            return std::nullopt;
        }

        auto reading = normalizer_.normalize(device.vendor, device.name, raw.value(),
                                             captured_at_ns);
        if (!reading) {
            LOG(WARNING) << "Failed to poll " << label(device) << ": unusable usage response "
                         << raw.value().dump();
            return std::nullopt;
        }

        LOG(INFO) << describe(*reading);
        return reading;

    } catch (const std::exception& e) {
        LOG(WARNING) << "Failed to poll " << label(device) << ": " << e.what();
        return std::nullopt;
    } catch (...) {
        LOG(WARNING) << "Failed to poll " << label(device) << ": unknown exception";
        return std::nullopt;
    }
}

ReadingSet PollCycle::run(int64_t captured_at_ns) {
    ReadingSet readings;

    if (!pool_) {
        for (const auto& target : targets_) {
            auto reading = poll_device(target, captured_at_ns);
            if (reading) {
                readings.put(std::move(*reading));
            }
        }
        return readings;
    }

    std::vector<std::future<std::optional<Reading>>> pending;
    pending.reserve(targets_.size());
    for (const auto& target : targets_) {
        pending.push_back(pool_->submit([this, &target, captured_at_ns] {
            return poll_device(target, captured_at_ns);
        }));
    }

    for (auto& result : pending) {
        auto reading = result.get();
        if (reading) {
            readings.put(std::move(*reading));
        }
    }
    return readings;
}

}  // namespace plugpoll
