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

/// @file config.hpp
/// @brief Typed collector configuration loaded from YAML
///
/// The YAML document is validated once at startup. Anything missing or of the
/// wrong type raises ConfigError; nothing downstream re-checks it.

#include "plugpoll/errors.hpp"
#include "plugpoll/types.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <vector>

namespace plugpoll {

/// One time-series destination.
struct DestinationConfig {
    std::string name;
    std::string type = "influxdb";  // "influxdb" or "log"
    std::string url;
    std::string token;
    std::string org;
    std::string bucket;
};

/// Devices of one vendor family sharing one set of credentials.
struct FamilyConfig {
    Credentials credentials;
    std::vector<DeviceConfig> devices;
};

struct PollerConfig {
    bool persist = false;
    std::optional<int> interval_sec;
    std::string loglevel = "info";
    int workers = 1;
    int timeout_sec = 10;
};

struct Config {
    std::vector<DestinationConfig> destinations;
    std::optional<FamilyConfig> kasa;
    std::optional<FamilyConfig> tapo;
    PollerConfig poller;

    /// All configured devices, Kasa first, each family in file order.
    std::vector<DeviceConfig> all_devices() const;
};

/// Load and validate a configuration file.
/// @throws ConfigError if the file is unreadable, unparseable or invalid
Config load_config(const std::string& path);

/// Validate an already parsed document.
/// @throws ConfigError
Config parse_config(const YAML::Node& root);

/// Convenience for tests and embedded configs.
/// @throws ConfigError
Config parse_config_string(const std::string& yaml);

}  // namespace plugpoll
