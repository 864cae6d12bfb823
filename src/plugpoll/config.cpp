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

#include "plugpoll/config.hpp"

#include <glog/logging.h>

namespace plugpoll {

namespace {

std::string required_string(const YAML::Node& node, const char* key,
                            const std::string& where) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) {
        throw ConfigError(where + ": missing required field '" + key + "'");
    }
    return value.as<std::string>();
}

std::string optional_string(const YAML::Node& node, const char* key,
                            const std::string& fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    return value.as<std::string>();
}

std::vector<DeviceConfig> parse_devices(const YAML::Node& family, Vendor vendor,
                                        const std::string& where) {
    const YAML::Node list = family["devices"];
    if (!list || !list.IsSequence()) {
        throw ConfigError(where + ": 'devices' must be a list");
    }

    std::vector<DeviceConfig> devices;
    for (std::size_t i = 0; i < list.size(); ++i) {
        const YAML::Node entry = list[i];
        const std::string entry_where = where + ".devices[" + std::to_string(i) + "]";
        if (!entry.IsMap()) {
            throw ConfigError(entry_where + ": expected a mapping");
        }

        DeviceConfig device;
        device.vendor = vendor;
        device.name = required_string(entry, "name", entry_where);
        device.address = required_string(entry, "ip", entry_where);

        if (vendor == Vendor::Tapo) {
            std::string mode = optional_string(entry, "auth", "");
            auto parsed = parse_auth_mode(mode);
            if (!parsed) {
                throw ConfigError(entry_where + ": unknown auth mode '" + mode +
                                  "' (expected all, default_only or legacy_only)");
            }
            device.auth_mode = *parsed;
        }
        devices.push_back(std::move(device));
    }
    return devices;
}

FamilyConfig parse_kasa(const YAML::Node& node) {
    const std::string where = "devices.kasa";
    if (!node.IsMap()) {
        throw ConfigError(where + ": expected a mapping");
    }

    FamilyConfig family;
    const YAML::Node auth = node["auth"];
    if (auth && !auth.IsNull()) {
        if (!auth.IsMap()) {
            throw ConfigError(where + ".auth: expected a mapping");
        }
        family.credentials.username = required_string(auth, "user", where + ".auth");
        family.credentials.password = required_string(auth, "passw", where + ".auth");
    }
    family.devices = parse_devices(node, Vendor::Kasa, where);
    return family;
}

FamilyConfig parse_tapo(const YAML::Node& node) {
    const std::string where = "devices.tapo";
    if (!node.IsMap()) {
        throw ConfigError(where + ": expected a mapping");
    }

    FamilyConfig family;
    family.credentials.username = required_string(node, "user", where);
    family.credentials.password = required_string(node, "passw", where);
    family.devices = parse_devices(node, Vendor::Tapo, where);
    return family;
}

std::vector<DestinationConfig> parse_destinations(const YAML::Node& list,
                                                  const std::string& key) {
    // "destinations:" with nothing after it means none.
    if (list.IsNull()) {
        return {};
    }
    if (!list.IsSequence()) {
        throw ConfigError(key + ": expected a list");
    }

    std::vector<DestinationConfig> destinations;
    for (std::size_t i = 0; i < list.size(); ++i) {
        const YAML::Node entry = list[i];
        const std::string where = key + "[" + std::to_string(i) + "]";
        if (!entry.IsMap()) {
            throw ConfigError(where + ": expected a mapping");
        }

        DestinationConfig dest;
        dest.type = optional_string(entry, "type", "influxdb");
        if (dest.type != "influxdb" && dest.type != "log") {
            throw ConfigError(where + ": unknown destination type '" + dest.type + "'");
        }

        dest.name = required_string(entry, "name", where);
        dest.org = required_string(entry, "org", where);
        dest.bucket = required_string(entry, "bucket", where);
        if (dest.type == "influxdb") {
            dest.url = required_string(entry, "url", where);
            dest.token = required_string(entry, "token", where);
        } else {
            dest.url = optional_string(entry, "url", "");
            dest.token = optional_string(entry, "token", "");
        }
        destinations.push_back(std::move(dest));
    }
    return destinations;
}

PollerConfig parse_poller(const YAML::Node& node) {
    PollerConfig poller;
    if (!node || node.IsNull()) {
        return poller;
    }
    if (!node.IsMap()) {
        throw ConfigError("poller: expected a mapping");
    }

    poller.persist = node["persist"].as<bool>(false);
    if (node["interval"] && !node["interval"].IsNull()) {
        poller.interval_sec = node["interval"].as<int>();
    }
    poller.loglevel = optional_string(node, "loglevel", poller.loglevel);
    poller.workers = node["workers"].as<int>(poller.workers);
    poller.timeout_sec = node["timeout"].as<int>(poller.timeout_sec);

    if (poller.workers < 1) {
        throw ConfigError("poller.workers must be at least 1");
    }
    if (poller.timeout_sec < 1) {
        throw ConfigError("poller.timeout must be a positive number of seconds");
    }
    return poller;
}

}  // namespace

std::vector<DeviceConfig> Config::all_devices() const {
    std::vector<DeviceConfig> devices;
    if (kasa) {
        devices.insert(devices.end(), kasa->devices.begin(), kasa->devices.end());
    }
    if (tapo) {
        devices.insert(devices.end(), tapo->devices.begin(), tapo->devices.end());
    }
    return devices;
}

Config parse_config(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw ConfigError("configuration root must be a mapping");
    }

    Config config;
    try {
        if (root["destinations"]) {
            config.destinations = parse_destinations(root["destinations"], "destinations");
        } else if (root["influxdb"]) {
            config.destinations = parse_destinations(root["influxdb"], "influxdb");
        }

        const YAML::Node devices = root["devices"];
        if (devices && devices.IsMap()) {
            if (devices["kasa"] && !devices["kasa"].IsNull()) {
                config.kasa = parse_kasa(devices["kasa"]);
            }
            if (devices["tapo"] && !devices["tapo"].IsNull()) {
                config.tapo = parse_tapo(devices["tapo"]);
            }
        }

        config.poller = parse_poller(root["poller"]);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }

    if (!config.kasa && !config.tapo) {
        throw ConfigError("no device family configured (expected devices.kasa and/or devices.tapo)");
    }
    return config;
}

Config parse_config_string(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("failed to parse configuration: ") + e.what());
    }
    return parse_config(root);
}

Config load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("failed to load " + path + ": " + e.what());
    }

    Config config = parse_config(root);
    LOG(INFO) << "Loaded configuration from " << path << ": "
              << (config.kasa ? config.kasa->devices.size() : 0) << " kasa device(s), "
              << (config.tapo ? config.tapo->devices.size() : 0) << " tapo device(s), "
              << config.destinations.size() << " destination(s)";
    return config;
}

}  // namespace plugpoll
