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

/// @file sinks/line_protocol.hpp
/// @brief InfluxDB line protocol encoding
///
///   <measurement>[,<tag>=<value>...] <field>=<value> <timestamp_ns>

#include "plugpoll/types.hpp"

#include <string>
#include <vector>

namespace plugpoll {
namespace sinks {
namespace line_protocol {

/// Escape commas and spaces.
std::string escape_measurement(const std::string& text);

/// Escape commas, equals signs and spaces (tag keys, tag values, field keys).
std::string escape_key(const std::string& text);

/// Float field value. Integral values carry no suffix so they stay floats.
std::string format_value(double value);

std::string encode(const MetricPoint& point);

/// One line per point, newline separated.
std::string encode(const std::vector<MetricPoint>& points);

}  // namespace line_protocol
}  // namespace sinks
}  // namespace plugpoll
