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

#include "plugpoll/sinks/line_protocol.hpp"

#include <iomanip>
#include <locale>
#include <sstream>

namespace plugpoll {
namespace sinks {
namespace line_protocol {

namespace {

std::string escape(const std::string& text, const char* special) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (std::string(special).find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

}  // namespace

std::string escape_measurement(const std::string& text) {
    return escape(text, ", ");
}

std::string escape_key(const std::string& text) {
    return escape(text, ",= ");
}

std::string format_value(double value) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::setprecision(15) << value;
    return out.str();
}

std::string encode(const MetricPoint& point) {
    std::string line = escape_measurement(point.measurement);
    for (const auto& tag : point.tags) {
        line += ',';
        line += escape_key(tag.first);
        line += '=';
        line += escape_key(tag.second);
    }
    line += ' ';
    line += escape_key(point.field);
    line += '=';
    line += format_value(point.value);
    line += ' ';
    line += std::to_string(point.timestamp_ns);
    return line;
}

std::string encode(const std::vector<MetricPoint>& points) {
    std::string body;
    for (const auto& point : points) {
        if (!body.empty()) {
            body += '\n';
        }
        body += encode(point);
    }
    return body;
}

}  // namespace line_protocol
}  // namespace sinks
}  // namespace plugpoll
