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

#include "plugpoll/logging.hpp"
#include "plugpoll/errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>

namespace plugpoll {

void apply_log_level(const std::string& level) {
    std::string name = level;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    int severity = google::INFO;
    int verbosity = 0;

    if (name == "debug") {
        verbosity = 1;
    } else if (name == "info" || name.empty()) {
        // defaults
    } else if (name == "warning" || name == "warn") {
        severity = google::WARNING;
    } else if (name == "error" || name == "critical" || name == "fatal") {
        severity = google::ERROR;
    } else {
        throw ConfigError("unknown log level '" + level + "'");
    }

    FLAGS_minloglevel = severity;
    FLAGS_v = verbosity;
    google::SetStderrLogging(severity);
}

}  // namespace plugpoll
