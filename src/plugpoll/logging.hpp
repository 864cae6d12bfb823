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

/// @file logging.hpp
/// @brief Map the configured log level name onto glog
///
/// Scheme-probe noise is logged with VLOG(1) everywhere, so it only shows up
/// at "debug".

#include <string>

namespace plugpoll {

/// Apply a level name (debug, info, warning/warn, error, critical/fatal).
/// @throws ConfigError for an unknown name
void apply_log_level(const std::string& level);

}  // namespace plugpoll
