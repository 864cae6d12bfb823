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

#include "plugpoll/reading_set.hpp"

namespace plugpoll {

void ReadingSet::put(Reading reading) {
    auto it = index_.find(reading.device_name);
    if (it != index_.end()) {
        readings_[it->second] = std::move(reading);
        return;
    }
    index_.emplace(reading.device_name, readings_.size());
    readings_.push_back(std::move(reading));
}

const Reading* ReadingSet::find(const std::string& device_name) const {
    auto it = index_.find(device_name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &readings_[it->second];
}

}  // namespace plugpoll
