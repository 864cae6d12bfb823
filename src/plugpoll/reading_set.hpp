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

/// @file reading_set.hpp
/// @brief Insertion-ordered device name -> Reading mapping for one cycle

#include "plugpoll/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace plugpoll {

/// Readings of one cycle, in the order devices were processed.
///
/// Putting a Reading for a name already present replaces the value but keeps
/// the original position. Not thread-safe; a cycle merges results from one
/// thread.
class ReadingSet {
public:
    using const_iterator = std::vector<Reading>::const_iterator;

    void put(Reading reading);

    /// @return nullptr if no Reading for `device_name`
    const Reading* find(const std::string& device_name) const;

    bool empty() const { return readings_.empty(); }
    std::size_t size() const { return readings_.size(); }

    const_iterator begin() const { return readings_.begin(); }
    const_iterator end() const { return readings_.end(); }

private:
    std::vector<Reading> readings_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace plugpoll
