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

#include "plugpoll/errors.hpp"

namespace plugpoll {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeviceUnreachable:
            return "device unreachable";
        case ErrorKind::AuthFailure:
            return "authentication failed";
        case ErrorKind::ProtocolShapeError:
            return "unexpected response";
        case ErrorKind::SinkWriteError:
            return "write failed";
    }
    return "unknown error";
}

}  // namespace plugpoll
