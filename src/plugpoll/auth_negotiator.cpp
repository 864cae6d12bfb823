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

#include "plugpoll/auth_negotiator.hpp"

#include <glog/logging.h>

#include <vector>

namespace plugpoll {

AuthNegotiator::AuthNegotiator(DeviceClient& default_scheme,
                               DeviceClient& legacy_scheme)
    : default_scheme_(default_scheme)
    , legacy_scheme_(legacy_scheme) {}

Result<nlohmann::json> AuthNegotiator::attempt(DeviceClient& client,
                                               const std::string& address,
                                               const Credentials& credentials) {
    try {
        auto session = client.connect(address, credentials);
        if (!session) {
            VLOG(1) << client.name() << " " << address << ": "
                    << to_string(session.error().kind) << ": " << session.error().message;
            return session.error();
        }

        auto usage = session.value()->read_usage();
        session.value()->close();
        if (!usage) {
            VLOG(1) << client.name() << " " << address << ": "
                    << to_string(usage.error().kind) << ": " << usage.error().message;
        }
        return usage;

    } catch (const std::exception& e) {
        VLOG(1) << client.name() << " " << address << ": " << e.what();
        return Error{ErrorKind::ProtocolShapeError, e.what()};
    } catch (...) {
        VLOG(1) << client.name() << " " << address << ": unknown exception";
        return Error{ErrorKind::ProtocolShapeError, "unknown exception from " + client.name()};
    }
}

Result<nlohmann::json> AuthNegotiator::negotiate(const std::string& address,
                                                 const Credentials& credentials,
                                                 AuthMode mode) const {
    std::vector<DeviceClient*> schemes;
    switch (mode) {
        case AuthMode::All:
            schemes = {&default_scheme_, &legacy_scheme_};
            break;
        case AuthMode::DefaultOnly:
            schemes = {&default_scheme_};
            break;
        case AuthMode::LegacyOnly:
            schemes = {&legacy_scheme_};
            break;
    }

    Error last{ErrorKind::DeviceUnreachable, "no authentication scheme attempted"};
    for (DeviceClient* scheme : schemes) {
        auto usage = attempt(*scheme, address, credentials);
        if (usage) {
            VLOG(1) << address << ": " << scheme->name() << " succeeded";
            return usage;
        }
        last = usage.error();
    }
    return last;
}

}  // namespace plugpoll
