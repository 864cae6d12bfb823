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

#include "plugpoll/vendors/tapo_client.hpp"

#include "common/time_utils.hpp"
#include "plugpoll/vendors/klap_transport.hpp"
#include "plugpoll/vendors/passthrough_transport.hpp"

#include <glog/logging.h>

namespace plugpoll {
namespace vendors {

using nlohmann::json;

namespace {

json energy_usage_request() {
    return json{{"method", "get_energy_usage"}, {"requestTimeMils", utils::now_ms()}};
}

class KlapSession : public DeviceSession {
public:
    explicit KlapSession(std::unique_ptr<KlapTransport> transport)
        : transport_(std::move(transport)) {}

    ~KlapSession() override { close(); }

    Result<json> read_usage() override {
        if (!transport_) {
            return Error{ErrorKind::DeviceUnreachable, "session closed"};
        }
        auto reply = transport_->request(energy_usage_request());
        if (!reply) {
            return reply;
        }
        const json& body = reply.value();
        auto code = body.find("error_code");
        if (code != body.end() && code->is_number_integer() && code->get<int>() != 0) {
            return Error{ErrorKind::ProtocolShapeError,
                         "get_energy_usage error_code " + std::to_string(code->get<int>())};
        }
        auto result = body.find("result");
        if (result == body.end()) {
            return Error{ErrorKind::ProtocolShapeError, "get_energy_usage reply has no result"};
        }
        return *result;
    }

    void close() noexcept override { transport_.reset(); }

private:
    std::unique_ptr<KlapTransport> transport_;
};

class PassthroughSession : public DeviceSession {
public:
    explicit PassthroughSession(std::unique_ptr<PassthroughTransport> transport)
        : transport_(std::move(transport)) {}

    ~PassthroughSession() override { close(); }

    Result<json> read_usage() override {
        if (!transport_) {
            return Error{ErrorKind::DeviceUnreachable, "session closed"};
        }
        return transport_->request(energy_usage_request());
    }

    void close() noexcept override { transport_.reset(); }

private:
    std::unique_ptr<PassthroughTransport> transport_;
};

}  // namespace

TapoKlapClient::TapoKlapClient(std::chrono::seconds timeout)
    : timeout_(timeout) {}

Result<std::unique_ptr<DeviceSession>> TapoKlapClient::connect(const std::string& address,
                                                               const Credentials& credentials) {
    auto transport = std::make_unique<KlapTransport>(address, KlapVersion::V2, timeout_);
    Status status = transport->handshake(credentials);
    if (!status) {
        return status.error();
    }
    return std::unique_ptr<DeviceSession>(std::make_unique<KlapSession>(std::move(transport)));
}

TapoPassthroughClient::TapoPassthroughClient(std::chrono::seconds timeout)
    : timeout_(timeout) {}

Result<std::unique_ptr<DeviceSession>> TapoPassthroughClient::connect(
    const std::string& address, const Credentials& credentials) {
    auto transport = std::make_unique<PassthroughTransport>(address, timeout_);
    Status status = transport->handshake(credentials);
    if (!status) {
        return status.error();
    }
    return std::unique_ptr<DeviceSession>(
        std::make_unique<PassthroughSession>(std::move(transport)));
}

}  // namespace vendors
}  // namespace plugpoll
