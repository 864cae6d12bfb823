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

#include "plugpoll/vendors/kasa_client.hpp"

#include "common/time_utils.hpp"
#include "plugpoll/vendors/klap_transport.hpp"

#include <boost/system/system_error.hpp>

#include <glog/logging.h>

#include <functional>

namespace plugpoll {
namespace vendors {

using nlohmann::json;

namespace {

const char kSysinfoRequest[] = R"({"system":{"get_sysinfo":{}}})";

bool is_number(const json& value) {
    return value.is_number() && !value.is_boolean();
}

int err_code_of(const json& section) {
    auto it = section.find("err_code");
    if (it == section.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<int>();
}

Result<json> read_emeter(const std::function<Result<json>(const json&)>& send) {
    int year = 0;
    int month = 0;
    int day = 0;
    utils::local_date(year, month, day);

    auto reply = send(kasa::usage_request(year, month));
    if (!reply) {
        return reply;
    }
    return kasa::usage_from_emeter(reply.value(), day);
}

/// Legacy XOR session on TCP 9999.
class XorSession : public DeviceSession {
public:
    explicit XorSession(std::unique_ptr<KasaConnection> connection)
        : connection_(std::move(connection)) {}

    ~XorSession() override { close(); }

    Result<json> read_usage() override {
        if (!connection_) {
            return Error{ErrorKind::DeviceUnreachable, "session closed"};
        }
        return read_emeter([this](const json& request) -> Result<json> {
            try {
                return json::parse(connection_->query(request.dump()));
            } catch (const boost::system::system_error& e) {
                return Error{ErrorKind::DeviceUnreachable, e.what()};
            } catch (const json::exception& e) {
                return Error{ErrorKind::ProtocolShapeError, e.what()};
            }
        });
    }

    void close() noexcept override {
        if (connection_) {
            connection_->close();
            connection_.reset();
        }
    }

private:
    std::unique_ptr<KasaConnection> connection_;
};

/// KLAP v1 session for firmware without the XOR port.
class KlapV1Session : public DeviceSession {
public:
    explicit KlapV1Session(std::unique_ptr<KlapTransport> transport)
        : transport_(std::move(transport)) {}

    ~KlapV1Session() override { close(); }

    Result<json> read_usage() override {
        if (!transport_) {
            return Error{ErrorKind::DeviceUnreachable, "session closed"};
        }
        return read_emeter(
            [this](const json& request) { return transport_->request(request); });
    }

    void close() noexcept override { transport_.reset(); }

private:
    std::unique_ptr<KlapTransport> transport_;
};

}  // namespace

namespace kasa {

json usage_request(int year, int month) {
    return json{{"emeter",
                 {{"get_realtime", json::object()},
                  {"get_daystat", {{"year", year}, {"month", month}}}}}};
}

Result<json> usage_from_emeter(const json& reply, int day) {
    auto emeter = reply.find("emeter");
    if (emeter == reply.end() || !emeter->is_object()) {
        return Error{ErrorKind::ProtocolShapeError, "reply has no emeter section"};
    }

    auto realtime = emeter->find("get_realtime");
    if (realtime == emeter->end() || !realtime->is_object()) {
        return Error{ErrorKind::ProtocolShapeError, "reply has no realtime reading"};
    }
    int code = err_code_of(*realtime);
    if (code != 0) {
        return Error{ErrorKind::ProtocolShapeError,
                     "get_realtime err_code " + std::to_string(code)};
    }

    json usage = json::object();
    // Older hardware revisions report watts instead of milliwatts.
    auto power_mw = realtime->find("power_mw");
    auto power = realtime->find("power");
    if (power_mw != realtime->end()) {
        usage["power_mw"] = *power_mw;
    } else if (power != realtime->end() && is_number(*power)) {
        usage["power_mw"] = power->get<double>() * 1000.0;
    }

    usage["today"] = false;
    auto daystat = emeter->find("get_daystat");
    if (daystat == emeter->end() || !daystat->is_object() || err_code_of(*daystat) != 0) {
        return usage;
    }
    auto days = daystat->find("day_list");
    if (days == daystat->end() || !days->is_array()) {
        return usage;
    }
    for (const auto& entry : *days) {
        auto entry_day = entry.find("day");
        if (entry_day == entry.end() || !entry_day->is_number_integer() ||
            entry_day->get<int>() != day) {
            continue;
        }
        auto wh = entry.find("energy_wh");
        auto kwh = entry.find("energy");
        if (wh != entry.end() && is_number(*wh)) {
            usage["today"] = wh->get<double>() / 1000.0;
            usage["today_wh"] = *wh;
        } else if (kwh != entry.end() && is_number(*kwh)) {
            usage["today"] = kwh->get<double>();
        }
        break;
    }
    return usage;
}

}  // namespace kasa

KasaClient::KasaClient(std::chrono::seconds timeout, uint16_t xor_port)
    : timeout_(timeout)
    , xor_port_(xor_port) {}

Result<std::unique_ptr<DeviceSession>> KasaClient::connect(const std::string& address,
                                                           const Credentials& credentials) {
    Error xor_failure{ErrorKind::DeviceUnreachable, ""};
    try {
        auto connection = std::make_unique<KasaConnection>(timeout_);
        connection->open(address, xor_port_);
        json sysinfo = json::parse(connection->query(kSysinfoRequest));
        if (sysinfo.is_object() && sysinfo.contains("system")) {
            VLOG(1) << address << " answers on the XOR port";
            return std::unique_ptr<DeviceSession>(
                std::make_unique<XorSession>(std::move(connection)));
        }
        xor_failure = Error{ErrorKind::ProtocolShapeError, "sysinfo reply has no system section"};
    } catch (const boost::system::system_error& e) {
        xor_failure.message = e.what();
    } catch (const json::exception& e) {
        xor_failure = Error{ErrorKind::ProtocolShapeError, e.what()};
    }

    if (credentials.empty()) {
        return xor_failure;
    }

    VLOG(1) << address << ": XOR probe failed (" << xor_failure.message << "), trying KLAP";
    auto transport = std::make_unique<KlapTransport>(address, KlapVersion::V1, timeout_);
    Status status = transport->handshake(credentials);
    if (!status) {
        return status.error();
    }
    return std::unique_ptr<DeviceSession>(std::make_unique<KlapV1Session>(std::move(transport)));
}

}  // namespace vendors
}  // namespace plugpoll
