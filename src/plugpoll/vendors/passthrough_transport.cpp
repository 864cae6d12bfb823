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

#include "plugpoll/vendors/passthrough_transport.hpp"

#include "common/time_utils.hpp"

#include <boost/system/system_error.hpp>

#include <glog/logging.h>

namespace plugpoll {
namespace vendors {

using crypto::Bytes;
using nlohmann::json;

namespace {

constexpr char kSessionCookie[] = "TP_SESSIONID";
constexpr std::size_t kKeyBytes = 16;

int error_code_of(const json& reply) {
    auto it = reply.find("error_code");
    if (it == reply.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<int>();
}

}  // namespace

namespace passthrough {

json login_request(const Credentials& credentials, int64_t request_time_ms) {
    std::string user_digest = crypto::hex(crypto::sha1(crypto::to_bytes(credentials.username)));
    return json{
        {"method", "login_device"},
        {"params",
         {{"username", crypto::base64_encode(crypto::to_bytes(user_digest))},
          {"password", crypto::base64_encode(crypto::to_bytes(credentials.password))}}},
        {"requestTimeMils", request_time_ms},
    };
}

json wrap(const Bytes& key, const Bytes& iv, const json& request) {
    Bytes ciphertext = crypto::aes128_cbc_encrypt(key, iv, crypto::to_bytes(request.dump()));
    return json{
        {"method", "securePassthrough"},
        {"params", {{"request", crypto::base64_encode(ciphertext)}}},
    };
}

json unwrap(const Bytes& key, const Bytes& iv, const json& reply) {
    const std::string& encoded = reply.at("result").at("response").get_ref<const std::string&>();
    Bytes plaintext = crypto::aes128_cbc_decrypt(key, iv, crypto::base64_decode(encoded));
    return json::parse(crypto::to_string(plaintext));
}

}  // namespace passthrough

PassthroughTransport::PassthroughTransport(const std::string& address,
                                           std::chrono::seconds timeout)
    : http_(timeout)
    , base_(net::Url::parse("http://" + address + "/app")) {}

Result<json> PassthroughTransport::post_json(const net::Url& url, const json& body) {
    net::Headers headers{{"Content-Type", "application/json"}};
    if (!session_cookie_.empty()) {
        headers["Cookie"] = std::string(kSessionCookie) + "=" + session_cookie_;
    }

    auto response = http_.post(url, body.dump(), headers);
    if (response.status != 200) {
        return Error{ErrorKind::ProtocolShapeError,
                     "HTTP " + std::to_string(response.status) + " from " + url.target};
    }
    auto cookie = response.cookie(kSessionCookie);
    if (cookie) {
        session_cookie_ = *cookie;
    }
    return json::parse(response.body);
}

Result<json> PassthroughTransport::secure_request(const net::Url& url, const json& payload) {
    auto reply = post_json(url, passthrough::wrap(key_, iv_, payload));
    if (!reply) {
        return reply.error();
    }
    int outer = error_code_of(reply.value());
    if (outer != 0) {
        return Error{ErrorKind::ProtocolShapeError,
                     "securePassthrough error_code " + std::to_string(outer)};
    }
    return passthrough::unwrap(key_, iv_, reply.value());
}

Status PassthroughTransport::handshake(const Credentials& credentials) {
    session_cookie_.clear();
    token_.clear();

    try {
        crypto::RsaKeyPair rsa;
        json exchange{
            {"method", "handshake"},
            {"params", {{"key", rsa.public_pem()}, {"requestTimeMils", utils::now_ms()}}},
        };
        auto reply = post_json(base_, exchange);
        if (!reply) {
            return Error{ErrorKind::AuthFailure, "key exchange rejected: " + reply.error().message};
        }
        int code = error_code_of(reply.value());
        if (code != 0) {
            return Error{ErrorKind::AuthFailure,
                         "key exchange refused with error_code " + std::to_string(code)};
        }

        Bytes material = rsa.decrypt(crypto::base64_decode(
            reply.value().at("result").at("key").get<std::string>()));
        if (material.size() < 2 * kKeyBytes) {
            return Error{ErrorKind::ProtocolShapeError, "short session key from device"};
        }
        key_.assign(material.begin(), material.begin() + kKeyBytes);
        iv_.assign(material.begin() + kKeyBytes, material.begin() + 2 * kKeyBytes);

        auto login = secure_request(base_, passthrough::login_request(credentials, utils::now_ms()));
        if (!login) {
            return login.error();
        }
        code = error_code_of(login.value());
        if (code != 0) {
            return Error{ErrorKind::AuthFailure,
                         "login refused with error_code " + std::to_string(code)};
        }
        token_ = login.value().at("result").at("token").get<std::string>();
        VLOG(1) << "securePassthrough session established with " << base_.host;
        return Status::Ok();

    } catch (const boost::system::system_error& e) {
        return Error{ErrorKind::DeviceUnreachable, e.what()};
    } catch (const crypto::CryptoError& e) {
        return Error{ErrorKind::ProtocolShapeError, e.what()};
    } catch (const json::exception& e) {
        return Error{ErrorKind::ProtocolShapeError, e.what()};
    }
}

Result<json> PassthroughTransport::request(const json& payload) {
    if (token_.empty()) {
        return Error{ErrorKind::AuthFailure, "not logged in"};
    }

    try {
        auto reply = secure_request(base_.with_target("/app?token=" + token_), payload);
        if (!reply) {
            return reply;
        }
        int code = error_code_of(reply.value());
        if (code != 0) {
            return Error{ErrorKind::ProtocolShapeError,
                         "device answered error_code " + std::to_string(code)};
        }
        return reply;

    } catch (const boost::system::system_error& e) {
        return Error{ErrorKind::DeviceUnreachable, e.what()};
    } catch (const crypto::CryptoError& e) {
        return Error{ErrorKind::ProtocolShapeError, e.what()};
    } catch (const json::exception& e) {
        return Error{ErrorKind::ProtocolShapeError, e.what()};
    }
}

}  // namespace vendors
}  // namespace plugpoll
