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

/// @file vendors/passthrough_transport.hpp
/// @brief Tapo securePassthrough: RSA key exchange, token login, AES requests
///
/// The client posts an RSA public key; the device answers with an AES key and
/// IV encrypted to it. Every later request is the AES-encrypted JSON, base64
/// encoded inside {"method":"securePassthrough","params":{"request":...}}.

#include "plugpoll/crypto/crypto.hpp"
#include "plugpoll/errors.hpp"
#include "plugpoll/net/http_client.hpp"
#include "plugpoll/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace plugpoll {
namespace vendors {

namespace passthrough {

/// Login request body for the given credentials.
nlohmann::json login_request(const Credentials& credentials, int64_t request_time_ms);

/// Wrap an encrypted request.
nlohmann::json wrap(const crypto::Bytes& key, const crypto::Bytes& iv,
                    const nlohmann::json& request);

/// Decrypt the inner response of a securePassthrough reply.
/// @throws CryptoError, nlohmann::json::exception
nlohmann::json unwrap(const crypto::Bytes& key, const crypto::Bytes& iv,
                      const nlohmann::json& reply);

}  // namespace passthrough

class PassthroughTransport {
public:
    PassthroughTransport(const std::string& address, std::chrono::seconds timeout);

    /// Key exchange followed by login_device.
    /// @return DeviceUnreachable if the device cannot be reached,
    ///         AuthFailure if it rejects the exchange or the credentials
    Status handshake(const Credentials& credentials);

    /// Send one request; returns the full decrypted response
    /// ({"error_code":0,"result":{...}}).
    Result<nlohmann::json> request(const nlohmann::json& payload);

    bool established() const { return !token_.empty(); }

private:
    Result<nlohmann::json> post_json(const net::Url& url, const nlohmann::json& body);
    Result<nlohmann::json> secure_request(const net::Url& url, const nlohmann::json& payload);

    net::HttpClient http_;
    net::Url base_;
    std::string session_cookie_;
    std::string token_;
    crypto::Bytes key_;
    crypto::Bytes iv_;
};

}  // namespace vendors
}  // namespace plugpoll
