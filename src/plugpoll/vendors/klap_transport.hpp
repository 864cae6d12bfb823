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

/// @file vendors/klap_transport.hpp
/// @brief KLAP: seed-exchange authentication with AES-128-CBC requests
///
/// Two handshakes over HTTP prove both sides hold the same credential hash:
///
///   handshake1: client sends local_seed, device answers
///               remote_seed || server_hash and a TP_SESSIONID cookie
///   handshake2: client sends its own hash over the seeds
///
/// Requests are then POSTed to /app/request?seq=N as
/// sha256(sig || seq || ciphertext) || ciphertext.
///
/// Version 1 (Kasa) hashes credentials with MD5, version 2 (Tapo) with
/// SHA-1/SHA-256; the two also differ in which seeds the handshake hashes
/// cover.

#include "plugpoll/crypto/crypto.hpp"
#include "plugpoll/errors.hpp"
#include "plugpoll/net/http_client.hpp"
#include "plugpoll/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace plugpoll {
namespace vendors {

enum class KlapVersion {
    V1,  // Kasa
    V2,  // Tapo
};

namespace klap {

crypto::Bytes auth_hash(KlapVersion version, const Credentials& credentials);

/// What handshake1 expects the device to answer with.
crypto::Bytes server_hash(KlapVersion version, const crypto::Bytes& local_seed,
                          const crypto::Bytes& remote_seed, const crypto::Bytes& auth_hash);

/// What handshake2 sends back.
crypto::Bytes client_hash(KlapVersion version, const crypto::Bytes& local_seed,
                          const crypto::Bytes& remote_seed, const crypto::Bytes& auth_hash);

}  // namespace klap

/// Per-session key material derived from both seeds and the auth hash.
class KlapCipher {
public:
    KlapCipher(const crypto::Bytes& local_seed, const crypto::Bytes& remote_seed,
               const crypto::Bytes& auth_hash);

    /// Advance the sequence number and encrypt `plaintext` for it.
    /// @return signature || ciphertext
    crypto::Bytes encrypt(const std::string& plaintext);

    /// Decrypt a response body (signature || ciphertext) for the current seq.
    std::string decrypt(const crypto::Bytes& body) const;

    int32_t seq() const { return seq_; }
    const crypto::Bytes& key() const { return key_; }
    const crypto::Bytes& signature_key() const { return sig_; }

    /// IV for a given sequence number.
    crypto::Bytes iv_for(int32_t seq) const;

private:
    crypto::Bytes key_;
    crypto::Bytes iv_prefix_;
    crypto::Bytes sig_;
    int32_t seq_;
};

/// One authenticated KLAP session with one device.
class KlapTransport {
public:
    KlapTransport(const std::string& address, KlapVersion version,
                  std::chrono::seconds timeout);

    /// Run both handshakes.
    /// @return DeviceUnreachable if the device cannot be reached,
    ///         AuthFailure if it does not accept the credentials
    Status handshake(const Credentials& credentials);

    /// Send one JSON request over the established session.
    Result<nlohmann::json> request(const nlohmann::json& payload);

    bool established() const { return cipher_.has_value(); }

private:
    net::HttpClient http_;
    net::Url base_;
    KlapVersion version_;
    std::string session_cookie_;
    std::optional<KlapCipher> cipher_;
};

}  // namespace vendors
}  // namespace plugpoll
