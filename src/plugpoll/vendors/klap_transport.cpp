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

#include "plugpoll/vendors/klap_transport.hpp"

#include <boost/system/system_error.hpp>

#include <glog/logging.h>

namespace plugpoll {
namespace vendors {

using crypto::Bytes;

namespace {

constexpr std::size_t kSeedBytes = 16;
constexpr std::size_t kSignatureBytes = 32;
constexpr char kSessionCookie[] = "TP_SESSIONID";

Bytes seq_bytes(int32_t seq) {
    uint32_t value = static_cast<uint32_t>(seq);
    return {static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
            static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value)};
}

Bytes slice(const Bytes& bytes, std::size_t begin, std::size_t end) {
    return Bytes(bytes.begin() + static_cast<std::ptrdiff_t>(begin),
                 bytes.begin() + static_cast<std::ptrdiff_t>(end));
}

Bytes derive(const char* label, const Bytes& local_seed, const Bytes& remote_seed,
             const Bytes& auth_hash) {
    Bytes prefix = crypto::to_bytes(label);
    return crypto::sha256(crypto::concat({&prefix, &local_seed, &remote_seed, &auth_hash}));
}

}  // namespace

namespace klap {

Bytes auth_hash(KlapVersion version, const Credentials& credentials) {
    Bytes user = crypto::to_bytes(credentials.username);
    Bytes pass = crypto::to_bytes(credentials.password);
    if (version == KlapVersion::V1) {
        Bytes user_hash = crypto::md5(user);
        Bytes pass_hash = crypto::md5(pass);
        return crypto::md5(crypto::concat({&user_hash, &pass_hash}));
    }
    Bytes user_hash = crypto::sha1(user);
    Bytes pass_hash = crypto::sha1(pass);
    return crypto::sha256(crypto::concat({&user_hash, &pass_hash}));
}

Bytes server_hash(KlapVersion version, const Bytes& local_seed, const Bytes& remote_seed,
                  const Bytes& auth_hash) {
    if (version == KlapVersion::V1) {
        return crypto::sha256(crypto::concat({&local_seed, &auth_hash}));
    }
    return crypto::sha256(crypto::concat({&local_seed, &remote_seed, &auth_hash}));
}

Bytes client_hash(KlapVersion version, const Bytes& local_seed, const Bytes& remote_seed,
                  const Bytes& auth_hash) {
    if (version == KlapVersion::V1) {
        return crypto::sha256(crypto::concat({&remote_seed, &auth_hash}));
    }
    return crypto::sha256(crypto::concat({&remote_seed, &local_seed, &auth_hash}));
}

}  // namespace klap

KlapCipher::KlapCipher(const Bytes& local_seed, const Bytes& remote_seed,
                       const Bytes& auth_hash) {
    key_ = slice(derive("lsk", local_seed, remote_seed, auth_hash), 0, 16);

    Bytes iv = derive("iv", local_seed, remote_seed, auth_hash);
    iv_prefix_ = slice(iv, 0, 12);
    seq_ = static_cast<int32_t>((static_cast<uint32_t>(iv[28]) << 24) |
                                (static_cast<uint32_t>(iv[29]) << 16) |
                                (static_cast<uint32_t>(iv[30]) << 8) |
                                static_cast<uint32_t>(iv[31]));

    sig_ = slice(derive("ldk", local_seed, remote_seed, auth_hash), 0, 28);
}

Bytes KlapCipher::iv_for(int32_t seq) const {
    Bytes counter = seq_bytes(seq);
    return crypto::concat({&iv_prefix_, &counter});
}

Bytes KlapCipher::encrypt(const std::string& plaintext) {
    seq_ = static_cast<int32_t>(static_cast<uint32_t>(seq_) + 1u);

    Bytes ciphertext = crypto::aes128_cbc_encrypt(key_, iv_for(seq_), crypto::to_bytes(plaintext));
    Bytes counter = seq_bytes(seq_);
    Bytes signature = crypto::sha256(crypto::concat({&sig_, &counter, &ciphertext}));
    return crypto::concat({&signature, &ciphertext});
}

std::string KlapCipher::decrypt(const Bytes& body) const {
    if (body.size() <= kSignatureBytes) {
        throw crypto::CryptoError("KLAP response too short");
    }
    Bytes ciphertext = slice(body, kSignatureBytes, body.size());
    return crypto::to_string(crypto::aes128_cbc_decrypt(key_, iv_for(seq_), ciphertext));
}

KlapTransport::KlapTransport(const std::string& address, KlapVersion version,
                             std::chrono::seconds timeout)
    : http_(timeout)
    , base_(net::Url::parse("http://" + address + "/app"))
    , version_(version) {}

Status KlapTransport::handshake(const Credentials& credentials) {
    cipher_.reset();
    session_cookie_.clear();

    try {
        Bytes local_seed = crypto::random_bytes(kSeedBytes);
        Bytes auth = klap::auth_hash(version_, credentials);

        auto first = http_.post(base_.with_target("/app/handshake1"),
                                crypto::to_string(local_seed));
        if (first.status != 200) {
            return Error{ErrorKind::AuthFailure,
                         "handshake1 rejected with HTTP " + std::to_string(first.status)};
        }
        if (first.body.size() < kSeedBytes + kSignatureBytes) {
            return Error{ErrorKind::ProtocolShapeError, "handshake1 response too short"};
        }

        Bytes reply = crypto::to_bytes(first.body);
        Bytes remote_seed = slice(reply, 0, kSeedBytes);
        Bytes device_hash = slice(reply, kSeedBytes, kSeedBytes + kSignatureBytes);
        if (device_hash != klap::server_hash(version_, local_seed, remote_seed, auth)) {
            return Error{ErrorKind::AuthFailure, "device does not accept these credentials"};
        }

        auto cookie = first.cookie(kSessionCookie);
        if (cookie) {
            session_cookie_ = *cookie;
        }

        net::Headers headers;
        if (!session_cookie_.empty()) {
            headers["Cookie"] = std::string(kSessionCookie) + "=" + session_cookie_;
        }
        auto second = http_.post(base_.with_target("/app/handshake2"),
                                 crypto::to_string(klap::client_hash(version_, local_seed,
                                                                     remote_seed, auth)),
                                 headers);
        if (second.status != 200) {
            return Error{ErrorKind::AuthFailure,
                         "handshake2 rejected with HTTP " + std::to_string(second.status)};
        }

        cipher_.emplace(local_seed, remote_seed, auth);
        VLOG(1) << "KLAP session established with " << base_.host;
        return Status::Ok();

    } catch (const boost::system::system_error& e) {
        return Error{ErrorKind::DeviceUnreachable, e.what()};
    } catch (const crypto::CryptoError& e) {
        return Error{ErrorKind::ProtocolShapeError, e.what()};
    }
}

Result<nlohmann::json> KlapTransport::request(const nlohmann::json& payload) {
    if (!cipher_) {
        return Error{ErrorKind::AuthFailure, "no KLAP session"};
    }

    try {
        Bytes body = cipher_->encrypt(payload.dump());

        net::Headers headers;
        if (!session_cookie_.empty()) {
            headers["Cookie"] = std::string(kSessionCookie) + "=" + session_cookie_;
        }
        auto response = http_.post(
            base_.with_target("/app/request?seq=" + std::to_string(cipher_->seq())),
            crypto::to_string(body), headers);

        if (response.status == 401 || response.status == 403) {
            return Error{ErrorKind::AuthFailure,
                         "request rejected with HTTP " + std::to_string(response.status)};
        }
        if (response.status != 200) {
            return Error{ErrorKind::ProtocolShapeError,
                         "request failed with HTTP " + std::to_string(response.status)};
        }

        std::string text = cipher_->decrypt(crypto::to_bytes(response.body));
        VLOG(2) << "KLAP <- " << text;
        return nlohmann::json::parse(text);

    } catch (const boost::system::system_error& e) {
        return Error{ErrorKind::DeviceUnreachable, e.what()};
    } catch (const crypto::CryptoError& e) {
        return Error{ErrorKind::ProtocolShapeError, e.what()};
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorKind::ProtocolShapeError, e.what()};
    }
}

}  // namespace vendors
}  // namespace plugpoll
