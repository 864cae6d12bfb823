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

/// @file crypto/crypto.hpp
/// @brief OpenSSL primitives used by the device protocols
///
/// All functions throw CryptoError when OpenSSL reports a failure.

#include <openssl/evp.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace plugpoll {
namespace crypto {

using Bytes = std::vector<uint8_t>;

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& what)
        : std::runtime_error(what) {}
};

Bytes to_bytes(const std::string& text);
std::string to_string(const Bytes& bytes);

/// Concatenate byte strings.
Bytes concat(std::initializer_list<const Bytes*> parts);

Bytes md5(const Bytes& data);
Bytes sha1(const Bytes& data);
Bytes sha256(const Bytes& data);

/// Lower-case hex encoding.
std::string hex(const Bytes& data);

std::string base64_encode(const Bytes& data);
/// @throws CryptoError on malformed input
Bytes base64_decode(const std::string& text);

Bytes random_bytes(std::size_t count);

/// AES-128-CBC with PKCS#7 padding.
Bytes aes128_cbc_encrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext);
Bytes aes128_cbc_decrypt(const Bytes& key, const Bytes& iv, const Bytes& ciphertext);

/// RSA key pair for the securePassthrough handshake.
class RsaKeyPair {
public:
    /// Generate a fresh key of `bits` bits.
    explicit RsaKeyPair(int bits = 1024);

    /// Public key as a PEM "PUBLIC KEY" block.
    std::string public_pem() const;

    /// PKCS#1 v1.5 decryption.
    Bytes decrypt(const Bytes& ciphertext) const;

private:
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
};

}  // namespace crypto
}  // namespace plugpoll
