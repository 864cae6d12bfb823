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

/// @file test_crypto.cpp
/// @brief Known-answer tests for the OpenSSL wrappers

#include "plugpoll/crypto/crypto.hpp"

#include <gtest/gtest.h>

namespace crypto = plugpoll::crypto;

namespace {

crypto::Bytes from_hex(const std::string& hex) {
    crypto::Bytes out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

}  // namespace

TEST(CryptoTest, Digests) {
    auto abc = crypto::to_bytes("abc");

    EXPECT_EQ(crypto::hex(crypto::md5(abc)), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(crypto::hex(crypto::sha1(abc)), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(crypto::hex(crypto::sha256(abc)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTest, Base64) {
    EXPECT_EQ(crypto::base64_encode(crypto::to_bytes("hunter2")), "aHVudGVyMg==");
    EXPECT_EQ(crypto::base64_encode(crypto::to_bytes("abc")), "YWJj");
    EXPECT_EQ(crypto::base64_encode({}), "");

    EXPECT_EQ(crypto::to_string(crypto::base64_decode("aHVudGVyMg==")), "hunter2");
    EXPECT_EQ(crypto::to_string(crypto::base64_decode("YWI=")), "ab");
    EXPECT_THROW(crypto::base64_decode("not base64!"), crypto::CryptoError);
}

TEST(CryptoTest, Concat) {
    crypto::Bytes a{1, 2};
    crypto::Bytes b{};
    crypto::Bytes c{3};

    EXPECT_EQ(crypto::concat({&a, &b, &c}), (crypto::Bytes{1, 2, 3}));
}

TEST(CryptoTest, AesCbcKnownAnswer) {
    // SP 800-38A F.2.1, first block, followed by the PKCS#7 padding block.
    auto key = from_hex("2b7e151628aed2a6abf7158809cf4f3c");
    auto iv = from_hex("000102030405060708090a0b0c0d0e0f");
    auto plaintext = from_hex("6bc1bee22e409f96e93d7e117393172a");

    auto ciphertext = crypto::aes128_cbc_encrypt(key, iv, plaintext);

    EXPECT_EQ(crypto::hex(ciphertext),
              "7649abac8119b246cee98e9b12e9197d8964e0b149c10b7b682e6e39aaeb731c");
    EXPECT_EQ(crypto::aes128_cbc_decrypt(key, iv, ciphertext), plaintext);
}

TEST(CryptoTest, AesDecryptRejectsBadPadding) {
    auto key = from_hex("2b7e151628aed2a6abf7158809cf4f3c");
    auto iv = from_hex("000102030405060708090a0b0c0d0e0f");

    EXPECT_THROW(crypto::aes128_cbc_decrypt(key, iv, from_hex("00112233")), crypto::CryptoError);
}

TEST(CryptoTest, RandomBytes) {
    auto a = crypto::random_bytes(16);
    auto b = crypto::random_bytes(16);

    EXPECT_EQ(a.size(), 16u);
    EXPECT_NE(a, b);
}

TEST(CryptoTest, RsaKeyPairExportsPem) {
    crypto::RsaKeyPair rsa;
    std::string pem = rsa.public_pem();

    EXPECT_EQ(pem.rfind("-----BEGIN PUBLIC KEY-----", 0), 0u);
    EXPECT_NE(pem.find("-----END PUBLIC KEY-----"), std::string::npos);
    EXPECT_NE(pem, crypto::RsaKeyPair().public_pem());
}
