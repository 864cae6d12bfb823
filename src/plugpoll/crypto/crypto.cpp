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

#include "plugpoll/crypto/crypto.hpp"

#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

namespace plugpoll {
namespace crypto {

namespace {

Bytes digest(const EVP_MD* md, const Bytes& data) {
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &length, md, nullptr) != 1) {
        throw CryptoError("digest failed");
    }
    out.resize(length);
    return out;
}

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

Bytes aes128_cbc(bool encrypt, const Bytes& key, const Bytes& iv, const Bytes& input) {
    if (key.size() != 16 || iv.size() != 16) {
        throw CryptoError("AES-128-CBC needs a 16 byte key and iv");
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw CryptoError("Failed to create cipher context");
    }
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), iv.data(),
                          encrypt ? 1 : 0) != 1) {
        throw CryptoError("Failed to initialize AES-128-CBC");
    }

    Bytes output(input.size() + EVP_MAX_BLOCK_LENGTH);
    int length = 0;
    int total = 0;
    if (EVP_CipherUpdate(ctx.get(), output.data(), &length, input.data(),
                         static_cast<int>(input.size())) != 1) {
        throw CryptoError(encrypt ? "Failed to encrypt" : "Failed to decrypt");
    }
    total = length;
    if (EVP_CipherFinal_ex(ctx.get(), output.data() + total, &length) != 1) {
        throw CryptoError(encrypt ? "Failed to finalize encryption"
                                  : "Failed to finalize decryption (bad padding)");
    }
    total += length;
    output.resize(static_cast<std::size_t>(total));
    return output;
}

}  // namespace

Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

std::string to_string(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

Bytes concat(std::initializer_list<const Bytes*> parts) {
    Bytes out;
    for (const Bytes* part : parts) {
        out.insert(out.end(), part->begin(), part->end());
    }
    return out;
}

Bytes md5(const Bytes& data) { return digest(EVP_md5(), data); }
Bytes sha1(const Bytes& data) { return digest(EVP_sha1(), data); }
Bytes sha256(const Bytes& data) { return digest(EVP_sha256(), data); }

std::string hex(const Bytes& data) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0f]);
    }
    return out;
}

std::string base64_encode(const Bytes& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                 data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(length));
    return out;
}

Bytes base64_decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (c != '\n' && c != '\r') {
            clean.push_back(c);
        }
    }
    if (clean.size() % 4 != 0) {
        throw CryptoError("base64 input length is not a multiple of 4");
    }
    if (clean.empty()) {
        return {};
    }

    Bytes out(clean.size() / 4 * 3);
    int length = EVP_DecodeBlock(out.data(),
                                 reinterpret_cast<const unsigned char*>(clean.data()),
                                 static_cast<int>(clean.size()));
    if (length < 0) {
        throw CryptoError("malformed base64 input");
    }

    // EVP_DecodeBlock counts padding as zero bytes.
    std::size_t padding = 0;
    if (clean[clean.size() - 1] == '=') ++padding;
    if (clean[clean.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(length) - padding);
    return out;
}

Bytes random_bytes(std::size_t count) {
    Bytes out(count);
    if (RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw CryptoError("RAND_bytes failed");
    }
    return out;
}

Bytes aes128_cbc_encrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext) {
    return aes128_cbc(true, key, iv, plaintext);
}

Bytes aes128_cbc_decrypt(const Bytes& key, const Bytes& iv, const Bytes& ciphertext) {
    return aes128_cbc(false, key, iv, ciphertext);
}

RsaKeyPair::RsaKeyPair(int bits)
    : key_(nullptr, EVP_PKEY_free) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free);
    if (!ctx) {
        throw CryptoError("Failed to create RSA key context");
    }
    if (EVP_PKEY_keygen_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) != 1) {
        throw CryptoError("Failed to initialize RSA key generation");
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        throw CryptoError("RSA key generation failed");
    }
    key_.reset(raw);
}

std::string RsaKeyPair::public_pem() const {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
        throw CryptoError("Failed to export RSA public key");
    }
    char* data = nullptr;
    long length = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<std::size_t>(length));
}

Bytes RsaKeyPair::decrypt(const Bytes& ciphertext) const {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new(key_.get(), nullptr), EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) != 1) {
        throw CryptoError("Failed to initialize RSA decryption");
    }

    std::size_t length = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &length, ciphertext.data(),
                         ciphertext.size()) != 1) {
        throw CryptoError("RSA decryption failed");
    }
    Bytes out(length);
    if (EVP_PKEY_decrypt(ctx.get(), out.data(), &length, ciphertext.data(),
                         ciphertext.size()) != 1) {
        throw CryptoError("RSA decryption failed");
    }
    out.resize(length);
    return out;
}

}  // namespace crypto
}  // namespace plugpoll
