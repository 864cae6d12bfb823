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

/// @file vendors/kasa_protocol.hpp
/// @brief Kasa legacy transport: XOR autokey cipher over TCP 9999
///
/// Frames are a 4 byte big-endian length followed by the ciphertext. The
/// cipher XORs each byte with the previous ciphertext byte, starting at 171.

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace plugpoll {
namespace vendors {

namespace kasa {

constexpr uint16_t kPort = 9999;
constexpr uint8_t kInitialKey = 171;

std::vector<uint8_t> encrypt(const std::string& plaintext);
std::string decrypt(const std::vector<uint8_t>& ciphertext);

/// Length-prefixed encrypted frame.
std::vector<uint8_t> frame(const std::string& plaintext);

}  // namespace kasa

/// One TCP connection to a Kasa plug. Each call is bounded by the timeout.
class KasaConnection {
public:
    explicit KasaConnection(std::chrono::seconds timeout);
    ~KasaConnection();

    KasaConnection(const KasaConnection&) = delete;
    KasaConnection& operator=(const KasaConnection&) = delete;

    /// @throws boost::system::system_error on failure or timeout
    void open(const std::string& address, uint16_t port = kasa::kPort);

    /// Send one JSON command and return the decrypted JSON reply text.
    /// @throws boost::system::system_error on failure or timeout
    std::string query(const std::string& request);

    void close() noexcept;

    bool is_open() const;

private:
    void run();

    std::chrono::seconds timeout_;
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::beast::tcp_stream> stream_;
};

}  // namespace vendors
}  // namespace plugpoll
