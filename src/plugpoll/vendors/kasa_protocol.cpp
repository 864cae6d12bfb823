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

#include "plugpoll/vendors/kasa_protocol.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>

#include <glog/logging.h>

namespace plugpoll {
namespace vendors {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

// Replies larger than this are not energy-meter responses.
constexpr uint32_t kMaxReplyBytes = 1 << 20;

}  // namespace

namespace kasa {

std::vector<uint8_t> encrypt(const std::string& plaintext) {
    std::vector<uint8_t> out;
    out.reserve(plaintext.size());
    uint8_t key = kInitialKey;
    for (char c : plaintext) {
        key = static_cast<uint8_t>(key ^ static_cast<uint8_t>(c));
        out.push_back(key);
    }
    return out;
}

std::string decrypt(const std::vector<uint8_t>& ciphertext) {
    std::string out;
    out.reserve(ciphertext.size());
    uint8_t key = kInitialKey;
    for (uint8_t byte : ciphertext) {
        out.push_back(static_cast<char>(key ^ byte));
        key = byte;
    }
    return out;
}

std::vector<uint8_t> frame(const std::string& plaintext) {
    std::vector<uint8_t> payload = encrypt(plaintext);
    uint32_t length = static_cast<uint32_t>(payload.size());

    std::vector<uint8_t> out;
    out.reserve(payload.size() + 4);
    out.push_back(static_cast<uint8_t>(length >> 24));
    out.push_back(static_cast<uint8_t>(length >> 16));
    out.push_back(static_cast<uint8_t>(length >> 8));
    out.push_back(static_cast<uint8_t>(length));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

}  // namespace kasa

KasaConnection::KasaConnection(std::chrono::seconds timeout)
    : timeout_(timeout) {}

KasaConnection::~KasaConnection() {
    close();
}

void KasaConnection::run() {
    ioc_.restart();
    ioc_.run();
}

void KasaConnection::open(const std::string& address, uint16_t port) {
    close();

    tcp::resolver resolver(ioc_);
    auto endpoints = resolver.resolve(address, std::to_string(port));

    stream_ = std::make_unique<beast::tcp_stream>(ioc_);
    beast::error_code ec;
    stream_->expires_after(timeout_);
    stream_->async_connect(endpoints,
                           [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run();
    if (ec) {
        stream_.reset();
        throw beast::system_error(ec, "connect " + address);
    }
}

std::string KasaConnection::query(const std::string& request) {
    if (!stream_) {
        throw beast::system_error(asio::error::not_connected, "kasa query");
    }

    beast::error_code ec;
    std::vector<uint8_t> out = kasa::frame(request);
    stream_->expires_after(timeout_);
    asio::async_write(*stream_, asio::buffer(out),
                      [&ec](beast::error_code e, std::size_t) { ec = e; });
    run();
    if (ec) {
        throw beast::system_error(ec, "kasa write");
    }

    uint8_t header[4];
    stream_->expires_after(timeout_);
    asio::async_read(*stream_, asio::buffer(header),
                     [&ec](beast::error_code e, std::size_t) { ec = e; });
    run();
    if (ec) {
        throw beast::system_error(ec, "kasa read header");
    }

    uint32_t length = (static_cast<uint32_t>(header[0]) << 24) |
                      (static_cast<uint32_t>(header[1]) << 16) |
                      (static_cast<uint32_t>(header[2]) << 8) |
                      static_cast<uint32_t>(header[3]);
    if (length > kMaxReplyBytes) {
        throw beast::system_error(asio::error::message_size, "kasa reply too large");
    }

    std::vector<uint8_t> payload(length);
    stream_->expires_after(timeout_);
    asio::async_read(*stream_, asio::buffer(payload),
                     [&ec](beast::error_code e, std::size_t) { ec = e; });
    run();
    if (ec) {
        throw beast::system_error(ec, "kasa read payload");
    }

    std::string reply = kasa::decrypt(payload);
    VLOG(2) << "kasa <- " << reply;
    return reply;
}

void KasaConnection::close() noexcept {
    if (!stream_) {
        return;
    }
    beast::error_code ec;
    stream_->socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_->socket().close(ec);
    stream_.reset();
}

bool KasaConnection::is_open() const {
    return stream_ != nullptr;
}

}  // namespace vendors
}  // namespace plugpoll
