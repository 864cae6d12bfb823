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

/// @file net/http_client.hpp
/// @brief Blocking HTTP/HTTPS POST with a per-operation deadline
///
/// Built on Boost.Beast. Every step (connect, TLS handshake, write, read) is
/// bounded by the client's timeout so an unreachable peer fails in bounded
/// time. One connection per request.

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace plugpoll {
namespace net {

/// Split form of an http:// or https:// URL.
struct Url {
    std::string scheme = "http";
    std::string host;
    std::string port = "80";
    std::string target = "/";

    bool tls() const { return scheme == "https"; }

    /// @throws std::invalid_argument for an unsupported or malformed URL
    static Url parse(const std::string& text);

    /// Same host and port, different target.
    Url with_target(const std::string& new_target) const;
};

struct HttpResponse {
    unsigned status = 0;
    std::string body;
    std::vector<std::string> set_cookies;

    bool ok() const { return status >= 200 && status < 300; }

    /// Value of cookie `name` from the Set-Cookie headers, if sent.
    std::optional<std::string> cookie(const std::string& name) const;
};

using Headers = std::map<std::string, std::string>;

class HttpClient {
public:
    explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(10));

    /// POST `body` to `url`.
    /// @throws boost::system::system_error on resolve/connect/IO failure or timeout
    HttpResponse post(const Url& url, const std::string& body,
                      const Headers& headers = {}) const;

    std::chrono::seconds timeout() const { return timeout_; }

private:
    std::chrono::seconds timeout_;
};

}  // namespace net
}  // namespace plugpoll
