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

#include "plugpoll/net/http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <glog/logging.h>
#include <openssl/err.h>

namespace plugpoll {
namespace net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

// Drive the pending async operation to completion on this thread.
void run(asio::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

void check(const beast::error_code& ec, const char* what) {
    if (ec) {
        throw beast::system_error(ec, what);
    }
}

std::string to_std(beast::string_view view) {
    return std::string(view.data(), view.size());
}

http::request<http::string_body> make_request(const Url& url, const std::string& body,
                                              const Headers& headers) {
    http::request<http::string_body> req{http::verb::post, url.target, 11};
    bool default_port = (url.tls() && url.port == "443") || (!url.tls() && url.port == "80");
    req.set(http::field::host, default_port ? url.host : url.host + ":" + url.port);
    req.set(http::field::user_agent, "plugpoll/" BOOST_BEAST_VERSION_STRING);
    for (const auto& header : headers) {
        req.set(header.first, header.second);
    }
    req.body() = body;
    req.prepare_payload();
    return req;
}

template <class Stream>
HttpResponse exchange(asio::io_context& ioc, Stream& stream, beast::tcp_stream& lowest,
                      http::request<http::string_body>& req,
                      std::chrono::seconds timeout) {
    beast::error_code ec;

    lowest.expires_after(timeout);
    http::async_write(stream, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
    run(ioc);
    check(ec, "http write");

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    lowest.expires_after(timeout);
    http::async_read(stream, buffer, res,
                     [&ec](beast::error_code e, std::size_t) { ec = e; });
    run(ioc);
    check(ec, "http read");

    HttpResponse response;
    response.status = res.result_int();
    response.body = std::move(res.body());
    auto cookies = res.equal_range(http::field::set_cookie);
    for (auto it = cookies.first; it != cookies.second; ++it) {
        response.set_cookies.push_back(to_std(it->value()));
    }
    return response;
}

void connect(asio::io_context& ioc, beast::tcp_stream& stream, const Url& url,
             std::chrono::seconds timeout) {
    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(url.host, url.port);

    beast::error_code ec;
    stream.expires_after(timeout);
    stream.async_connect(endpoints,
                         [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run(ioc);
    check(ec, "connect");
}

}  // namespace

Url Url::parse(const std::string& text) {
    Url url;
    std::string rest;

    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        throw std::invalid_argument("URL has no scheme: " + text);
    }
    url.scheme = text.substr(0, scheme_end);
    if (url.scheme != "http" && url.scheme != "https") {
        throw std::invalid_argument("unsupported URL scheme: " + url.scheme);
    }
    url.port = url.tls() ? "443" : "80";
    rest = text.substr(scheme_end + 3);

    auto path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        url.target = rest.substr(path_start);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
    } else {
        url.host = authority;
    }
    if (url.host.empty() || url.port.empty()) {
        throw std::invalid_argument("malformed URL: " + text);
    }
    return url;
}

Url Url::with_target(const std::string& new_target) const {
    Url copy = *this;
    copy.target = new_target;
    return copy;
}

std::optional<std::string> HttpResponse::cookie(const std::string& name) const {
    const std::string prefix = name + "=";
    for (const auto& header : set_cookies) {
        std::size_t start = 0;
        while (start < header.size()) {
            std::size_t end = header.find(';', start);
            if (end == std::string::npos) {
                end = header.size();
            }
            std::string part = header.substr(start, end - start);
            auto first = part.find_first_not_of(' ');
            if (first != std::string::npos && part.compare(first, prefix.size(), prefix) == 0) {
                return part.substr(first + prefix.size());
            }
            start = end + 1;
        }
    }
    return std::nullopt;
}

HttpClient::HttpClient(std::chrono::seconds timeout)
    : timeout_(timeout) {}

HttpResponse HttpClient::post(const Url& url, const std::string& body,
                              const Headers& headers) const {
    asio::io_context ioc;
    auto req = make_request(url, body, headers);
    VLOG(2) << "POST " << url.scheme << "://" << url.host << ":" << url.port << url.target
            << " (" << body.size() << " bytes)";

    if (!url.tls()) {
        beast::tcp_stream stream(ioc);
        connect(ioc, stream, url, timeout_);
        HttpResponse response = exchange(ioc, stream, stream, req, timeout_);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    asio::ssl::context ctx(asio::ssl::context::tls_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(asio::ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
            "set SNI host name");
    }
    stream.set_verify_callback(asio::ssl::host_name_verification(url.host));

    connect(ioc, beast::get_lowest_layer(stream), url, timeout_);

    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(timeout_);
    stream.async_handshake(asio::ssl::stream_base::client,
                           [&ec](beast::error_code e) { ec = e; });
    run(ioc);
    check(ec, "tls handshake");

    HttpResponse response = exchange(ioc, stream, beast::get_lowest_layer(stream), req, timeout_);

    // Peers often drop the connection without close_notify; nothing to report.
    beast::get_lowest_layer(stream).expires_after(timeout_);
    stream.async_shutdown([&ec](beast::error_code e) { ec = e; });
    run(ioc);
    return response;
}

}  // namespace net
}  // namespace plugpoll
