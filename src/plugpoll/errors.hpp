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

/// @file errors.hpp
/// @brief Error taxonomy for the collector
///
/// Configuration problems are fatal and travel as exceptions. Everything a
/// single device or a single destination can do wrong is recoverable and is
/// returned as a value (Result / Status) so it can be contained at that unit.

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace plugpoll {

/// Fatal: unreadable, unparseable or invalid configuration.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Fatal: persistent mode requested without a usable interval.
class IntervalMisconfiguration : public ConfigError {
public:
    explicit IntervalMisconfiguration(const std::string& what)
        : ConfigError(what) {}
};

/// Recoverable failure kinds, scoped to one device or one destination.
enum class ErrorKind {
    DeviceUnreachable,
    AuthFailure,
    ProtocolShapeError,
    SinkWriteError,
};

const char* to_string(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;
};

/// Either a value or an Error. Never throws on construction.
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    const Error& error() const { return error_; }

private:
    std::optional<T> value_;
    Error error_{ErrorKind::ProtocolShapeError, ""};
};

/// Success or an Error, for calls with nothing to return.
class Status {
public:
    static Status Ok() { return Status(); }

    Status(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *error_; }

private:
    Status() = default;

    std::optional<Error> error_;
};

}  // namespace plugpoll
