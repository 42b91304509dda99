// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

VERITAS_NAMESPACE_BEGIN

struct Url
{
    std::string scheme{};
    std::string host{};
    std::string port{};
    std::string target{"/"};

    bool is_https() const noexcept
    {
        return scheme == "https";
    }

    std::string to_string() const;

    /// Resolves `reference` against this url: absolute urls are returned
    /// as is, anything else replaces the last path segment
    Url join(std::string_view reference) const;
};

/// Fails with `FetchError::Fetch` on an unsupported scheme or missing host
Result<Url> parse_url(std::string_view);

/// Percent-encodes everything except unreserved characters and `/`
std::string url_encode_path(std::string_view);

struct HttpResponse
{
    unsigned status;
    std::string body;
};

class HttpClient
{
    std::chrono::seconds timeout_;
    size_t body_limit_;

public:
    explicit HttpClient(
        std::chrono::seconds timeout = std::chrono::seconds{300},
        size_t body_limit = size_t{1} << 30);

    Result<HttpResponse> get(Url const &) const;

    /// As `get`, but any status other than 200 is `FetchError::Fetch`
    Result<std::string> get_ok(Url const &) const;
};

VERITAS_NAMESPACE_END
