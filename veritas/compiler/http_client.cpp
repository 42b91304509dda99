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

#include <veritas/compiler/fetcher.hpp>
#include <veritas/compiler/http_client.hpp>

#include <veritas/core/config.hpp>
#include <veritas/core/fmt.hpp>
#include <veritas/core/result.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/system/system_error.hpp>

#include <quill/Quill.h>

#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <string_view>
#include <utility>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

template <typename Future>
auto run(net::io_context &ioc, Future &&f)
{
    ioc.restart();
    ioc.run();
    return f.get();
}

// The body is read in full before the connection is dropped, so a TLS
// close_notify is not waited for
template <typename Stream>
HttpResponse exchange(
    net::io_context &ioc, Stream &stream, Url const &url,
    std::chrono::seconds const timeout, size_t const body_limit)
{
    http::request<http::empty_body> req{http::verb::get, url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::user_agent, "veritas/" BOOST_BEAST_VERSION_STRING);

    beast::get_lowest_layer(stream).expires_after(timeout);
    run(ioc, http::async_write(stream, req, net::use_future));

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(body_limit);
    beast::get_lowest_layer(stream).expires_after(timeout);
    run(ioc, http::async_read(stream, buffer, parser, net::use_future));

    auto res = parser.release();
    beast::error_code ec;
    beast::get_lowest_layer(stream).socket().shutdown(
        tcp::socket::shutdown_both, ec);
    return HttpResponse{
        .status = res.result_int(), .body = std::move(res.body())};
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

std::string Url::to_string() const
{
    bool const default_port = (scheme == "http" && port == "80") ||
                              (scheme == "https" && port == "443");
    return scheme + "://" + host + (default_port ? "" : ":" + port) + target;
}

Url Url::join(std::string_view const reference) const
{
    if (reference.find("://") != std::string_view::npos) {
        auto url = parse_url(reference);
        if (url.has_value()) {
            return std::move(url).value();
        }
    }
    Url joined = *this;
    std::string_view path = target;
    path = path.substr(0, path.find('?'));
    auto const slash = path.rfind('/');
    std::string base{
        slash == std::string_view::npos ? "/" : path.substr(0, slash + 1)};
    if (reference.starts_with("/")) {
        joined.target = std::string{reference};
    }
    else {
        joined.target = base + std::string{reference};
    }
    return joined;
}

Result<Url> parse_url(std::string_view s)
{
    Url url;
    auto const scheme_end = s.find("://");
    if (scheme_end == std::string_view::npos) {
        return FetchError::Fetch;
    }
    url.scheme = std::string{s.substr(0, scheme_end)};
    if (url.scheme != "http" && url.scheme != "https") {
        return FetchError::Fetch;
    }
    s.remove_prefix(scheme_end + 3);

    auto const authority_end = std::min(s.find_first_of("/?"), s.size());
    auto const authority = s.substr(0, authority_end);
    auto const colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        url.host = std::string{authority.substr(0, colon)};
        url.port = std::string{authority.substr(colon + 1)};
    }
    else {
        url.host = std::string{authority};
        url.port = url.is_https() ? "443" : "80";
    }
    if (url.host.empty() || url.port.empty()) {
        return FetchError::Fetch;
    }
    s.remove_prefix(authority_end);
    if (s.empty()) {
        url.target = "/";
    }
    else if (s.front() == '?') {
        url.target = "/" + std::string{s};
    }
    else {
        url.target = std::string{s};
    }
    return url;
}

std::string url_encode_path(std::string_view const s)
{
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (char const c : s) {
        auto const u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~' ||
            c == '/') {
            out.push_back(c);
        }
        else {
            out.push_back('%');
            out.push_back(hex[u >> 4]);
            out.push_back(hex[u & 0xf]);
        }
    }
    return out;
}

HttpClient::HttpClient(std::chrono::seconds const timeout, size_t const body_limit)
    : timeout_{timeout}
    , body_limit_{body_limit}
{
}

Result<HttpResponse> HttpClient::get(Url const &url) const
{
    try {
        net::io_context ioc;
        tcp::resolver resolver{ioc};
        auto const endpoints = resolver.resolve(url.host, url.port);

        if (!url.is_https()) {
            beast::tcp_stream stream{ioc};
            stream.expires_after(timeout_);
            run(ioc, stream.async_connect(endpoints, net::use_future));
            return exchange(ioc, stream, url, timeout_, body_limit_);
        }

        ssl::context ctx{ssl::context::tls_client};
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);
        beast::ssl_stream<beast::tcp_stream> stream{ioc, ctx};
        if (!SSL_set_tlsext_host_name(
                stream.native_handle(), url.host.c_str())) {
            LOG_WARNING("GET {}: cannot set SNI host name", url.to_string());
            return FetchError::Fetch;
        }
        stream.set_verify_callback(ssl::host_name_verification(url.host));
        beast::get_lowest_layer(stream).expires_after(timeout_);
        run(ioc,
            beast::get_lowest_layer(stream).async_connect(
                endpoints, net::use_future));
        beast::get_lowest_layer(stream).expires_after(timeout_);
        run(ioc,
            stream.async_handshake(
                ssl::stream_base::client, net::use_future));
        return exchange(ioc, stream, url, timeout_, body_limit_);
    }
    catch (boost::system::system_error const &e) {
        LOG_WARNING("GET {} failed: {}", url.to_string(), e.what());
        return FetchError::Fetch;
    }
}

Result<std::string> HttpClient::get_ok(Url const &url) const
{
    auto res = get(url);
    if (res.has_error()) {
        return std::move(res).assume_error();
    }
    if (res.value().status != 200) {
        LOG_WARNING(
            "GET {} returned status {}", url.to_string(), res.value().status);
        return FetchError::Fetch;
    }
    return std::move(res.value().body);
}

VERITAS_NAMESPACE_END
