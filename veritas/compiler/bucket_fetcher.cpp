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

#include <veritas/compiler/bucket_fetcher.hpp>

#include <veritas/compiler/version_fmt.hpp>
#include <veritas/core/bytes.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/fmt.hpp>
#include <veritas/core/hex.hpp>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <quill/Quill.h>

#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace pt = boost::property_tree;

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

Url object_url(Url const &bucket_url, std::string_view const key)
{
    Url url = bucket_url;
    auto path = url.target.substr(0, url.target.find('?'));
    if (!path.ends_with('/')) {
        path += '/';
    }
    url.target = path + url_encode_path(key);
    return url;
}

Result<VersionManifest> load_bucket(
    HttpClient const &client, Url const &bucket_url,
    std::string_view const binary_name)
{
    std::vector<std::string> prefixes;
    std::optional<std::string> token;
    do {
        Url page = object_url(bucket_url, "");
        page.target += "?list-type=2&delimiter=%2F";
        if (token) {
            page.target += "&continuation-token=" + url_encode_path(*token);
        }
        auto body = client.get_ok(page);
        if (body.has_error()) {
            return std::move(body).assume_error();
        }
        auto listing = parse_bucket_listing(body.value());
        if (listing.has_error()) {
            return std::move(listing).assume_error();
        }
        for (auto &prefix : listing.value().prefixes) {
            prefixes.push_back(std::move(prefix));
        }
        token = std::move(listing.value().continuation_token);
    }
    while (token);
    return make_bucket_manifest(bucket_url, prefixes, binary_name);
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

Result<BucketListing> parse_bucket_listing(std::string_view const xml)
{
    pt::ptree tree;
    try {
        std::istringstream in{std::string{xml}};
        pt::read_xml(in, tree);
    }
    catch (pt::xml_parser_error const &e) {
        LOG_WARNING("cannot parse bucket listing: {}", e.what());
        return FetchError::Fetch;
    }

    auto const result = tree.get_child_optional("ListBucketResult");
    if (!result) {
        LOG_WARNING("bucket listing has no ListBucketResult");
        return FetchError::Fetch;
    }

    BucketListing listing;
    for (auto const &[name, child] : *result) {
        if (name == "CommonPrefixes") {
            if (auto const prefix = child.get_optional<std::string>("Prefix")) {
                listing.prefixes.push_back(*prefix);
            }
        }
    }
    if (result->get<std::string>("IsTruncated", "false") == "true") {
        listing.continuation_token =
            result->get_optional<std::string>("NextContinuationToken");
    }
    return listing;
}

VersionManifest make_bucket_manifest(
    Url const &bucket_url, std::vector<std::string> const &prefixes,
    std::string_view const binary_name)
{
    VersionManifest manifest;
    for (auto const &prefix : prefixes) {
        std::string_view dir = prefix;
        if (dir.ends_with('/')) {
            dir.remove_suffix(1);
        }
        auto version = parse_compiler_version(dir);
        if (version.has_error()) {
            LOG_WARNING("skipping bucket prefix '{}'", prefix);
            continue;
        }
        std::string const key{dir};
        manifest.emplace(
            std::move(version).value(),
            ManifestEntry{
                .url = object_url(
                           bucket_url, key + "/" + std::string{binary_name})
                           .to_string(),
                .sha256 = std::nullopt,
                .sha256_url =
                    object_url(bucket_url, key + "/sha256.hash").to_string()});
    }
    return manifest;
}

Result<bytes32_t> parse_sha256_hash(std::string_view const text)
{
    auto const digest = from_hex(trim(text));
    if (!digest || digest->size() != sizeof(bytes32_t)) {
        return FetchError::HashParse;
    }
    return to_bytes(*digest);
}

BucketFetcher::BucketFetcher(
    HttpClient client, Url bucket_url, std::string binary_name,
    VersionManifest initial, std::chrono::seconds const refresh_interval)
    : client_{std::move(client)}
    , bucket_url_{std::move(bucket_url)}
    , binary_name_{std::move(binary_name)}
    , refresher_{
          std::move(initial),
          [this] { return load_bucket(client_, bucket_url_, binary_name_); },
          refresh_interval}
{
}

Result<std::unique_ptr<BucketFetcher>> BucketFetcher::create(
    HttpClient client, Url bucket_url, std::string binary_name,
    std::chrono::seconds const refresh_interval)
{
    auto initial = load_bucket(client, bucket_url, binary_name);
    if (initial.has_error()) {
        return std::move(initial).assume_error();
    }
    LOG_INFO(
        "loaded {} compiler versions from bucket {}",
        initial.value().size(),
        bucket_url.to_string());
    return std::make_unique<BucketFetcher>(
        std::move(client),
        std::move(bucket_url),
        std::move(binary_name),
        std::move(initial).value(),
        refresh_interval);
}

Result<FetchedBinary> BucketFetcher::fetch(CompilerVersion const &version)
{
    auto const manifest = refresher_.snapshot();
    auto const it = manifest->find(version);
    if (it == manifest->end()) {
        return FetchError::NotFound;
    }

    auto hash_url = parse_url(it->second.sha256_url);
    if (hash_url.has_error()) {
        return std::move(hash_url).assume_error();
    }
    auto hash_text = client_.get_ok(hash_url.value());
    if (hash_text.has_error()) {
        return std::move(hash_text).assume_error();
    }
    auto expected = parse_sha256_hash(hash_text.value());
    if (expected.has_error()) {
        LOG_WARNING("{}: invalid sha256.hash", version);
        return std::move(expected).assume_error();
    }

    auto binary_url = parse_url(it->second.url);
    if (binary_url.has_error()) {
        return std::move(binary_url).assume_error();
    }
    auto body = client_.get_ok(binary_url.value());
    if (body.has_error()) {
        return std::move(body).assume_error();
    }
    return FetchedBinary{
        .data = byte_string{to_byte_string_view(body.value())},
        .expected_sha256 = expected.value()};
}

std::set<CompilerVersion> BucketFetcher::all_versions()
{
    return refresher_.versions();
}

VERITAS_NAMESPACE_END
