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

#include <veritas/compiler/list_fetcher.hpp>

#include <veritas/compiler/version_fmt.hpp>
#include <veritas/core/bytes.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/fmt.hpp>
#include <veritas/core/hex.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <memory>
#include <string>
#include <utility>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

bool has_string(nlohmann::json const &j, char const *const key)
{
    return j.is_object() && j.contains(key) && j[key].is_string();
}

Result<VersionManifest> load_list(HttpClient const &client, Url const &url)
{
    auto body = client.get_ok(url);
    if (body.has_error()) {
        return std::move(body).assume_error();
    }
    return parse_compiler_list(body.value(), url);
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

Result<VersionManifest>
parse_compiler_list(std::string_view const json, Url const &list_url)
{
    auto const doc = nlohmann::json::parse(json, nullptr, false);
    if (doc.is_discarded() || !doc.contains("builds") ||
        !doc["builds"].is_array()) {
        LOG_WARNING("compiler list {} is not valid json", list_url.to_string());
        return FetchError::Fetch;
    }

    VersionManifest manifest;
    for (auto const &build : doc["builds"]) {
        if (!has_string(build, "path") || !has_string(build, "longVersion") ||
            !has_string(build, "sha256")) {
            continue;
        }
        auto const long_version = build["longVersion"].get<std::string>();
        auto version = parse_compiler_version(long_version);
        if (version.has_error()) {
            LOG_WARNING("skipping unparsable version '{}'", long_version);
            continue;
        }
        auto const digest = from_hex(build["sha256"].get<std::string>());
        if (!digest || digest->size() != sizeof(bytes32_t)) {
            LOG_WARNING("skipping {}: invalid sha256", version.value());
            continue;
        }
        manifest.emplace(
            std::move(version).value(),
            ManifestEntry{
                .url = list_url.join(build["path"].get<std::string>())
                           .to_string(),
                .sha256 = to_bytes(*digest)});
    }
    return manifest;
}

ListFetcher::ListFetcher(
    HttpClient client, Url list_url, VersionManifest initial,
    std::chrono::seconds const refresh_interval)
    : client_{std::move(client)}
    , list_url_{std::move(list_url)}
    , refresher_{
          std::move(initial),
          [this] { return load_list(client_, list_url_); },
          refresh_interval}
{
}

Result<std::unique_ptr<ListFetcher>> ListFetcher::create(
    HttpClient client, Url list_url, std::chrono::seconds const refresh_interval)
{
    auto initial = load_list(client, list_url);
    if (initial.has_error()) {
        return std::move(initial).assume_error();
    }
    LOG_INFO(
        "loaded {} compiler versions from {}",
        initial.value().size(),
        list_url.to_string());
    return std::make_unique<ListFetcher>(
        std::move(client),
        std::move(list_url),
        std::move(initial).value(),
        refresh_interval);
}

Result<FetchedBinary> ListFetcher::fetch(CompilerVersion const &version)
{
    auto const manifest = refresher_.snapshot();
    auto const it = manifest->find(version);
    if (it == manifest->end()) {
        return FetchError::NotFound;
    }
    auto url = parse_url(it->second.url);
    if (url.has_error()) {
        return std::move(url).assume_error();
    }
    auto body = client_.get_ok(url.value());
    if (body.has_error()) {
        return std::move(body).assume_error();
    }
    auto const &data = body.value();
    return FetchedBinary{
        .data = byte_string{to_byte_string_view(data)},
        .expected_sha256 = *it->second.sha256};
}

std::set<CompilerVersion> ListFetcher::all_versions()
{
    return refresher_.versions();
}

VERITAS_NAMESPACE_END
