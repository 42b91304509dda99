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

#include <veritas/compiler/fetcher.hpp>
#include <veritas/compiler/http_client.hpp>
#include <veritas/compiler/versions_refresher.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

VERITAS_NAMESPACE_BEGIN

struct BucketListing
{
    std::vector<std::string> prefixes;
    std::optional<std::string> continuation_token;
};

/// Parses one page of an S3 `ListObjectsV2` response
Result<BucketListing> parse_bucket_listing(std::string_view xml);

/// Builds the manifest for a bucket laid out as `<version>/<binary>` with
/// the hex digest in `<version>/sha256.hash`
VersionManifest make_bucket_manifest(
    Url const &bucket_url, std::vector<std::string> const &prefixes,
    std::string_view binary_name);

Result<bytes32_t> parse_sha256_hash(std::string_view);

/// Fetches compilers from a public object storage bucket
class BucketFetcher final : public Fetcher
{
    HttpClient client_;
    Url bucket_url_;
    std::string binary_name_;
    VersionsRefresher refresher_;

public:
    BucketFetcher(
        HttpClient client, Url bucket_url, std::string binary_name,
        VersionManifest initial, std::chrono::seconds refresh_interval);

    static Result<std::unique_ptr<BucketFetcher>> create(
        HttpClient client, Url bucket_url, std::string binary_name,
        std::chrono::seconds refresh_interval);

    Result<FetchedBinary> fetch(CompilerVersion const &) override;

    std::set<CompilerVersion> all_versions() override;
};

VERITAS_NAMESPACE_END
