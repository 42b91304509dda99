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
#include <set>
#include <string_view>

VERITAS_NAMESPACE_BEGIN

/// Parses a `list.json` compiler index: `{"builds": [{"path", "longVersion",
/// "sha256"}]}`. Relative paths resolve against `list_url`. Entries that do
/// not parse are skipped.
Result<VersionManifest>
parse_compiler_list(std::string_view json, Url const &list_url);

/// Fetches compilers listed in an http json index
class ListFetcher final : public Fetcher
{
    HttpClient client_;
    Url list_url_;
    VersionsRefresher refresher_;

public:
    ListFetcher(
        HttpClient client, Url list_url, VersionManifest initial,
        std::chrono::seconds refresh_interval);

    /// Loads the index once; fails if it cannot be fetched or parsed
    static Result<std::unique_ptr<ListFetcher>> create(
        HttpClient client, Url list_url, std::chrono::seconds refresh_interval);

    Result<FetchedBinary> fetch(CompilerVersion const &) override;

    std::set<CompilerVersion> all_versions() override;

    VersionsRefresher &refresher()
    {
        return refresher_;
    }
};

VERITAS_NAMESPACE_END
