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

#include <veritas/compiler/version.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/bytes.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>

VERITAS_NAMESPACE_BEGIN

enum class FetchError
{
    Success = 0,
    NotFound,
    HashMismatch,
    HashParse,
    Fetch,
    File
};

/// Where to download one compiler build and how to check it. Bucket
/// listings carry no digest; it is downloaded from `sha256_url` instead.
struct ManifestEntry
{
    std::string url{};
    std::optional<bytes32_t> sha256{};
    std::string sha256_url{};

    friend bool operator==(ManifestEntry const &, ManifestEntry const &) =
        default;
};

using VersionManifest = std::map<CompilerVersion, ManifestEntry>;

struct FetchedBinary
{
    byte_string data;
    bytes32_t expected_sha256;
};

/// Remote source of compiler binaries
class Fetcher
{
public:
    virtual ~Fetcher() = default;

    virtual Result<FetchedBinary> fetch(CompilerVersion const &) = 0;

    virtual std::set<CompilerVersion> all_versions() = 0;
};

std::set<CompilerVersion> versions_of(VersionManifest const &);

VERITAS_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<veritas::FetchError>
    : quick_status_code_from_enum_defaults<veritas::FetchError>
{
    static constexpr auto const domain_name = "Fetch Error";
    static constexpr auto const domain_uuid =
        "62eb275cb8d5cb2211a85acbbe8bb882f76e";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
