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

#include <compare>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <string_view>

VERITAS_NAMESPACE_BEGIN

enum class VersionError
{
    Success = 0,
    Malformed,
    InvalidCommit,
    InvalidDate
};

struct NightlyDate
{
    uint16_t year;
    uint8_t month;
    uint8_t day;

    friend auto operator<=>(NightlyDate const &, NightlyDate const &) = default;
    friend bool operator==(NightlyDate const &, NightlyDate const &) = default;
};

/// A compiler release (`v0.8.19+commit.7dd6d404`) or nightly build
/// (`v0.8.20-nightly.2023.2.22+commit.1f8f1a3d`). Versions are ordered by
/// semver, then releases after nightlies of the same semver, then by date
/// and commit.
class CompilerVersion
{
    uint64_t major_{0};
    uint64_t minor_{0};
    uint64_t patch_{0};
    std::string pre_{};
    std::optional<NightlyDate> nightly_{};
    std::string commit_{};

public:
    CompilerVersion() = default;
    CompilerVersion(
        uint64_t major, uint64_t minor, uint64_t patch,
        std::string commit = {}, std::string pre = {},
        std::optional<NightlyDate> nightly = std::nullopt);

    uint64_t major() const noexcept
    {
        return major_;
    }

    uint64_t minor() const noexcept
    {
        return minor_;
    }

    uint64_t patch() const noexcept
    {
        return patch_;
    }

    std::string const &pre() const noexcept
    {
        return pre_;
    }

    std::optional<NightlyDate> const &nightly() const noexcept
    {
        return nightly_;
    }

    std::string const &commit() const noexcept
    {
        return commit_;
    }

    bool is_release() const noexcept
    {
        return !nightly_.has_value();
    }

    /// True if both name the same build; commits match when one is a prefix
    /// of the other so short commit hashes resolve
    bool same_build(CompilerVersion const &) const noexcept;

    std::string to_string() const;

    friend std::strong_ordering
    operator<=>(CompilerVersion const &, CompilerVersion const &) noexcept;

    friend bool
    operator==(CompilerVersion const &a, CompilerVersion const &b) noexcept
    {
        return (a <=> b) == std::strong_ordering::equal;
    }
};

Result<CompilerVersion> parse_compiler_version(std::string_view);

/// Finds the known version that `requested` names, resolving short commits
std::optional<CompilerVersion> normalize_version(
    CompilerVersion const &requested, std::set<CompilerVersion> const &known);

VERITAS_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<veritas::VersionError>
    : quick_status_code_from_enum_defaults<veritas::VersionError>
{
    static constexpr auto const domain_name = "Version Error";
    static constexpr auto const domain_uuid =
        "cdbc2af6e54e8b2affde8e3eb87074506eaa";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
