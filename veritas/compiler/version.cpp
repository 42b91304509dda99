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

#include <veritas/compiler/version.hpp>

#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

std::optional<uint64_t> consume_number(std::string_view &s)
{
    uint64_t value = 0;
    auto const *const end = s.data() + s.size();
    auto const [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc{} || ptr == s.data()) {
        return std::nullopt;
    }
    s.remove_prefix(static_cast<size_t>(ptr - s.data()));
    return value;
}

bool consume(std::string_view &s, std::string_view const prefix)
{
    if (!s.starts_with(prefix)) {
        return false;
    }
    s.remove_prefix(prefix.size());
    return true;
}

bool is_hex(std::string_view const s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char const c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

bool is_numeric(std::string_view const s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char const c) {
        return c >= '0' && c <= '9';
    });
}

std::string to_lower(std::string_view const s)
{
    std::string r{s};
    std::transform(r.begin(), r.end(), r.begin(), [](unsigned char const c) {
        return static_cast<char>(std::tolower(c));
    });
    return r;
}

// semver pre-release precedence: absent sorts after any pre-release,
// otherwise dot separated identifiers compare numerically when both are
// numeric and lexically otherwise
std::strong_ordering compare_pre(std::string_view a, std::string_view b)
{
    if (a.empty() || b.empty()) {
        return a.empty() <=> b.empty();
    }
    while (!a.empty() && !b.empty()) {
        auto const a_end = std::min(a.find('.'), a.size());
        auto const b_end = std::min(b.find('.'), b.size());
        auto const a_id = a.substr(0, a_end);
        auto const b_id = b.substr(0, b_end);
        bool const a_num = is_numeric(a_id);
        bool const b_num = is_numeric(b_id);
        std::strong_ordering order = std::strong_ordering::equal;
        if (a_num && b_num) {
            order = a_id.size() != b_id.size() ? a_id.size() <=> b_id.size()
                                               : a_id.compare(b_id) <=> 0;
        }
        else if (a_num != b_num) {
            order = a_num ? std::strong_ordering::less
                          : std::strong_ordering::greater;
        }
        else {
            order = a_id.compare(b_id) <=> 0;
        }
        if (order != 0) {
            return order;
        }
        a.remove_prefix(std::min(a_end + 1, a.size()));
        b.remove_prefix(std::min(b_end + 1, b.size()));
    }
    return a.size() <=> b.size();
}

bool commits_match(std::string_view const a, std::string_view const b)
{
    return a.starts_with(b) || b.starts_with(a);
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

CompilerVersion::CompilerVersion(
    uint64_t const major, uint64_t const minor, uint64_t const patch,
    std::string commit, std::string pre, std::optional<NightlyDate> nightly)
    : major_{major}
    , minor_{minor}
    , patch_{patch}
    , pre_{std::move(pre)}
    , nightly_{nightly}
    , commit_{to_lower(commit)}
{
}

bool CompilerVersion::same_build(CompilerVersion const &other) const noexcept
{
    return major_ == other.major_ && minor_ == other.minor_ &&
           patch_ == other.patch_ && pre_ == other.pre_ &&
           nightly_ == other.nightly_ &&
           commits_match(commit_, other.commit_);
}

std::string CompilerVersion::to_string() const
{
    std::string s = "v" + std::to_string(major_) + "." +
                    std::to_string(minor_) + "." + std::to_string(patch_);
    if (nightly_) {
        s += "-nightly." + std::to_string(nightly_->year) + "." +
             std::to_string(nightly_->month) + "." +
             std::to_string(nightly_->day);
    }
    else if (!pre_.empty()) {
        s += "-" + pre_;
    }
    if (!commit_.empty()) {
        s += "+commit." + commit_;
    }
    return s;
}

std::strong_ordering
operator<=>(CompilerVersion const &a, CompilerVersion const &b) noexcept
{
    if (auto const c = std::tie(a.major_, a.minor_, a.patch_) <=>
                       std::tie(b.major_, b.minor_, b.patch_);
        c != 0) {
        return c;
    }
    if (auto const c = compare_pre(a.pre_, b.pre_); c != 0) {
        return c;
    }
    if (auto const c = a.is_release() <=> b.is_release(); c != 0) {
        return c;
    }
    if (auto const c = a.nightly_ <=> b.nightly_; c != 0) {
        return c;
    }
    return a.commit_ <=> b.commit_;
}

Result<CompilerVersion> parse_compiler_version(std::string_view s)
{
    consume(s, "v");
    auto const major = consume_number(s);
    if (!major || !consume(s, ".")) {
        return VersionError::Malformed;
    }
    auto const minor = consume_number(s);
    if (!minor || !consume(s, ".")) {
        return VersionError::Malformed;
    }
    auto const patch = consume_number(s);
    if (!patch) {
        return VersionError::Malformed;
    }

    std::string pre;
    std::optional<NightlyDate> nightly;
    if (consume(s, "-nightly.")) {
        auto const year = consume_number(s);
        if (!year || !consume(s, ".")) {
            return VersionError::InvalidDate;
        }
        auto const month = consume_number(s);
        if (!month || !consume(s, ".")) {
            return VersionError::InvalidDate;
        }
        auto const day = consume_number(s);
        if (!day || *year > UINT16_MAX || *month < 1 || *month > 12 ||
            *day < 1 || *day > 31) {
            return VersionError::InvalidDate;
        }
        nightly = NightlyDate{
            .year = static_cast<uint16_t>(*year),
            .month = static_cast<uint8_t>(*month),
            .day = static_cast<uint8_t>(*day)};
    }
    else if (consume(s, "-")) {
        auto const end = std::min(s.find('+'), s.size());
        pre = std::string{s.substr(0, end)};
        s.remove_prefix(end);
        if (pre.empty()) {
            return VersionError::Malformed;
        }
    }

    std::string commit;
    if (consume(s, "+")) {
        if (!consume(s, "commit.") || !is_hex(s)) {
            return VersionError::InvalidCommit;
        }
        commit = std::string{s};
        s = {};
    }
    else if (nightly) {
        return VersionError::InvalidCommit;
    }

    if (!s.empty()) {
        return VersionError::Malformed;
    }
    return CompilerVersion{
        *major, *minor, *patch, std::move(commit), std::move(pre), nightly};
}

std::optional<CompilerVersion> normalize_version(
    CompilerVersion const &requested, std::set<CompilerVersion> const &known)
{
    if (known.contains(requested)) {
        return requested;
    }
    // iterate newest first so an empty commit resolves to the latest build
    for (auto it = known.rbegin(); it != known.rend(); ++it) {
        if (it->same_build(requested)) {
            return *it;
        }
    }
    return std::nullopt;
}

VERITAS_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<veritas::VersionError>::mapping> const &
quick_status_code_from_enum<veritas::VersionError>::value_mappings()
{
    using veritas::VersionError;

    static std::initializer_list<mapping> const v = {
        {VersionError::Success, "success", {errc::success}},
        {VersionError::Malformed, "malformed compiler version", {}},
        {VersionError::InvalidCommit, "invalid commit hash", {}},
        {VersionError::InvalidDate, "invalid nightly date", {}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
