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

#include <veritas/core/bytes.hpp>
#include <veritas/core/config.hpp>

#include <quill/Fmt.h>
#include <quill/Quill.h>

#include <span>

namespace fmt = fmtquill::v10;

VERITAS_NAMESPACE_BEGIN

struct BasicFormatter
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }
};

VERITAS_NAMESPACE_END

template <>
struct quill::copy_loggable<veritas::bytes32_t> : std::true_type
{
};

template <>
struct fmt::formatter<veritas::bytes32_t> : public veritas::BasicFormatter
{
    template <typename FormatContext>
    auto format(veritas::bytes32_t const &value, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "{:02x}", fmt::join(value.bytes, ""));
        return ctx.out();
    }
};
