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

#include <veritas/compile/cbor_auxdata.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

VERITAS_NAMESPACE_BEGIN

enum class PartType : uint8_t
{
    Main = 1,
    Metadata = 2
};

std::string_view to_string(PartType);

struct BytecodePart
{
    PartType type;
    byte_string data;

    friend bool operator==(BytecodePart const &, BytecodePart const &) = default;
};

/// Cuts `code` at the metadata blocks of `auxdata`: code between blocks
/// becomes Main parts and each block a Metadata part. Without auxdata the
/// trailing block, if any, is split off.
std::vector<BytecodePart> split_parts(
    byte_string_view code, CborAuxdata const &auxdata,
    Language = Language::Solidity);

byte_string join_parts(std::vector<BytecodePart> const &);

enum class PartsMatch : uint8_t
{
    NoMatch,
    Partial,
    Full
};

/// Checks stored parts against on chain code. Main parts must be equal;
/// metadata may differ as long as its encoded length and embedded solc
/// version agree. Bytes past the parts are left to the caller.
PartsMatch
compare_parts(std::vector<BytecodePart> const &, byte_string_view on_chain);

VERITAS_NAMESPACE_END
