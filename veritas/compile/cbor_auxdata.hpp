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

#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

VERITAS_NAMESPACE_BEGIN

/// A metadata block embedded in code: the CBOR item followed by its 2 byte
/// big endian length
struct CborAuxdataValue
{
    uint32_t offset;
    byte_string value;

    friend bool
    operator==(CborAuxdataValue const &, CborAuxdataValue const &) = default;
};

/// Keyed "1", "2", ... in code order
using CborAuxdata = std::map<std::string, CborAuxdataValue>;

/// Locates every metadata block by diffing `code` against the same
/// contract compiled from sources with a changed metadata hash. Both must
/// have equal length; a difference that is not inside a decodable block
/// yields `CompileError::Internal`.
Result<CborAuxdata> find_cbor_auxdata(
    Language, byte_string_view code, byte_string_view modified_code);

/// Single trailing block located through the final two length bytes
CborAuxdata find_trailing_auxdata(Language, byte_string_view code);

/// Whether `value` is a decodable CBOR item followed by a length trailer
/// consistent with the language's convention
bool is_cbor_auxdata(Language, byte_string_view value);

/// Decodes the CBOR item of a block, without its length trailer
std::optional<nlohmann::json> decode_cbor_auxdata(byte_string_view value);

nlohmann::json to_json(CborAuxdata const &);

VERITAS_NAMESPACE_END
