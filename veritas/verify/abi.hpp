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

#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <nlohmann/json.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

VERITAS_NAMESPACE_BEGIN

enum class AbiError
{
    Success = 0,
    InvalidAbi,
    InvalidType,
    Truncated,
    InvalidOffset,
    InvalidPadding,
    InvalidBool,
    TrailingData
};

struct AbiType
{
    enum class Kind
    {
        Uint,
        Int,
        Address,
        Bool,
        FixedBytes,
        Function,
        Bytes,
        String,
        Array,
        FixedArray,
        Tuple
    };

    Kind kind;
    /// Bits for integers, bytes for `bytesN`, length for `T[k]`
    size_t size{0};
    /// Element type of arrays, components of tuples
    std::vector<AbiType> children{};

    bool is_dynamic() const;

    /// Bytes the type takes in the head of an enclosing tuple
    size_t head_size() const;
};

/// Parses a canonical type such as `uint256[2][]`; `components` describes
/// tuples as in a json ABI
Result<AbiType>
parse_abi_type(std::string_view type, nlohmann::json const &components = {});

/// Inputs of the constructor in a json ABI; nullopt if it declares none
Result<std::optional<std::vector<AbiType>>>
constructor_inputs(nlohmann::json const &abi);

/// Strict decoding: padding must be clean, offsets and lengths must stay in
/// bounds and nothing may follow the encoded values
Result<void>
validate_abi_encoding(std::vector<AbiType> const &, byte_string_view data);

VERITAS_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<veritas::AbiError>
    : quick_status_code_from_enum_defaults<veritas::AbiError>
{
    static constexpr auto const domain_name = "Abi Error";
    static constexpr auto const domain_uuid =
        "5c6ce00ebebb3d7607b64b3f12c63285b305";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
