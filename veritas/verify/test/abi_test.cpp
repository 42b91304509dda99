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

#include <veritas/core/byte_string.hpp>
#include <veritas/core/hex.hpp>
#include <veritas/verify/abi.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace veritas;

namespace
{
    std::string left(std::string_view const hex)
    {
        return std::string(64 - hex.size(), '0') + std::string{hex};
    }

    std::string right(std::string_view const hex)
    {
        return std::string{hex} + std::string(64 - hex.size(), '0');
    }

    Result<void>
    validate(std::vector<std::string_view> const &types, std::string const &hex)
    {
        std::vector<AbiType> parsed;
        for (auto const type : types) {
            parsed.push_back(parse_abi_type(type).value());
        }
        return validate_abi_encoding(parsed, from_hex(hex).value());
    }
}

TEST(AbiType, parses_nested_arrays)
{
    auto const res = parse_abi_type("uint256[2][]");
    ASSERT_FALSE(res.has_error());
    auto const &type = res.value();
    EXPECT_EQ(type.kind, AbiType::Kind::Array);
    EXPECT_TRUE(type.is_dynamic());
    ASSERT_EQ(type.children.size(), 1);

    auto const &element = type.children.front();
    EXPECT_EQ(element.kind, AbiType::Kind::FixedArray);
    EXPECT_EQ(element.size, 2);
    EXPECT_FALSE(element.is_dynamic());
    EXPECT_EQ(element.head_size(), 64);
    EXPECT_EQ(element.children.front().kind, AbiType::Kind::Uint);
    EXPECT_EQ(element.children.front().size, 256);
}

TEST(AbiType, parses_elementary_types)
{
    EXPECT_EQ(parse_abi_type("uint").value().size, 256);
    EXPECT_EQ(parse_abi_type("int8").value().kind, AbiType::Kind::Int);
    EXPECT_EQ(parse_abi_type("bytes4").value().size, 4);
    EXPECT_EQ(parse_abi_type("address").value().kind, AbiType::Kind::Address);
    EXPECT_EQ(parse_abi_type("ufixed128x18").value().size, 128);
    EXPECT_TRUE(parse_abi_type("string").value().is_dynamic());
    EXPECT_TRUE(parse_abi_type("bytes").value().is_dynamic());
}

TEST(AbiType, rejects_invalid_types)
{
    for (auto const type :
         {"uint7", "uint264", "bytes33", "bytes0", "foo", "uint256[0]",
          "uint256]", "tuple"}) {
        auto const res = parse_abi_type(type);
        ASSERT_TRUE(res.has_error()) << type;
        EXPECT_EQ(res.error(), AbiError::InvalidType) << type;
    }
}

TEST(AbiType, parses_tuple_components)
{
    auto const components = nlohmann::json::parse(R"([
        {"name": "a", "type": "uint256"},
        {"name": "b", "type": "string"}
    ])");
    auto const res = parse_abi_type("tuple[]", components);
    ASSERT_FALSE(res.has_error());
    auto const &tuple = res.value().children.front();
    EXPECT_EQ(tuple.kind, AbiType::Kind::Tuple);
    ASSERT_EQ(tuple.children.size(), 2);
    EXPECT_TRUE(tuple.is_dynamic());
}

TEST(ConstructorInputs, reads_constructor)
{
    auto const abi = nlohmann::json::parse(R"([
        {"type": "function", "name": "f", "inputs": []},
        {"type": "constructor", "inputs": [
            {"name": "x", "type": "uint256"},
            {"name": "y", "type": "bytes"}
        ]}
    ])");
    auto const res = constructor_inputs(abi);
    ASSERT_FALSE(res.has_error());
    ASSERT_TRUE(res.value().has_value());
    ASSERT_EQ(res.value()->size(), 2);
    EXPECT_EQ(res.value()->at(1).kind, AbiType::Kind::Bytes);
}

TEST(ConstructorInputs, absent_constructor)
{
    auto const abi = nlohmann::json::parse(
        R"([{"type": "function", "name": "f", "inputs": []}])");
    auto const res = constructor_inputs(abi);
    ASSERT_FALSE(res.has_error());
    EXPECT_FALSE(res.value().has_value());

    auto const null = constructor_inputs(nlohmann::json{});
    ASSERT_FALSE(null.has_error());
    EXPECT_FALSE(null.value().has_value());

    auto const empty = constructor_inputs(
        nlohmann::json::parse(R"([{"type": "constructor"}])"));
    ASSERT_FALSE(empty.has_error());
    ASSERT_TRUE(empty.value().has_value());
    EXPECT_TRUE(empty.value()->empty());
}

TEST(ConstructorInputs, rejects_malformed_abi)
{
    auto const res = constructor_inputs(nlohmann::json::parse(R"({"a": 1})"));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), AbiError::InvalidAbi);

    auto const bad_input = constructor_inputs(nlohmann::json::parse(
        R"([{"type": "constructor", "inputs": [{"name": "x"}]}])"));
    ASSERT_TRUE(bad_input.has_error());
    EXPECT_EQ(bad_input.error(), AbiError::InvalidAbi);
}

TEST(AbiEncoding, accepts_static_values)
{
    EXPECT_FALSE(validate({"uint256", "bool"}, left("2a") + left("1")).has_error());
    EXPECT_FALSE(validate({"int8"}, std::string(64, 'f')).has_error());
    EXPECT_FALSE(validate({"bytes4"}, right("deadbeef")).has_error());
    EXPECT_FALSE(
        validate({"address"}, left("00112233445566778899aabbccddeeff00112233"))
            .has_error());
    EXPECT_FALSE(validate({}, "").has_error());
}

TEST(AbiEncoding, rejects_dirty_values)
{
    auto const dirty_uint = validate({"uint8"}, left("1ff"));
    ASSERT_TRUE(dirty_uint.has_error());
    EXPECT_EQ(dirty_uint.error(), AbiError::InvalidPadding);

    auto const dirty_int = validate({"int8"}, left("ff"));
    ASSERT_TRUE(dirty_int.has_error());
    EXPECT_EQ(dirty_int.error(), AbiError::InvalidPadding);

    auto const dirty_bytes = validate({"bytes1"}, right("aabb"));
    ASSERT_TRUE(dirty_bytes.has_error());
    EXPECT_EQ(dirty_bytes.error(), AbiError::InvalidPadding);

    auto const bad_bool = validate({"bool"}, left("2"));
    ASSERT_TRUE(bad_bool.has_error());
    EXPECT_EQ(bad_bool.error(), AbiError::InvalidBool);
}

TEST(AbiEncoding, accepts_dynamic_values)
{
    // "hello"
    auto const string = left("20") + left("5") + right("68656c6c6f");
    EXPECT_FALSE(validate({"string"}, string).has_error());

    auto const array = left("20") + left("2") + left("1") + left("2");
    EXPECT_FALSE(validate({"uint256[]"}, array).has_error());

    auto const mixed =
        left("7") + left("60") + left("1") + left("3") + right("aabbcc");
    EXPECT_FALSE(validate({"uint256", "bytes", "bool"}, mixed).has_error());
}

TEST(AbiEncoding, rejects_malformed_dynamic_values)
{
    auto const dirty_padding = left("20") + left("1") + right("aabb");
    auto const padding = validate({"bytes"}, dirty_padding);
    ASSERT_TRUE(padding.has_error());
    EXPECT_EQ(padding.error(), AbiError::InvalidPadding);

    auto const far_offset = validate({"bytes"}, left("1000") + left("0"));
    ASSERT_TRUE(far_offset.has_error());
    EXPECT_EQ(far_offset.error(), AbiError::InvalidOffset);

    auto const long_string = validate({"string"}, left("20") + left("40"));
    ASSERT_TRUE(long_string.has_error());
    EXPECT_EQ(long_string.error(), AbiError::Truncated);

    auto const many_elements =
        validate({"uint256[]"}, left("20") + left("3") + left("1"));
    ASSERT_TRUE(many_elements.has_error());
    EXPECT_EQ(many_elements.error(), AbiError::Truncated);
}

TEST(AbiEncoding, rejects_truncated_and_trailing_data)
{
    auto const truncated = validate({"uint256", "uint256"}, left("1"));
    ASSERT_TRUE(truncated.has_error());
    EXPECT_EQ(truncated.error(), AbiError::Truncated);

    auto const trailing = validate({"uint256"}, left("1") + left("2"));
    ASSERT_TRUE(trailing.has_error());
    EXPECT_EQ(trailing.error(), AbiError::TrailingData)
        << trailing.error().message().c_str();

    auto const empty = validate({"uint256"}, "");
    ASSERT_TRUE(empty.has_error());
    EXPECT_EQ(empty.error(), AbiError::Truncated);
}
