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

#include <veritas/bytecode_db/part.hpp>
#include <veritas/compile/cbor_auxdata.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/hex.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace veritas;

namespace
{
    std::string const MAIN =
        "6080604052348015600f57600080fd5b506004361060285760003560e01c8063f43f"
        "a80514602d575b600080fd5b60336047565b604051603e91906062565b6040518091"
        "0390f35b600065100000000001905090565b605c81607b565b82525050565b600060"
        "2082019050607560008301846055565b92915050565b600081905091905056fe";
    std::string const OTHER_MAIN =
        "6080604052600080fdfe";
    // solc 0.8.14
    std::string const AUX_ONE =
        "a26469706673582212202e82fb6222f966f0e56dc49cd1fb8a6b5eac9bdf74f62b8a"
        "5e9d8812901095d664736f6c634300080e0033";
    std::string const AUX_TWO =
        "a2646970667358221220bd9f7fd5fb164e10dd86ccc9880d27a177e74ba873e6a9b9"
        "7b6c4d7062b26ff064736f6c634300080e0033";
    // solc 0.8.7
    std::string const AUX_OLD =
        "a2646970667358221220ad5a5e9ea0429c6665dc23af78b0acca8d56235be9dc3573"
        "672141811ea4a0da64736f6c63430008070033";

    byte_string bytes(std::string const &hex)
    {
        return from_hex(hex).value();
    }

    std::vector<BytecodePart> parts(std::vector<std::string> const &hex)
    {
        std::vector<BytecodePart> result;
        for (size_t i = 0; i < hex.size(); ++i) {
            result.push_back(BytecodePart{
                .type = i % 2 == 0 ? PartType::Main : PartType::Metadata,
                .data = bytes(hex[i])});
        }
        return result;
    }
}

TEST(SplitParts, uses_auxdata_offsets)
{
    auto const code = bytes(MAIN + AUX_ONE + OTHER_MAIN + AUX_TWO);
    CborAuxdata const auxdata{
        {"1",
         CborAuxdataValue{
             .offset = static_cast<uint32_t>(MAIN.size() / 2),
             .value = bytes(AUX_ONE)}},
        {"2",
         CborAuxdataValue{
             .offset = static_cast<uint32_t>(
                 (MAIN.size() + AUX_ONE.size() + OTHER_MAIN.size()) / 2),
             .value = bytes(AUX_TWO)}}};

    EXPECT_EQ(
        split_parts(code, auxdata),
        parts({MAIN, AUX_ONE, OTHER_MAIN, AUX_TWO}));
}

TEST(SplitParts, keeps_on_chain_metadata)
{
    // offsets come from the recompiled code, bytes from the stored one
    auto const code = bytes(MAIN + AUX_ONE);
    CborAuxdata const auxdata{
        {"1",
         CborAuxdataValue{
             .offset = static_cast<uint32_t>(MAIN.size() / 2),
             .value = bytes(AUX_TWO)}}};
    EXPECT_EQ(split_parts(code, auxdata), parts({MAIN, AUX_ONE}));
}

TEST(SplitParts, trailing_metadata_without_auxdata)
{
    EXPECT_EQ(split_parts(bytes(MAIN + AUX_ONE), {}), parts({MAIN, AUX_ONE}));
}

TEST(SplitParts, single_main_part)
{
    EXPECT_EQ(split_parts(bytes(MAIN), {}), parts({MAIN}));
    EXPECT_TRUE(split_parts(byte_string{}, {}).empty());
}

TEST(SplitParts, ignores_blocks_outside_code)
{
    CborAuxdata const auxdata{
        {"1", CborAuxdataValue{.offset = 1000, .value = bytes(AUX_ONE)}}};
    EXPECT_EQ(split_parts(bytes(MAIN), auxdata), parts({MAIN}));
}

TEST(CompareParts, same_code)
{
    EXPECT_EQ(
        compare_parts(parts({MAIN, AUX_ONE}), bytes(MAIN + AUX_ONE)),
        PartsMatch::Full);
    EXPECT_EQ(
        compare_parts(
            parts({MAIN, AUX_ONE}), bytes(MAIN + AUX_ONE + std::string(64, '0'))),
        PartsMatch::Full);
}

TEST(CompareParts, different_metadata)
{
    EXPECT_EQ(
        compare_parts(parts({MAIN, AUX_ONE}), bytes(MAIN + AUX_TWO)),
        PartsMatch::Partial);
    EXPECT_EQ(
        compare_parts(
            parts({MAIN, AUX_ONE, OTHER_MAIN, AUX_ONE}),
            bytes(MAIN + AUX_TWO + OTHER_MAIN + AUX_TWO)),
        PartsMatch::Partial);
}

TEST(CompareParts, different_main)
{
    EXPECT_EQ(
        compare_parts(parts({MAIN, AUX_ONE}), bytes(OTHER_MAIN + AUX_ONE)),
        PartsMatch::NoMatch);
    EXPECT_EQ(
        compare_parts(
            parts({MAIN, AUX_ONE, OTHER_MAIN, AUX_ONE}),
            bytes(MAIN + AUX_TWO + MAIN + AUX_TWO)),
        PartsMatch::NoMatch);
}

TEST(CompareParts, different_compiler_version)
{
    EXPECT_EQ(
        compare_parts(parts({MAIN, AUX_ONE}), bytes(MAIN + AUX_OLD)),
        PartsMatch::NoMatch);
}

TEST(CompareParts, invalid_metadata)
{
    EXPECT_EQ(
        compare_parts(
            parts({MAIN, AUX_ONE}), bytes(MAIN + std::string(102, 'f') + "0033")),
        PartsMatch::NoMatch);
    EXPECT_EQ(
        compare_parts(parts({MAIN, AUX_ONE}), bytes(MAIN)),
        PartsMatch::NoMatch);
}
