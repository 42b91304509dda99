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

#include <veritas/core/hex.hpp>
#include <veritas/core/keccak.hpp>
#include <veritas/core/sha256.hpp>

#include <gtest/gtest.h>

using namespace veritas;
using namespace veritas::literals;

TEST(Hex, round_trip_and_prefix)
{
    auto const bytes = "0x6080604052"_hex;
    EXPECT_EQ(bytes.size(), 5);
    EXPECT_EQ(to_hex(bytes), "6080604052");
    EXPECT_EQ(to_prefixed_hex(bytes), "0x6080604052");
    EXPECT_EQ(from_hex("6080604052"), bytes);
}

TEST(Hex, rejects_malformed)
{
    EXPECT_FALSE(from_hex("0x608").has_value());
    EXPECT_FALSE(from_hex("zz").has_value());
    EXPECT_EQ(from_hex(""), byte_string{});
}

TEST(Digest, keccak_of_empty)
{
    EXPECT_EQ(
        to_hex(to_byte_string_view(to_bytes(keccak256({})))),
        "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(Digest, sha256_of_abc)
{
    EXPECT_EQ(
        to_hex(to_byte_string_view(sha256(to_byte_string_view("abc")))),
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
