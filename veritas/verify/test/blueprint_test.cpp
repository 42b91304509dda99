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

#include <veritas/compile/artifacts.hpp>
#include <veritas/compile/cbor_auxdata.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/hex.hpp>
#include <veritas/verify/blueprint.hpp>
#include <veritas/verify/verify_contract.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace veritas;

namespace
{
    std::string const INITCODE = "6080604052348015600f57600080fd5b50";
    std::string const VYPER_AUX = "a165767970657283000307000d";
    std::string const OTHER_VYPER_AUX = "a165767970657283000304000d";

    byte_string bytes(std::string const &hex)
    {
        return from_hex(hex).value();
    }

    byte_string deploy(byte_string const &blueprint)
    {
        byte_string code{
            0x61,
            static_cast<uint8_t>(blueprint.size() >> 8),
            static_cast<uint8_t>(blueprint.size()),
            0x3d,
            0x81,
            0x60,
            0x0a,
            0x3d,
            0x39,
            0xf3};
        return code + blueprint;
    }

    ContractArtifacts compiled(std::string const &creation)
    {
        return ContractArtifacts{
            .file_name = "factory.vy",
            .contract_name = "factory",
            .creation = CodeArtifacts{
                .code = bytes(creation),
                .cbor_auxdata = {
                    {"1",
                     CborAuxdataValue{
                         .offset = static_cast<uint32_t>(
                             (creation.size() - VYPER_AUX.size()) / 2),
                         .value = bytes(VYPER_AUX)}}}}};
    }
}

TEST(Blueprint, parses_container)
{
    auto const code = bytes("fe7100" + INITCODE);
    auto const blueprint = parse_blueprint(code);
    ASSERT_TRUE(blueprint.has_value());
    EXPECT_EQ(blueprint->version, 0);
    EXPECT_TRUE(blueprint->preamble.empty());
    EXPECT_EQ(byte_string{blueprint->initcode}, bytes(INITCODE));
}

TEST(Blueprint, parses_preamble)
{
    auto const code = bytes("fe710102abcd" + INITCODE);
    auto const blueprint = parse_blueprint(code);
    ASSERT_TRUE(blueprint.has_value());
    EXPECT_EQ(byte_string{blueprint->preamble}, bytes("abcd"));
    EXPECT_EQ(byte_string{blueprint->initcode}, bytes(INITCODE));
}

TEST(Blueprint, rejects_other_code)
{
    EXPECT_FALSE(parse_blueprint(bytes(INITCODE)).has_value());
    EXPECT_FALSE(parse_blueprint(bytes("fe7103" + INITCODE)).has_value());
    EXPECT_FALSE(parse_blueprint(bytes("fe7101ff")).has_value());
    EXPECT_FALSE(parse_blueprint(bytes("fe71")).has_value());
}

TEST(Blueprint, strips_deployer)
{
    auto const blueprint = bytes("fe7100" + INITCODE);
    auto const creation = deploy(blueprint);
    EXPECT_EQ(byte_string{strip_blueprint_deployer(creation)}, blueprint);
    EXPECT_EQ(
        byte_string{strip_blueprint_deployer(blueprint)}, blueprint);
    ASSERT_TRUE(parse_blueprint_creation(creation).has_value());

    EXPECT_TRUE(is_blueprint(OnChainCode{.creation = creation}));
    EXPECT_TRUE(is_blueprint(OnChainCode{.runtime = blueprint}));
    EXPECT_FALSE(is_blueprint(OnChainCode{.creation = bytes(INITCODE)}));
}

TEST(Blueprint, verifies_initcode_only)
{
    auto const on_chain = deploy(bytes("fe7100" + INITCODE + OTHER_VYPER_AUX));
    auto const res = verify_blueprint(
        on_chain, compiled(INITCODE + VYPER_AUX), Language::Vyper);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().result, VerificationResult::CreationMatch);
    ASSERT_TRUE(res.value().creation_match.has_value());
    EXPECT_EQ(res.value().creation_match->transformations.size(), 1);
    EXPECT_FALSE(res.value().runtime_match.has_value());
}

TEST(Blueprint, compiled_in_blueprint_form)
{
    auto const on_chain = deploy(bytes("fe7100" + INITCODE + VYPER_AUX));
    auto const creation =
        deploy(bytes("fe7100" + INITCODE + VYPER_AUX));
    auto const res = verify_blueprint(
        on_chain, compiled(to_hex(creation)), Language::Vyper);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().result, VerificationResult::CreationMatch);
    EXPECT_TRUE(res.value().creation_match->is_full());
}

TEST(Blueprint, no_constructor_arguments)
{
    auto const on_chain =
        deploy(bytes("fe7100" + INITCODE + VYPER_AUX + std::string(64, '0')));
    auto const res = verify_blueprint(
        on_chain, compiled(INITCODE + VYPER_AUX), Language::Vyper);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().result, VerificationResult::Failure);
    EXPECT_EQ(res.value().mismatches.size(), 1);
}

TEST(Blueprint, plain_creation_code_fails)
{
    auto const res = verify_blueprint(
        bytes(INITCODE + VYPER_AUX),
        compiled(INITCODE + VYPER_AUX),
        Language::Vyper);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().result, VerificationResult::Failure);
    ASSERT_EQ(res.value().mismatches.size(), 1);
    EXPECT_EQ(
        res.value().mismatches.front().reason,
        "on chain code is not a blueprint");
}
