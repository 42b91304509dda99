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
#include <veritas/compile/compile_error.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/hex.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace veritas;

namespace
{
    std::string const MAIN_ONE =
        "608060405234801561001057600080fd5b506040518060200161002190610050565b"
        "6020820181038252601f19601f820116604052506000908051906020019061004a92"
        "919061005c565b5061015f565b605c806101ac83390190565b8280546100689061012e"
        "565b90600052602060002090601f01602090048101928261008a57600085556100d156"
        "5b82601f106100a357805160ff19168380011785556100d1565b828001600101855582"
        "156100d1579182015b828111156100d05782518255916020019190600101906100b556"
        "5b5b5090506100de91906100e2565b5090565b5b808211156100fb5760008160009055"
        "506001016100e3565b5090565b7f4e487b710000000000000000000000000000000000"
        "0000000000000000000000600052602260045260246000fd5b60006002820490506001"
        "8216806101465760"
        "7f821691505b602082108103610159576101586100ff565b5b50919050565b603f8061"
        "016d6000396000f3fe6080604052600080fdfe";
    std::string const MAIN_TWO =
        "6080604052348015600f57600080fd5b50603f80601d6000396000f3fe6080604052"
        "600080fdfe";
    std::string const AUX_ONE =
        "a26469706673582212202e82fb6222f966f0e56dc49cd1fb8a6b5eac9bdf74f62b8a"
        "5e9d8812901095d664736f6c634300080e0033";
    std::string const AUX_TWO =
        "a2646970667358221220bd9f7fd5fb164e10dd86ccc9880d27a177e74ba873e6a9b9"
        "7b6c4d7062b26ff064736f6c634300080e0033";
    std::string const AUX_THREE =
        "a264697066735822122028c67e368422bc9c0b12226a099aa62a1facd39b08a84427"
        "d7f3efe1e37029b864736f6c634300080e0033";
    std::string const AUX_FOUR =
        "a26469706673582212206b331720b143820ca2e65d7db53a1b005672433fcb7f2da3"
        "ab539851bddc226a64736f6c634300080e0033";
    // {"vyper": [0, 3, 7]} followed by its length plus two
    std::string const VYPER_AUX = "a165767970657283000307000d";

    byte_string bytes(std::string const &hex)
    {
        return from_hex(hex).value();
    }
}

TEST(CborAuxdata, finds_single_block)
{
    auto const code = bytes(MAIN_ONE + AUX_ONE);
    auto const modified = bytes(MAIN_ONE + AUX_THREE);

    auto const res = find_cbor_auxdata(Language::Solidity, code, modified);
    ASSERT_FALSE(res.has_error());
    CborAuxdata const expected{
        {"1",
         CborAuxdataValue{
             .offset = static_cast<uint32_t>(MAIN_ONE.size() / 2),
             .value = bytes(AUX_ONE)}}};
    EXPECT_EQ(res.value(), expected);
}

TEST(CborAuxdata, finds_several_blocks)
{
    auto const code = bytes(MAIN_ONE + AUX_ONE + MAIN_TWO + AUX_TWO);
    auto const modified = bytes(MAIN_ONE + AUX_THREE + MAIN_TWO + AUX_FOUR);

    auto const res = find_cbor_auxdata(Language::Solidity, code, modified);
    ASSERT_FALSE(res.has_error());
    ASSERT_EQ(res.value().size(), 2);
    EXPECT_EQ(res.value().at("1").offset, MAIN_ONE.size() / 2);
    EXPECT_EQ(res.value().at("1").value, bytes(AUX_ONE));
    EXPECT_EQ(
        res.value().at("2").offset,
        (MAIN_ONE.size() + AUX_ONE.size() + MAIN_TWO.size()) / 2);
    EXPECT_EQ(res.value().at("2").value, bytes(AUX_TWO));
}

TEST(CborAuxdata, identical_code_has_no_blocks)
{
    auto const code = bytes(MAIN_TWO);
    auto const res = find_cbor_auxdata(Language::Solidity, code, code);
    ASSERT_FALSE(res.has_error());
    EXPECT_TRUE(res.value().empty());
}

TEST(CborAuxdata, rejects_differences_outside_metadata)
{
    auto const code = bytes(MAIN_TWO + AUX_ONE);
    auto modified = code;
    modified[3] ^= 0xff;
    auto const res = find_cbor_auxdata(Language::Solidity, code, modified);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), CompileError::Internal);

    auto const shorter = bytes(MAIN_TWO);
    EXPECT_TRUE(find_cbor_auxdata(Language::Solidity, code, shorter).has_error());
}

TEST(CborAuxdata, trailing_block)
{
    auto const solc = find_trailing_auxdata(
        Language::Solidity, bytes(MAIN_TWO + AUX_ONE));
    ASSERT_EQ(solc.size(), 1);
    EXPECT_EQ(solc.at("1").offset, MAIN_TWO.size() / 2);
    EXPECT_EQ(solc.at("1").value, bytes(AUX_ONE));

    auto const vyper =
        find_trailing_auxdata(Language::Vyper, bytes("6001" + VYPER_AUX));
    ASSERT_EQ(vyper.size(), 1);
    EXPECT_EQ(vyper.at("1").offset, 2);
    EXPECT_TRUE(is_cbor_auxdata(Language::Vyper, bytes(VYPER_AUX)));
    EXPECT_FALSE(is_cbor_auxdata(Language::Solidity, bytes(VYPER_AUX)));

    EXPECT_TRUE(find_trailing_auxdata(Language::Solidity, bytes(MAIN_TWO))
                    .empty());
}

TEST(CborAuxdata, decodes_solc_metadata)
{
    auto const json = decode_cbor_auxdata(bytes(AUX_ONE));
    ASSERT_TRUE(json.has_value());
    EXPECT_TRUE(json->contains("ipfs"));
    ASSERT_TRUE(json->contains("solc"));
    EXPECT_TRUE((*json)["solc"].is_binary());
}

TEST(Artifacts, zeroes_library_placeholders)
{
    std::string const placeholder = "__$ebac7c63e4d1a1d4d2f1b5b6b3e0b1c2d3$__";
    ASSERT_EQ(placeholder.size(), 40);

    LinkReferences refs;
    auto const code = decode_object("0x6001" + placeholder + "6002", refs);
    ASSERT_FALSE(code.has_error());
    EXPECT_EQ(
        code.value(),
        bytes("6001" + std::string(40, '0') + "6002"));
    ASSERT_EQ(refs.size(), 1);
    EXPECT_EQ(refs.begin()->first, "$ebac7c63e4d1a1d4d2f1b5b6b3e0b1c2d3$");
    EXPECT_EQ(refs.begin()->second, (std::vector<CodeRange>{{2, 20}}));

    std::string const legacy =
        "__A.sol:Lib" + std::string(40 - 11, '_');
    LinkReferences legacy_refs;
    auto const legacy_code = decode_object("73" + legacy + "00", legacy_refs);
    ASSERT_FALSE(legacy_code.has_error());
    EXPECT_EQ(
        legacy_refs.at("A.sol:Lib"), (std::vector<CodeRange>{{1, 20}}));

    LinkReferences none;
    EXPECT_TRUE(decode_object("60zz", none).has_error());
}

TEST(Artifacts, collects_contracts)
{
    auto const output = nlohmann::json::parse(R"({
        "sources": {"A.sol": {"id": 0}, "L.sol": {"id": 1}},
        "contracts": {"A.sol": {"A": {
            "abi": [{"type": "constructor", "inputs": [{"name": "x", "type": "uint256"}]}],
            "metadata": "{\"compiler\": {\"version\": \"0.8.14\"}}",
            "evm": {
                "bytecode": {
                    "object": "6001__$00000000000000000000000000000000ff$__",
                    "sourceMap": "1:2:0",
                    "linkReferences": {"L.sol": {"L": [{"start": 2, "length": 20}]}}
                },
                "deployedBytecode": {
                    "object": "6002",
                    "immutableReferences": {"7": [{"start": 1, "length": 32}]}
                }
            }
        }}}
    })");
    auto const res = collect_artifacts(output);
    ASSERT_FALSE(res.has_error());
    ASSERT_EQ(res.value().size(), 1);
    auto const &a = res.value().front();
    EXPECT_EQ(a.fully_qualified_name(), "A.sol:A");
    EXPECT_EQ(a.creation.code, bytes("6001" + std::string(40, '0')));
    EXPECT_EQ(a.creation.source_map, "1:2:0");
    EXPECT_EQ(
        a.creation.link_references.at("L.sol:L"),
        (std::vector<CodeRange>{{2, 20}}));
    EXPECT_EQ(a.runtime.immutable_references.at("7"),
              (std::vector<CodeRange>{{1, 32}}));
    EXPECT_EQ(a.metadata["compiler"]["version"], "0.8.14");
    EXPECT_EQ(source_ids(output)["L.sol"]["id"], 1);

    auto const json = to_json(a);
    EXPECT_EQ(
        json["creationCodeArtifacts"]["linkReferences"]["L.sol"]["L"][0]
            ["length"],
        20);
    EXPECT_EQ(
        json["runtimeCodeArtifacts"]["immutableReferences"]["7"][0]["start"],
        1);
}

TEST(Artifacts, missing_bytecode_is_internal)
{
    auto const output = nlohmann::json::parse(
        R"({"contracts": {"A.sol": {"A": {"evm": {"bytecode": {"object": "00"}}}}}})");
    auto const res = collect_artifacts(output);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), CompileError::Internal);
}

TEST(Artifacts, attaches_auxdata_from_modified_compilation)
{
    std::vector<ContractArtifacts> contracts(1);
    contracts[0].file_name = "A.sol";
    contracts[0].contract_name = "A";
    contracts[0].creation.code = bytes(MAIN_ONE + AUX_ONE);
    contracts[0].runtime.code = bytes(MAIN_TWO + AUX_TWO);
    auto modified = contracts;
    modified[0].creation.code = bytes(MAIN_ONE + AUX_THREE);
    modified[0].runtime.code = bytes(MAIN_TWO + AUX_FOUR);

    attach_cbor_auxdata(Language::Solidity, contracts, &modified);
    EXPECT_EQ(contracts[0].creation.cbor_auxdata.at("1").offset,
              MAIN_ONE.size() / 2);
    EXPECT_EQ(contracts[0].runtime.cbor_auxdata.at("1").offset,
              MAIN_TWO.size() / 2);

    contracts[0].creation.cbor_auxdata.clear();
    attach_cbor_auxdata(Language::Solidity, contracts, nullptr);
    EXPECT_EQ(contracts[0].creation.cbor_auxdata.at("1").value, bytes(AUX_ONE));
}
