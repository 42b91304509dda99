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

#include <veritas/compile/compile_error.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/compile/evm_compiler.hpp>
#include <veritas/compile/solc_compiler.hpp>
#include <veritas/compile/subprocess.hpp>
#include <veritas/compiler/version.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace veritas;

namespace
{
    bool selects(nlohmann::json const &settings, std::string const &output)
    {
        auto const &list = settings["outputSelection"]["*"]["*"];
        return std::find(list.begin(), list.end(), output) != list.end();
    }
}

TEST(CompilerInput, parses_standard_json)
{
    auto const json = nlohmann::json::parse(R"({
        "language": "solidity",
        "sources": {"contracts/A.sol": {"content": "contract A {}"}},
        "settings": {"optimizer": {"enabled": true, "runs": 200}}
    })");
    auto const res = parse_standard_json(json);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().language, Language::Solidity);
    ASSERT_EQ(res.value().sources.size(), 1);
    EXPECT_EQ(res.value().sources.at("contracts/A.sol"), "contract A {}");
    EXPECT_EQ(res.value().settings["optimizer"]["runs"], 200);

    auto const back = to_standard_json(res.value());
    EXPECT_EQ(back["language"], "Solidity");
    EXPECT_EQ(back["sources"]["contracts/A.sol"]["content"], "contract A {}");
    EXPECT_FALSE(back.contains("interfaces"));
}

TEST(CompilerInput, rejects_malformed_input)
{
    EXPECT_EQ(
        parse_standard_json(nlohmann::json::parse(R"({"language": "Solidity"})"))
            .error(),
        CompileError::InvalidInput);
    EXPECT_EQ(
        parse_standard_json(
            nlohmann::json::parse(
                R"({"language": "Solidity", "sources": {"A.sol": {}}})"))
            .error(),
        CompileError::InvalidInput);
    EXPECT_EQ(
        parse_standard_json(
            nlohmann::json::parse(R"({"language": "Fe", "sources": {}})"))
            .error(),
        CompileError::UnsupportedLanguage);
}

TEST(CompilerInput, vyper_interfaces)
{
    auto const json = nlohmann::json::parse(R"({
        "language": "Vyper",
        "sources": {"A.vy": {"content": "x: uint256"}},
        "interfaces": {
            "I.vy": {"content": "@external\ndef f(): pass"},
            "E.json": {"abi": []},
            "T.json": {"contractTypes": {}}
        }
    })");
    auto const res = parse_standard_json(json);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().interfaces.size(), 3);
    EXPECT_EQ(to_standard_json(res.value())["interfaces"], json["interfaces"]);

    auto bad = json;
    bad["interfaces"]["X.json"] = nlohmann::json::object();
    EXPECT_EQ(parse_standard_json(bad).error(), CompileError::InvalidInput);
}

TEST(CompilerInput, normalizes_output_selection)
{
    CompilerInput input{
        .sources = {{"A.sol", "contract A {}"}},
        .settings = nlohmann::json::parse(
            R"({"outputSelection": {"*": {"*": ["abi"]}}})")};

    normalize_output_selection(input, CompilerVersion{0, 8, 19});
    EXPECT_TRUE(selects(input.settings, "evm.bytecode.object"));
    EXPECT_TRUE(selects(input.settings, "evm.deployedBytecode.linkReferences"));
    EXPECT_TRUE(
        selects(input.settings, "evm.deployedBytecode.immutableReferences"));
    EXPECT_TRUE(selects(input.settings, "metadata"));
    EXPECT_EQ(
        input.settings["outputSelection"]["*"][""],
        nlohmann::json::array({"ast"}));

    normalize_output_selection(input, CompilerVersion{0, 5, 0});
    EXPECT_FALSE(
        selects(input.settings, "evm.deployedBytecode.immutableReferences"));
    EXPECT_FALSE(selects(input.settings, "storageLayout"));

    CompilerInput vyper{.language = Language::Vyper};
    normalize_output_selection(vyper, CompilerVersion{0, 3, 7});
    auto const &list = vyper.settings["outputSelection"]["*"];
    EXPECT_NE(
        std::find(list.begin(), list.end(), "evm.deployedBytecode"),
        list.end());
}

TEST(CompilerInput, modified_copy_appends_comment)
{
    CompilerInput const input{.sources = {{"A.sol", "contract A {}"}}};
    auto const copy = modified_copy(input);
    EXPECT_EQ(copy.sources.at("A.sol"), "contract A {}\n// veritas");
    EXPECT_EQ(input.sources.at("A.sol"), "contract A {}");

    CompilerInput const vyper{
        .language = Language::Vyper, .sources = {{"A.vy", "x: uint256"}}};
    EXPECT_EQ(modified_copy(vyper).sources.at("A.vy"), "x: uint256\n# veritas");
}

TEST(CompilerOutput, classifies_process_results)
{
    auto const crashed = standard_json_output(
        ProcessOutput{.exit_code = 1, .out = "", .err = "segfault"});
    ASSERT_TRUE(crashed.has_errors());
    EXPECT_EQ(crashed.errors().front().message, "segfault");

    auto const garbage = standard_json_output(
        ProcessOutput{.exit_code = 0, .out = "not json", .err = ""});
    EXPECT_TRUE(garbage.has_errors());

    auto const ok = standard_json_output(ProcessOutput{
        .exit_code = 0,
        .out = R"({"errors": [{"severity": "warning", "message": "w",
                   "sourceLocation": {"file": "A.sol", "start": 3, "end": 9}}],
                   "contracts": {}})",
        .err = ""});
    EXPECT_FALSE(ok.has_errors());
    ASSERT_EQ(ok.diagnostics.size(), 1);
    EXPECT_EQ(ok.diagnostics[0].file.value_or(""), "A.sol");
    EXPECT_EQ(ok.diagnostics[0].start.value_or(-1), 3);
    EXPECT_EQ(ok.diagnostics[0].formatted_message, "w");
}

TEST(SolcCompiler, standard_json_support_by_version)
{
    EXPECT_FALSE(has_standard_json(CompilerVersion{0, 4, 10}));
    EXPECT_TRUE(has_standard_json(CompilerVersion{0, 4, 11}));
    EXPECT_TRUE(has_standard_json(CompilerVersion{0, 8, 0}));
}

TEST(SolcCompiler, combined_json_layout)
{
    CompilerInput const input{.sources = {{"A.sol", ""}}};
    auto const combined = nlohmann::json::parse(R"({"contracts": {
        "A.sol:A": {"abi": "[{\"type\":\"constructor\",\"inputs\":[]}]",
                    "bin": "6001", "bin-runtime": "6002"},
        "B": {"abi": [], "bin": "", "bin-runtime": ""}
    }})");
    auto const out = combined_to_standard_json(combined, input);
    auto const &a = out["contracts"]["A.sol"]["A"];
    EXPECT_EQ(a["abi"][0]["type"], "constructor");
    EXPECT_EQ(a["evm"]["bytecode"]["object"], "6001");
    EXPECT_EQ(a["evm"]["deployedBytecode"]["object"], "6002");
    EXPECT_TRUE(out["contracts"]["A.sol"].contains("B"));
}
