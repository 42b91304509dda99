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

#include <veritas/compile/compiler_input.hpp>

#include <veritas/compile/compile_error.hpp>
#include <veritas/compiler/version.hpp>
#include <veritas/core/config.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <string>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

bool iequals(std::string_view const a, std::string_view const b)
{
    return std::ranges::equal(a, b, [](char const x, char const y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

nlohmann::json solidity_selection(veritas::CompilerVersion const &version)
{
    auto contract = nlohmann::json::array(
        {"abi",
         "metadata",
         "userdoc",
         "devdoc",
         "evm.bytecode.object",
         "evm.bytecode.sourceMap",
         "evm.bytecode.linkReferences",
         "evm.deployedBytecode.object",
         "evm.deployedBytecode.sourceMap",
         "evm.deployedBytecode.linkReferences",
         "evm.methodIdentifiers"});
    // immutables appeared in 0.6.5, storage layout in 0.5.13
    if (version >= veritas::CompilerVersion{0, 6, 5}) {
        contract.push_back("evm.deployedBytecode.immutableReferences");
    }
    if (version >= veritas::CompilerVersion{0, 5, 13}) {
        contract.push_back("storageLayout");
    }
    return {
        {"*",
         {{"", nlohmann::json::array({"ast"})}, {"*", std::move(contract)}}}};
}

nlohmann::json vyper_selection()
{
    return {
        {"*",
         {"abi",
          "userdoc",
          "devdoc",
          "evm.bytecode",
          "evm.deployedBytecode",
          "evm.methodIdentifiers"}}};
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

std::string_view to_string(Language const language)
{
    switch (language) {
    case Language::Solidity:
        return "Solidity";
    case Language::Yul:
        return "Yul";
    case Language::Vyper:
        return "Vyper";
    }
    return "Solidity";
}

std::optional<Language> parse_language(std::string_view const s)
{
    for (auto const language :
         {Language::Solidity, Language::Yul, Language::Vyper}) {
        if (iequals(s, to_string(language))) {
            return language;
        }
    }
    return std::nullopt;
}

nlohmann::json to_standard_json(CompilerInput const &input)
{
    nlohmann::json sources = nlohmann::json::object();
    for (auto const &[path, content] : input.sources) {
        sources[path] = {{"content", content}};
    }
    nlohmann::json json = {
        {"language", to_string(input.language)},
        {"sources", std::move(sources)},
        {"settings", input.settings}};
    if (input.language == Language::Vyper && !input.interfaces.empty()) {
        json["interfaces"] = input.interfaces;
    }
    return json;
}

Result<CompilerInput> parse_standard_json(nlohmann::json const &json)
{
    if (!json.is_object() || !json.contains("language") ||
        !json["language"].is_string() || !json.contains("sources") ||
        !json["sources"].is_object()) {
        return CompileError::InvalidInput;
    }
    auto const language =
        parse_language(json["language"].get_ref<std::string const &>());
    if (!language) {
        return CompileError::UnsupportedLanguage;
    }

    CompilerInput input{.language = *language};
    for (auto const &[path, source] : json["sources"].items()) {
        if (!source.is_object() || !source.contains("content") ||
            !source["content"].is_string()) {
            return CompileError::InvalidInput;
        }
        input.sources.emplace(path, source["content"].get<std::string>());
    }
    if (json.contains("interfaces")) {
        if (!json["interfaces"].is_object()) {
            return CompileError::InvalidInput;
        }
        for (auto const &[path, interface] : json["interfaces"].items()) {
            if (!interface.is_object() ||
                !(interface.contains("content") || interface.contains("abi") ||
                  interface.contains("contractTypes"))) {
                return CompileError::InvalidInput;
            }
        }
        input.interfaces = json["interfaces"];
    }
    if (json.contains("settings")) {
        if (!json["settings"].is_object()) {
            return CompileError::InvalidInput;
        }
        input.settings = json["settings"];
    }
    return input;
}

void normalize_output_selection(
    CompilerInput &input, CompilerVersion const &version)
{
    input.settings["outputSelection"] = input.language == Language::Vyper
                                            ? vyper_selection()
                                            : solidity_selection(version);
}

CompilerInput modified_copy(CompilerInput const &input)
{
    CompilerInput copy = input;
    char const *const comment =
        input.language == Language::Vyper ? "\n# veritas" : "\n// veritas";
    for (auto &[path, content] : copy.sources) {
        content += comment;
    }
    return copy;
}

VERITAS_NAMESPACE_END
