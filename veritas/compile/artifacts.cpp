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
#include <veritas/core/config.hpp>
#include <veritas/core/hex.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

constexpr size_t PLACEHOLDER_CHARS = 40;

void zero_chars(std::string &object, size_t const begin, size_t const count)
{
    if (begin >= object.size()) {
        return;
    }
    object.replace(
        begin,
        std::min(count, object.size() - begin),
        std::min(count, object.size() - begin),
        '0');
}

/// `__$<34 hex>$__` names a library by hash, `__<name>____` by a truncated
/// fully qualified name
std::string placeholder_name(std::string_view const placeholder)
{
    auto name = placeholder.substr(2, PLACEHOLDER_CHARS - 2);
    while (!name.empty() && name.back() == '_') {
        name.remove_suffix(1);
    }
    return std::string{name};
}

std::optional<CodeRange> parse_range(nlohmann::json const &json)
{
    if (!json.is_object() || !json.contains("start") ||
        !json["start"].is_number_unsigned() || !json.contains("length") ||
        !json["length"].is_number_unsigned()) {
        return std::nullopt;
    }
    return CodeRange{
        .offset = json["start"].get<uint32_t>(),
        .length = json["length"].get<uint32_t>()};
}

LinkReferences parse_link_references(nlohmann::json const &bytecode)
{
    LinkReferences refs;
    if (!bytecode.contains("linkReferences") ||
        !bytecode["linkReferences"].is_object()) {
        return refs;
    }
    for (auto const &[file, libraries] : bytecode["linkReferences"].items()) {
        if (!libraries.is_object()) {
            continue;
        }
        for (auto const &[library, ranges] : libraries.items()) {
            if (!ranges.is_array()) {
                continue;
            }
            auto &entry = refs[file + ":" + library];
            for (auto const &range : ranges) {
                if (auto const r = parse_range(range)) {
                    entry.push_back(*r);
                }
            }
        }
    }
    return refs;
}

ImmutableReferences parse_immutable_references(nlohmann::json const &bytecode)
{
    ImmutableReferences refs;
    if (!bytecode.contains("immutableReferences") ||
        !bytecode["immutableReferences"].is_object()) {
        return refs;
    }
    for (auto const &[id, ranges] : bytecode["immutableReferences"].items()) {
        if (!ranges.is_array()) {
            continue;
        }
        auto &entry = refs[id];
        for (auto const &range : ranges) {
            if (auto const r = parse_range(range)) {
                entry.push_back(*r);
            }
        }
    }
    return refs;
}

nlohmann::json ranges_to_json(std::vector<CodeRange> const &ranges)
{
    nlohmann::json json = nlohmann::json::array();
    for (auto const &range : ranges) {
        json.push_back({{"start", range.offset}, {"length", range.length}});
    }
    return json;
}

nlohmann::json field_or_null(nlohmann::json const &json, char const *const key)
{
    return json.contains(key) ? json[key] : nlohmann::json{};
}

Result<CodeArtifacts> code_artifacts(
    nlohmann::json const &evm, char const *const key, bool const runtime)
{
    if (!evm.contains(key) || !evm[key].is_object() ||
        !evm[key].contains("object") || !evm[key]["object"].is_string()) {
        return CompileError::Internal;
    }
    auto const &bytecode = evm[key];

    CodeArtifacts artifacts{
        .link_references = parse_link_references(bytecode)};
    auto code = decode_object(
        bytecode["object"].get<std::string>(), artifacts.link_references);
    if (code.has_error()) {
        return std::move(code).assume_error();
    }
    artifacts.code = std::move(code).value();
    if (bytecode.contains("sourceMap") && bytecode["sourceMap"].is_string()) {
        artifacts.source_map = bytecode["sourceMap"].get<std::string>();
    }
    if (runtime) {
        artifacts.immutable_references = parse_immutable_references(bytecode);
    }
    return artifacts;
}

void attach_code_auxdata(
    Language const language, CodeArtifacts &code, CodeArtifacts const *modified,
    std::string const &name)
{
    if (code.code.empty()) {
        return;
    }
    if (modified) {
        auto auxdata = find_cbor_auxdata(language, code.code, modified->code);
        if (auxdata.has_value()) {
            code.cbor_auxdata = std::move(auxdata).value();
            return;
        }
        LOG_DEBUG("falling back to trailing cbor auxdata for {}", name);
    }
    code.cbor_auxdata = find_trailing_auxdata(language, code.code);
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

Result<byte_string>
decode_object(std::string object, LinkReferences &link_references)
{
    if (object.starts_with("0x")) {
        object.erase(0, 2);
    }
    for (auto const &[_, ranges] : link_references) {
        for (auto const &range : ranges) {
            zero_chars(object, size_t{range.offset} * 2, size_t{range.length} * 2);
        }
    }
    for (auto pos = object.find("__"); pos != std::string::npos;
         pos = object.find("__", pos)) {
        if (pos % 2 != 0 || pos + PLACEHOLDER_CHARS > object.size()) {
            LOG_WARNING("malformed library placeholder at {}", pos);
            return CompileError::Internal;
        }
        auto const name = placeholder_name(
            std::string_view{object}.substr(pos, PLACEHOLDER_CHARS));
        link_references[name].push_back(CodeRange{
            .offset = static_cast<uint32_t>(pos / 2), .length = 20});
        zero_chars(object, pos, PLACEHOLDER_CHARS);
        pos += PLACEHOLDER_CHARS;
    }
    auto code = from_hex(object);
    if (!code) {
        return CompileError::Internal;
    }
    return std::move(*code);
}

Result<std::vector<ContractArtifacts>>
collect_artifacts(nlohmann::json const &output)
{
    std::vector<ContractArtifacts> result;
    if (!output.contains("contracts") || !output["contracts"].is_object()) {
        return result;
    }
    for (auto const &[file, contracts] : output["contracts"].items()) {
        if (!contracts.is_object()) {
            return CompileError::Internal;
        }
        for (auto const &[name, contract] : contracts.items()) {
            if (!contract.is_object() || !contract.contains("evm") ||
                !contract["evm"].is_object()) {
                LOG_WARNING("no evm output for {}:{}", file, name);
                return CompileError::Internal;
            }
            auto const &evm = contract["evm"];
            auto creation = code_artifacts(evm, "bytecode", false);
            if (creation.has_error()) {
                LOG_WARNING("no creation code for {}:{}", file, name);
                return std::move(creation).assume_error();
            }
            auto runtime = code_artifacts(evm, "deployedBytecode", true);
            if (runtime.has_error()) {
                LOG_WARNING("no runtime code for {}:{}", file, name);
                return std::move(runtime).assume_error();
            }

            ContractArtifacts artifacts{
                .file_name = file,
                .contract_name = name,
                .userdoc = field_or_null(contract, "userdoc"),
                .devdoc = field_or_null(contract, "devdoc"),
                .storage_layout = field_or_null(contract, "storageLayout"),
                .creation = std::move(creation).value(),
                .runtime = std::move(runtime).value()};
            if (contract.contains("abi") && contract["abi"].is_array()) {
                artifacts.abi = contract["abi"];
            }
            // solc emits metadata as a json encoded string
            if (contract.contains("metadata")) {
                auto const &metadata = contract["metadata"];
                artifacts.metadata =
                    metadata.is_string()
                        ? nlohmann::json::parse(
                              metadata.get<std::string>(), nullptr, false)
                        : metadata;
                if (artifacts.metadata.is_discarded()) {
                    artifacts.metadata = nullptr;
                }
            }
            result.push_back(std::move(artifacts));
        }
    }
    return result;
}

nlohmann::json source_ids(nlohmann::json const &output)
{
    nlohmann::json ids = nlohmann::json::object();
    if (!output.contains("sources") || !output["sources"].is_object()) {
        return ids;
    }
    for (auto const &[file, source] : output["sources"].items()) {
        if (source.is_object() && source.contains("id")) {
            ids[file] = {{"id", source["id"]}};
        }
    }
    return ids;
}

void attach_cbor_auxdata(
    Language const language, std::vector<ContractArtifacts> &contracts,
    std::vector<ContractArtifacts> const *const modified)
{
    for (auto &contract : contracts) {
        ContractArtifacts const *match = nullptr;
        if (modified) {
            for (auto const &candidate : *modified) {
                if (candidate.file_name == contract.file_name &&
                    candidate.contract_name == contract.contract_name) {
                    match = &candidate;
                    break;
                }
            }
        }
        auto const name = contract.fully_qualified_name();
        attach_code_auxdata(
            language,
            contract.creation,
            match ? &match->creation : nullptr,
            name);
        attach_code_auxdata(
            language, contract.runtime, match ? &match->runtime : nullptr, name);
    }
}

nlohmann::json to_json(LinkReferences const &refs)
{
    nlohmann::json json = nlohmann::json::object();
    for (auto const &[key, ranges] : refs) {
        auto const colon = key.rfind(':');
        auto const file =
            colon == std::string::npos ? std::string{} : key.substr(0, colon);
        auto const library =
            colon == std::string::npos ? key : key.substr(colon + 1);
        json[file][library] = ranges_to_json(ranges);
    }
    return json;
}

nlohmann::json to_json(CodeArtifacts const &code, bool const runtime)
{
    nlohmann::json json = {
        {"sourceMap", code.source_map},
        {"linkReferences", to_json(code.link_references)},
        {"cborAuxdata", to_json(code.cbor_auxdata)}};
    if (runtime) {
        nlohmann::json immutables = nlohmann::json::object();
        for (auto const &[id, ranges] : code.immutable_references) {
            immutables[id] = ranges_to_json(ranges);
        }
        json["immutableReferences"] = std::move(immutables);
    }
    return json;
}

nlohmann::json to_json(ContractArtifacts const &contract)
{
    return {
        {"fileName", contract.file_name},
        {"contractName", contract.contract_name},
        {"compilationArtifacts",
         {{"abi", contract.abi},
          {"userdoc", contract.userdoc},
          {"devdoc", contract.devdoc},
          {"storageLayout", contract.storage_layout}}},
        {"creationCodeArtifacts", to_json(contract.creation, false)},
        {"runtimeCodeArtifacts", to_json(contract.runtime, true)}};
}

VERITAS_NAMESPACE_END
