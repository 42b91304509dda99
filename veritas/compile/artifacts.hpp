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

#include <veritas/compile/cbor_auxdata.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

VERITAS_NAMESPACE_BEGIN

struct CodeRange
{
    uint32_t offset;
    uint32_t length;

    friend bool operator==(CodeRange const &, CodeRange const &) = default;
};

/// `file:library` to the ranges its address occupies
using LinkReferences = std::map<std::string, std::vector<CodeRange>>;

/// AST id of an immutable to the ranges holding its value
using ImmutableReferences = std::map<std::string, std::vector<CodeRange>>;

struct CodeArtifacts
{
    /// Placeholders of unlinked libraries are zeroed
    byte_string code{};
    std::string source_map{};
    LinkReferences link_references{};
    ImmutableReferences immutable_references{};
    CborAuxdata cbor_auxdata{};
};

struct ContractArtifacts
{
    std::string file_name{};
    std::string contract_name{};
    nlohmann::json abi{nlohmann::json::array()};
    nlohmann::json metadata{};
    nlohmann::json userdoc{};
    nlohmann::json devdoc{};
    nlohmann::json storage_layout{};
    CodeArtifacts creation{};
    CodeArtifacts runtime{};

    std::string fully_qualified_name() const
    {
        return file_name + ":" + contract_name;
    }
};

/// Extracts every contract of a standard JSON output. A contract missing
/// its bytecode objects is `CompileError::Internal`.
Result<std::vector<ContractArtifacts>>
collect_artifacts(nlohmann::json const &output);

/// `{file: {"id": n}}` from the output's `sources`
nlohmann::json source_ids(nlohmann::json const &output);

/// Locates metadata blocks of `contracts` by diffing against the modified
/// compilation; without one, or when the diff fails, the trailing block is
/// used
void attach_cbor_auxdata(
    Language, std::vector<ContractArtifacts> &contracts,
    std::vector<ContractArtifacts> const *modified);

/// Replaces library placeholders (`__$...$__` or `__Name___`) in a hex
/// object by zeros and records where they were
Result<byte_string>
decode_object(std::string object, LinkReferences &link_references);

nlohmann::json to_json(LinkReferences const &);
nlohmann::json to_json(CodeArtifacts const &, bool runtime);
nlohmann::json to_json(ContractArtifacts const &);

VERITAS_NAMESPACE_END
