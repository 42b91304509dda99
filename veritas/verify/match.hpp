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

#include <veritas/compile/artifacts.hpp>
#include <veritas/compile/cbor_auxdata.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

VERITAS_NAMESPACE_BEGIN

enum class CodeType
{
    Creation,
    Runtime
};

std::string_view to_string(CodeType);

std::optional<CodeType> parse_code_type(std::string_view);

struct Transformation
{
    enum class Type
    {
        Replace,
        Insert
    };

    enum class Reason
    {
        CborAuxdata,
        Library,
        Immutable,
        Constructor
    };

    Type type;
    Reason reason;
    size_t offset;
    size_t length;
    std::string id{};

    friend bool
    operator==(Transformation const &, Transformation const &) = default;
};

/// On chain values substituted by the transformations
struct MatchValues
{
    std::map<std::string, byte_string> cbor_auxdata{};
    std::map<std::string, byte_string> libraries{};
    std::map<std::string, byte_string> immutables{};
    std::optional<byte_string> constructor_arguments{};

    friend bool operator==(MatchValues const &, MatchValues const &) = default;
};

struct Match
{
    bool metadata_match{false};
    std::vector<Transformation> transformations{};
    MatchValues values{};

    /// Matched without substituting anything
    bool is_full() const noexcept
    {
        return transformations.empty();
    }
};

struct SliceMismatch
{
    CodeType code_type;
    size_t expected_size;
    size_t found_size;
    std::optional<size_t> first_mismatch_offset{};
    std::string reason{};
};

using SliceOutcome = std::variant<Match, SliceMismatch>;

/// Turns recompiled code into on chain code by substituting the regions
/// that legitimately differ: metadata blocks, then library addresses, then
/// immutables or constructor arguments. Artifacts pointing outside the
/// recompiled code are `CompileError::Internal`.
class MatchBuilder
{
    byte_string_view on_chain_;
    byte_string compiled_;
    CodeType code_type_;
    std::vector<Transformation> transformations_{};
    MatchValues values_{};
    bool has_cbor_auxdata_{false};
    bool has_cbor_auxdata_transformation_{false};
    std::string failure_{};

    bool in_range(size_t offset, size_t length) const noexcept;

public:
    MatchBuilder(byte_string_view on_chain, byte_string compiled, CodeType);

    Result<void> apply_cbor_auxdata(CborAuxdata const &, Language);

    Result<void> apply_libraries(LinkReferences const &);

    Result<void> apply_immutables(ImmutableReferences const &);

    /// On chain bytes past the recompiled code are constructor arguments and
    /// must decode against the constructor inputs of `abi`
    void apply_constructor(nlohmann::json const &abi);

    SliceOutcome build() const;
};

Result<SliceOutcome> verify_runtime_code(
    byte_string_view on_chain, CodeArtifacts const &, Language);

Result<SliceOutcome> verify_creation_code(
    byte_string_view on_chain, CodeArtifacts const &,
    nlohmann::json const &abi, Language);

nlohmann::json to_json(Transformation const &);
nlohmann::json to_json(MatchValues const &);
nlohmann::json to_json(SliceMismatch const &);

VERITAS_NAMESPACE_END
