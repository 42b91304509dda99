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

#include <veritas/verify/match.hpp>

#include <veritas/compile/artifacts.hpp>
#include <veritas/compile/cbor_auxdata.hpp>
#include <veritas/compile/compile_error.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/hex.hpp>
#include <veritas/verify/abi.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <variant>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

std::string_view to_string(Transformation::Type const type)
{
    return type == Transformation::Type::Replace ? "replace" : "insert";
}

std::string_view to_string(Transformation::Reason const reason)
{
    switch (reason) {
    case Transformation::Reason::CborAuxdata:
        return "cborAuxdata";
    case Transformation::Reason::Library:
        return "library";
    case Transformation::Reason::Immutable:
        return "immutable";
    case Transformation::Reason::Constructor:
        return "constructor";
    }
    return "unknown";
}

nlohmann::json hex_map(std::map<std::string, byte_string> const &values)
{
    nlohmann::json json = nlohmann::json::object();
    for (auto const &[id, value] : values) {
        json[id] = to_prefixed_hex(value);
    }
    return json;
}

/// Byte identical code is a full match whatever its artifacts say
std::optional<SliceOutcome>
identical(byte_string_view const on_chain, CodeArtifacts const &compiled)
{
    if (on_chain != byte_string_view{compiled.code}) {
        return std::nullopt;
    }
    return SliceOutcome{Match{.metadata_match = !compiled.cbor_auxdata.empty()}};
}

void log_outcome(SliceOutcome const &slice)
{
    if (auto const *const mismatch = std::get_if<SliceMismatch>(&slice)) {
        LOG_DEBUG(
            "{} code does not match: {} (expected {} bytes, found {})",
            to_string(mismatch->code_type),
            mismatch->reason,
            mismatch->expected_size,
            mismatch->found_size);
    }
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

std::string_view to_string(CodeType const code_type)
{
    return code_type == CodeType::Creation ? "creation" : "runtime";
}

std::optional<CodeType> parse_code_type(std::string_view const s)
{
    if (s == "creation") {
        return CodeType::Creation;
    }
    if (s == "runtime") {
        return CodeType::Runtime;
    }
    return std::nullopt;
}

MatchBuilder::MatchBuilder(
    byte_string_view const on_chain, byte_string compiled,
    CodeType const code_type)
    : on_chain_{on_chain}
    , compiled_{std::move(compiled)}
    , code_type_{code_type}
{
    if (on_chain_.size() < compiled_.size()) {
        failure_ = "on chain code is shorter than recompiled code";
    }
}

bool MatchBuilder::in_range(size_t const offset, size_t const length)
    const noexcept
{
    return offset <= compiled_.size() && compiled_.size() - offset >= length;
}

Result<void> MatchBuilder::apply_cbor_auxdata(
    CborAuxdata const &auxdata, Language const language)
{
    if (!failure_.empty()) {
        return outcome::success();
    }
    has_cbor_auxdata_ = !auxdata.empty();
    for (auto const &[id, value] : auxdata) {
        if (!in_range(value.offset, value.value.size())) {
            LOG_WARNING("cbor auxdata {} out of range", id);
            return CompileError::Internal;
        }
        auto const on_chain = on_chain_.substr(value.offset, value.value.size());
        if (on_chain == byte_string_view{value.value}) {
            continue;
        }
        if (!is_cbor_auxdata(language, on_chain)) {
            failure_ = "on chain metadata " + id + " is not valid cbor";
            return outcome::success();
        }
        std::ranges::copy(on_chain, compiled_.begin() + value.offset);
        has_cbor_auxdata_transformation_ = true;
        transformations_.push_back(Transformation{
            .type = Transformation::Type::Replace,
            .reason = Transformation::Reason::CborAuxdata,
            .offset = value.offset,
            .length = value.value.size(),
            .id = id});
        values_.cbor_auxdata.insert_or_assign(id, byte_string{on_chain});
    }
    return outcome::success();
}

Result<void> MatchBuilder::apply_libraries(LinkReferences const &references)
{
    if (!failure_.empty()) {
        return outcome::success();
    }
    for (auto const &[id, ranges] : references) {
        std::optional<byte_string_view> address;
        for (auto const &range : ranges) {
            if (!in_range(range.offset, range.length)) {
                LOG_WARNING("link reference {} out of range", id);
                return CompileError::Internal;
            }
            auto const on_chain = on_chain_.substr(range.offset, range.length);
            if (address && *address != on_chain) {
                failure_ = "inconsistent addresses of library " + id;
                return outcome::success();
            }
            address = on_chain;
            std::ranges::copy(on_chain, compiled_.begin() + range.offset);
            transformations_.push_back(Transformation{
                .type = Transformation::Type::Replace,
                .reason = Transformation::Reason::Library,
                .offset = range.offset,
                .length = range.length,
                .id = id});
            values_.libraries.insert_or_assign(id, byte_string{on_chain});
        }
    }
    return outcome::success();
}

Result<void>
MatchBuilder::apply_immutables(ImmutableReferences const &references)
{
    if (!failure_.empty()) {
        return outcome::success();
    }
    for (auto const &[id, ranges] : references) {
        std::optional<byte_string_view> immutable;
        for (auto const &range : ranges) {
            if (!in_range(range.offset, range.length)) {
                LOG_WARNING("immutable reference {} out of range", id);
                return CompileError::Internal;
            }
            auto const on_chain = on_chain_.substr(range.offset, range.length);
            if (immutable && *immutable != on_chain) {
                failure_ = "inconsistent values of immutable " + id;
                return outcome::success();
            }
            immutable = on_chain;
            std::ranges::copy(on_chain, compiled_.begin() + range.offset);
            transformations_.push_back(Transformation{
                .type = Transformation::Type::Replace,
                .reason = Transformation::Reason::Immutable,
                .offset = range.offset,
                .length = range.length,
                .id = id});
            values_.immutables.insert_or_assign(id, byte_string{on_chain});
        }
    }
    return outcome::success();
}

void MatchBuilder::apply_constructor(nlohmann::json const &abi)
{
    if (!failure_.empty()) {
        return;
    }
    size_t const offset = compiled_.size();
    auto const arguments = on_chain_.substr(offset);

    auto const inputs = constructor_inputs(abi);
    if (inputs.has_error()) {
        failure_ = std::string{"cannot read constructor: "} +
                   inputs.error().message().c_str();
        return;
    }
    if (!inputs.value().has_value() || inputs.value()->empty()) {
        if (!arguments.empty()) {
            failure_ = "constructor takes no arguments";
        }
        return;
    }
    auto const valid = validate_abi_encoding(*inputs.value(), arguments);
    if (valid.has_error()) {
        failure_ = std::string{"invalid constructor arguments: "} +
                   valid.error().message().c_str();
        return;
    }
    compiled_.append(arguments);
    transformations_.push_back(Transformation{
        .type = Transformation::Type::Insert,
        .reason = Transformation::Reason::Constructor,
        .offset = offset,
        .length = arguments.size()});
    values_.constructor_arguments = byte_string{arguments};
}

SliceOutcome MatchBuilder::build() const
{
    SliceMismatch mismatch{
        .code_type = code_type_,
        .expected_size = compiled_.size(),
        .found_size = on_chain_.size(),
        .reason = failure_};
    if (!failure_.empty()) {
        return mismatch;
    }
    if (on_chain_ == byte_string_view{compiled_}) {
        return Match{
            .metadata_match =
                has_cbor_auxdata_ && !has_cbor_auxdata_transformation_,
            .transformations = transformations_,
            .values = values_};
    }

    size_t const common = std::min(on_chain_.size(), compiled_.size());
    size_t offset = 0;
    while (offset < common && on_chain_[offset] == compiled_[offset]) {
        ++offset;
    }
    mismatch.first_mismatch_offset = offset;
    mismatch.reason = on_chain_.size() == compiled_.size()
                          ? "bytecode differs"
                          : "bytecode size differs";
    return mismatch;
}

Result<SliceOutcome> verify_runtime_code(
    byte_string_view const on_chain, CodeArtifacts const &compiled,
    Language const language)
{
    if (compiled.code.empty()) {
        return SliceOutcome{SliceMismatch{
            .code_type = CodeType::Runtime,
            .expected_size = 0,
            .found_size = on_chain.size(),
            .reason = "no recompiled code"}};
    }
    if (auto exact = identical(on_chain, compiled)) {
        return std::move(*exact);
    }
    MatchBuilder builder{on_chain, compiled.code, CodeType::Runtime};
    BOOST_OUTCOME_TRY(builder.apply_cbor_auxdata(compiled.cbor_auxdata, language));
    BOOST_OUTCOME_TRY(builder.apply_libraries(compiled.link_references));
    BOOST_OUTCOME_TRY(builder.apply_immutables(compiled.immutable_references));
    auto slice = builder.build();
    log_outcome(slice);
    return slice;
}

Result<SliceOutcome> verify_creation_code(
    byte_string_view const on_chain, CodeArtifacts const &compiled,
    nlohmann::json const &abi, Language const language)
{
    if (compiled.code.empty()) {
        return SliceOutcome{SliceMismatch{
            .code_type = CodeType::Creation,
            .expected_size = 0,
            .found_size = on_chain.size(),
            .reason = "no recompiled code"}};
    }
    if (auto exact = identical(on_chain, compiled)) {
        return std::move(*exact);
    }
    MatchBuilder builder{on_chain, compiled.code, CodeType::Creation};
    BOOST_OUTCOME_TRY(builder.apply_cbor_auxdata(compiled.cbor_auxdata, language));
    BOOST_OUTCOME_TRY(builder.apply_libraries(compiled.link_references));
    builder.apply_constructor(abi);
    auto slice = builder.build();
    log_outcome(slice);
    return slice;
}

nlohmann::json to_json(Transformation const &transformation)
{
    nlohmann::json json = {
        {"type", to_string(transformation.type)},
        {"reason", to_string(transformation.reason)},
        {"offset", transformation.offset},
        {"length", transformation.length}};
    if (!transformation.id.empty()) {
        json["id"] = transformation.id;
    }
    return json;
}

nlohmann::json to_json(MatchValues const &values)
{
    nlohmann::json json = nlohmann::json::object();
    if (!values.cbor_auxdata.empty()) {
        json["cborAuxdata"] = hex_map(values.cbor_auxdata);
    }
    if (!values.libraries.empty()) {
        json["libraries"] = hex_map(values.libraries);
    }
    if (!values.immutables.empty()) {
        json["immutables"] = hex_map(values.immutables);
    }
    if (values.constructor_arguments) {
        json["constructorArguments"] =
            to_prefixed_hex(*values.constructor_arguments);
    }
    return json;
}

nlohmann::json to_json(SliceMismatch const &mismatch)
{
    nlohmann::json json = {
        {"codeType", to_string(mismatch.code_type)},
        {"expectedSize", mismatch.expected_size},
        {"foundSize", mismatch.found_size},
        {"reason", mismatch.reason}};
    if (mismatch.first_mismatch_offset) {
        json["firstMismatchOffset"] = *mismatch.first_mismatch_offset;
    }
    return json;
}

VERITAS_NAMESPACE_END
