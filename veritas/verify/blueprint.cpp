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

#include <veritas/verify/blueprint.hpp>

#include <veritas/compile/artifacts.hpp>
#include <veritas/compile/cbor_auxdata.hpp>
#include <veritas/core/config.hpp>
#include <veritas/verify/match.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint8_t EIP_5202_MAGIC_0 = 0xfe;
constexpr uint8_t EIP_5202_MAGIC_1 = 0x71;

constexpr size_t DEPLOYER_SIZE = 10;

/// Shifts artifact offsets of `code` into a window starting at `start`,
/// dropping references outside of it
CodeArtifacts
window(CodeArtifacts const &code, size_t const start, byte_string_view initcode)
{
    CodeArtifacts result;
    result.code = byte_string{initcode};
    result.source_map = code.source_map;
    auto const inside = [&](size_t const offset, size_t const length) {
        return offset >= start && offset - start + length <= initcode.size();
    };
    for (auto const &[id, value] : code.cbor_auxdata) {
        if (inside(value.offset, value.value.size())) {
            result.cbor_auxdata.emplace(
                id,
                CborAuxdataValue{
                    .offset = static_cast<uint32_t>(value.offset - start),
                    .value = value.value});
        }
    }
    for (auto const &[id, ranges] : code.link_references) {
        for (auto const &range : ranges) {
            if (inside(range.offset, range.length)) {
                result.link_references[id].push_back(CodeRange{
                    .offset = static_cast<uint32_t>(range.offset - start),
                    .length = range.length});
            }
        }
    }
    return result;
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

std::optional<Blueprint> parse_blueprint(byte_string_view const code)
{
    if (code.size() < 3 || code[0] != EIP_5202_MAGIC_0 ||
        code[1] != EIP_5202_MAGIC_1) {
        return std::nullopt;
    }
    uint8_t const version = code[2] >> 2;
    uint8_t const length_size = code[2] & 0x03;
    if (length_size == 0x03) {
        return std::nullopt;
    }
    size_t pos = 3;
    if (code.size() < pos + length_size) {
        return std::nullopt;
    }
    size_t preamble_size = 0;
    for (uint8_t i = 0; i < length_size; ++i) {
        preamble_size = (preamble_size << 8) | code[pos++];
    }
    if (code.size() - pos < preamble_size) {
        return std::nullopt;
    }
    return Blueprint{
        .version = version,
        .preamble = code.substr(pos, preamble_size),
        .initcode = code.substr(pos + preamble_size)};
}

byte_string_view strip_blueprint_deployer(byte_string_view const creation)
{
    if (creation.size() < DEPLOYER_SIZE || creation[0] != 0x61 ||
        creation[3] != 0x3d || creation[4] != 0x81 || creation[5] != 0x60 ||
        creation[6] != 0x0a || creation[7] != 0x3d || creation[8] != 0x39 ||
        creation[9] != 0xf3) {
        return creation;
    }
    size_t const length =
        static_cast<size_t>(creation[1]) << 8 | static_cast<size_t>(creation[2]);
    if (creation.size() - DEPLOYER_SIZE < length) {
        return creation;
    }
    return creation.substr(DEPLOYER_SIZE, length);
}

std::optional<Blueprint> parse_blueprint_creation(byte_string_view const creation)
{
    return parse_blueprint(strip_blueprint_deployer(creation));
}

bool is_blueprint(OnChainCode const &on_chain)
{
    if (on_chain.runtime && parse_blueprint(*on_chain.runtime)) {
        return true;
    }
    if (on_chain.creation) {
        auto const stripped = strip_blueprint_deployer(*on_chain.creation);
        return stripped.size() != on_chain.creation->size() &&
               parse_blueprint(stripped).has_value();
    }
    return false;
}

Result<VerificationOutcome> verify_blueprint(
    byte_string_view const on_chain_creation,
    ContractArtifacts const &compiled, Language const language)
{
    VerificationOutcome outcome;
    auto const on_chain = parse_blueprint_creation(on_chain_creation);
    if (!on_chain) {
        outcome.mismatches.push_back(SliceMismatch{
            .code_type = CodeType::Creation,
            .expected_size = compiled.creation.code.size(),
            .found_size = on_chain_creation.size(),
            .reason = "on chain code is not a blueprint"});
        return outcome;
    }

    // compiled creation code is the plain initcode unless the compiler was
    // asked for the blueprint form
    byte_string_view const compiled_code{compiled.creation.code};
    auto const compiled_blueprint = parse_blueprint_creation(compiled_code);
    auto const initcode =
        compiled_blueprint ? compiled_blueprint->initcode : compiled_code;
    auto const artifacts = window(
        compiled.creation,
        static_cast<size_t>(initcode.data() - compiled_code.data()),
        initcode);

    MatchBuilder builder{on_chain->initcode, artifacts.code, CodeType::Creation};
    BOOST_OUTCOME_TRY(builder.apply_cbor_auxdata(artifacts.cbor_auxdata, language));
    BOOST_OUTCOME_TRY(builder.apply_libraries(artifacts.link_references));
    auto slice = builder.build();
    if (auto *const match = std::get_if<Match>(&slice)) {
        outcome.result = VerificationResult::CreationMatch;
        outcome.creation_match = std::move(*match);
    }
    else {
        auto &mismatch = std::get<SliceMismatch>(slice);
        LOG_DEBUG(
            "blueprint {} does not match: {}",
            compiled.fully_qualified_name(),
            mismatch.reason);
        outcome.mismatches.push_back(std::move(mismatch));
    }
    return outcome;
}

VERITAS_NAMESPACE_END
