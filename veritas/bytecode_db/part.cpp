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

#include <veritas/bytecode_db/part.hpp>

#include <veritas/compile/cbor_auxdata.hpp>
#include <veritas/core/config.hpp>
#include <veritas/verify/metadata.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <vector>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

bool metadata_agrees(byte_string_view const stored, byte_string_view const on_chain)
{
    if (stored.size() < 2 ||
        stored.substr(stored.size() - 2) != on_chain.substr(on_chain.size() - 2)) {
        LOG_DEBUG("metadata length differs");
        return false;
    }
    if (!decode_cbor_auxdata(on_chain).has_value()) {
        LOG_DEBUG("on chain metadata is not cbor");
        return false;
    }
    auto const expected = parse_solc_metadata(stored);
    auto const found = parse_solc_metadata(on_chain);
    if (expected && found && expected->solc && found->solc &&
        *expected->solc != *found->solc) {
        LOG_DEBUG(
            "metadata compiler {} does not match {}",
            *found->solc,
            *expected->solc);
        return false;
    }
    return true;
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

std::string_view to_string(PartType const type)
{
    return type == PartType::Main ? "main" : "metadata";
}

std::vector<BytecodePart> split_parts(
    byte_string_view const code, CborAuxdata const &auxdata,
    Language const language)
{
    std::vector<CborAuxdataValue> blocks;
    for (auto const &[_, value] : auxdata) {
        blocks.push_back(value);
    }
    if (blocks.empty()) {
        for (auto const &[_, value] : find_trailing_auxdata(language, code)) {
            blocks.push_back(value);
        }
    }
    std::ranges::sort(blocks, {}, &CborAuxdataValue::offset);

    std::vector<BytecodePart> parts;
    size_t pos = 0;
    for (auto const &block : blocks) {
        size_t const offset = block.offset;
        size_t const size = block.value.size();
        if (size == 0 || offset < pos || offset > code.size() ||
            code.size() - offset < size) {
            continue;
        }
        if (offset > pos) {
            parts.push_back(BytecodePart{
                .type = PartType::Main,
                .data = byte_string{code.substr(pos, offset - pos)}});
        }
        parts.push_back(BytecodePart{
            .type = PartType::Metadata,
            .data = byte_string{code.substr(offset, size)}});
        pos = offset + size;
    }
    if (pos < code.size()) {
        parts.push_back(BytecodePart{
            .type = PartType::Main, .data = byte_string{code.substr(pos)}});
    }
    return parts;
}

byte_string join_parts(std::vector<BytecodePart> const &parts)
{
    byte_string code;
    for (auto const &part : parts) {
        code += part.data;
    }
    return code;
}

PartsMatch compare_parts(
    std::vector<BytecodePart> const &parts, byte_string_view const on_chain)
{
    auto const local = join_parts(parts);
    if (on_chain.starts_with(byte_string_view{local})) {
        return PartsMatch::Full;
    }
    if (on_chain.size() < local.size()) {
        return PartsMatch::NoMatch;
    }

    size_t pos = 0;
    for (auto const &part : parts) {
        auto const remote = on_chain.substr(pos, part.data.size());
        if (part.type == PartType::Main) {
            if (remote != byte_string_view{part.data}) {
                return PartsMatch::NoMatch;
            }
        }
        else if (!metadata_agrees(part.data, remote)) {
            return PartsMatch::NoMatch;
        }
        pos += part.data.size();
    }
    return PartsMatch::Partial;
}

VERITAS_NAMESPACE_END
