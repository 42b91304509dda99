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

#include <veritas/compile/cbor_auxdata.hpp>

#include <veritas/compile/compile_error.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/hex.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

size_t read_length(byte_string_view const code, size_t const offset)
{
    return static_cast<size_t>(code[offset]) << 8 | code[offset + 1];
}

// solc encodes the CBOR length, vyper the CBOR length plus the trailer
size_t encoded_length(Language const language, size_t const cbor_size)
{
    return language == Language::Vyper ? cbor_size + 2 : cbor_size;
}

bool decodes(Language const language, byte_string_view const cbor)
{
    auto const json =
        nlohmann::json::from_cbor(cbor.begin(), cbor.end(), true, false);
    if (json.is_discarded()) {
        return false;
    }
    return json.is_object() || (language == Language::Vyper && json.is_array());
}

/// Size of the CBOR item starting at `start` whose trailer is consistent
std::optional<size_t> auxdata_at(
    Language const language, byte_string_view const code, size_t const start)
{
    size_t const max_size = std::min<size_t>(
        code.size() - start, std::numeric_limits<uint16_t>::max());
    for (size_t size = 1; size + 2 <= max_size; ++size) {
        if (read_length(code, start + size) !=
            encoded_length(language, size)) {
            continue;
        }
        if (decodes(language, code.substr(start, size))) {
            return size;
        }
    }
    return std::nullopt;
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

Result<CborAuxdata> find_cbor_auxdata(
    Language const language, byte_string_view const code,
    byte_string_view const modified_code)
{
    if (code.size() != modified_code.size()) {
        LOG_WARNING(
            "modified code length {} differs from {}",
            modified_code.size(),
            code.size());
        return CompileError::Internal;
    }

    CborAuxdata auxdata;
    size_t processed = 0;
    while (true) {
        size_t mismatch = processed;
        while (mismatch < code.size() &&
               code[mismatch] == modified_code[mismatch]) {
            ++mismatch;
        }
        if (mismatch == code.size()) {
            return auxdata;
        }

        std::optional<size_t> size;
        size_t start = mismatch;
        for (;;) {
            size = auxdata_at(language, code, start);
            if (size.has_value() || start == processed) {
                break;
            }
            --start;
        }
        if (!size.has_value()) {
            LOG_WARNING(
                "no cbor auxdata around code difference at {}", mismatch);
            return CompileError::Internal;
        }

        auto const key = std::to_string(auxdata.size() + 1);
        auxdata.emplace(
            key,
            CborAuxdataValue{
                .offset = static_cast<uint32_t>(start),
                .value = byte_string{code.substr(start, *size + 2)}});
        processed = start + *size + 2;
    }
}

CborAuxdata
find_trailing_auxdata(Language const language, byte_string_view const code)
{
    if (code.size() < 2) {
        return {};
    }
    size_t const length = read_length(code, code.size() - 2);
    size_t const block = language == Language::Vyper ? length : length + 2;
    if (block <= 2 || block > code.size()) {
        return {};
    }
    auto const value = code.substr(code.size() - block);
    if (!is_cbor_auxdata(language, value)) {
        return {};
    }
    return {
        {"1",
         CborAuxdataValue{
             .offset = static_cast<uint32_t>(code.size() - block),
             .value = byte_string{value}}}};
}

bool is_cbor_auxdata(Language const language, byte_string_view const value)
{
    if (value.size() < 3) {
        return false;
    }
    size_t const cbor_size = value.size() - 2;
    return read_length(value, cbor_size) ==
               encoded_length(language, cbor_size) &&
           decodes(language, value.substr(0, cbor_size));
}

std::optional<nlohmann::json>
decode_cbor_auxdata(byte_string_view const value)
{
    if (value.size() < 3) {
        return std::nullopt;
    }
    auto const cbor = value.substr(0, value.size() - 2);
    auto json = nlohmann::json::from_cbor(cbor.begin(), cbor.end(), true, false);
    if (json.is_discarded()) {
        return std::nullopt;
    }
    return json;
}

nlohmann::json to_json(CborAuxdata const &auxdata)
{
    nlohmann::json json = nlohmann::json::object();
    for (auto const &[key, value] : auxdata) {
        json[key] = {
            {"offset", value.offset}, {"value", to_prefixed_hex(value.value)}};
    }
    return json;
}

VERITAS_NAMESPACE_END
