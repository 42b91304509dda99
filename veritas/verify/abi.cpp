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

#include <veritas/verify/abi.hpp>

#include <veritas/core/config.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <utility>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

constexpr size_t WORD = 32;

std::optional<size_t> parse_size(std::string_view const s)
{
    if (s.empty()) {
        return std::nullopt;
    }
    size_t value = 0;
    auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<size_t> integer_bits(std::string_view const suffix)
{
    if (suffix.empty()) {
        return 256;
    }
    auto const bits = parse_size(suffix);
    if (!bits || *bits == 0 || *bits > 256 || *bits % 8 != 0) {
        return std::nullopt;
    }
    return bits;
}

/// `fixedMxN` keeps its value in an M bit integer
std::optional<size_t> fixed_bits(std::string_view const suffix)
{
    if (suffix.empty()) {
        return 128;
    }
    auto const x = suffix.find('x');
    if (x == std::string_view::npos) {
        return std::nullopt;
    }
    auto const decimals = parse_size(suffix.substr(x + 1));
    if (!decimals || *decimals == 0 || *decimals > 80) {
        return std::nullopt;
    }
    return integer_bits(suffix.substr(0, x));
}

/// Checks the encoded values and tracks how far they reach
class Validator
{
    byte_string_view data_;
    size_t end_{0};

    Result<byte_string_view> word(size_t const at)
    {
        if (at > data_.size() || data_.size() - at < WORD) {
            return AbiError::Truncated;
        }
        end_ = std::max(end_, at + WORD);
        return data_.substr(at, WORD);
    }

    /// A word used as an offset or length must fit the data
    Result<size_t> size_word(size_t const at)
    {
        auto w = word(at);
        if (w.has_error()) {
            return std::move(w).assume_error();
        }
        auto const bytes = w.value();
        if (!std::all_of(
                bytes.begin(), bytes.end() - 8, [](auto b) { return b == 0; })) {
            return AbiError::InvalidOffset;
        }
        uint64_t value = 0;
        for (size_t i = WORD - 8; i < WORD; ++i) {
            value = value << 8 | bytes[i];
        }
        if (value > data_.size()) {
            return AbiError::InvalidOffset;
        }
        return static_cast<size_t>(value);
    }

    Result<void> sequence(std::vector<AbiType> const &types, size_t const base)
    {
        size_t head = base;
        for (auto const &type : types) {
            if (type.is_dynamic()) {
                auto offset = size_word(head);
                if (offset.has_error()) {
                    return std::move(offset).assume_error();
                }
                BOOST_OUTCOME_TRY(check_value(type, base + offset.value()));
            }
            else {
                BOOST_OUTCOME_TRY(check_value(type, head));
            }
            head += type.head_size();
        }
        return outcome::success();
    }

    Result<void> repeated(AbiType const &element, size_t const count, size_t const at)
    {
        size_t const head = element.head_size();
        size_t const available = data_.size() - std::min(at, data_.size());
        if (head == 0 ? count > data_.size() : count > available / head) {
            return AbiError::Truncated;
        }
        std::vector<AbiType> const types(count, element);
        return sequence(types, at);
    }

    Result<void> check_value(AbiType const &type, size_t const at)
    {
        using Kind = AbiType::Kind;
        switch (type.kind) {
        case Kind::Uint:
        case Kind::Address:
        case Kind::Bool:
        case Kind::Int:
        case Kind::FixedBytes:
        case Kind::Function:
            return static_value(type, at);
        case Kind::Bytes:
        case Kind::String: {
            auto length = size_word(at);
            if (length.has_error()) {
                return std::move(length).assume_error();
            }
            size_t const padded = (length.value() + WORD - 1) / WORD * WORD;
            size_t const begin = at + WORD;
            if (begin > data_.size() || data_.size() - begin < padded) {
                return AbiError::Truncated;
            }
            auto const padding =
                data_.substr(begin + length.value(), padded - length.value());
            if (!std::all_of(padding.begin(), padding.end(), [](auto b) {
                    return b == 0;
                })) {
                return AbiError::InvalidPadding;
            }
            end_ = std::max(end_, begin + padded);
            return outcome::success();
        }
        case Kind::Array: {
            auto length = size_word(at);
            if (length.has_error()) {
                return std::move(length).assume_error();
            }
            return repeated(type.children.front(), length.value(), at + WORD);
        }
        case Kind::FixedArray:
            return repeated(type.children.front(), type.size, at);
        case Kind::Tuple:
            return sequence(type.children, at);
        }
        return AbiError::InvalidType;
    }

    Result<void> static_value(AbiType const &type, size_t const at)
    {
        using Kind = AbiType::Kind;
        auto w = word(at);
        if (w.has_error()) {
            return std::move(w).assume_error();
        }
        auto const bytes = w.value();
        auto const zero = [](auto const b) { return b == 0; };
        switch (type.kind) {
        case Kind::Uint:
        case Kind::Address: {
            size_t const width = type.kind == Kind::Address ? 20 : type.size / 8;
            if (!std::all_of(bytes.begin(), bytes.end() - width, zero)) {
                return AbiError::InvalidPadding;
            }
            break;
        }
        case Kind::Int: {
            size_t const width = type.size / 8;
            unsigned char const fill = (bytes[WORD - width] & 0x80) ? 0xff : 0;
            if (!std::all_of(bytes.begin(), bytes.end() - width, [&](auto b) {
                    return b == fill;
                })) {
                return AbiError::InvalidPadding;
            }
            break;
        }
        case Kind::Bool:
            if (!std::all_of(bytes.begin(), bytes.end() - 1, zero)) {
                return AbiError::InvalidPadding;
            }
            if (bytes.back() > 1) {
                return AbiError::InvalidBool;
            }
            break;
        case Kind::FixedBytes:
        case Kind::Function: {
            size_t const width = type.kind == Kind::Function ? 24 : type.size;
            if (!std::all_of(bytes.begin() + width, bytes.end(), zero)) {
                return AbiError::InvalidPadding;
            }
            break;
        }
        default:
            return AbiError::InvalidType;
        }
        return outcome::success();
    }

public:
    explicit Validator(byte_string_view const data)
        : data_{data}
    {
    }

    Result<void> run(std::vector<AbiType> const &types)
    {
        BOOST_OUTCOME_TRY(sequence(types, 0));
        if (end_ != data_.size()) {
            return AbiError::TrailingData;
        }
        return outcome::success();
    }
};

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

bool AbiType::is_dynamic() const
{
    switch (kind) {
    case Kind::Bytes:
    case Kind::String:
    case Kind::Array:
        return true;
    case Kind::FixedArray:
        return children.front().is_dynamic();
    case Kind::Tuple:
        return std::ranges::any_of(children, &AbiType::is_dynamic);
    default:
        return false;
    }
}

size_t AbiType::head_size() const
{
    if (is_dynamic()) {
        return WORD;
    }
    switch (kind) {
    case Kind::FixedArray:
        return size * children.front().head_size();
    case Kind::Tuple: {
        size_t total = 0;
        for (auto const &child : children) {
            total += child.head_size();
        }
        return total;
    }
    default:
        return WORD;
    }
}

Result<AbiType>
parse_abi_type(std::string_view const type, nlohmann::json const &components)
{
    using Kind = AbiType::Kind;

    if (type.ends_with(']')) {
        auto const open = type.rfind('[');
        if (open == std::string_view::npos) {
            return AbiError::InvalidType;
        }
        auto element = parse_abi_type(type.substr(0, open), components);
        if (element.has_error()) {
            return std::move(element).assume_error();
        }
        auto const dimension = type.substr(open + 1, type.size() - open - 2);
        if (dimension.empty()) {
            return AbiType{
                .kind = Kind::Array, .children = {std::move(element).value()}};
        }
        auto const length = parse_size(dimension);
        if (!length || *length == 0) {
            return AbiError::InvalidType;
        }
        return AbiType{
            .kind = Kind::FixedArray,
            .size = *length,
            .children = {std::move(element).value()}};
    }

    if (type == "tuple") {
        if (!components.is_array()) {
            return AbiError::InvalidType;
        }
        AbiType tuple{.kind = Kind::Tuple};
        for (auto const &component : components) {
            if (!component.is_object() || !component.contains("type") ||
                !component["type"].is_string()) {
                return AbiError::InvalidAbi;
            }
            auto child = parse_abi_type(
                component["type"].get_ref<std::string const &>(),
                component.value("components", nlohmann::json{}));
            if (child.has_error()) {
                return std::move(child).assume_error();
            }
            tuple.children.push_back(std::move(child).value());
        }
        return tuple;
    }
    if (type == "address") {
        return AbiType{.kind = Kind::Address};
    }
    if (type == "bool") {
        return AbiType{.kind = Kind::Bool};
    }
    if (type == "string") {
        return AbiType{.kind = Kind::String};
    }
    if (type == "bytes") {
        return AbiType{.kind = Kind::Bytes};
    }
    if (type == "function") {
        return AbiType{.kind = Kind::Function};
    }
    if (type.starts_with("bytes")) {
        auto const size = parse_size(type.substr(5));
        if (!size || *size == 0 || *size > 32) {
            return AbiError::InvalidType;
        }
        return AbiType{.kind = Kind::FixedBytes, .size = *size};
    }

    std::optional<size_t> bits;
    Kind kind = Kind::Uint;
    if (type.starts_with("uint")) {
        bits = integer_bits(type.substr(4));
    }
    else if (type.starts_with("int")) {
        kind = Kind::Int;
        bits = integer_bits(type.substr(3));
    }
    else if (type.starts_with("ufixed")) {
        bits = fixed_bits(type.substr(6));
    }
    else if (type.starts_with("fixed")) {
        kind = Kind::Int;
        bits = fixed_bits(type.substr(5));
    }
    if (!bits) {
        return AbiError::InvalidType;
    }
    return AbiType{.kind = kind, .size = *bits};
}

Result<std::optional<std::vector<AbiType>>>
constructor_inputs(nlohmann::json const &abi)
{
    if (abi.is_null()) {
        return std::nullopt;
    }
    if (!abi.is_array()) {
        return AbiError::InvalidAbi;
    }
    for (auto const &entry : abi) {
        if (!entry.is_object() || !entry.contains("type") ||
            entry["type"] != "constructor") {
            continue;
        }
        std::vector<AbiType> inputs;
        if (!entry.contains("inputs")) {
            return std::make_optional(std::move(inputs));
        }
        if (!entry["inputs"].is_array()) {
            return AbiError::InvalidAbi;
        }
        for (auto const &input : entry["inputs"]) {
            if (!input.is_object() || !input.contains("type") ||
                !input["type"].is_string()) {
                return AbiError::InvalidAbi;
            }
            auto type = parse_abi_type(
                input["type"].get_ref<std::string const &>(),
                input.value("components", nlohmann::json{}));
            if (type.has_error()) {
                return std::move(type).assume_error();
            }
            inputs.push_back(std::move(type).value());
        }
        return std::make_optional(std::move(inputs));
    }
    return std::nullopt;
}

Result<void> validate_abi_encoding(
    std::vector<AbiType> const &types, byte_string_view const data)
{
    return Validator{data}.run(types);
}

VERITAS_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<veritas::AbiError>::mapping> const &
quick_status_code_from_enum<veritas::AbiError>::value_mappings()
{
    using veritas::AbiError;

    static std::initializer_list<mapping> const v = {
        {AbiError::Success, "success", {errc::success}},
        {AbiError::InvalidAbi, "invalid abi", {}},
        {AbiError::InvalidType, "invalid abi type", {}},
        {AbiError::Truncated, "abi data too short", {}},
        {AbiError::InvalidOffset, "abi offset out of range", {}},
        {AbiError::InvalidPadding, "abi value not clean", {}},
        {AbiError::InvalidBool, "abi bool not 0 or 1", {}},
        {AbiError::TrailingData, "data after abi encoded values", {}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
