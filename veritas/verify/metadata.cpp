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

#include <veritas/verify/metadata.hpp>

#include <veritas/compile/cbor_auxdata.hpp>
#include <veritas/core/config.hpp>

#include <nlohmann/json.hpp>

#include <string>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

std::optional<byte_string>
binary_field(nlohmann::json const &json, char const *const key)
{
    if (!json.contains(key) || !json[key].is_binary()) {
        return std::nullopt;
    }
    auto const &binary = json[key].get_binary();
    return byte_string{binary.data(), binary.size()};
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

std::optional<SolcMetadata> parse_solc_metadata(byte_string_view const value)
{
    auto const json = decode_cbor_auxdata(value);
    if (!json || !json->is_object()) {
        return std::nullopt;
    }

    SolcMetadata metadata{
        .ipfs = binary_field(*json, "ipfs"),
        .bzzr0 = binary_field(*json, "bzzr0"),
        .bzzr1 = binary_field(*json, "bzzr1"),
        .experimental = json->contains("experimental") &&
                        (*json)["experimental"].is_boolean() &&
                        (*json)["experimental"].get<bool>()};
    if (json->contains("solc")) {
        auto const &solc = (*json)["solc"];
        if (solc.is_binary() && solc.get_binary().size() == 3) {
            auto const &v = solc.get_binary();
            metadata.solc = std::to_string(v[0]) + "." + std::to_string(v[1]) +
                            "." + std::to_string(v[2]);
        }
        else if (solc.is_string()) {
            metadata.solc = solc.get<std::string>();
        }
        else {
            return std::nullopt;
        }
    }
    return metadata;
}

VERITAS_NAMESPACE_END
