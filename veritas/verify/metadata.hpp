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

#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>

#include <optional>
#include <string>

VERITAS_NAMESPACE_BEGIN

/// Contents of the CBOR block solc appends to code
struct SolcMetadata
{
    /// `0.8.14` for releases, the full string for prereleases
    std::optional<std::string> solc{};
    std::optional<byte_string> ipfs{};
    std::optional<byte_string> bzzr0{};
    std::optional<byte_string> bzzr1{};
    bool experimental{false};
};

/// `value` is a metadata block including its length trailer
std::optional<SolcMetadata> parse_solc_metadata(byte_string_view value);

VERITAS_NAMESPACE_END
