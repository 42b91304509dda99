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
#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>
#include <veritas/verify/verify_contract.hpp>

#include <cstdint>
#include <optional>

VERITAS_NAMESPACE_BEGIN

/// ERC-5202 blueprint container: FE 71 <version:6 bits|length bytes:2 bits>
/// [preamble length] [preamble] initcode
struct Blueprint
{
    uint8_t version;
    byte_string_view preamble;
    byte_string_view initcode;
};

std::optional<Blueprint> parse_blueprint(byte_string_view code);

/// Strips the vyper blueprint deployer
/// `61 <length:2> 3d 81 60 0a 3d 39 f3` when present
byte_string_view strip_blueprint_deployer(byte_string_view creation);

/// Blueprint carried by creation code, with or without the deployer
std::optional<Blueprint> parse_blueprint_creation(byte_string_view creation);

bool is_blueprint(OnChainCode const &);

/// Compares only the initcode inside the blueprint container; runtime code
/// is not checked and constructor arguments are not allowed
Result<VerificationOutcome> verify_blueprint(
    byte_string_view on_chain_creation, ContractArtifacts const &, Language);

VERITAS_NAMESPACE_END
