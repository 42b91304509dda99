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
#include <veritas/verify/match.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

VERITAS_NAMESPACE_BEGIN

struct OnChainCode
{
    std::optional<byte_string> creation{};
    std::optional<byte_string> runtime{};
};

enum class VerificationResult : uint8_t
{
    Failure,
    RuntimeMatch,
    CreationMatch,
    CompleteMatch
};

std::string_view to_string(VerificationResult);

struct VerificationOutcome
{
    VerificationResult result{VerificationResult::Failure};
    std::optional<Match> creation_match{};
    std::optional<Match> runtime_match{};
    std::vector<SliceMismatch> mismatches{};

    bool matched() const noexcept
    {
        return result != VerificationResult::Failure;
    }

    /// Every matched slice matched without transformations
    bool is_full() const noexcept;
};

/// Compares on chain code of a contract against its recompiled artifacts.
/// At least one of the on chain slices must be present.
Result<VerificationOutcome>
verify_contract(OnChainCode const &, ContractArtifacts const &, Language);

nlohmann::json to_json(VerificationOutcome const &);

VERITAS_NAMESPACE_END
