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

#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>
#include <veritas/verify/verify_contract.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

VERITAS_NAMESPACE_BEGIN

struct VerificationRequest
{
    std::map<std::string, std::string> source_files{};
    nlohmann::json settings{nlohmann::json::object()};
    /// Vyper interface files, as in standard JSON input
    nlohmann::json interfaces{nlohmann::json::object()};
    std::string compiler_version{};
    Language language{Language::Solidity};
    std::optional<byte_string> on_chain_creation_code{};
    std::optional<byte_string> on_chain_runtime_code{};
    std::optional<std::string> chain_id{};
    std::optional<std::string> contract_address{};
    bool is_blueprint{false};

    OnChainCode on_chain_code() const
    {
        return OnChainCode{
            .creation = on_chain_creation_code,
            .runtime = on_chain_runtime_code};
    }
};

/// Reads the json form of a request; malformed requests are
/// `CompileError::InvalidInput`
Result<VerificationRequest> parse_verification_request(nlohmann::json const &);

enum class VerificationStatus : uint8_t
{
    Success,
    Failure
};

enum class MatchType : uint8_t
{
    Full,
    Partial
};

std::string_view to_string(VerificationStatus);
std::string_view to_string(MatchType);

struct VerificationResponse
{
    VerificationStatus status{VerificationStatus::Failure};
    std::optional<MatchType> match_type{};
    VerificationResult result{VerificationResult::Failure};
    std::optional<std::string> contract_name{};
    std::optional<std::string> file_name{};
    std::optional<std::string> compiler_version{};
    /// Set when the verified contract was stored
    std::optional<int64_t> contract_id{};
    nlohmann::json artifacts{};
    nlohmann::json transformations{};
    nlohmann::json mismatches{nlohmann::json::array()};
    std::vector<std::string> errors{};
};

VerificationResponse failed_response(std::string error);

nlohmann::json to_json(VerificationResponse const &);

VERITAS_NAMESPACE_END
