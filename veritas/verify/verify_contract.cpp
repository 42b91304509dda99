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

#include <veritas/verify/verify_contract.hpp>

#include <veritas/compile/artifacts.hpp>
#include <veritas/core/assert.h>
#include <veritas/core/config.hpp>
#include <veritas/verify/match.hpp>
#include <veritas/verify/verification_result_fmt.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <optional>
#include <utility>
#include <variant>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

nlohmann::json to_json(Match const &match)
{
    nlohmann::json transformations = nlohmann::json::array();
    for (auto const &transformation : match.transformations) {
        transformations.push_back(to_json(transformation));
    }
    return {
        {"matchType", match.is_full() ? "full" : "partial"},
        {"metadataMatch", match.metadata_match},
        {"transformations", std::move(transformations)},
        {"values", to_json(match.values)}};
}

/// Moves a slice outcome into either the match slot or the mismatch list
void record(
    SliceOutcome &&outcome, std::optional<Match> &match,
    std::vector<SliceMismatch> &mismatches)
{
    if (auto *const m = std::get_if<Match>(&outcome)) {
        match = std::move(*m);
    }
    else {
        mismatches.push_back(std::get<SliceMismatch>(std::move(outcome)));
    }
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

std::string_view to_string(VerificationResult const result)
{
    switch (result) {
    case VerificationResult::Failure:
        return "failure";
    case VerificationResult::RuntimeMatch:
        return "runtime_match";
    case VerificationResult::CreationMatch:
        return "creation_match";
    case VerificationResult::CompleteMatch:
        return "complete_match";
    }
    return "unknown";
}

bool VerificationOutcome::is_full() const noexcept
{
    if (!matched()) {
        return false;
    }
    return (!creation_match || creation_match->is_full()) &&
           (!runtime_match || runtime_match->is_full());
}

Result<VerificationOutcome> verify_contract(
    OnChainCode const &on_chain, ContractArtifacts const &compiled,
    Language const language)
{
    VERITAS_ASSERT(on_chain.creation.has_value() || on_chain.runtime.has_value());

    VerificationOutcome outcome;
    if (on_chain.runtime) {
        auto res = verify_runtime_code(*on_chain.runtime, compiled.runtime, language);
        if (res.has_error()) {
            return std::move(res).assume_error();
        }
        record(std::move(res).value(), outcome.runtime_match, outcome.mismatches);
    }
    if (on_chain.creation) {
        auto res = verify_creation_code(
            *on_chain.creation, compiled.creation, compiled.abi, language);
        if (res.has_error()) {
            return std::move(res).assume_error();
        }
        record(std::move(res).value(), outcome.creation_match, outcome.mismatches);
    }

    if (outcome.creation_match && outcome.runtime_match) {
        outcome.result = VerificationResult::CompleteMatch;
    }
    else if (outcome.creation_match) {
        outcome.result = VerificationResult::CreationMatch;
    }
    else if (outcome.runtime_match) {
        outcome.result = VerificationResult::RuntimeMatch;
    }
    LOG_DEBUG(
        "{} verified as {}",
        compiled.fully_qualified_name(),
        outcome.result);
    return outcome;
}

nlohmann::json to_json(VerificationOutcome const &outcome)
{
    nlohmann::json json = {{"result", to_string(outcome.result)}};
    if (outcome.creation_match) {
        json["creationMatch"] = to_json(*outcome.creation_match);
    }
    if (outcome.runtime_match) {
        json["runtimeMatch"] = to_json(*outcome.runtime_match);
    }
    if (!outcome.mismatches.empty()) {
        nlohmann::json mismatches = nlohmann::json::array();
        for (auto const &mismatch : outcome.mismatches) {
            mismatches.push_back(to_json(mismatch));
        }
        json["mismatches"] = std::move(mismatches);
    }
    return json;
}

VERITAS_NAMESPACE_END
