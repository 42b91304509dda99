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

#include <veritas/verification/verifier.hpp>

#include <veritas/bytecode_db/bytecode_store.hpp>
#include <veritas/bytecode_db/part.hpp>
#include <veritas/compile/artifacts.hpp>
#include <veritas/compile/compilation.hpp>
#include <veritas/compile/compile_error.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/compiler/version.hpp>
#include <veritas/compiler/version_fmt.hpp>
#include <veritas/core/assert.h>
#include <veritas/core/config.hpp>
#include <veritas/core/fmt.hpp>
#include <veritas/verification/request.hpp>
#include <veritas/verify/blueprint.hpp>
#include <veritas/verify/verification_result_fmt.hpp>
#include <veritas/verify/verify_contract.hpp>

#include <boost/fiber/future/promise.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <exception>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

struct Candidate
{
    ContractArtifacts const *artifacts;
    VerificationOutcome outcome;
};

auto rank(VerificationOutcome const &outcome)
{
    return std::make_tuple(
        outcome.matched(),
        outcome.result == VerificationResult::CompleteMatch,
        outcome.matched() && outcome.is_full());
}

std::string compiler_name(Language const language)
{
    return language == Language::Vyper ? "vyper" : "solc";
}

std::string describe(std::string const &contract, SliceMismatch const &mismatch)
{
    if (mismatch.first_mismatch_offset) {
        return fmt::format(
            "{}: {} code: {} (expected {} bytes, found {} bytes, first "
            "difference at {})",
            contract,
            to_string(mismatch.code_type),
            mismatch.reason,
            mismatch.expected_size,
            mismatch.found_size,
            *mismatch.first_mismatch_offset);
    }
    return fmt::format(
        "{}: {} code: {} (expected {} bytes, found {} bytes)",
        contract,
        to_string(mismatch.code_type),
        mismatch.reason,
        mismatch.expected_size,
        mismatch.found_size);
}

VerificationResponse
found_response(SearchMatch const &found, CodeType const code_type)
{
    VerificationResponse response;
    response.status = VerificationStatus::Success;
    response.match_type =
        found.match == PartsMatch::Full ? MatchType::Full : MatchType::Partial;
    response.result = code_type == CodeType::Runtime
                          ? VerificationResult::RuntimeMatch
                          : VerificationResult::CreationMatch;
    response.contract_name = found.contract_name;
    response.file_name = found.file_name;
    response.compiler_version = found.compiler_version;
    response.contract_id = found.contract_id;
    return response;
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

Verifier::Verifier(
    std::shared_ptr<Compilers> solidity, std::shared_ptr<Compilers> vyper,
    std::shared_ptr<BytecodeStore> store)
    : solidity_{std::move(solidity)}
    , vyper_{std::move(vyper)}
    , store_{std::move(store)}
{
}

Compilers *Verifier::compilers_for(Language const language) const
{
    for (auto const &compilers : {solidity_, vyper_}) {
        if (compilers && compilers->supports(language)) {
            return compilers.get();
        }
    }
    return nullptr;
}

std::optional<int64_t> Verifier::persist(
    Compilation const &compilation, ContractArtifacts const &artifacts,
    VerificationOutcome const &outcome)
{
    if (!store_) {
        return std::nullopt;
    }
    ContractRecord record{
        .name = artifacts.contract_name,
        .file_name = artifacts.file_name,
        .compiler = compiler_name(compilation.language),
        .version = compilation.version.to_string(),
        .language = compilation.language,
        .settings = compilation.settings.dump(),
        .sources = compilation.sources};
    if (outcome.creation_match) {
        record.constructor_arguments =
            outcome.creation_match->values.constructor_arguments;
    }

    auto const contract_id = store_->insert_contract(record);
    if (contract_id.has_error()) {
        LOG_WARNING(
            "storing contract {} failed: {}",
            artifacts.fully_qualified_name(),
            contract_id.error().message().c_str());
        return std::nullopt;
    }

    auto const store_code = [&](CodeType const code_type,
                                CodeArtifacts const &code) {
        auto const stored = store_->persist(
            contract_id.value(),
            code_type,
            code.code,
            code.cbor_auxdata,
            compilation.language);
        if (stored.has_error()) {
            LOG_WARNING(
                "storing {} code of {} failed: {}",
                to_string(code_type),
                artifacts.fully_qualified_name(),
                stored.error().message().c_str());
            return false;
        }
        return true;
    };
    if (outcome.creation_match &&
        !store_code(CodeType::Creation, artifacts.creation)) {
        return std::nullopt;
    }
    if (outcome.runtime_match &&
        !store_code(CodeType::Runtime, artifacts.runtime)) {
        return std::nullopt;
    }
    return contract_id.value();
}

VerificationResponse Verifier::verify(VerificationRequest const &request)
{
    auto const on_chain = request.on_chain_code();
    if (!on_chain.creation && !on_chain.runtime) {
        return failed_response("no on chain code provided");
    }

    auto const version = parse_compiler_version(request.compiler_version);
    if (version.has_error()) {
        return failed_response(fmt::format(
            "invalid compiler version {}: {}",
            request.compiler_version,
            version.error().message().c_str()));
    }

    auto *const compilers = compilers_for(request.language);
    if (compilers == nullptr) {
        return failed_response(
            fmt::format("{} is not supported", to_string(request.language)));
    }

    bool const blueprint = request.is_blueprint || is_blueprint(on_chain);
    if (blueprint && !on_chain.creation) {
        return failed_response("blueprint verification needs creation code");
    }

    auto const compiled = compilers->compile(
        version.value(),
        CompilerInput{
            .language = request.language,
            .sources = request.source_files,
            .interfaces = request.interfaces,
            .settings = request.settings});
    if (compiled.has_error()) {
        if (compiled.error() == FetchError::HashMismatch ||
            compiled.error() == CompileError::Internal) {
            LOG_WARNING(
                "compiling with {} failed: {}",
                version.value(),
                compiled.error().message().c_str());
        }
        else {
            LOG_INFO(
                "compiling with {} failed: {}",
                version.value(),
                compiled.error().message().c_str());
        }
        return failed_response(fmt::format(
            "compilation with {} failed: {}",
            request.compiler_version,
            compiled.error().message().c_str()));
    }

    Compilation const &compilation = compiled.value();
    if (compilation.failed()) {
        VerificationResponse response;
        response.compiler_version = compilation.version.to_string();
        for (auto const &error : compilation.errors) {
            response.errors.push_back(
                error.formatted_message.empty() ? error.message
                                                : error.formatted_message);
        }
        return response;
    }
    if (compilation.contracts.empty()) {
        return failed_response("compilation produced no contracts");
    }

    std::vector<ContractArtifacts const *> contracts;
    for (auto const &contract : compilation.contracts) {
        contracts.push_back(&contract);
    }
    std::ranges::sort(contracts, [](auto const *const a, auto const *const b) {
        return std::tie(a->file_name, a->contract_name) <
               std::tie(b->file_name, b->contract_name);
    });

    std::optional<Candidate> best;
    nlohmann::json mismatches = nlohmann::json::array();
    std::vector<std::string> errors;
    for (auto const *const contract : contracts) {
        auto outcome =
            blueprint
                ? verify_blueprint(*on_chain.creation, *contract, request.language)
                : verify_contract(on_chain, *contract, request.language);
        if (outcome.has_error()) {
            LOG_WARNING(
                "matching {} failed: {}",
                contract->fully_qualified_name(),
                outcome.error().message().c_str());
            return failed_response(fmt::format(
                "matching {} failed: {}",
                contract->fully_qualified_name(),
                outcome.error().message().c_str()));
        }
        if (!outcome.value().matched()) {
            auto const name = contract->fully_qualified_name();
            nlohmann::json slices = nlohmann::json::array();
            for (auto const &mismatch : outcome.value().mismatches) {
                slices.push_back(to_json(mismatch));
                errors.push_back(describe(name, mismatch));
            }
            mismatches.push_back({{"contract", name}, {"mismatches", slices}});
            continue;
        }
        if (!best || rank(outcome.value()) > rank(best->outcome)) {
            best = Candidate{
                .artifacts = contract,
                .outcome = std::move(outcome).value()};
        }
    }

    if (!best) {
        LOG_DEBUG(
            "no contract compiled with {} matches the on chain code",
            compilation.version);
        VerificationResponse response;
        response.compiler_version = compilation.version.to_string();
        response.mismatches = std::move(mismatches);
        response.errors = std::move(errors);
        return response;
    }

    auto const &artifacts = *best->artifacts;
    auto const &outcome = best->outcome;
    LOG_INFO(
        "{} verified as {} with {}{}{}",
        artifacts.fully_qualified_name(),
        outcome.result,
        compilation.version,
        request.contract_address ? " at " + *request.contract_address : "",
        request.chain_id ? " on chain " + *request.chain_id : "");

    VerificationResponse response;
    response.status = VerificationStatus::Success;
    response.match_type =
        outcome.is_full() ? MatchType::Full : MatchType::Partial;
    response.result = outcome.result;
    response.contract_name = artifacts.contract_name;
    response.file_name = artifacts.file_name;
    response.compiler_version = compilation.version.to_string();
    response.artifacts = to_json(artifacts);
    response.transformations = to_json(outcome);
    response.contract_id = persist(compilation, artifacts, outcome);
    return response;
}

Result<std::vector<SearchMatch>>
Verifier::search(byte_string_view const code, CodeType const code_type)
{
    VERITAS_ASSERT(store_);

    auto candidates = store_->find_candidates(code, code_type);
    if (candidates.has_error()) {
        return std::move(candidates).assume_error();
    }

    std::vector<SearchMatch> found;
    for (auto const &candidate : candidates.value()) {
        auto parts = store_->parts(candidate.stored_bytecode_id);
        if (parts.has_error()) {
            return std::move(parts).assume_error();
        }
        if (code_type == CodeType::Runtime &&
            join_parts(parts.value()).size() != code.size()) {
            continue;
        }
        auto const match = compare_parts(parts.value(), code);
        if (match == PartsMatch::NoMatch) {
            continue;
        }
        auto contract = store_->contract(candidate.contract_id);
        if (contract.has_error()) {
            return std::move(contract).assume_error();
        }
        found.push_back(SearchMatch{
            .contract_id = candidate.contract_id,
            .stored_bytecode_id = candidate.stored_bytecode_id,
            .match = match,
            .contract_name = contract.value().name,
            .file_name = contract.value().file_name,
            .compiler_version = contract.value().version});
    }
    LOG_DEBUG(
        "{} of {} {} candidates confirmed",
        found.size(),
        candidates.value().size(),
        to_string(code_type));
    return found;
}

VerificationResponse
Verifier::search_and_verify(VerificationRequest const &request)
{
    if (!store_) {
        return verify(request);
    }
    auto const on_chain = request.on_chain_code();
    for (auto const &[code, code_type] :
         {std::make_pair(on_chain.runtime, CodeType::Runtime),
          std::make_pair(on_chain.creation, CodeType::Creation)}) {
        if (!code) {
            continue;
        }
        auto const found = search(*code, code_type);
        if (found.has_error()) {
            LOG_WARNING(
                "searching {} code failed: {}",
                to_string(code_type),
                found.error().message().c_str());
            continue;
        }
        if (found.value().empty()) {
            continue;
        }
        auto const full = std::ranges::find_if(
            found.value(),
            [](SearchMatch const &m) { return m.match == PartsMatch::Full; });
        return found_response(
            full != found.value().end() ? *full : found.value().front(),
            code_type);
    }
    return verify(request);
}

std::vector<VerificationResponse> Verifier::verify_batch(
    std::vector<VerificationRequest> const &requests, fiber::WorkerPool &pool)
{
    std::shared_ptr<boost::fibers::promise<VerificationResponse>[]> promises{
        new boost::fibers::promise<VerificationResponse>[requests.size()]};

    for (unsigned i = 0; i < requests.size(); ++i) {
        pool.submit([this,
                     i = i,
                     promises = promises,
                     &request = requests[i]] {
            try {
                promises[i].set_value(verify(request));
            }
            catch (...) {
                promises[i].set_exception(std::current_exception());
            }
        });
    }

    std::vector<VerificationResponse> responses;
    responses.reserve(requests.size());
    for (unsigned i = 0; i < requests.size(); ++i) {
        responses.push_back(promises[i].get_future().get());
    }
    return responses;
}

VERITAS_NAMESPACE_END
