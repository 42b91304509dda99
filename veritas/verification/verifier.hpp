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

#include <veritas/bytecode_db/bytecode_store.hpp>
#include <veritas/bytecode_db/part.hpp>
#include <veritas/compile/compilation.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/fiber/worker_pool.hpp>
#include <veritas/core/result.hpp>
#include <veritas/verification/request.hpp>
#include <veritas/verify/match.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

VERITAS_NAMESPACE_BEGIN

/// A stored bytecode confirmed against searched code
struct SearchMatch
{
    int64_t contract_id;
    int64_t stored_bytecode_id;
    PartsMatch match;
    std::string contract_name{};
    std::string file_name{};
    std::string compiler_version{};
};

/// Compiles submitted sources, matches the result against on chain code and
/// records verified bytecode for later searches. Either compiler family and
/// the store may be absent.
class Verifier
{
    std::shared_ptr<Compilers> solidity_;
    std::shared_ptr<Compilers> vyper_;
    std::shared_ptr<BytecodeStore> store_;

    Compilers *compilers_for(Language) const;

    std::optional<int64_t> persist(
        Compilation const &, ContractArtifacts const &,
        VerificationOutcome const &);

public:
    Verifier(
        std::shared_ptr<Compilers> solidity, std::shared_ptr<Compilers> vyper,
        std::shared_ptr<BytecodeStore> store);

    VerificationResponse verify(VerificationRequest const &);

    /// Stored bytecode matching `code`. Runtime code must match in length,
    /// creation code may carry constructor arguments past the stored code.
    Result<std::vector<SearchMatch>> search(byte_string_view code, CodeType);

    /// Reports an already verified contract when the on chain code is found
    /// in the store, otherwise verifies the request
    VerificationResponse search_and_verify(VerificationRequest const &);

    std::vector<VerificationResponse> verify_batch(
        std::vector<VerificationRequest> const &, fiber::WorkerPool &);
};

VERITAS_NAMESPACE_END
