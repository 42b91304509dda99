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
#include <veritas/compile/compiler_output.hpp>
#include <veritas/compile/evm_compiler.hpp>
#include <veritas/compiler/binary_cache.hpp>
#include <veritas/compiler/version.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/fiber/semaphore.hpp>
#include <veritas/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

VERITAS_NAMESPACE_BEGIN

struct Compilation
{
    Language language{Language::Solidity};
    CompilerVersion version{};
    nlohmann::json settings{nlohmann::json::object()};
    std::map<std::string, std::string> sources{};
    nlohmann::json source_ids{nlohmann::json::object()};
    /// Error diagnostics; when non-empty no contracts were produced
    std::vector<CompilerDiagnostic> errors{};
    std::vector<ContractArtifacts> contracts{};

    bool failed() const noexcept
    {
        return !errors.empty();
    }
};

struct CompilersConfig
{
    size_t max_concurrent{1};
    std::chrono::milliseconds timeout{std::chrono::seconds{60}};
};

/// A compiler family bound to the cache holding its binaries
class Compilers
{
    std::shared_ptr<BinaryCache> cache_;
    std::shared_ptr<EvmCompiler> compiler_;
    CompilersConfig config_;
    fiber::Semaphore semaphore_;

    Result<CompilerOutput> run(
        CachedBinary const &, CompilerVersion const &, CompilerInput const &);

public:
    Compilers(
        std::shared_ptr<BinaryCache>, std::shared_ptr<EvmCompiler>,
        CompilersConfig);

    Compilers(Compilers const &) = delete;
    Compilers &operator=(Compilers const &) = delete;

    bool supports(Language const language) const noexcept
    {
        return compiler_->supports(language);
    }

    BinaryCache &cache() noexcept
    {
        return *cache_;
    }

    /// Fetches the binary, compiles `input` and its modified copy and
    /// collects per contract artifacts. Rejected sources produce a failed
    /// `Compilation`, not an error.
    Result<Compilation> compile(CompilerVersion const &, CompilerInput);
};

VERITAS_NAMESPACE_END
