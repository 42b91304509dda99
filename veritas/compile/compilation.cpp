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

#include <veritas/compile/compilation.hpp>

#include <veritas/compile/artifacts.hpp>
#include <veritas/compile/compile_error.hpp>
#include <veritas/compiler/version_fmt.hpp>
#include <veritas/core/assert.h>
#include <veritas/core/config.hpp>
#include <veritas/core/fmt.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <optional>
#include <utility>
#include <vector>

VERITAS_NAMESPACE_BEGIN

Compilers::Compilers(
    std::shared_ptr<BinaryCache> cache, std::shared_ptr<EvmCompiler> compiler,
    CompilersConfig config)
    : cache_{std::move(cache)}
    , compiler_{std::move(compiler)}
    , config_{config}
    , semaphore_{config.max_concurrent}
{
    VERITAS_ASSERT(cache_);
    VERITAS_ASSERT(compiler_);
    VERITAS_ASSERT(config_.max_concurrent > 0);
}

Result<CompilerOutput> Compilers::run(
    CachedBinary const &binary, CompilerVersion const &version,
    CompilerInput const &input)
{
    fiber::SemaphoreGuard const guard{semaphore_};
    auto const start = std::chrono::steady_clock::now();
    auto output =
        compiler_->compile(binary.path, version, input, config_.timeout);
    LOG_DEBUG(
        "compiled with {} in {} ms",
        version,
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start)
            .count());
    return output;
}

Result<Compilation>
Compilers::compile(CompilerVersion const &requested, CompilerInput input)
{
    if (!compiler_->supports(input.language)) {
        return CompileError::UnsupportedLanguage;
    }
    auto version = cache_->normalize(requested);
    if (version.has_error()) {
        return std::move(version).assume_error();
    }
    auto binary = cache_->get_or_fetch(version.value());
    if (binary.has_error()) {
        return std::move(binary).assume_error();
    }

    normalize_output_selection(input, version.value());
    auto output = run(binary.value(), version.value(), input);
    if (output.has_error()) {
        return std::move(output).assume_error();
    }

    Compilation compilation{
        .language = input.language,
        .version = version.value(),
        .settings = input.settings,
        .sources = input.sources,
        .source_ids = source_ids(output.value().json),
        .errors = output.value().errors()};
    if (compilation.failed()) {
        LOG_DEBUG(
            "compilation with {} failed with {} errors",
            version.value(),
            compilation.errors.size());
        return compilation;
    }

    auto contracts = collect_artifacts(output.value().json);
    if (contracts.has_error()) {
        return std::move(contracts).assume_error();
    }
    compilation.contracts = std::move(contracts).value();

    std::optional<std::vector<ContractArtifacts>> modified_contracts;
    auto modified =
        run(binary.value(), version.value(), modified_copy(input));
    if (modified.has_value() && !modified.value().has_errors()) {
        auto collected = collect_artifacts(modified.value().json);
        if (collected.has_value()) {
            modified_contracts = std::move(collected).value();
        }
    }
    else {
        LOG_DEBUG("modified compilation with {} failed", version.value());
    }
    attach_cbor_auxdata(
        input.language,
        compilation.contracts,
        modified_contracts ? &*modified_contracts : nullptr);
    return compilation;
}

VERITAS_NAMESPACE_END
