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

#include <veritas/compile/vyper_compiler.hpp>

#include <veritas/compile/compile_error.hpp>
#include <veritas/compile/subprocess.hpp>
#include <veritas/core/config.hpp>

#include <utility>

VERITAS_NAMESPACE_BEGIN

Result<CompilerOutput> VyperCompiler::compile(
    std::filesystem::path const &binary, CompilerVersion const &,
    CompilerInput const &input, std::chrono::milliseconds const timeout)
{
    if (!supports(input.language)) {
        return CompileError::UnsupportedLanguage;
    }
    auto process = run_process(
        binary, {"--standard-json"}, to_standard_json(input).dump(), timeout);
    if (process.has_error()) {
        return std::move(process).assume_error();
    }
    return standard_json_output(process.value());
}

VERITAS_NAMESPACE_END
