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
#include <veritas/compile/compiler_output.hpp>
#include <veritas/compile/subprocess.hpp>
#include <veritas/compiler/version.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <chrono>
#include <filesystem>
#include <string>

VERITAS_NAMESPACE_BEGIN

/// One compiler family. Implementations run the binary out of process; a
/// source the compiler rejects is a successful run whose output carries
/// error diagnostics.
class EvmCompiler
{
public:
    virtual ~EvmCompiler() = default;

    virtual bool supports(Language) const noexcept = 0;

    /// Executable name inside the binary cache
    virtual std::string binary_name() const = 0;

    virtual Result<CompilerOutput> compile(
        std::filesystem::path const &binary, CompilerVersion const &,
        CompilerInput const &, std::chrono::milliseconds timeout) = 0;
};

/// Interprets a `--standard-json` run
CompilerOutput standard_json_output(ProcessOutput const &);

VERITAS_NAMESPACE_END
