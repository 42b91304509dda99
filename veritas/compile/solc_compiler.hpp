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

#include <veritas/compile/evm_compiler.hpp>
#include <veritas/core/config.hpp>

#include <nlohmann/json.hpp>

#include <string>

VERITAS_NAMESPACE_BEGIN

/// Solidity and Yul through `solc`. Releases older than 0.4.11 predate
/// `--standard-json` and are driven through `--combined-json` instead.
class SolcCompiler final : public EvmCompiler
{
public:
    bool supports(Language) const noexcept override;

    std::string binary_name() const override
    {
        return "solc";
    }

    Result<CompilerOutput> compile(
        std::filesystem::path const &binary, CompilerVersion const &,
        CompilerInput const &, std::chrono::milliseconds timeout) override;
};

bool has_standard_json(CompilerVersion const &);

/// Rewrites `--combined-json` output (`{"contracts": {"file:Name": ...}}`)
/// into the standard JSON output layout
nlohmann::json
combined_to_standard_json(nlohmann::json const &, CompilerInput const &);

VERITAS_NAMESPACE_END
