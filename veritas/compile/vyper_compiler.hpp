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

#include <string>

VERITAS_NAMESPACE_BEGIN

class VyperCompiler final : public EvmCompiler
{
public:
    bool supports(Language const language) const noexcept override
    {
        return language == Language::Vyper;
    }

    std::string binary_name() const override
    {
        return "vyper";
    }

    Result<CompilerOutput> compile(
        std::filesystem::path const &binary, CompilerVersion const &,
        CompilerInput const &, std::chrono::milliseconds timeout) override;
};

VERITAS_NAMESPACE_END
