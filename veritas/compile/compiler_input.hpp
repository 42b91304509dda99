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

#include <veritas/compiler/version.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

VERITAS_NAMESPACE_BEGIN

enum class Language
{
    Solidity,
    Yul,
    Vyper
};

std::string_view to_string(Language);

/// Accepts the standard JSON spelling, case-insensitively
std::optional<Language> parse_language(std::string_view);

/// Standard JSON compiler input. Vyper inputs may carry `interfaces`, each a
/// source (`content`), an `abi` or `contractTypes` document.
struct CompilerInput
{
    Language language{Language::Solidity};
    std::map<std::string, std::string> sources{};
    nlohmann::json interfaces{nlohmann::json::object()};
    nlohmann::json settings{nlohmann::json::object()};
};

nlohmann::json to_standard_json(CompilerInput const &);

Result<CompilerInput> parse_standard_json(nlohmann::json const &);

/// Overwrites the output selection so every artifact the matcher needs is
/// produced regardless of what the caller asked for
void normalize_output_selection(CompilerInput &, CompilerVersion const &);

/// Same input with a trailing comment on every source: the metadata hash
/// changes, the code does not
CompilerInput modified_copy(CompilerInput const &);

VERITAS_NAMESPACE_END
