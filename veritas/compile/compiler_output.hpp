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

#include <veritas/core/config.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

VERITAS_NAMESPACE_BEGIN

struct CompilerDiagnostic
{
    std::string severity{"error"};
    std::string type{};
    std::string message{};
    std::string formatted_message{};
    std::optional<std::string> file{};
    std::optional<int64_t> start{};
    std::optional<int64_t> end{};

    bool is_error() const noexcept
    {
        return severity == "error";
    }
};

struct CompilerOutput
{
    nlohmann::json json{nlohmann::json::object()};
    std::vector<CompilerDiagnostic> diagnostics{};

    bool has_errors() const noexcept;

    std::vector<CompilerDiagnostic> errors() const;
};

CompilerDiagnostic parse_diagnostic(nlohmann::json const &);

nlohmann::json to_json(CompilerDiagnostic const &);

/// Wraps standard JSON output, lifting its `errors` list into diagnostics
CompilerOutput make_compiler_output(nlohmann::json);

/// Output of a compiler run that produced no usable JSON
CompilerOutput failed_compiler_output(std::string message);

VERITAS_NAMESPACE_END
