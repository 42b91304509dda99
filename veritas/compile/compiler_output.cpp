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

#include <veritas/compile/compiler_output.hpp>

#include <veritas/core/config.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

std::string string_field(nlohmann::json const &json, char const *const key)
{
    if (json.contains(key) && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return {};
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

bool CompilerOutput::has_errors() const noexcept
{
    return std::ranges::any_of(diagnostics, &CompilerDiagnostic::is_error);
}

std::vector<CompilerDiagnostic> CompilerOutput::errors() const
{
    std::vector<CompilerDiagnostic> result;
    std::ranges::copy_if(
        diagnostics, std::back_inserter(result), &CompilerDiagnostic::is_error);
    return result;
}

CompilerDiagnostic parse_diagnostic(nlohmann::json const &json)
{
    CompilerDiagnostic diagnostic{
        .severity = string_field(json, "severity"),
        .type = string_field(json, "type"),
        .message = string_field(json, "message"),
        .formatted_message = string_field(json, "formattedMessage")};
    if (diagnostic.severity.empty()) {
        diagnostic.severity = "error";
    }
    if (diagnostic.formatted_message.empty()) {
        diagnostic.formatted_message = diagnostic.message;
    }
    if (json.contains("sourceLocation") && json["sourceLocation"].is_object()) {
        auto const &location = json["sourceLocation"];
        if (location.contains("file") && location["file"].is_string()) {
            diagnostic.file = location["file"].get<std::string>();
        }
        if (location.contains("start") &&
            location["start"].is_number_integer()) {
            diagnostic.start = location["start"].get<int64_t>();
        }
        if (location.contains("end") && location["end"].is_number_integer()) {
            diagnostic.end = location["end"].get<int64_t>();
        }
    }
    return diagnostic;
}

nlohmann::json to_json(CompilerDiagnostic const &diagnostic)
{
    nlohmann::json json = {
        {"severity", diagnostic.severity},
        {"type", diagnostic.type},
        {"message", diagnostic.message},
        {"formattedMessage", diagnostic.formatted_message}};
    if (diagnostic.file) {
        json["file"] = *diagnostic.file;
    }
    if (diagnostic.start) {
        json["start"] = *diagnostic.start;
    }
    if (diagnostic.end) {
        json["end"] = *diagnostic.end;
    }
    return json;
}

CompilerOutput make_compiler_output(nlohmann::json json)
{
    CompilerOutput output{.json = std::move(json)};
    if (output.json.contains("errors") && output.json["errors"].is_array()) {
        for (auto const &error : output.json["errors"]) {
            output.diagnostics.push_back(parse_diagnostic(error));
        }
    }
    return output;
}

CompilerOutput failed_compiler_output(std::string message)
{
    CompilerOutput output;
    output.diagnostics.push_back(CompilerDiagnostic{
        .severity = "error",
        .type = "CompilerError",
        .message = message,
        .formatted_message = std::move(message)});
    return output;
}

VERITAS_NAMESPACE_END
