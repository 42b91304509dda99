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

#include <veritas/verification/request.hpp>

#include <veritas/compile/compile_error.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/hex.hpp>
#include <veritas/verify/verify_contract.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <optional>
#include <string>
#include <utility>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

bool has_string(nlohmann::json const &json, char const *const key)
{
    return json.contains(key) && json[key].is_string();
}

/// Optional hex field; present but not hex is an error
bool read_code(
    nlohmann::json const &json, char const *const key,
    std::optional<byte_string> &code)
{
    if (!json.contains(key) || json[key].is_null()) {
        return true;
    }
    if (!json[key].is_string()) {
        return false;
    }
    code = from_hex(json[key].get<std::string>());
    return code.has_value();
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

Result<VerificationRequest>
parse_verification_request(nlohmann::json const &json)
{
    if (!json.is_object() || !has_string(json, "compiler_version") ||
        !json.contains("source_files") || !json["source_files"].is_object()) {
        return CompileError::InvalidInput;
    }

    VerificationRequest request;
    request.compiler_version = json["compiler_version"].get<std::string>();
    for (auto const &[path, content] : json["source_files"].items()) {
        if (!content.is_string()) {
            LOG_DEBUG("source {} is not a string", path);
            return CompileError::InvalidInput;
        }
        request.source_files.emplace(path, content.get<std::string>());
    }
    if (json.contains("settings")) {
        if (!json["settings"].is_object()) {
            return CompileError::InvalidInput;
        }
        request.settings = json["settings"];
    }
    if (json.contains("interfaces")) {
        if (!json["interfaces"].is_object()) {
            return CompileError::InvalidInput;
        }
        request.interfaces = json["interfaces"];
    }
    if (json.contains("language")) {
        if (!json["language"].is_string()) {
            return CompileError::InvalidInput;
        }
        auto const language =
            parse_language(json["language"].get_ref<std::string const &>());
        if (!language) {
            return CompileError::UnsupportedLanguage;
        }
        request.language = *language;
    }
    if (!read_code(json, "on_chain_creation_code", request.on_chain_creation_code) ||
        !read_code(json, "on_chain_runtime_code", request.on_chain_runtime_code)) {
        return CompileError::InvalidInput;
    }
    if (has_string(json, "chain_id")) {
        request.chain_id = json["chain_id"].get<std::string>();
    }
    if (has_string(json, "contract_address")) {
        request.contract_address = json["contract_address"].get<std::string>();
    }
    if (json.contains("is_blueprint")) {
        if (!json["is_blueprint"].is_boolean()) {
            return CompileError::InvalidInput;
        }
        request.is_blueprint = json["is_blueprint"].get<bool>();
    }
    return request;
}

std::string_view to_string(VerificationStatus const status)
{
    return status == VerificationStatus::Success ? "success" : "failure";
}

std::string_view to_string(MatchType const match_type)
{
    return match_type == MatchType::Full ? "full" : "partial";
}

VerificationResponse failed_response(std::string error)
{
    VerificationResponse response;
    response.errors.push_back(std::move(error));
    return response;
}

nlohmann::json to_json(VerificationResponse const &response)
{
    nlohmann::json json = {
        {"status", to_string(response.status)},
        {"result", to_string(response.result)},
        {"errors", response.errors}};
    if (response.match_type) {
        json["match_type"] = to_string(*response.match_type);
    }
    if (response.contract_name) {
        json["contract_name"] = *response.contract_name;
    }
    if (response.file_name) {
        json["file_name"] = *response.file_name;
    }
    if (response.compiler_version) {
        json["compiler_version"] = *response.compiler_version;
    }
    if (response.contract_id) {
        json["contract_id"] = *response.contract_id;
    }
    if (!response.artifacts.is_null()) {
        json["artifacts"] = response.artifacts;
    }
    if (!response.transformations.is_null()) {
        json["transformations"] = response.transformations;
    }
    if (!response.mismatches.empty()) {
        json["mismatches"] = response.mismatches;
    }
    return json;
}

VERITAS_NAMESPACE_END
