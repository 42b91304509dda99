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

#include <veritas/compile/solc_compiler.hpp>

#include <veritas/compile/compile_error.hpp>
#include <veritas/compile/subprocess.hpp>
#include <veritas/compiler/version_fmt.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/fmt.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>

namespace fs = std::filesystem;

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

/// Private working directory for one legacy compilation
class ScratchDir
{
    fs::path path_{};

public:
    ScratchDir()
    {
        std::error_code ec;
        auto const base = fs::temp_directory_path(ec);
        if (ec) {
            return;
        }
        auto tmpl = (base / "veritas_solc_XXXXXX").string();
        if (char const *const path = mkdtemp(tmpl.data())) {
            path_ = path;
        }
    }

    ScratchDir(ScratchDir const &) = delete;
    ScratchDir &operator=(ScratchDir const &) = delete;

    ~ScratchDir()
    {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
    }

    fs::path const &path() const noexcept
    {
        return path_;
    }
};

bool escapes_root(fs::path const &path)
{
    if (path.empty() || path.is_absolute()) {
        return true;
    }
    for (auto const &part : path) {
        if (part.string() == "..") {
            return true;
        }
    }
    return false;
}

Result<std::vector<std::string>>
write_sources(fs::path const &root, CompilerInput const &input)
{
    std::vector<std::string> files;
    for (auto const &[name, content] : input.sources) {
        fs::path const relative{name};
        if (escapes_root(relative)) {
            LOG_DEBUG("rejected source path {}", name);
            return CompileError::InvalidInput;
        }
        auto const path = root / relative;
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        out << content;
        out.close();
        if (ec || !out.good()) {
            LOG_ERROR("cannot write source {}", path.string());
            return CompileError::Internal;
        }
        files.push_back(relative.string());
    }
    return files;
}

std::vector<std::string> legacy_flags(nlohmann::json const &settings)
{
    std::vector<std::string> args{"--combined-json", "abi,bin,bin-runtime"};
    if (settings.contains("optimizer") && settings["optimizer"].is_object()) {
        auto const &optimizer = settings["optimizer"];
        if (optimizer.contains("enabled") && optimizer["enabled"].is_boolean() &&
            optimizer["enabled"].get<bool>()) {
            args.emplace_back("--optimize");
            if (optimizer.contains("runs") &&
                optimizer["runs"].is_number_unsigned()) {
                args.emplace_back("--optimize-runs");
                args.push_back(
                    std::to_string(optimizer["runs"].get<uint64_t>()));
            }
        }
    }
    if (settings.contains("libraries") && settings["libraries"].is_object()) {
        std::string libraries;
        for (auto const &[file, names] : settings["libraries"].items()) {
            if (!names.is_object()) {
                continue;
            }
            for (auto const &[name, address] : names.items()) {
                if (!address.is_string()) {
                    continue;
                }
                if (!libraries.empty()) {
                    libraries += ',';
                }
                libraries += name + ":" + address.get<std::string>();
            }
        }
        if (!libraries.empty()) {
            args.emplace_back("--libraries");
            args.push_back(std::move(libraries));
        }
    }
    return args;
}

Result<CompilerOutput> compile_legacy(
    fs::path const &binary, CompilerInput const &input,
    std::chrono::milliseconds const timeout)
{
    ScratchDir const dir;
    if (dir.path().empty()) {
        LOG_ERROR("cannot create a scratch dir for legacy solc");
        return CompileError::Internal;
    }
    auto files = write_sources(dir.path(), input);
    if (files.has_error()) {
        return std::move(files).assume_error();
    }

    auto args = legacy_flags(input.settings);
    args.insert(args.end(), files.value().begin(), files.value().end());

    auto process = run_process(binary, args, {}, timeout, dir.path());
    if (process.has_error()) {
        return std::move(process).assume_error();
    }
    auto const &result = process.value();
    if (result.exit_code != 0) {
        return failed_compiler_output(result.err);
    }
    auto json = nlohmann::json::parse(result.out, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return failed_compiler_output(
            "compiler returned invalid json: " + result.err);
    }
    auto output = make_compiler_output(combined_to_standard_json(json, input));
    if (!result.err.empty()) {
        output.diagnostics.push_back(CompilerDiagnostic{
            .severity = "warning",
            .type = "Warning",
            .message = result.err,
            .formatted_message = result.err});
    }
    return output;
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

bool has_standard_json(CompilerVersion const &version)
{
    return version >= CompilerVersion{0, 4, 11};
}

bool SolcCompiler::supports(Language const language) const noexcept
{
    return language == Language::Solidity || language == Language::Yul;
}

Result<CompilerOutput> SolcCompiler::compile(
    fs::path const &binary, CompilerVersion const &version,
    CompilerInput const &input, std::chrono::milliseconds const timeout)
{
    if (!supports(input.language)) {
        return CompileError::UnsupportedLanguage;
    }
    if (!has_standard_json(version)) {
        if (input.language != Language::Solidity) {
            return CompileError::UnsupportedLanguage;
        }
        LOG_DEBUG("compiling with legacy solc {}", version);
        return compile_legacy(binary, input, timeout);
    }

    auto process = run_process(
        binary, {"--standard-json"}, to_standard_json(input).dump(), timeout);
    if (process.has_error()) {
        return std::move(process).assume_error();
    }
    return standard_json_output(process.value());
}

nlohmann::json combined_to_standard_json(
    nlohmann::json const &combined, CompilerInput const &input)
{
    nlohmann::json contracts = nlohmann::json::object();
    if (!combined.contains("contracts") || !combined["contracts"].is_object()) {
        return {{"contracts", std::move(contracts)}};
    }
    auto const code = [](nlohmann::json const &contract, char const *key) {
        return contract.contains(key) && contract[key].is_string()
                   ? contract[key].get<std::string>()
                   : std::string{};
    };
    for (auto const &[key, contract] : combined["contracts"].items()) {
        if (!contract.is_object()) {
            continue;
        }
        std::string file;
        std::string name = key;
        if (auto const colon = key.rfind(':'); colon != std::string::npos) {
            file = key.substr(0, colon);
            name = key.substr(colon + 1);
        }
        else if (input.sources.size() == 1) {
            file = input.sources.begin()->first;
        }

        nlohmann::json abi = nlohmann::json::array();
        if (contract.contains("abi")) {
            // abi is a json encoded string before 0.8
            abi = contract["abi"].is_string()
                      ? nlohmann::json::parse(
                            contract["abi"].get<std::string>(), nullptr, false)
                      : contract["abi"];
        }
        contracts[file][name] = {
            {"abi", std::move(abi)},
            {"evm",
             {{"bytecode", {{"object", code(contract, "bin")}}},
              {"deployedBytecode",
               {{"object", code(contract, "bin-runtime")}}}}}};
    }
    return {{"contracts", std::move(contracts)}};
}

VERITAS_NAMESPACE_END
