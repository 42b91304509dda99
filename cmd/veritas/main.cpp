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

#include "file_io.hpp"

#include <veritas/bytecode_db/bytecode_store.hpp>
#include <veritas/compile/compilation.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/compile/evm_compiler.hpp>
#include <veritas/compile/solc_compiler.hpp>
#include <veritas/compile/vyper_compiler.hpp>
#include <veritas/compiler/binary_cache.hpp>
#include <veritas/compiler/bucket_fetcher.hpp>
#include <veritas/compiler/fetcher.hpp>
#include <veritas/compiler/http_client.hpp>
#include <veritas/compiler/list_fetcher.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/fiber/worker_pool.hpp>
#include <veritas/core/hex.hpp>
#include <veritas/core/log_level_map.hpp>
#include <veritas/core/result.hpp>
#include <veritas/core/veritas_exception.hpp>
#include <veritas/verification/request.hpp>
#include <veritas/verification/verifier.hpp>
#include <veritas/verify/match.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <boost/outcome/try.hpp>
#include <boost/stacktrace.hpp>

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

std::terminate_handler cxx_runtime_terminate_handler;

void backtrace_terminate_handler()
{
    std::cerr << boost::stacktrace::stacktrace() << std::endl;

    // Delegate the actual termination to the handler originally installed
    // by the C++ runtime support library
    cxx_runtime_terminate_handler();
}

Result<std::shared_ptr<Fetcher>> make_fetcher(
    HttpClient const &client, std::string const &list_url,
    std::string const &bucket, std::string const &binary_name,
    std::chrono::seconds const refresh_interval)
{
    if (!bucket.empty()) {
        auto url = parse_url(bucket);
        if (url.has_error()) {
            return std::move(url).assume_error();
        }
        auto fetcher = BucketFetcher::create(
            client, url.value(), binary_name, refresh_interval);
        if (fetcher.has_error()) {
            return std::move(fetcher).assume_error();
        }
        return std::shared_ptr<Fetcher>{std::move(fetcher).value()};
    }
    auto url = parse_url(list_url);
    if (url.has_error()) {
        return std::move(url).assume_error();
    }
    auto fetcher = ListFetcher::create(client, url.value(), refresh_interval);
    if (fetcher.has_error()) {
        return std::move(fetcher).assume_error();
    }
    return std::shared_ptr<Fetcher>{std::move(fetcher).value()};
}

Result<std::shared_ptr<Compilers>> make_compilers(
    std::shared_ptr<Fetcher> fetcher, fs::path const &dir,
    std::shared_ptr<EvmCompiler> compiler, CompilersConfig const &config)
{
    auto cache = std::make_shared<BinaryCache>(
        std::move(fetcher),
        BinaryCacheConfig{
            .dir = dir / compiler->binary_name(),
            .binary_name = compiler->binary_name()});
    BOOST_OUTCOME_TRY(cache->load_from_dir());
    LOG_INFO(
        "{} compilers cached in {}",
        cache->cached().size(),
        cache->dir().string());
    return std::make_shared<Compilers>(
        std::move(cache), std::move(compiler), config);
}

nlohmann::json versions_json(std::shared_ptr<Compilers> const &compilers)
{
    auto json = nlohmann::json::array();
    if (compilers) {
        auto const versions = compilers->cache().all_versions();
        for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
            json.push_back(it->to_string());
        }
    }
    return json;
}

nlohmann::json to_json(SearchMatch const &found)
{
    return {
        {"contract_id", found.contract_id},
        {"stored_bytecode_id", found.stored_bytecode_id},
        {"match_type",
         found.match == PartsMatch::Full ? "full" : "partial"},
        {"contract_name", found.contract_name},
        {"file_name", found.file_name},
        {"compiler_version", found.compiler_version}};
}

VERITAS_ANONYMOUS_NAMESPACE_END

using namespace veritas;

int main(int const argc, char const *argv[])
{
    cxx_runtime_terminate_handler = std::get_terminate();
    std::set_terminate(backtrace_terminate_handler);

    CLI::App cli{"veritas"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    fs::path compilers_dir = "compilers";
    std::string solc_list_url =
        "https://binaries.soliditylang.org/linux-amd64/list.json";
    std::string solc_bucket;
    std::string vyper_list_url;
    fs::path db_path = "veritas.db";
    unsigned refresh_interval = 3600;
    unsigned nthreads = 4;
    unsigned nfibers = 64;
    size_t max_compilers = 8;
    auto log_level = quill::LogLevel::Info;

    cli.add_option(
        "--compilers-dir", compilers_dir, "directory of downloaded compilers");
    auto *const sources = cli.add_option_group(
        "solc", "where solidity compilers are downloaded from");
    sources->add_option(
        "--solc-list-url", solc_list_url, "url of a solc list.json index");
    sources->add_option(
        "--solc-bucket",
        solc_bucket,
        "url of a bucket laid out as <version>/solc, overrides the list");
    cli.add_option(
        "--vyper-list-url",
        vyper_list_url,
        "url of a vyper list.json index, vyper is disabled if not set");
    cli.add_option("--db", db_path, "verified bytecode database");
    cli.add_option(
        "--refresh-interval",
        refresh_interval,
        "seconds between compiler list refreshes, 0 disables refreshing");
    cli.add_option("--nthreads", nthreads, "number of threads");
    cli.add_option("--nfibers", nfibers, "number of fibers");
    cli.add_option(
        "--max-compilers",
        max_compilers,
        "maximum concurrently running compilers per language");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    std::string compiler_version;
    std::vector<fs::path> source_paths;
    fs::path settings_path;
    auto language = Language::Solidity;
    std::string creation_code;
    std::string runtime_code;
    bool blueprint = false;
    bool search_first = false;
    unsigned timeout = 60;
    std::vector<fs::path> request_paths;

    std::unordered_map<std::string, Language> const language_map = {
        {"solidity", Language::Solidity},
        {"yul", Language::Yul},
        {"vyper", Language::Vyper}};

    auto *const verify_cmd =
        cli.add_subcommand("verify", "verify sources against on chain code");
    auto *const compiler_version_opt = verify_cmd->add_option(
        "--compiler-version", compiler_version, "compiler version");
    verify_cmd
        ->add_option("--source", source_paths, "source file, repeatable")
        ->check(CLI::ExistingFile);
    verify_cmd
        ->add_option(
            "--settings", settings_path, "standard json settings file")
        ->check(CLI::ExistingFile);
    verify_cmd->add_option("--language", language, "source language")
        ->transform(CLI::CheckedTransformer(language_map, CLI::ignore_case));
    verify_cmd->add_option(
        "--creation-code", creation_code, "hex creation transaction input");
    verify_cmd->add_option(
        "--runtime-code", runtime_code, "hex deployed runtime code");
    verify_cmd->add_flag(
        "--blueprint", blueprint, "creation code is an ERC-5202 blueprint");
    verify_cmd->add_flag(
        "--search-first",
        search_first,
        "report an already verified contract without compiling");
    verify_cmd->add_option("--timeout", timeout, "compilation timeout seconds");
    auto *const request_opt =
        verify_cmd
            ->add_option(
                "--request",
                request_paths,
                "json verification request file, repeatable; requests are "
                "verified concurrently")
            ->check(CLI::ExistingFile);
    request_opt->excludes(compiler_version_opt);

    std::string code;
    auto code_type = CodeType::Runtime;
    std::unordered_map<std::string, CodeType> const code_type_map = {
        {"creation", CodeType::Creation}, {"runtime", CodeType::Runtime}};

    auto *const search_cmd =
        cli.add_subcommand("search", "look up verified contracts by code");
    search_cmd->add_option("--code", code, "hex code")->required();
    search_cmd->add_option("--code-type", code_type, "code type")
        ->transform(CLI::CheckedTransformer(code_type_map, CLI::ignore_case));

    auto *const versions_cmd =
        cli.add_subcommand("versions", "list known compiler versions");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);
    LOG_INFO("running with commit '{}'", GIT_COMMIT_HASH);

    try {
        auto const store = std::make_shared<BytecodeStore>(db_path);
        LOG_INFO("opened bytecode database {}", db_path.string());

        if (*search_cmd) {
            auto const bytes = from_hex(code);
            if (!bytes) {
                LOG_ERROR("--code is not hex");
                return EXIT_FAILURE;
            }
            Verifier verifier{nullptr, nullptr, store};
            auto const found = verifier.search(*bytes, code_type);
            if (found.has_error()) {
                LOG_ERROR(
                    "search failed: {}", found.error().message().c_str());
                return EXIT_FAILURE;
            }
            auto json = nlohmann::json::array();
            for (auto const &match : found.value()) {
                json.push_back(to_json(match));
            }
            std::cout << json.dump(2) << std::endl;
            return EXIT_SUCCESS;
        }

        HttpClient const client;
        CompilersConfig const config{
            .max_concurrent = max_compilers,
            .timeout = std::chrono::seconds{timeout}};

        auto solc_fetcher = make_fetcher(
            client,
            solc_list_url,
            solc_bucket,
            "solc",
            std::chrono::seconds{refresh_interval});
        if (solc_fetcher.has_error()) {
            LOG_ERROR(
                "loading solc versions failed: {}",
                solc_fetcher.error().message().c_str());
            return EXIT_FAILURE;
        }
        auto solidity = make_compilers(
            std::move(solc_fetcher).value(),
            compilers_dir,
            std::make_shared<SolcCompiler>(),
            config);
        if (solidity.has_error()) {
            LOG_ERROR(
                "solc cache failed: {}", solidity.error().message().c_str());
            return EXIT_FAILURE;
        }

        std::shared_ptr<Compilers> vyper;
        if (!vyper_list_url.empty()) {
            auto vyper_fetcher = make_fetcher(
                client,
                vyper_list_url,
                "",
                "vyper",
                std::chrono::seconds{refresh_interval});
            if (vyper_fetcher.has_error()) {
                LOG_ERROR(
                    "loading vyper versions failed: {}",
                    vyper_fetcher.error().message().c_str());
                return EXIT_FAILURE;
            }
            auto compilers = make_compilers(
                std::move(vyper_fetcher).value(),
                compilers_dir,
                std::make_shared<VyperCompiler>(),
                config);
            if (compilers.has_error()) {
                LOG_ERROR(
                    "vyper cache failed: {}",
                    compilers.error().message().c_str());
                return EXIT_FAILURE;
            }
            vyper = std::move(compilers).value();
        }

        if (*versions_cmd) {
            nlohmann::json const json = {
                {"solidity", versions_json(solidity.value())},
                {"vyper", versions_json(vyper)}};
            std::cout << json.dump(2) << std::endl;
            return EXIT_SUCCESS;
        }

        std::vector<VerificationRequest> requests;
        for (auto const &path : request_paths) {
            auto request = parse_verification_request(read_json_file(path));
            if (request.has_error()) {
                LOG_ERROR(
                    "{} is not a verification request: {}",
                    path.string(),
                    request.error().message().c_str());
                return EXIT_FAILURE;
            }
            requests.push_back(std::move(request).value());
        }
        if (request_paths.empty()) {
            if (compiler_version.empty()) {
                LOG_ERROR("--compiler-version or --request is required");
                return EXIT_FAILURE;
            }
            VerificationRequest request{
                .source_files = read_sources(source_paths),
                .compiler_version = compiler_version,
                .language = language,
                .is_blueprint = blueprint};
            if (!settings_path.empty()) {
                request.settings = read_json_file(settings_path);
            }
            if (!creation_code.empty()) {
                request.on_chain_creation_code = from_hex(creation_code);
                if (!request.on_chain_creation_code) {
                    LOG_ERROR("--creation-code is not hex");
                    return EXIT_FAILURE;
                }
            }
            if (!runtime_code.empty()) {
                request.on_chain_runtime_code = from_hex(runtime_code);
                if (!request.on_chain_runtime_code) {
                    LOG_ERROR("--runtime-code is not hex");
                    return EXIT_FAILURE;
                }
            }
            requests.push_back(std::move(request));
        }

        Verifier verifier{solidity.value(), vyper, store};
        std::vector<VerificationResponse> responses;
        if (search_first) {
            for (auto const &request : requests) {
                responses.push_back(verifier.search_and_verify(request));
            }
        }
        else {
            fiber::WorkerPool pool{nthreads, nfibers};
            responses = verifier.verify_batch(requests, pool);
        }

        bool verified = true;
        auto json = nlohmann::json::array();
        for (auto const &response : responses) {
            if (response.status != VerificationStatus::Success) {
                verified = false;
            }
            json.push_back(to_json(response));
        }
        std::cout << (json.size() == 1 ? json[0] : json).dump(2) << std::endl;
        return verified ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (VeritasException const &e) {
        e.print();
        return EXIT_FAILURE;
    }
}
