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

#include <veritas/compiler/binary_cache.hpp>

#include <veritas/compiler/version_fmt.hpp>
#include <veritas/core/assert.h>
#include <veritas/core/config.hpp>
#include <veritas/core/fmt.hpp>
#include <veritas/core/sha256.hpp>

#include <boost/fiber/future.hpp>
#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

std::optional<byte_string> read_file(fs::path const &path)
{
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        return std::nullopt;
    }
    std::string const data{
        std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::nullopt;
    }
    return byte_string{to_byte_string_view(data)};
}

bool write_file(fs::path const &path, byte_string_view const data)
{
    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    out.write(
        reinterpret_cast<char const *>(data.data()),
        static_cast<std::streamsize>(data.size()));
    out.close();
    return out.good();
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

BinaryCache::BinaryCache(
    std::shared_ptr<Fetcher> fetcher, BinaryCacheConfig config)
    : fetcher_{std::move(fetcher)}
    , config_{std::move(config)}
{
    VERITAS_ASSERT(fetcher_);
}

Result<void> BinaryCache::load_from_dir()
{
    std::error_code ec;
    fs::create_directories(config_.dir, ec);
    if (ec) {
        LOG_ERROR(
            "cannot create compilers dir {}: {}",
            config_.dir.string(),
            ec.message());
        return FetchError::File;
    }

    size_t loaded = 0;
    for (auto const &entry : fs::directory_iterator{config_.dir, ec}) {
        if (!entry.is_directory()) {
            continue;
        }
        auto version =
            parse_compiler_version(entry.path().filename().string());
        if (version.has_error()) {
            continue;
        }
        auto const binary = entry.path() / config_.binary_name;
        if (!fs::is_regular_file(binary)) {
            continue;
        }
        auto const data = read_file(binary);
        if (!data) {
            continue;
        }
        std::lock_guard const lock{mutex_};
        cached_.insert_or_assign(
            version.value(),
            CachedBinary{
                .version = version.value(),
                .path = binary,
                .sha256 = sha256(*data)});
        ++loaded;
    }
    if (ec) {
        LOG_ERROR(
            "cannot list compilers dir {}: {}",
            config_.dir.string(),
            ec.message());
        return FetchError::File;
    }
    LOG_INFO(
        "found {} cached compilers in {}", loaded, config_.dir.string());
    return success();
}

Result<CachedBinary> BinaryCache::get_or_fetch(CompilerVersion const &version)
{
    boost::fibers::shared_future<FetchOutcome> pending;
    std::optional<boost::fibers::promise<FetchOutcome>> promise;
    {
        std::lock_guard const lock{mutex_};
        if (auto const it = cached_.find(version); it != cached_.end()) {
            return it->second;
        }
        if (auto const it = in_flight_.find(version); it != in_flight_.end()) {
            pending = it->second;
        }
    }

    if (!pending.valid()) {
        if (!fetcher_->all_versions().contains(version)) {
            LOG_DEBUG("compiler version {} not found", version);
            return FetchError::NotFound;
        }
        std::unique_lock lock{mutex_};
        if (auto const it = cached_.find(version); it != cached_.end()) {
            return it->second;
        }
        if (auto const it = in_flight_.find(version); it != in_flight_.end()) {
            pending = it->second;
        }
        else {
            promise.emplace();
            pending = promise->get_future().share();
            in_flight_.emplace(version, pending);
        }
    }

    if (promise) {
        FetchOutcome outcome;
        try {
            outcome = fetch_and_store(version);
        }
        catch (...) {
            {
                std::lock_guard const lock{mutex_};
                in_flight_.erase(version);
            }
            promise->set_exception(std::current_exception());
            throw;
        }
        {
            std::lock_guard const lock{mutex_};
            if (outcome.binary) {
                cached_.insert_or_assign(version, *outcome.binary);
            }
            in_flight_.erase(version);
        }
        promise->set_value(std::move(outcome));
    }

    auto const &outcome = pending.get();
    if (outcome.binary) {
        return *outcome.binary;
    }
    return outcome.error;
}

BinaryCache::FetchOutcome
BinaryCache::fetch_and_store(CompilerVersion const &version)
{
    LOG_INFO("fetching compiler {}", version);
    auto fetched = fetcher_->fetch(version);
    if (fetched.has_error()) {
        LOG_WARNING(
            "failed to fetch compiler {}: {}",
            version,
            fetched.error().message().c_str());
        auto error = FetchError::Fetch;
        if (fetched.error() == FetchError::NotFound) {
            error = FetchError::NotFound;
        }
        else if (fetched.error() == FetchError::HashParse) {
            error = FetchError::HashParse;
        }
        return {.binary = std::nullopt, .error = error};
    }

    auto const dir = config_.dir / version.to_string();
    auto const tmp = dir / (config_.binary_name + ".tmp");
    auto const path = dir / config_.binary_name;
    auto const &expected = fetched.value().expected_sha256;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !write_file(tmp, fetched.value().data)) {
        LOG_ERROR("cannot write {}", tmp.string());
        fs::remove(tmp, ec);
        return {.binary = std::nullopt, .error = FetchError::File};
    }

    auto const written = read_file(tmp);
    auto const found = written ? sha256(*written) : bytes32_t{};
    if (!written || found != expected) {
        LOG_WARNING(
            "hash mismatch for compiler {}: expected {} found {}",
            version,
            expected,
            found);
        fs::remove(tmp, ec);
        fs::remove(dir, ec);
        return {.binary = std::nullopt, .error = FetchError::HashMismatch};
    }

    fs::permissions(
        tmp,
        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
            fs::perms::others_read | fs::perms::others_exec,
        ec);
    if (!ec) {
        fs::rename(tmp, path, ec);
    }
    if (ec) {
        LOG_ERROR("cannot install {}: {}", path.string(), ec.message());
        fs::remove(tmp, ec);
        return {.binary = std::nullopt, .error = FetchError::File};
    }

    LOG_INFO("compiler {} stored at {}", version, path.string());
    return {
        .binary =
            CachedBinary{.version = version, .path = path, .sha256 = found},
        .error = FetchError::Success};
}

Result<CompilerVersion>
BinaryCache::normalize(CompilerVersion const &requested) const
{
    auto const known = all_versions();
    if (auto const version = normalize_version(requested, known)) {
        return *version;
    }
    return FetchError::NotFound;
}

Result<void> BinaryCache::revalidate(CompilerVersion const &version)
{
    std::optional<CachedBinary> binary;
    {
        std::lock_guard const lock{mutex_};
        if (auto const it = cached_.find(version); it != cached_.end()) {
            binary = it->second;
        }
    }
    if (!binary) {
        return FetchError::NotFound;
    }
    auto const data = read_file(binary->path);
    if (data && sha256(*data) == binary->sha256) {
        return success();
    }
    LOG_WARNING("cached compiler {} failed revalidation", version);
    BOOST_OUTCOME_TRY(evict(version));
    return FetchError::HashMismatch;
}

Result<void> BinaryCache::evict(CompilerVersion const &version)
{
    std::optional<CachedBinary> binary;
    {
        std::lock_guard const lock{mutex_};
        auto const it = cached_.find(version);
        if (it == cached_.end()) {
            return FetchError::NotFound;
        }
        binary = std::move(it->second);
        cached_.erase(it);
    }
    std::error_code ec;
    fs::remove(binary->path, ec);
    if (ec) {
        LOG_ERROR("cannot remove {}: {}", binary->path.string(), ec.message());
        return FetchError::File;
    }
    fs::remove(binary->path.parent_path(), ec);
    return success();
}

std::set<CompilerVersion> BinaryCache::all_versions() const
{
    auto versions = fetcher_->all_versions();
    std::lock_guard const lock{mutex_};
    for (auto const &[version, _] : cached_) {
        versions.insert(version);
    }
    return versions;
}

std::vector<CachedBinary> BinaryCache::cached() const
{
    std::lock_guard const lock{mutex_};
    std::vector<CachedBinary> binaries;
    binaries.reserve(cached_.size());
    for (auto const &[_, binary] : cached_) {
        binaries.push_back(binary);
    }
    return binaries;
}

VERITAS_NAMESPACE_END
