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

#include <veritas/compiler/fetcher.hpp>
#include <veritas/compiler/version.hpp>
#include <veritas/core/bytes.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <boost/fiber/future.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

VERITAS_NAMESPACE_BEGIN

struct CachedBinary
{
    CompilerVersion version;
    std::filesystem::path path;
    bytes32_t sha256;
};

struct BinaryCacheConfig
{
    std::filesystem::path dir;
    std::string binary_name{"solc"};
};

/// Version addressed store of verified compiler executables laid out as
/// `<dir>/<version>/<binary_name>`. At most one download runs per version;
/// concurrent requests for that version wait for it and share its outcome.
class BinaryCache
{
    struct FetchOutcome
    {
        std::optional<CachedBinary> binary;
        FetchError error{FetchError::Success};
    };

    std::shared_ptr<Fetcher> fetcher_;
    BinaryCacheConfig config_;

    mutable std::mutex mutex_{};
    std::map<CompilerVersion, CachedBinary> cached_{};
    std::map<CompilerVersion, boost::fibers::shared_future<FetchOutcome>>
        in_flight_{};

    FetchOutcome fetch_and_store(CompilerVersion const &);

public:
    BinaryCache(std::shared_ptr<Fetcher>, BinaryCacheConfig);

    BinaryCache(BinaryCache const &) = delete;
    BinaryCache &operator=(BinaryCache const &) = delete;

    /// Creates the cache directory and registers binaries already on disk
    Result<void> load_from_dir();

    Result<CachedBinary> get_or_fetch(CompilerVersion const &);

    /// Resolves a possibly abbreviated version against the known versions
    Result<CompilerVersion> normalize(CompilerVersion const &) const;

    /// Re-hashes a cached binary; on mismatch it is evicted
    Result<void> revalidate(CompilerVersion const &);

    Result<void> evict(CompilerVersion const &);

    std::set<CompilerVersion> all_versions() const;

    std::vector<CachedBinary> cached() const;

    std::filesystem::path const &dir() const noexcept
    {
        return config_.dir;
    }
};

VERITAS_NAMESPACE_END
