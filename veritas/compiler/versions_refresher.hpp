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
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

VERITAS_NAMESPACE_BEGIN

/// Holds the current version manifest and periodically reloads it. Readers
/// get an immutable snapshot; a reload swaps the whole snapshot at once.
class VersionsRefresher
{
public:
    using Loader = std::function<Result<VersionManifest>()>;

private:
    mutable std::mutex mutex_{};
    std::shared_ptr<VersionManifest const> manifest_;
    Loader loader_;
    std::chrono::seconds interval_;
    std::condition_variable_any cv_{};
    std::mutex wait_mutex_{};
    std::jthread thread_{};

public:
    /// A zero `interval` disables the background thread; `refresh` may
    /// still be called directly
    VersionsRefresher(
        VersionManifest initial, Loader loader, std::chrono::seconds interval);

    VersionsRefresher(VersionsRefresher const &) = delete;
    VersionsRefresher &operator=(VersionsRefresher const &) = delete;

    ~VersionsRefresher();

    std::shared_ptr<VersionManifest const> snapshot() const;

    std::set<CompilerVersion> versions() const;

    /// Reloads once; returns true if the manifest changed. Load failures
    /// are logged and leave the current manifest in place.
    bool refresh();
};

VERITAS_NAMESPACE_END
