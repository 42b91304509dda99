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

#include <veritas/compiler/versions_refresher.hpp>

#include <veritas/core/config.hpp>
#include <veritas/core/fmt.hpp>

#include <quill/Quill.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <utility>

#include <pthread.h>

VERITAS_NAMESPACE_BEGIN

VersionsRefresher::VersionsRefresher(
    VersionManifest initial, Loader loader, std::chrono::seconds const interval)
    : manifest_{std::make_shared<VersionManifest const>(std::move(initial))}
    , loader_{std::move(loader)}
    , interval_{interval}
{
    if (interval_.count() == 0) {
        return;
    }
    thread_ = std::jthread([this](std::stop_token const token) {
        pthread_setname_np(pthread_self(), "versions refresh");
        while (!token.stop_requested()) {
            {
                std::unique_lock lock{wait_mutex_};
                cv_.wait_for(lock, token, interval_, [&token] {
                    return token.stop_requested();
                });
            }
            if (token.stop_requested()) {
                return;
            }
            refresh();
        }
    });
}

VersionsRefresher::~VersionsRefresher()
{
    if (thread_.joinable()) {
        thread_.request_stop();
        cv_.notify_all();
        thread_.join();
    }
}

std::shared_ptr<VersionManifest const> VersionsRefresher::snapshot() const
{
    std::lock_guard const lock{mutex_};
    return manifest_;
}

std::set<CompilerVersion> VersionsRefresher::versions() const
{
    return versions_of(*snapshot());
}

bool VersionsRefresher::refresh()
{
    LOG_DEBUG("refreshing compiler versions");
    auto loaded = loader_();
    if (loaded.has_error()) {
        LOG_WARNING(
            "failed to refresh compiler versions: {}",
            loaded.error().message().c_str());
        return false;
    }
    auto next =
        std::make_shared<VersionManifest const>(std::move(loaded).value());
    std::lock_guard const lock{mutex_};
    if (*next == *manifest_) {
        return false;
    }
    LOG_INFO(
        "compiler versions updated: {} -> {} entries",
        manifest_->size(),
        next->size());
    manifest_ = std::move(next);
    return true;
}

VERITAS_NAMESPACE_END
