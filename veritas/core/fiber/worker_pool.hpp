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

#include <veritas/core/fiber/config.hpp>

#include <boost/fiber/buffered_channel.hpp>
#include <boost/fiber/condition_variable.hpp>
#include <boost/fiber/fiber.hpp>
#include <boost/fiber/mutex.hpp>

#include <functional>
#include <future>
#include <thread>
#include <vector>

VERITAS_FIBER_NAMESPACE_BEGIN

/// Runs submitted tasks on `n_fibers` fibers spread over `n_threads` threads
/// which share one ready queue. Tasks may block on fiber primitives without
/// stalling other tasks on the same thread.
class WorkerPool final
{
    bool done_{false};

    boost::fibers::mutex mutex_{};
    boost::fibers::condition_variable cv_{};

    std::vector<std::thread> threads_{};

    boost::fibers::buffered_channel<std::function<void()>> channel_{1024};

    std::vector<boost::fibers::fiber> fibers_{};

    std::promise<void> start_{};

public:
    WorkerPool(unsigned n_threads, unsigned n_fibers);

    WorkerPool(WorkerPool const &) = delete;
    WorkerPool &operator=(WorkerPool const &) = delete;

    ~WorkerPool();

    void submit(std::function<void()> task)
    {
        channel_.push(std::move(task));
    }
};

VERITAS_FIBER_NAMESPACE_END
