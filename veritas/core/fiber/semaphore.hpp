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

#include <boost/fiber/condition_variable.hpp>
#include <boost/fiber/mutex.hpp>

#include <cstddef>
#include <mutex>

VERITAS_FIBER_NAMESPACE_BEGIN

/// Counting semaphore usable from fibers and plain threads alike.
class Semaphore final
{
    boost::fibers::mutex mutex_{};
    boost::fibers::condition_variable cv_{};
    size_t available_;

public:
    explicit Semaphore(size_t const count)
        : available_{count}
    {
    }

    Semaphore(Semaphore const &) = delete;
    Semaphore &operator=(Semaphore const &) = delete;

    void acquire()
    {
        std::unique_lock<boost::fibers::mutex> lock{mutex_};
        cv_.wait(lock, [this] { return available_ > 0; });
        --available_;
    }

    void release()
    {
        {
            std::unique_lock<boost::fibers::mutex> const lock{mutex_};
            ++available_;
        }
        cv_.notify_one();
    }

    size_t available()
    {
        std::unique_lock<boost::fibers::mutex> const lock{mutex_};
        return available_;
    }
};

class SemaphoreGuard final
{
    Semaphore &sem_;

public:
    explicit SemaphoreGuard(Semaphore &sem)
        : sem_{sem}
    {
        sem_.acquire();
    }

    SemaphoreGuard(SemaphoreGuard const &) = delete;
    SemaphoreGuard &operator=(SemaphoreGuard const &) = delete;

    ~SemaphoreGuard()
    {
        sem_.release();
    }
};

VERITAS_FIBER_NAMESPACE_END
