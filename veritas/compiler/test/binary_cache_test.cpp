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
#include <veritas/compiler/fetcher.hpp>
#include <veritas/compiler/versions_refresher.hpp>
#include <veritas/core/sha256.hpp>
#include <veritas/core/test_util/temp_dir.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace veritas;
namespace fs = std::filesystem;

namespace
{
    CompilerVersion version(std::string_view const s)
    {
        return parse_compiler_version(s).value();
    }

    struct MockFetcher final : public Fetcher
    {
        std::set<CompilerVersion> versions;
        byte_string data;
        bytes32_t expected;
        std::atomic<unsigned> fetches{0};
        std::shared_future<void> gate;
        std::atomic<unsigned> throws{0};

        Result<FetchedBinary> fetch(CompilerVersion const &v) override
        {
            fetches.fetch_add(1, std::memory_order_acq_rel);
            if (throws.load(std::memory_order_acquire) > 0) {
                throws.fetch_sub(1, std::memory_order_acq_rel);
                throw std::runtime_error{"connection reset"};
            }
            if (gate.valid()) {
                gate.wait();
            }
            if (!versions.contains(v)) {
                return FetchError::NotFound;
            }
            return FetchedBinary{.data = data, .expected_sha256 = expected};
        }

        std::set<CompilerVersion> all_versions() override
        {
            return versions;
        }
    };

    class BinaryCacheTest : public ::testing::Test
    {
    protected:
        test::TempDir tmp{"veritas_binary_cache"};
        std::shared_ptr<MockFetcher> fetcher{std::make_shared<MockFetcher>()};
        CompilerVersion const v1{version("v1.2.3+commit.abcdef")};

        void SetUp() override
        {
            fetcher->versions = {v1};
            fetcher->data = byte_string{
                to_byte_string_view("#!/bin/sh\necho compiler\n")};
            fetcher->expected = sha256(fetcher->data);
        }

        BinaryCache make_cache()
        {
            return BinaryCache{
                fetcher, BinaryCacheConfig{.dir = tmp.path() / "solc"}};
        }
    };
}

TEST_F(BinaryCacheTest, fetches_once_then_hits)
{
    auto cache = make_cache();
    ASSERT_FALSE(cache.load_from_dir().has_error());

    auto const first = cache.get_or_fetch(v1);
    ASSERT_FALSE(first.has_error());
    EXPECT_EQ(first.value().path, tmp.path() / "solc" / v1.to_string() / "solc");
    EXPECT_TRUE(fs::is_regular_file(first.value().path));
    EXPECT_FALSE(fs::exists(first.value().path.string() + ".tmp"));
    auto const perms = fs::status(first.value().path).permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
    EXPECT_EQ(first.value().sha256, fetcher->expected);

    auto const second = cache.get_or_fetch(v1);
    ASSERT_FALSE(second.has_error());
    EXPECT_EQ(second.value().path, first.value().path);
    EXPECT_EQ(fetcher->fetches.load(), 1);
}

TEST_F(BinaryCacheTest, unknown_version)
{
    auto cache = make_cache();
    auto const res = cache.get_or_fetch(version("v0.0.1+commit.00"));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), FetchError::NotFound);
    EXPECT_EQ(fetcher->fetches.load(), 0);
}

TEST_F(BinaryCacheTest, hash_mismatch_leaves_nothing_on_disk)
{
    fetcher->expected = sha256(to_byte_string_view("something else"));
    auto cache = make_cache();
    ASSERT_FALSE(cache.load_from_dir().has_error());

    auto const res = cache.get_or_fetch(v1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), FetchError::HashMismatch);
    EXPECT_FALSE(fs::exists(tmp.path() / "solc" / v1.to_string()));
    EXPECT_TRUE(cache.cached().empty());

    // not memoized: the next call fetches again
    fetcher->expected = sha256(fetcher->data);
    EXPECT_FALSE(cache.get_or_fetch(v1).has_error());
    EXPECT_EQ(fetcher->fetches.load(), 2);
}

TEST_F(BinaryCacheTest, concurrent_requests_share_one_fetch)
{
    std::promise<void> release;
    fetcher->gate = release.get_future().share();
    auto cache = make_cache();

    constexpr unsigned N = 8;
    std::vector<std::future<Result<CachedBinary>>> results;
    for (unsigned i = 0; i < N; ++i) {
        results.push_back(std::async(
            std::launch::async, [&] { return cache.get_or_fetch(v1); }));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    release.set_value();

    for (auto &f : results) {
        auto const res = f.get();
        ASSERT_FALSE(res.has_error());
        EXPECT_EQ(res.value().sha256, fetcher->expected);
    }
    EXPECT_EQ(fetcher->fetches.load(), 1);
}

TEST_F(BinaryCacheTest, concurrent_requests_share_one_failure)
{
    std::promise<void> release;
    fetcher->gate = release.get_future().share();
    fetcher->expected = bytes32_t{};
    auto cache = make_cache();

    constexpr unsigned N = 8;
    std::vector<std::future<Result<CachedBinary>>> results;
    for (unsigned i = 0; i < N; ++i) {
        results.push_back(std::async(
            std::launch::async, [&] { return cache.get_or_fetch(v1); }));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    release.set_value();

    for (auto &f : results) {
        auto const res = f.get();
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), FetchError::HashMismatch);
    }
    EXPECT_EQ(fetcher->fetches.load(), 1);
}

TEST_F(BinaryCacheTest, throwing_fetch_can_be_retried)
{
    fetcher->throws = 1;
    auto cache = make_cache();
    EXPECT_THROW((void)cache.get_or_fetch(v1), std::runtime_error);
    EXPECT_TRUE(cache.cached().empty());

    auto const res = cache.get_or_fetch(v1);
    ASSERT_FALSE(res.has_error());
    EXPECT_TRUE(fs::exists(res.value().path));
    EXPECT_EQ(fetcher->fetches.load(), 2);
}

TEST_F(BinaryCacheTest, load_from_dir_registers_existing)
{
    {
        auto cache = make_cache();
        ASSERT_FALSE(cache.get_or_fetch(v1).has_error());
    }
    fs::create_directories(tmp.path() / "solc" / "not-a-version");
    std::ofstream{tmp.path() / "solc" / "not-a-version" / "solc"} << "x";

    fetcher->versions.clear();
    auto cache = make_cache();
    ASSERT_FALSE(cache.load_from_dir().has_error());
    ASSERT_EQ(cache.cached().size(), 1);
    EXPECT_EQ(cache.cached().front().version, v1);

    auto const res = cache.get_or_fetch(v1);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(fetcher->fetches.load(), 1);
}

TEST_F(BinaryCacheTest, revalidate_and_evict)
{
    auto cache = make_cache();
    auto const res = cache.get_or_fetch(v1);
    ASSERT_FALSE(res.has_error());
    EXPECT_FALSE(cache.revalidate(v1).has_error());

    std::ofstream{res.value().path, std::ios::trunc} << "tampered";
    auto const revalidated = cache.revalidate(v1);
    ASSERT_TRUE(revalidated.has_error());
    EXPECT_EQ(revalidated.error(), FetchError::HashMismatch);
    EXPECT_FALSE(fs::exists(res.value().path));
    EXPECT_TRUE(cache.cached().empty());

    EXPECT_EQ(cache.evict(v1).error(), FetchError::NotFound);
}

TEST_F(BinaryCacheTest, normalize_resolves_short_commit)
{
    auto cache = make_cache();
    auto const res = cache.normalize(version("1.2.3+commit.abc"));
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), v1);
    EXPECT_EQ(
        cache.normalize(version("1.2.4")).error(), FetchError::NotFound);
}

TEST(VersionsRefresher, swaps_only_on_change)
{
    unsigned loads = 0;
    VersionManifest next;
    next.emplace(
        version("v0.8.19+commit.7dd6d404"),
        ManifestEntry{.url = "http://example.org/solc"});
    bool fail = false;

    VersionsRefresher refresher{
        {},
        [&]() -> Result<VersionManifest> {
            ++loads;
            if (fail) {
                return FetchError::Fetch;
            }
            return next;
        },
        std::chrono::seconds{0}};

    EXPECT_TRUE(refresher.versions().empty());
    auto const before = refresher.snapshot();
    EXPECT_TRUE(refresher.refresh());
    EXPECT_EQ(refresher.versions().size(), 1);
    // readers keep their snapshot
    EXPECT_TRUE(before->empty());

    EXPECT_FALSE(refresher.refresh());
    fail = true;
    EXPECT_FALSE(refresher.refresh());
    EXPECT_EQ(refresher.versions().size(), 1);
    EXPECT_EQ(loads, 3);
}

TEST(VersionsRefresher, background_thread_refreshes)
{
    std::atomic<unsigned> loads{0};
    {
        VersionsRefresher refresher{
            {},
            [&]() -> Result<VersionManifest> {
                loads.fetch_add(1);
                return VersionManifest{};
            },
            std::chrono::seconds{1}};
        auto const deadline =
            std::chrono::steady_clock::now() + std::chrono::seconds{10};
        while (loads.load() == 0 &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    EXPECT_GE(loads.load(), 1);
}
