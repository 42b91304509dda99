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
#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/sha256.hpp>

#include <atomic>
#include <map>
#include <set>
#include <string>

VERITAS_NAMESPACE_BEGIN

namespace test
{
    /// Serves fixed binaries, typically shell scripts standing in for
    /// compilers
    class StaticFetcher final : public Fetcher
    {
        std::map<CompilerVersion, byte_string> binaries_;

    public:
        std::atomic<unsigned> fetches{0};

        void add(CompilerVersion const &version, std::string const &script)
        {
            binaries_.insert_or_assign(
                version, byte_string{to_byte_string_view(script)});
        }

        Result<FetchedBinary> fetch(CompilerVersion const &version) override
        {
            fetches.fetch_add(1, std::memory_order_acq_rel);
            auto const it = binaries_.find(version);
            if (it == binaries_.end()) {
                return FetchError::NotFound;
            }
            return FetchedBinary{
                .data = it->second, .expected_sha256 = sha256(it->second)};
        }

        std::set<CompilerVersion> all_versions() override
        {
            std::set<CompilerVersion> versions;
            for (auto const &[version, _] : binaries_) {
                versions.insert(version);
            }
            return versions;
        }
    };
}

VERITAS_NAMESPACE_END
