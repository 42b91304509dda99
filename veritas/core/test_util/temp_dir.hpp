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

#include <veritas/core/assert.h>
#include <veritas/core/config.hpp>

#include <filesystem>
#include <string>
#include <system_error>

#include <stdlib.h>

VERITAS_NAMESPACE_BEGIN

namespace test
{
    /// Directory under the system temp dir, removed with its contents on
    /// destruction
    class TempDir
    {
        std::filesystem::path path_;

    public:
        explicit TempDir(std::string const &prefix = "veritas_test")
        {
            auto tmpl =
                (std::filesystem::temp_directory_path() / (prefix + "_XXXXXX"))
                    .string();
            char *const path = mkdtemp(tmpl.data());
            VERITAS_ASSERT(path != nullptr);
            path_ = path;
        }

        TempDir(TempDir const &) = delete;
        TempDir &operator=(TempDir const &) = delete;

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        std::filesystem::path const &path() const noexcept
        {
            return path_;
        }
    };
}

VERITAS_NAMESPACE_END
