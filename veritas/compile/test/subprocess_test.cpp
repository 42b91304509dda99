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

#include <veritas/compile/compile_error.hpp>
#include <veritas/compile/subprocess.hpp>
#include <veritas/core/test_util/temp_dir.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace veritas;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace
{
    fs::path write_script(fs::path const &dir, std::string const &body)
    {
        auto const path = dir / "script.sh";
        std::ofstream out{path};
        out << "#!/bin/sh\n" << body;
        out.close();
        fs::permissions(
            path, fs::perms::owner_all | fs::perms::group_read |
                      fs::perms::group_exec);
        return path;
    }
}

TEST(Subprocess, pipes_stdin_to_stdout)
{
    test::TempDir const tmp{"veritas_subprocess"};
    auto const script = write_script(tmp.path(), "cat\necho done >&2\n");

    auto const res = run_process(script, {}, "hello compiler", 10s);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().exit_code, 0);
    EXPECT_EQ(res.value().out, "hello compiler");
    EXPECT_EQ(res.value().err, "done\n");
}

TEST(Subprocess, reports_exit_code_and_args)
{
    test::TempDir const tmp{"veritas_subprocess"};
    auto const script = write_script(tmp.path(), "echo \"$1 $2\"\nexit 3\n");

    auto const res = run_process(script, {"--standard-json", "x"}, {}, 10s);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().exit_code, 3);
    EXPECT_EQ(res.value().out, "--standard-json x\n");
}

TEST(Subprocess, runs_in_working_dir)
{
    test::TempDir const tmp{"veritas_subprocess"};
    test::TempDir const cwd{"veritas_subprocess_cwd"};
    std::ofstream{cwd.path() / "A.sol"} << "contract A {}";
    auto const script = write_script(tmp.path(), "cat A.sol\n");

    auto const res = run_process(script, {}, {}, 10s, cwd.path());
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().out, "contract A {}");
}

TEST(Subprocess, kills_on_timeout)
{
    test::TempDir const tmp{"veritas_subprocess"};
    auto const script = write_script(tmp.path(), "exec sleep 30\n");

    auto const start = std::chrono::steady_clock::now();
    auto const res = run_process(script, {}, {}, 200ms);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), CompileError::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST(Subprocess, missing_binary)
{
    test::TempDir const tmp{"veritas_subprocess"};
    auto const res = run_process(tmp.path() / "no_such_solc", {}, {}, 10s);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), CompileError::Execute);
}
