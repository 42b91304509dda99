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

#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

VERITAS_NAMESPACE_BEGIN

struct ProcessOutput
{
    int exit_code;
    std::string out;
    std::string err;
};

/// Runs `exe` with `input` on stdin and collects both output streams. The
/// process is killed once `timeout` elapses (`CompileError::Timeout`); a
/// binary that cannot be started yields `CompileError::Execute`.
Result<ProcessOutput> run_process(
    std::filesystem::path const &exe, std::vector<std::string> const &args,
    std::string const &input, std::chrono::milliseconds timeout,
    std::filesystem::path const &cwd = {});

VERITAS_NAMESPACE_END
