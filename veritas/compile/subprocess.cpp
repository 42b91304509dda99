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

#include <veritas/compile/subprocess.hpp>

#include <veritas/compile/compile_error.hpp>
#include <veritas/core/config.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include <quill/Quill.h>

#include <future>
#include <optional>
#include <system_error>

namespace bp = boost::process;

VERITAS_NAMESPACE_BEGIN

Result<ProcessOutput> run_process(
    std::filesystem::path const &exe, std::vector<std::string> const &args,
    std::string const &input, std::chrono::milliseconds const timeout,
    std::filesystem::path const &cwd)
{
    boost::asio::io_context ios;
    std::future<std::string> out;
    std::future<std::string> err;
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    std::optional<bp::child> child;
    try {
        auto const dir = cwd.empty() ? std::filesystem::current_path() : cwd;
        child.emplace(
            bp::exe = exe.string(),
            bp::args = args,
            bp::std_in < boost::asio::buffer(input),
            bp::std_out > out,
            bp::std_err > err,
            bp::start_dir = dir.string(),
            ios);
    }
    catch (bp::process_error const &e) {
        LOG_WARNING("cannot execute {}: {}", exe.string(), e.what());
        return CompileError::Execute;
    }
    catch (std::filesystem::filesystem_error const &e) {
        LOG_WARNING("cannot execute {}: {}", exe.string(), e.what());
        return CompileError::Execute;
    }

    ios.run_until(deadline);
    if (!ios.stopped()) {
        std::error_code ec;
        child->terminate(ec);
        LOG_WARNING(
            "{} killed after {} ms", exe.string(), timeout.count());
        return CompileError::Timeout;
    }

    std::error_code ec;
    child->wait(ec);
    if (ec) {
        LOG_WARNING("cannot wait for {}: {}", exe.string(), ec.message());
        return CompileError::Execute;
    }
    return ProcessOutput{
        .exit_code = child->exit_code(), .out = out.get(), .err = err.get()};
}

VERITAS_NAMESPACE_END
