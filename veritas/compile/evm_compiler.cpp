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

#include <veritas/compile/evm_compiler.hpp>

#include <veritas/compile/compiler_output.hpp>
#include <veritas/compile/subprocess.hpp>
#include <veritas/core/config.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

VERITAS_NAMESPACE_BEGIN

CompilerOutput standard_json_output(ProcessOutput const &process)
{
    if (process.exit_code != 0) {
        return failed_compiler_output(
            process.err.empty() ? process.out : process.err);
    }
    auto json = nlohmann::json::parse(process.out, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return failed_compiler_output(
            "compiler returned invalid json: " + process.err);
    }
    return make_compiler_output(std::move(json));
}

VERITAS_NAMESPACE_END
