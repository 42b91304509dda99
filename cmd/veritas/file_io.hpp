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

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

VERITAS_NAMESPACE_BEGIN

/// Throws `VeritasException` if the file cannot be read
std::string read_text_file(std::filesystem::path const &);

/// Throws `VeritasException` if the file cannot be read or parsed
nlohmann::json read_json_file(std::filesystem::path const &);

/// Sources keyed by the path they were given as
std::map<std::string, std::string>
read_sources(std::vector<std::filesystem::path> const &);

VERITAS_NAMESPACE_END
