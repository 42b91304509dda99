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

#include "file_io.hpp"

#include <veritas/core/config.hpp>
#include <veritas/core/veritas_exception.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

VERITAS_NAMESPACE_BEGIN

std::string read_text_file(std::filesystem::path const &path)
{
    VERITAS_ASSERT_THROW(
        std::filesystem::is_regular_file(path), "missing or bad file");
    std::ifstream is(path);
    VERITAS_ASSERT_THROW(is, "file cannot be opened");
    return std::string{
        std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
}

nlohmann::json read_json_file(std::filesystem::path const &path)
{
    auto json = nlohmann::json::parse(
        read_text_file(path), nullptr, /*allow_exceptions*/ false);
    if (json.is_discarded()) {
        LOG_ERROR("{} is not valid json", path.string());
    }
    VERITAS_ASSERT_THROW(!json.is_discarded(), "file is not valid json");
    return json;
}

std::map<std::string, std::string>
read_sources(std::vector<std::filesystem::path> const &paths)
{
    std::map<std::string, std::string> sources;
    for (auto const &path : paths) {
        sources.emplace(path.generic_string(), read_text_file(path));
    }
    return sources;
}

VERITAS_NAMESPACE_END
