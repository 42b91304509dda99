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

#include <veritas/core/sha256.hpp>

#include <silkpre/sha256.h>

VERITAS_NAMESPACE_BEGIN

bytes32_t sha256(byte_string_view const data)
{
    bytes32_t h;
    silkpre_sha256(h.bytes, data.data(), data.size(), true /* use_cpu_extensions */);
    return h;
}

VERITAS_NAMESPACE_END
