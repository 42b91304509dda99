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

#include <veritas/bytecode_db/part.hpp>
#include <veritas/compile/cbor_auxdata.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/result.hpp>
#include <veritas/verify/match.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

VERITAS_NAMESPACE_BEGIN

/// A verified contract and the sources it was compiled from
struct ContractRecord
{
    std::string name{};
    std::string file_name{};
    std::string compiler{};
    std::string version{};
    Language language{Language::Solidity};
    std::string settings{};
    std::optional<byte_string> constructor_arguments{};
    std::map<std::string, std::string> sources{};
};

struct StoredBytecode
{
    int64_t id;
    int64_t contract_id;
    CodeType code_type;
    std::vector<int64_t> part_ids;

    friend bool
    operator==(StoredBytecode const &, StoredBytecode const &) = default;
};

struct CandidateContract
{
    int64_t contract_id;
    int64_t stored_bytecode_id;

    friend bool
    operator==(CandidateContract const &, CandidateContract const &) = default;
};

/// Content addressed store of verified bytecode. Parts are shared between
/// contracts by keccak256 of their content and each contract keeps at most
/// one bytecode per code type. Backed by a single SQLite connection;
/// operations are serialized and writes are transactional.
class BytecodeStore final
{
    class Impl;

    std::unique_ptr<Impl> impl_;

public:
    /// Size of the hex indexed prefix of Main parts
    static constexpr size_t prefix_size = 32;

    BytecodeStore() = delete;
    BytecodeStore(BytecodeStore const &) = delete;
    BytecodeStore(BytecodeStore &&);
    /// Opens or creates the database; throws `VeritasException` if it
    /// cannot be opened
    explicit BytecodeStore(std::filesystem::path const &);
    ~BytecodeStore();

    /// Id of the contract with the same name, compiler and sources,
    /// inserting it if new
    Result<int64_t> insert_contract(ContractRecord const &);

    Result<ContractRecord> contract(int64_t contract_id) const;

    Result<StoredBytecode> persist(
        int64_t contract_id, CodeType, byte_string_view code,
        CborAuxdata const &auxdata, Language = Language::Solidity);

    Result<std::optional<StoredBytecode>>
    find_bytecode(int64_t contract_id, CodeType) const;

    /// Every stored bytecode of `code_type` whose first Main part is a
    /// prefix of `code`, by ascending bytecode id
    Result<std::vector<CandidateContract>>
    find_candidates(byte_string_view code, CodeType) const;

    Result<std::vector<BytecodePart>> parts(int64_t stored_bytecode_id) const;

    Result<byte_string> reassemble(int64_t stored_bytecode_id) const;

    Result<size_t> part_count() const;
};

VERITAS_NAMESPACE_END
