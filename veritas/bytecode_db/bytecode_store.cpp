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

#include <veritas/bytecode_db/bytecode_store.hpp>

#include <veritas/bytecode_db/part.hpp>
#include <veritas/bytecode_db/store_error.hpp>
#include <veritas/compile/compiler_input.hpp>
#include <veritas/core/byte_string.hpp>
#include <veritas/core/config.hpp>
#include <veritas/core/hex.hpp>
#include <veritas/core/keccak.hpp>
#include <veritas/core/veritas_exception.hpp>
#include <veritas/verify/match.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <sqlite3.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

VERITAS_ANONYMOUS_NAMESPACE_BEGIN

constexpr char const *SCHEMA = R"sql(
CREATE TABLE IF NOT EXISTS contracts (
    id INTEGER PRIMARY KEY,
    fingerprint BLOB NOT NULL UNIQUE,
    name TEXT NOT NULL,
    file_name TEXT NOT NULL,
    compiler TEXT NOT NULL,
    version TEXT NOT NULL,
    language TEXT NOT NULL,
    settings TEXT NOT NULL,
    constructor_arguments BLOB,
    created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now'))
);
CREATE TABLE IF NOT EXISTS source_files (
    contract_id INTEGER NOT NULL REFERENCES contracts (id),
    path TEXT NOT NULL,
    content TEXT NOT NULL,
    PRIMARY KEY (contract_id, path)
);
CREATE TABLE IF NOT EXISTS parts (
    id INTEGER PRIMARY KEY,
    hash BLOB NOT NULL,
    part_type INTEGER NOT NULL,
    data BLOB NOT NULL,
    size INTEGER NOT NULL,
    data_prefix TEXT NOT NULL,
    UNIQUE (hash, part_type)
);
CREATE INDEX IF NOT EXISTS parts_main_prefix
    ON parts (data_prefix) WHERE part_type = 1;
CREATE INDEX IF NOT EXISTS parts_main_size
    ON parts (size) WHERE part_type = 1;
CREATE TABLE IF NOT EXISTS bytecodes (
    id INTEGER PRIMARY KEY,
    contract_id INTEGER NOT NULL REFERENCES contracts (id),
    code_type TEXT NOT NULL,
    UNIQUE (contract_id, code_type)
);
CREATE TABLE IF NOT EXISTS bytecode_parts (
    bytecode_id INTEGER NOT NULL REFERENCES bytecodes (id),
    position INTEGER NOT NULL,
    part_id INTEGER NOT NULL REFERENCES parts (id),
    PRIMARY KEY (bytecode_id, position)
);
)sql";

bool exec(sqlite3 *const db, char const *const sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        LOG_ERROR(
            "sqlite exec failed: {}",
            error != nullptr ? error : sqlite3_errmsg(db));
        sqlite3_free(error);
        return false;
    }
    return true;
}

/// Prepared statement; bind failures surface from `step`
class Statement
{
    sqlite3_stmt *stmt_{nullptr};
    int bind_rc_{SQLITE_OK};

    void check(int const rc) noexcept
    {
        if (bind_rc_ == SQLITE_OK) {
            bind_rc_ = rc;
        }
    }

public:
    Statement(sqlite3 *const db, char const *const sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            LOG_ERROR("sqlite prepare failed: {}", sqlite3_errmsg(db));
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    Statement(Statement const &) = delete;
    Statement &operator=(Statement const &) = delete;

    ~Statement()
    {
        sqlite3_finalize(stmt_);
    }

    explicit operator bool() const noexcept
    {
        return stmt_ != nullptr;
    }

    void bind(int const index, int64_t const value)
    {
        check(sqlite3_bind_int64(stmt_, index, value));
    }

    void bind(int const index, std::string_view const value)
    {
        check(sqlite3_bind_text(
            stmt_,
            index,
            value.data(),
            static_cast<int>(value.size()),
            SQLITE_TRANSIENT));
    }

    void bind(int const index, byte_string_view const value)
    {
        if (value.empty()) {
            check(sqlite3_bind_zeroblob(stmt_, index, 0));
            return;
        }
        check(sqlite3_bind_blob(
            stmt_,
            index,
            value.data(),
            static_cast<int>(value.size()),
            SQLITE_TRANSIENT));
    }

    void bind_null(int const index)
    {
        check(sqlite3_bind_null(stmt_, index));
    }

    int step()
    {
        return bind_rc_ != SQLITE_OK ? bind_rc_ : sqlite3_step(stmt_);
    }

    void reset()
    {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
        bind_rc_ = SQLITE_OK;
    }

    int64_t int_column(int const index) const
    {
        return sqlite3_column_int64(stmt_, index);
    }

    std::string text_column(int const index) const
    {
        auto const *const text = sqlite3_column_text(stmt_, index);
        if (text == nullptr) {
            return {};
        }
        return std::string{
            reinterpret_cast<char const *>(text),
            static_cast<size_t>(sqlite3_column_bytes(stmt_, index))};
    }

    byte_string blob_column(int const index) const
    {
        auto const *const blob =
            static_cast<uint8_t const *>(sqlite3_column_blob(stmt_, index));
        if (blob == nullptr) {
            return {};
        }
        return byte_string{
            blob, static_cast<size_t>(sqlite3_column_bytes(stmt_, index))};
    }

    bool is_null(int const index) const
    {
        return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
    }
};

/// `BEGIN IMMEDIATE` scope, rolled back unless committed
class Transaction
{
    sqlite3 *db_;
    bool open_;

public:
    explicit Transaction(sqlite3 *const db)
        : db_{db}
        , open_{exec(db, "BEGIN IMMEDIATE")}
    {
    }

    Transaction(Transaction const &) = delete;
    Transaction &operator=(Transaction const &) = delete;

    ~Transaction()
    {
        if (open_) {
            exec(db_, "ROLLBACK");
        }
    }

    bool begun() const noexcept
    {
        return open_;
    }

    bool commit()
    {
        if (!exec(db_, "COMMIT")) {
            return false;
        }
        open_ = false;
        return true;
    }
};

byte_string fingerprint(ContractRecord const &record)
{
    nlohmann::json const json = {
        {"name", record.name},
        {"file_name", record.file_name},
        {"compiler", record.compiler},
        {"version", record.version},
        {"language", to_string(record.language)},
        {"settings", record.settings},
        {"sources", record.sources}};
    auto const hash = keccak256(to_byte_string_view(json.dump()));
    return byte_string{hash.bytes, sizeof(hash.bytes)};
}

VERITAS_ANONYMOUS_NAMESPACE_END

VERITAS_NAMESPACE_BEGIN

class BytecodeStore::Impl
{
    mutable std::mutex mutex_;
    sqlite3 *db_{nullptr};

    StoreError database_error(char const *const what) const
    {
        LOG_ERROR("{}: {}", what, sqlite3_errmsg(db_));
        return StoreError::Database;
    }

    Result<std::vector<int64_t>> part_ids(int64_t const bytecode_id) const
    {
        Statement select{
            db_,
            "SELECT part_id FROM bytecode_parts WHERE bytecode_id = ?1 "
            "ORDER BY position"};
        if (!select) {
            return StoreError::Database;
        }
        select.bind(1, bytecode_id);
        std::vector<int64_t> ids;
        int rc;
        while ((rc = select.step()) == SQLITE_ROW) {
            ids.push_back(select.int_column(0));
        }
        if (rc != SQLITE_DONE) {
            return database_error("cannot read bytecode parts");
        }
        return ids;
    }

    Result<std::optional<StoredBytecode>>
    find_bytecode_locked(int64_t const contract_id, CodeType const code_type) const
    {
        Statement select{
            db_,
            "SELECT id FROM bytecodes WHERE contract_id = ?1 AND code_type = ?2"};
        if (!select) {
            return StoreError::Database;
        }
        select.bind(1, contract_id);
        select.bind(2, to_string(code_type));
        int const rc = select.step();
        if (rc == SQLITE_DONE) {
            return std::optional<StoredBytecode>{};
        }
        if (rc != SQLITE_ROW) {
            return database_error("cannot read bytecode");
        }
        int64_t const id = select.int_column(0);
        auto ids = part_ids(id);
        if (ids.has_error()) {
            return std::move(ids).assume_error();
        }
        return std::make_optional(StoredBytecode{
            .id = id,
            .contract_id = contract_id,
            .code_type = code_type,
            .part_ids = std::move(ids).value()});
    }

    Result<std::vector<BytecodePart>> parts_locked(int64_t const bytecode_id) const
    {
        Statement select{
            db_,
            "SELECT bp.position, p.part_type, p.data FROM bytecode_parts bp "
            "JOIN parts p ON p.id = bp.part_id WHERE bp.bytecode_id = ?1 "
            "ORDER BY bp.position"};
        if (!select) {
            return StoreError::Database;
        }
        select.bind(1, bytecode_id);
        std::vector<BytecodePart> parts;
        int rc;
        while ((rc = select.step()) == SQLITE_ROW) {
            auto const position = select.int_column(0);
            auto const type = select.int_column(1);
            if (position != static_cast<int64_t>(parts.size()) ||
                (type != static_cast<int64_t>(PartType::Main) &&
                 type != static_cast<int64_t>(PartType::Metadata))) {
                LOG_ERROR(
                    "bytecode {} has part {} at position {}",
                    bytecode_id,
                    parts.size(),
                    position);
                return StoreError::InconsistentParts;
            }
            parts.push_back(BytecodePart{
                .type = static_cast<PartType>(type),
                .data = select.blob_column(2)});
        }
        if (rc != SQLITE_DONE) {
            return database_error("cannot read bytecode parts");
        }
        if (parts.empty()) {
            Statement exists{db_, "SELECT 1 FROM bytecodes WHERE id = ?1"};
            if (!exists) {
                return StoreError::Database;
            }
            exists.bind(1, bytecode_id);
            int const found = exists.step();
            if (found == SQLITE_DONE) {
                return StoreError::NotFound;
            }
            if (found != SQLITE_ROW) {
                return database_error("cannot read bytecode");
            }
        }
        return parts;
    }

    Result<int64_t> upsert_part(BytecodePart const &part)
    {
        auto const hash = keccak256(part.data);
        byte_string_view const key{hash.bytes, sizeof(hash.bytes)};

        Statement select{
            db_, "SELECT id FROM parts WHERE hash = ?1 AND part_type = ?2"};
        if (!select) {
            return StoreError::Database;
        }
        select.bind(1, key);
        select.bind(2, static_cast<int64_t>(part.type));
        int const rc = select.step();
        if (rc == SQLITE_ROW) {
            return select.int_column(0);
        }
        if (rc != SQLITE_DONE) {
            return database_error("cannot read part");
        }

        Statement insert{
            db_,
            "INSERT INTO parts (hash, part_type, data, size, data_prefix) "
            "VALUES (?1, ?2, ?3, ?4, ?5)"};
        if (!insert) {
            return StoreError::Database;
        }
        insert.bind(1, key);
        insert.bind(2, static_cast<int64_t>(part.type));
        insert.bind(3, byte_string_view{part.data});
        insert.bind(4, static_cast<int64_t>(part.data.size()));
        insert.bind(
            5,
            std::string_view{to_hex(
                byte_string_view{part.data}.substr(0, BytecodeStore::prefix_size))});
        if (insert.step() != SQLITE_DONE) {
            return database_error("cannot insert part");
        }
        return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
    }

public:
    explicit Impl(std::filesystem::path const &path)
    {
        int const rc = sqlite3_open_v2(
            path.c_str(),
            &db_,
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
            nullptr);
        if (rc != SQLITE_OK) {
            LOG_ERROR(
                "cannot open {}: {}",
                path.string(),
                db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_);
            db_ = nullptr;
        }
        VERITAS_ASSERT_THROW(db_ != nullptr, "cannot open bytecode database");

        sqlite3_busy_timeout(db_, 5000);
        if (!exec(db_, "PRAGMA journal_mode=WAL;") ||
            !exec(db_, "PRAGMA foreign_keys=ON;") || !exec(db_, SCHEMA)) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        VERITAS_ASSERT_THROW(db_ != nullptr, "cannot create bytecode schema");
        LOG_INFO("bytecode database at {}", path.string());
    }

    Impl(Impl const &) = delete;
    Impl &operator=(Impl const &) = delete;

    ~Impl()
    {
        sqlite3_close(db_);
    }

    Result<int64_t> insert_contract(ContractRecord const &record)
    {
        std::lock_guard const lock{mutex_};
        auto const key = fingerprint(record);

        Transaction tx{db_};
        if (!tx.begun()) {
            return StoreError::Database;
        }
        Statement select{db_, "SELECT id FROM contracts WHERE fingerprint = ?1"};
        if (!select) {
            return StoreError::Database;
        }
        select.bind(1, byte_string_view{key});
        int const rc = select.step();
        if (rc == SQLITE_ROW) {
            return select.int_column(0);
        }
        if (rc != SQLITE_DONE) {
            return database_error("cannot read contract");
        }

        Statement insert{
            db_,
            "INSERT INTO contracts (fingerprint, name, file_name, compiler, "
            "version, language, settings, constructor_arguments) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)"};
        if (!insert) {
            return StoreError::Database;
        }
        insert.bind(1, byte_string_view{key});
        insert.bind(2, std::string_view{record.name});
        insert.bind(3, std::string_view{record.file_name});
        insert.bind(4, std::string_view{record.compiler});
        insert.bind(5, std::string_view{record.version});
        insert.bind(6, to_string(record.language));
        insert.bind(7, std::string_view{record.settings});
        if (record.constructor_arguments) {
            insert.bind(8, byte_string_view{*record.constructor_arguments});
        }
        else {
            insert.bind_null(8);
        }
        if (insert.step() != SQLITE_DONE) {
            return database_error("cannot insert contract");
        }
        int64_t const id = static_cast<int64_t>(sqlite3_last_insert_rowid(db_));

        Statement source{
            db_,
            "INSERT INTO source_files (contract_id, path, content) "
            "VALUES (?1, ?2, ?3)"};
        if (!source) {
            return StoreError::Database;
        }
        for (auto const &[path, content] : record.sources) {
            source.reset();
            source.bind(1, id);
            source.bind(2, std::string_view{path});
            source.bind(3, std::string_view{content});
            if (source.step() != SQLITE_DONE) {
                return database_error("cannot insert source file");
            }
        }
        if (!tx.commit()) {
            return StoreError::Database;
        }
        LOG_DEBUG("stored contract {}:{} as {}", record.file_name, record.name, id);
        return id;
    }

    Result<ContractRecord> contract(int64_t const contract_id) const
    {
        std::lock_guard const lock{mutex_};
        Statement select{
            db_,
            "SELECT name, file_name, compiler, version, language, settings, "
            "constructor_arguments FROM contracts WHERE id = ?1"};
        if (!select) {
            return StoreError::Database;
        }
        select.bind(1, contract_id);
        int const rc = select.step();
        if (rc == SQLITE_DONE) {
            return StoreError::NotFound;
        }
        if (rc != SQLITE_ROW) {
            return database_error("cannot read contract");
        }
        auto const language = parse_language(select.text_column(4));
        if (!language) {
            LOG_ERROR(
                "contract {} has unknown language {}",
                contract_id,
                select.text_column(4));
            return StoreError::Database;
        }
        ContractRecord record{
            .name = select.text_column(0),
            .file_name = select.text_column(1),
            .compiler = select.text_column(2),
            .version = select.text_column(3),
            .language = *language,
            .settings = select.text_column(5)};
        if (!select.is_null(6)) {
            record.constructor_arguments = select.blob_column(6);
        }

        Statement sources{
            db_,
            "SELECT path, content FROM source_files WHERE contract_id = ?1"};
        if (!sources) {
            return StoreError::Database;
        }
        sources.bind(1, contract_id);
        int source_rc;
        while ((source_rc = sources.step()) == SQLITE_ROW) {
            record.sources.emplace(sources.text_column(0), sources.text_column(1));
        }
        if (source_rc != SQLITE_DONE) {
            return database_error("cannot read source files");
        }
        return record;
    }

    Result<StoredBytecode> persist(
        int64_t const contract_id, CodeType const code_type,
        std::vector<BytecodePart> const &parts)
    {
        std::lock_guard const lock{mutex_};
        Transaction tx{db_};
        if (!tx.begun()) {
            return StoreError::Database;
        }

        auto existing = find_bytecode_locked(contract_id, code_type);
        if (existing.has_error()) {
            return std::move(existing).assume_error();
        }
        if (existing.value().has_value()) {
            auto const &stored = *existing.value();
            auto stored_parts = parts_locked(stored.id);
            if (stored_parts.has_error()) {
                return std::move(stored_parts).assume_error();
            }
            if (stored_parts.value() != parts) {
                LOG_WARNING(
                    "contract {} already has different {} code",
                    contract_id,
                    to_string(code_type));
                return StoreError::BytecodeConflict;
            }
            return stored;
        }

        StoredBytecode stored{
            .id = 0, .contract_id = contract_id, .code_type = code_type};
        for (auto const &part : parts) {
            auto id = upsert_part(part);
            if (id.has_error()) {
                return std::move(id).assume_error();
            }
            stored.part_ids.push_back(id.value());
        }

        Statement insert{
            db_, "INSERT INTO bytecodes (contract_id, code_type) VALUES (?1, ?2)"};
        if (!insert) {
            return StoreError::Database;
        }
        insert.bind(1, contract_id);
        insert.bind(2, to_string(code_type));
        if (insert.step() != SQLITE_DONE) {
            return database_error("cannot insert bytecode");
        }
        stored.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db_));

        Statement link{
            db_,
            "INSERT INTO bytecode_parts (bytecode_id, position, part_id) "
            "VALUES (?1, ?2, ?3)"};
        if (!link) {
            return StoreError::Database;
        }
        for (size_t i = 0; i < stored.part_ids.size(); ++i) {
            link.reset();
            link.bind(1, stored.id);
            link.bind(2, static_cast<int64_t>(i));
            link.bind(3, stored.part_ids[i]);
            if (link.step() != SQLITE_DONE) {
                return database_error("cannot insert bytecode part");
            }
        }
        if (!tx.commit()) {
            return StoreError::Database;
        }
        LOG_DEBUG(
            "stored {} code of contract {} as bytecode {} with {} parts",
            to_string(code_type),
            contract_id,
            stored.id,
            stored.part_ids.size());
        return stored;
    }

    Result<std::optional<StoredBytecode>>
    find_bytecode(int64_t const contract_id, CodeType const code_type) const
    {
        std::lock_guard const lock{mutex_};
        return find_bytecode_locked(contract_id, code_type);
    }

    Result<std::vector<CandidateContract>>
    find_candidates(byte_string_view const code, CodeType const code_type) const
    {
        std::lock_guard const lock{mutex_};
        Statement select{
            db_,
            "SELECT b.id, b.contract_id, p.data FROM bytecodes b "
            "JOIN bytecode_parts bp ON bp.bytecode_id = b.id "
            "AND bp.position = 0 "
            "JOIN parts p ON p.id = bp.part_id "
            "WHERE b.code_type = ?1 AND p.id IN ("
            "SELECT id FROM parts WHERE part_type = 1 AND data_prefix = ?2 "
            "UNION ALL "
            "SELECT id FROM parts WHERE part_type = 1 AND size < ?3) "
            "ORDER BY b.id"};
        if (!select) {
            return StoreError::Database;
        }
        auto const prefix = to_hex(code.substr(0, BytecodeStore::prefix_size));
        select.bind(1, to_string(code_type));
        select.bind(2, std::string_view{prefix});
        select.bind(3, static_cast<int64_t>(BytecodeStore::prefix_size));

        std::vector<CandidateContract> candidates;
        int rc;
        while ((rc = select.step()) == SQLITE_ROW) {
            auto const main = select.blob_column(2);
            if (!code.starts_with(byte_string_view{main})) {
                continue;
            }
            candidates.push_back(CandidateContract{
                .contract_id = select.int_column(1),
                .stored_bytecode_id = select.int_column(0)});
        }
        if (rc != SQLITE_DONE) {
            return database_error("cannot search bytecodes");
        }
        LOG_DEBUG(
            "{} candidates for {} code with prefix {}",
            candidates.size(),
            to_string(code_type),
            prefix);
        return candidates;
    }

    Result<std::vector<BytecodePart>> parts(int64_t const bytecode_id) const
    {
        std::lock_guard const lock{mutex_};
        return parts_locked(bytecode_id);
    }

    Result<size_t> part_count() const
    {
        std::lock_guard const lock{mutex_};
        Statement select{db_, "SELECT COUNT(*) FROM parts"};
        if (!select) {
            return StoreError::Database;
        }
        if (select.step() != SQLITE_ROW) {
            return database_error("cannot count parts");
        }
        return static_cast<size_t>(select.int_column(0));
    }
};

BytecodeStore::BytecodeStore(BytecodeStore &&) = default;

BytecodeStore::BytecodeStore(std::filesystem::path const &path)
    : impl_{new Impl{path}}
{
}

BytecodeStore::~BytecodeStore() = default;

Result<int64_t> BytecodeStore::insert_contract(ContractRecord const &record)
{
    return impl_->insert_contract(record);
}

Result<ContractRecord> BytecodeStore::contract(int64_t const contract_id) const
{
    return impl_->contract(contract_id);
}

Result<StoredBytecode> BytecodeStore::persist(
    int64_t const contract_id, CodeType const code_type,
    byte_string_view const code, CborAuxdata const &auxdata,
    Language const language)
{
    return impl_->persist(
        contract_id, code_type, split_parts(code, auxdata, language));
}

Result<std::optional<StoredBytecode>>
BytecodeStore::find_bytecode(int64_t const contract_id, CodeType const code_type) const
{
    return impl_->find_bytecode(contract_id, code_type);
}

Result<std::vector<CandidateContract>> BytecodeStore::find_candidates(
    byte_string_view const code, CodeType const code_type) const
{
    return impl_->find_candidates(code, code_type);
}

Result<std::vector<BytecodePart>>
BytecodeStore::parts(int64_t const stored_bytecode_id) const
{
    return impl_->parts(stored_bytecode_id);
}

Result<byte_string> BytecodeStore::reassemble(int64_t const stored_bytecode_id) const
{
    auto res = impl_->parts(stored_bytecode_id);
    if (res.has_error()) {
        return std::move(res).assume_error();
    }
    return join_parts(res.value());
}

Result<size_t> BytecodeStore::part_count() const
{
    return impl_->part_count();
}

VERITAS_NAMESPACE_END
