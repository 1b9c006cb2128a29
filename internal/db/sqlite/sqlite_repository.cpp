#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace relay::db::sqlite {

using relay::db::ErrorCode;
using relay::db::Result;
using relay::manager::v1::JobStatus;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Column order follows sql::ITEM_COLUMNS.
static model::ItemRecord ReadItem(sqlite3_stmt* st) {
    model::ItemRecord r;
    r.external_id        = ColText(st, 0);
    r.title              = ColText(st, 1);
    r.source_name        = ColText(st, 2);
    r.duration_seconds   = static_cast<uint32_t>(ColI32(st, 3));
    r.thumbnail          = ColText(st, 4);
    r.retrieval_status   = static_cast<JobStatus>(ColI32(st, 5));
    r.retrieval_attempts = static_cast<uint32_t>(ColI32(st, 6));
    r.retrieval_error    = ColText(st, 7);
    r.local_path         = ColText(st, 8);
    r.local_size         = ColU64(st, 9);
    r.retrieved_at_ms    = ColU64(st, 10);
    r.relay_status       = static_cast<JobStatus>(ColI32(st, 11));
    r.relay_attempts     = static_cast<uint32_t>(ColI32(st, 12));
    r.relay_error        = ColText(st, 13);
    r.remote_ref         = ColText(st, 14);
    r.relayed_at_ms      = ColU64(st, 15);
    r.created_at_ms      = ColU64(st, 16);
    return r;
}

static model::SourceRecord ReadSource(sqlite3_stmt* st) {
    model::SourceRecord r;
    r.source_id          = ColText(st, 0);
    r.name               = ColText(st, 1);
    r.thumbnail          = ColText(st, 2);
    r.last_seen_item_id  = ColText(st, 3);
    r.last_seen_at_ms    = ColU64(st, 4);
    r.last_scanned_at_ms = ColU64(st, 5);
    r.enabled            = ColI32(st, 6) != 0;
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result SqliteRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_ITEM);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, r.external_id);
    BindText(st.Get(), 2, r.title);
    BindText(st.Get(), 3, r.source_name);
    BindI32(st.Get(), 4, static_cast<int>(r.duration_seconds));
    BindText(st.Get(), 5, r.thumbnail);
    BindI32(st.Get(), 6, static_cast<int>(r.retrieval_status));
    BindI32(st.Get(), 7, static_cast<int>(r.retrieval_attempts));
    BindText(st.Get(), 8, r.retrieval_error);
    BindText(st.Get(), 9, r.local_path);
    BindU64(st.Get(), 10, r.local_size);
    BindU64(st.Get(), 11, r.retrieved_at_ms);
    BindI32(st.Get(), 12, static_cast<int>(r.relay_status));
    BindI32(st.Get(), 13, static_cast<int>(r.relay_attempts));
    BindText(st.Get(), 14, r.relay_error);
    BindText(st.Get(), 15, r.remote_ref);
    BindU64(st.Get(), 16, r.relayed_at_ms);
    BindU64(st.Get(), 17, r.created_at_ms);

    return Translate(db, st.Step());
}

std::optional<model::ItemRecord>
SqliteRepository::GetItem(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_ITEM);
    if (!st.Ok()) return std::nullopt;

    BindText(st.Get(), 1, id);
    if (st.Step() != SQLITE_ROW) return std::nullopt;
    return ReadItem(st.Get());
}

Result SqliteRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_ITEM);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, r.title);
    BindText(st.Get(), 2, r.source_name);
    BindI32(st.Get(), 3, static_cast<int>(r.duration_seconds));
    BindText(st.Get(), 4, r.thumbnail);
    BindI32(st.Get(), 5, static_cast<int>(r.retrieval_status));
    BindI32(st.Get(), 6, static_cast<int>(r.retrieval_attempts));
    BindText(st.Get(), 7, r.retrieval_error);
    BindText(st.Get(), 8, r.local_path);
    BindU64(st.Get(), 9, r.local_size);
    BindU64(st.Get(), 10, r.retrieved_at_ms);
    BindI32(st.Get(), 11, static_cast<int>(r.relay_status));
    BindI32(st.Get(), 12, static_cast<int>(r.relay_attempts));
    BindText(st.Get(), 13, r.relay_error);
    BindText(st.Get(), 14, r.remote_ref);
    BindU64(st.Get(), 15, r.relayed_at_ms);
    BindText(st.Get(), 16, r.external_id);

    const int rc = st.Step();
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, r.external_id);
    return Translate(db, rc);
}

Result SqliteRepository::DeleteItem(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_ITEM);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, id);
    return Translate(db, st.Step());
}

std::vector<model::ItemRecord> SqliteRepository::ListItems(Transaction& t) {
    std::vector<model::ItemRecord> out;
    Statement st(TX(t).Handle(), sql::LIST_ITEMS);
    if (!st.Ok()) return out;

    while (st.Step() == SQLITE_ROW) out.push_back(ReadItem(st.Get()));
    return out;
}

std::vector<model::ItemRecord> SqliteRepository::ListItemsByRetrievalStatus(Transaction& t, JobStatus status) {
    std::vector<model::ItemRecord> out;
    Statement st(TX(t).Handle(), sql::LIST_ITEMS_BY_RETRIEVAL_STATUS);
    if (!st.Ok()) return out;

    BindI32(st.Get(), 1, static_cast<int>(status));
    while (st.Step() == SQLITE_ROW) out.push_back(ReadItem(st.Get()));
    return out;
}

std::vector<model::ItemRecord> SqliteRepository::ListItemsByRelayStatus(Transaction& t, JobStatus status) {
    std::vector<model::ItemRecord> out;
    Statement st(TX(t).Handle(), sql::LIST_ITEMS_BY_RELAY_STATUS);
    if (!st.Ok()) return out;

    BindI32(st.Get(), 1, static_cast<int>(status));
    while (st.Step() == SQLITE_ROW) out.push_back(ReadItem(st.Get()));
    return out;
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSource(Transaction& t, const model::SourceRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_SOURCE);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, r.source_id);
    BindText(st.Get(), 2, r.name);
    BindText(st.Get(), 3, r.thumbnail);
    BindText(st.Get(), 4, r.last_seen_item_id);
    BindU64(st.Get(), 5, r.last_seen_at_ms);
    BindU64(st.Get(), 6, r.last_scanned_at_ms);
    BindI32(st.Get(), 7, r.enabled ? 1 : 0);

    return Translate(db, st.Step());
}

std::optional<model::SourceRecord> SqliteRepository::GetSource(Transaction& t, const std::string& source_id) {
    Statement st(TX(t).Handle(), sql::SELECT_SOURCE);
    if (!st.Ok()) return std::nullopt;

    BindText(st.Get(), 1, source_id);
    if (st.Step() != SQLITE_ROW) return std::nullopt;
    return ReadSource(st.Get());
}

std::vector<model::SourceRecord> SqliteRepository::ListSources(Transaction& t) {
    std::vector<model::SourceRecord> out;
    Statement st(TX(t).Handle(), sql::LIST_SOURCES);
    if (!st.Ok()) return out;

    while (st.Step() == SQLITE_ROW) out.push_back(ReadSource(st.Get()));
    return out;
}

// ------------------------------------------------------------------
// Key/value state
// ------------------------------------------------------------------

Result SqliteRepository::PutState(Transaction& t, const model::StateRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::PUT_STATE);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, r.key);
    BindText(st.Get(), 2, r.value);
    BindU64(st.Get(), 3, r.updated_at_ms);

    return Translate(db, st.Step());
}

std::optional<model::StateRecord> SqliteRepository::GetState(Transaction& t, const std::string& key) {
    Statement st(TX(t).Handle(), sql::GET_STATE);
    if (!st.Ok()) return std::nullopt;

    BindText(st.Get(), 1, key);
    if (st.Step() != SQLITE_ROW) return std::nullopt;

    model::StateRecord r;
    r.key           = ColText(st.Get(), 0);
    r.value         = ColText(st.Get(), 1);
    r.updated_at_ms = ColU64(st.Get(), 2);
    return r;
}

} // namespace relay::db::sqlite
