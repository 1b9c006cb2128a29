#pragma once

namespace relay::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Column order of ITEM_COLUMNS is what the row readers expect.
*/

#define RELAY_ITEM_COLUMNS                                                                                  \
  "external_id,title,source_name,duration_seconds,thumbnail,"                                               \
  "retrieval_status,retrieval_attempts,retrieval_error,local_path,local_size,retrieved_at_ms,"              \
  "relay_status,relay_attempts,relay_error,remote_ref,relayed_at_ms,created_at_ms"

static constexpr const char* ITEM_COLUMNS = RELAY_ITEM_COLUMNS;

static constexpr const char* INSERT_ITEM =
    "INSERT INTO items(" RELAY_ITEM_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ITEM =
    "SELECT " RELAY_ITEM_COLUMNS " FROM items WHERE external_id=?;";

// created_at_ms is immutable and not part of the update
static constexpr const char* UPDATE_ITEM =
    "UPDATE items SET title=?,source_name=?,duration_seconds=?,thumbnail=?,"
    "retrieval_status=?,retrieval_attempts=?,retrieval_error=?,local_path=?,local_size=?,retrieved_at_ms=?,"
    "relay_status=?,relay_attempts=?,relay_error=?,remote_ref=?,relayed_at_ms=?"
    " WHERE external_id=?;";

static constexpr const char* DELETE_ITEM =
    "DELETE FROM items WHERE external_id=?;";

static constexpr const char* LIST_ITEMS =
    "SELECT " RELAY_ITEM_COLUMNS " FROM items ORDER BY created_at_ms ASC, rowid ASC;";

static constexpr const char* LIST_ITEMS_BY_RETRIEVAL_STATUS =
    "SELECT " RELAY_ITEM_COLUMNS " FROM items WHERE retrieval_status=? ORDER BY created_at_ms ASC, rowid ASC;";

static constexpr const char* LIST_ITEMS_BY_RELAY_STATUS =
    "SELECT " RELAY_ITEM_COLUMNS " FROM items WHERE relay_status=? ORDER BY created_at_ms ASC, rowid ASC;";

// sources

static constexpr const char* UPSERT_SOURCE =
    "INSERT INTO sources(source_id,name,thumbnail,last_seen_item_id,last_seen_at_ms,last_scanned_at_ms,enabled)"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(source_id) DO UPDATE SET"
    " name=excluded.name,"
    " thumbnail=excluded.thumbnail,"
    " last_seen_item_id=excluded.last_seen_item_id,"
    " last_seen_at_ms=excluded.last_seen_at_ms,"
    " last_scanned_at_ms=excluded.last_scanned_at_ms,"
    " enabled=excluded.enabled;";

static constexpr const char* SELECT_SOURCE =
    "SELECT source_id,name,thumbnail,last_seen_item_id,last_seen_at_ms,last_scanned_at_ms,enabled"
    " FROM sources WHERE source_id=?;";

static constexpr const char* LIST_SOURCES =
    "SELECT source_id,name,thumbnail,last_seen_item_id,last_seen_at_ms,last_scanned_at_ms,enabled"
    " FROM sources ORDER BY source_id ASC;";

// key/value state

static constexpr const char* PUT_STATE =
    "INSERT INTO app_state(key,value,updated_at_ms) VALUES(?,?,?)"
    " ON CONFLICT(key) DO UPDATE SET value=excluded.value, updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* GET_STATE =
    "SELECT key,value,updated_at_ms FROM app_state WHERE key=?;";

#undef RELAY_ITEM_COLUMNS

} // namespace relay::db::sql
