#pragma once

#include <string>
#include <vector>

namespace relay::db::sql {

/*
  Idempotent schema bootstrap.

  Each backend implements ExecuteSQL(); statements only ever use
  CREATE ... IF NOT EXISTS so bootstrap can run on every start.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

inline void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS items ("
      " external_id TEXT PRIMARY KEY,"
      " title TEXT NOT NULL DEFAULT '',"
      " source_name TEXT NOT NULL DEFAULT '',"
      " duration_seconds INTEGER NOT NULL DEFAULT 0,"
      " thumbnail TEXT NOT NULL DEFAULT '',"
      " retrieval_status INTEGER NOT NULL,"
      " retrieval_attempts INTEGER NOT NULL DEFAULT 0,"
      " retrieval_error TEXT NOT NULL DEFAULT '',"
      " local_path TEXT NOT NULL DEFAULT '',"
      " local_size INTEGER NOT NULL DEFAULT 0,"
      " retrieved_at_ms INTEGER NOT NULL DEFAULT 0,"
      " relay_status INTEGER NOT NULL,"
      " relay_attempts INTEGER NOT NULL DEFAULT 0,"
      " relay_error TEXT NOT NULL DEFAULT '',"
      " remote_ref TEXT NOT NULL DEFAULT '',"
      " relayed_at_ms INTEGER NOT NULL DEFAULT 0,"
      " created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS items_retrieval_status ON items(retrieval_status);",
      "CREATE INDEX IF NOT EXISTS items_relay_status ON items(relay_status);",
      "CREATE TABLE IF NOT EXISTS sources ("
      " source_id TEXT PRIMARY KEY,"
      " name TEXT NOT NULL DEFAULT '',"
      " thumbnail TEXT NOT NULL DEFAULT '',"
      " last_seen_item_id TEXT NOT NULL DEFAULT '',"
      " last_seen_at_ms INTEGER NOT NULL DEFAULT 0,"
      " last_scanned_at_ms INTEGER NOT NULL DEFAULT 0,"
      " enabled INTEGER NOT NULL DEFAULT 1);",
      "CREATE TABLE IF NOT EXISTS app_state ("
      " key TEXT PRIMARY KEY,"
      " value TEXT NOT NULL,"
      " updated_at_ms INTEGER NOT NULL);",
  };
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS items ("
      " external_id TEXT PRIMARY KEY,"
      " title TEXT NOT NULL DEFAULT '',"
      " source_name TEXT NOT NULL DEFAULT '',"
      " duration_seconds INTEGER NOT NULL DEFAULT 0,"
      " thumbnail TEXT NOT NULL DEFAULT '',"
      " retrieval_status SMALLINT NOT NULL,"
      " retrieval_attempts INTEGER NOT NULL DEFAULT 0,"
      " retrieval_error TEXT NOT NULL DEFAULT '',"
      " local_path TEXT NOT NULL DEFAULT '',"
      " local_size BIGINT NOT NULL DEFAULT 0,"
      " retrieved_at_ms BIGINT NOT NULL DEFAULT 0,"
      " relay_status SMALLINT NOT NULL,"
      " relay_attempts INTEGER NOT NULL DEFAULT 0,"
      " relay_error TEXT NOT NULL DEFAULT '',"
      " remote_ref TEXT NOT NULL DEFAULT '',"
      " relayed_at_ms BIGINT NOT NULL DEFAULT 0,"
      " created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS items_retrieval_status ON items(retrieval_status);",
      "CREATE INDEX IF NOT EXISTS items_relay_status ON items(relay_status);",
      "CREATE TABLE IF NOT EXISTS sources ("
      " source_id TEXT PRIMARY KEY,"
      " name TEXT NOT NULL DEFAULT '',"
      " thumbnail TEXT NOT NULL DEFAULT '',"
      " last_seen_item_id TEXT NOT NULL DEFAULT '',"
      " last_seen_at_ms BIGINT NOT NULL DEFAULT 0,"
      " last_scanned_at_ms BIGINT NOT NULL DEFAULT 0,"
      " enabled BOOLEAN NOT NULL DEFAULT TRUE);",
      "CREATE TABLE IF NOT EXISTS app_state ("
      " key TEXT PRIMARY KEY,"
      " value TEXT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL);",
  };
  return kSchema;
}

} // namespace relay::db::sql
