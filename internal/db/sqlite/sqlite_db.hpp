#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace relay::db::sqlite {

/*
  Thin RAII wrapper around one shared sqlite3* connection.

  Transactions on the connection are serialized through TxMutex();
  sqlite has a single transaction context per connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema bootstrap)
  void Exec(const std::string& sql);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  // Configure PRAGMAs (WAL, busy timeout, cache)
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Prepared statement scoped to a block; finalized on destruction.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return stmt_ != nullptr;
  }

  sqlite3_stmt* Get() const {
    return stmt_;
  }

  int Step() {
    return sqlite3_step(stmt_);
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace relay::db::sqlite
