#include "pg_pool.hpp"

namespace relay::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kItemColumns =
      "external_id,title,source_name,duration_seconds,thumbnail,"
      "retrieval_status,retrieval_attempts,retrieval_error,local_path,local_size,retrieved_at_ms,"
      "relay_status,relay_attempts,relay_error,remote_ref,relayed_at_ms,created_at_ms";

  // FOR UPDATE: callers read-modify-write the row inside the same transaction
  conn.prepare("get_item", std::string("SELECT ") + kItemColumns + " FROM items WHERE external_id=$1 FOR UPDATE");

  conn.prepare("insert_item", std::string("INSERT INTO items(") + kItemColumns +
                                  ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17)");

  conn.prepare("update_item",
               "UPDATE items SET title=$2,source_name=$3,duration_seconds=$4,thumbnail=$5,"
               "retrieval_status=$6,retrieval_attempts=$7,retrieval_error=$8,local_path=$9,local_size=$10,retrieved_at_ms=$11,"
               "relay_status=$12,relay_attempts=$13,relay_error=$14,remote_ref=$15,relayed_at_ms=$16 "
               "WHERE external_id=$1");

  conn.prepare("delete_item", "DELETE FROM items WHERE external_id=$1");

  conn.prepare("list_items", std::string("SELECT ") + kItemColumns + " FROM items ORDER BY created_at_ms ASC, external_id ASC");

  conn.prepare("list_items_by_retrieval_status",
               std::string("SELECT ") + kItemColumns + " FROM items WHERE retrieval_status=$1 ORDER BY created_at_ms ASC, external_id ASC");

  conn.prepare("list_items_by_relay_status",
               std::string("SELECT ") + kItemColumns + " FROM items WHERE relay_status=$1 ORDER BY created_at_ms ASC, external_id ASC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace relay::db::postgres
