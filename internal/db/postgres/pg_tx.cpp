#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace relay::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      RELAY_LOG_WARN("postgres rollback failed", {relay::observability::StringField("error", e.what())});
    }
  }
  // the work must end before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}
