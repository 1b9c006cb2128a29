#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace relay::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertItem(Transaction&, const model::ItemRecord&) override;
  std::optional<model::ItemRecord> GetItem(Transaction&, const std::string&) override;
  Result UpdateItem(Transaction&, const model::ItemRecord&) override;
  Result DeleteItem(Transaction&, const std::string&) override;
  std::vector<model::ItemRecord> ListItems(Transaction&) override;
  std::vector<model::ItemRecord> ListItemsByRetrievalStatus(Transaction&, relay::manager::v1::JobStatus) override;
  std::vector<model::ItemRecord> ListItemsByRelayStatus(Transaction&, relay::manager::v1::JobStatus) override;

  Result UpsertSource(Transaction&, const model::SourceRecord&) override;
  std::optional<model::SourceRecord> GetSource(Transaction&, const std::string&) override;
  std::vector<model::SourceRecord> ListSources(Transaction&) override;

  Result PutState(Transaction&, const model::StateRecord&) override;
  std::optional<model::StateRecord> GetState(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
