#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/db/model/source_record.hpp"
#include "internal/db/model/state_record.hpp"

namespace relay::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A read-modify-write of one item inside a transaction is atomic
    (serialized transactions for memory/sqlite, row locks for postgres)

  The DB is the source of truth for:
    item lifecycle state
    source checkpoints
    persisted key/value state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Items
  // ---------------------------------------------------------------------

  virtual Result InsertItem(Transaction&, const model::ItemRecord&) = 0;

  virtual std::optional<model::ItemRecord> GetItem(Transaction&, const std::string& external_id) = 0;

  virtual Result UpdateItem(Transaction&, const model::ItemRecord&) = 0;

  virtual Result DeleteItem(Transaction&, const std::string& external_id) = 0;

  // Ordered by created_at, oldest first.
  virtual std::vector<model::ItemRecord> ListItems(Transaction&) = 0;

  virtual std::vector<model::ItemRecord> ListItemsByRetrievalStatus(Transaction&, relay::manager::v1::JobStatus status) = 0;

  virtual std::vector<model::ItemRecord> ListItemsByRelayStatus(Transaction&, relay::manager::v1::JobStatus status) = 0;

  // ---------------------------------------------------------------------
  // Sources
  // ---------------------------------------------------------------------

  virtual Result UpsertSource(Transaction&, const model::SourceRecord&) = 0;

  virtual std::optional<model::SourceRecord> GetSource(Transaction&, const std::string& source_id) = 0;

  virtual std::vector<model::SourceRecord> ListSources(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Key/value state
  // ---------------------------------------------------------------------

  virtual Result PutState(Transaction&, const model::StateRecord&) = 0;

  virtual std::optional<model::StateRecord> GetState(Transaction&, const std::string& key) = 0;
};

} // namespace relay::db
