#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace relay::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ItemRecord> items;
    std::map<std::string, model::SourceRecord>         sources;
    std::map<std::string, model::StateRecord>          state;
    // insertion order breaks created_at ties
    uint64_t                                           next_sequence = 0;
    std::unordered_map<std::string, uint64_t>          sequence;
  };

  std::mutex mutex_;
  State      committed_;
};

}
