#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/events/event_sink.hpp"
#include "relay/manager/v1/types.pb.h"

namespace relay::core {

/*
  Item lifecycle operations on top of db::Repository.

  Every method is one read-modify-write transaction on a single item.
  Status changes are published to the event sink after commit.

  Failed db::Result values surface as util:: exceptions.
*/
class ItemStore {
 public:
  enum class DiscoverOutcome {
    kCreated,
    kRequeued,
    kSkipped,
  };

  struct ResetCounts {
    uint32_t retrieval = 0;
    uint32_t relay     = 0;
  };

  ItemStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventSink> events);

  std::optional<db::model::ItemRecord> Get(const std::string& external_id);

  // Unseen -> pending; retrieval error -> pending; anything else skipped.
  DiscoverOutcome RecordDiscovered(const db::model::ItemRecord& candidate);

  // ---------------------------------------------------------------------
  // Retrieval phase
  // ---------------------------------------------------------------------

  // pending -> in_progress, attempts++. nullopt when the item is missing
  // or no longer pending.
  std::optional<db::model::ItemRecord> BeginRetrieval(const std::string& external_id);

  db::model::ItemRecord CompleteRetrieval(const std::string& external_id, const std::string& local_path, uint64_t local_size);

  // false when the item is no longer in_progress.
  bool FailRetrieval(const std::string& external_id, const std::string& error);

  // ---------------------------------------------------------------------
  // Relay phase
  // ---------------------------------------------------------------------

  // Throws InvalidState when retrieval has not produced a local file.
  std::optional<db::model::ItemRecord> BeginRelay(const std::string& external_id);

  void CompleteRelay(const std::string& external_id, const std::string& remote_ref, bool clear_local_path);

  bool FailRelay(const std::string& external_id, const std::string& error);

  // ---------------------------------------------------------------------
  // Recovery
  // ---------------------------------------------------------------------

  // Forces every in_progress phase back to pending. Idempotent.
  ResetCounts ResetStuck();

  // in_progress -> pending for one phase; false when no longer in_progress.
  bool ResetInProgress(const std::string& external_id, relay::manager::v1::Phase phase);

  // error -> pending with the error cleared; false when not in error or,
  // with max_attempts > 0, when the phase already used that many attempts.
  bool RequeueFailed(const std::string& external_id, relay::manager::v1::Phase phase, uint32_t max_attempts = 0);

  // ---------------------------------------------------------------------
  // Queries / operator actions
  // ---------------------------------------------------------------------

  std::vector<db::model::ItemRecord> List();
  std::vector<db::model::ItemRecord> ListByRetrievalStatus(relay::manager::v1::JobStatus status);
  std::vector<db::model::ItemRecord> ListByRelayStatus(relay::manager::v1::JobStatus status);

  // Refuses items with a phase in_progress. Returns the removed row.
  db::model::ItemRecord Delete(const std::string& external_id);

 private:
  void Publish(relay::manager::v1::Phase phase, const std::string& external_id, relay::manager::v1::JobStatus status,
               const std::string& error = {});

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<events::EventSink> events_;
};

relay::manager::v1::Item ToItemProto(const db::model::ItemRecord& record);

} // namespace relay::core
