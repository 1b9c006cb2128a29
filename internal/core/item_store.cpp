#include "item_store.hpp"

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace relay::core {

using namespace relay::manager::v1;

namespace {

constexpr std::size_t kMaxErrorLength = 1000;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StoreError(message);
  }
}

db::model::ItemRecord RequireItem(db::Repository& repository, db::Transaction& tx, const std::string& external_id) {
  auto record = repository.GetItem(tx, external_id);
  if (!record) {
    throw util::NotFound("item not found: " + external_id);
  }
  return *record;
}

void RequireTransition(JobStatus from, JobStatus to, const std::string& external_id) {
  if (!model::CanTransition(from, to)) {
    throw util::InvalidState("item " + external_id + ": illegal transition " + std::string(model::StatusName(from)) + " -> " +
                             std::string(model::StatusName(to)));
  }
}

} // namespace

ItemStore::ItemStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventSink> events)
    : repository_(std::move(repository)), events_(std::move(events)) {
  if (!events_) {
    events_ = std::make_shared<events::NullEventSink>();
  }
}

void ItemStore::Publish(Phase phase, const std::string& external_id, JobStatus status, const std::string& error) {
  events_->Publish(events::StatusEvent(phase, external_id, status, error));
}

std::optional<db::model::ItemRecord> ItemStore::Get(const std::string& external_id) {
  auto tx = repository_->Begin();
  return repository_->GetItem(*tx, external_id);
}

ItemStore::DiscoverOutcome ItemStore::RecordDiscovered(const db::model::ItemRecord& candidate) {
  auto tx       = repository_->Begin();
  auto existing = repository_->GetItem(*tx, candidate.external_id);

  if (!existing) {
    db::model::ItemRecord record;
    record.external_id      = candidate.external_id;
    record.title            = candidate.title;
    record.source_name      = candidate.source_name;
    record.duration_seconds = candidate.duration_seconds;
    record.thumbnail        = candidate.thumbnail;
    record.retrieval_status = JOB_STATUS_PENDING;
    record.relay_status     = JOB_STATUS_PENDING;
    record.created_at_ms    = util::ToUnixMillis(util::Now());

    ThrowIfDbError(repository_->InsertItem(*tx, record), "insert item");
    tx->Commit();
    Publish(PHASE_RETRIEVAL, record.external_id, JOB_STATUS_PENDING);
    return DiscoverOutcome::kCreated;
  }

  if (existing->retrieval_status != JOB_STATUS_ERROR) {
    return DiscoverOutcome::kSkipped;
  }

  existing->retrieval_status = JOB_STATUS_PENDING;
  existing->retrieval_error.clear();
  if (candidate.duration_seconds > 0) existing->duration_seconds = candidate.duration_seconds;
  if (!candidate.title.empty()) existing->title = candidate.title;

  ThrowIfDbError(repository_->UpdateItem(*tx, *existing), "requeue item");
  tx->Commit();
  Publish(PHASE_RETRIEVAL, existing->external_id, JOB_STATUS_PENDING);
  return DiscoverOutcome::kRequeued;
}

// ------------------------------------------------------------
// Retrieval phase
// ------------------------------------------------------------

std::optional<db::model::ItemRecord> ItemStore::BeginRetrieval(const std::string& external_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetItem(*tx, external_id);
  if (!record) {
    RELAY_LOG_WARN("retrieval skipped: item missing", {observability::StringField("item_id", external_id)});
    return std::nullopt;
  }
  if (record->retrieval_status != JOB_STATUS_PENDING) {
    return std::nullopt;
  }

  record->retrieval_status = JOB_STATUS_IN_PROGRESS;
  record->retrieval_attempts += 1;
  record->retrieval_error.clear();

  ThrowIfDbError(repository_->UpdateItem(*tx, *record), "begin retrieval");
  tx->Commit();
  Publish(PHASE_RETRIEVAL, external_id, JOB_STATUS_IN_PROGRESS);
  return record;
}

db::model::ItemRecord ItemStore::CompleteRetrieval(const std::string& external_id, const std::string& local_path, uint64_t local_size) {
  auto tx     = repository_->Begin();
  auto record = RequireItem(*repository_, *tx, external_id);
  RequireTransition(record.retrieval_status, JOB_STATUS_COMPLETED, external_id);

  record.retrieval_status = JOB_STATUS_COMPLETED;
  record.retrieval_error.clear();
  record.local_path      = local_path;
  record.local_size      = local_size;
  record.retrieved_at_ms = util::ToUnixMillis(util::Now());

  ThrowIfDbError(repository_->UpdateItem(*tx, record), "complete retrieval");
  tx->Commit();
  Publish(PHASE_RETRIEVAL, external_id, JOB_STATUS_COMPLETED);
  return record;
}

bool ItemStore::FailRetrieval(const std::string& external_id, const std::string& error) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetItem(*tx, external_id);
  if (!record || record->retrieval_status != JOB_STATUS_IN_PROGRESS) {
    return false;
  }

  record->retrieval_status = JOB_STATUS_ERROR;
  record->retrieval_error  = util::Truncate(error, kMaxErrorLength);

  ThrowIfDbError(repository_->UpdateItem(*tx, *record), "fail retrieval");
  tx->Commit();
  Publish(PHASE_RETRIEVAL, external_id, JOB_STATUS_ERROR, record->retrieval_error);
  return true;
}

// ------------------------------------------------------------
// Relay phase
// ------------------------------------------------------------

std::optional<db::model::ItemRecord> ItemStore::BeginRelay(const std::string& external_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetItem(*tx, external_id);
  if (!record) {
    RELAY_LOG_WARN("relay skipped: item missing", {observability::StringField("item_id", external_id)});
    return std::nullopt;
  }
  // duplicate queue entry; a completed relay may already have cleared local_path
  if (record->relay_status != JOB_STATUS_PENDING) {
    return std::nullopt;
  }
  if (!model::RelayEligible(record->retrieval_status, !record->local_path.empty())) {
    throw util::InvalidState("item " + external_id + " is not ready for relay (retrieval " +
                             std::string(model::StatusName(record->retrieval_status)) + ")");
  }

  record->relay_status = JOB_STATUS_IN_PROGRESS;
  record->relay_attempts += 1;
  record->relay_error.clear();

  ThrowIfDbError(repository_->UpdateItem(*tx, *record), "begin relay");
  tx->Commit();
  Publish(PHASE_RELAY, external_id, JOB_STATUS_IN_PROGRESS);
  return record;
}

void ItemStore::CompleteRelay(const std::string& external_id, const std::string& remote_ref, bool clear_local_path) {
  auto tx     = repository_->Begin();
  auto record = RequireItem(*repository_, *tx, external_id);
  RequireTransition(record.relay_status, JOB_STATUS_COMPLETED, external_id);

  record.relay_status = JOB_STATUS_COMPLETED;
  record.relay_error.clear();
  record.remote_ref    = remote_ref;
  record.relayed_at_ms = util::ToUnixMillis(util::Now());
  if (clear_local_path) {
    record.local_path.clear();
  }

  ThrowIfDbError(repository_->UpdateItem(*tx, record), "complete relay");
  tx->Commit();
  Publish(PHASE_RELAY, external_id, JOB_STATUS_COMPLETED);
}

bool ItemStore::FailRelay(const std::string& external_id, const std::string& error) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetItem(*tx, external_id);
  if (!record || record->relay_status != JOB_STATUS_IN_PROGRESS) {
    return false;
  }

  record->relay_status = JOB_STATUS_ERROR;
  record->relay_error  = util::Truncate(error, kMaxErrorLength);

  ThrowIfDbError(repository_->UpdateItem(*tx, *record), "fail relay");
  tx->Commit();
  Publish(PHASE_RELAY, external_id, JOB_STATUS_ERROR, record->relay_error);
  return true;
}

// ------------------------------------------------------------
// Recovery
// ------------------------------------------------------------

ItemStore::ResetCounts ItemStore::ResetStuck() {
  ResetCounts counts;

  for (const auto& record : ListByRetrievalStatus(JOB_STATUS_IN_PROGRESS)) {
    if (ResetInProgress(record.external_id, PHASE_RETRIEVAL)) ++counts.retrieval;
  }
  for (const auto& record : ListByRelayStatus(JOB_STATUS_IN_PROGRESS)) {
    if (ResetInProgress(record.external_id, PHASE_RELAY)) ++counts.relay;
  }
  return counts;
}

bool ItemStore::ResetInProgress(const std::string& external_id, Phase phase) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetItem(*tx, external_id);
  if (!record) {
    return false;
  }

  auto& status = phase == PHASE_RELAY ? record->relay_status : record->retrieval_status;
  if (status != JOB_STATUS_IN_PROGRESS) {
    return false;
  }
  status = JOB_STATUS_PENDING;

  ThrowIfDbError(repository_->UpdateItem(*tx, *record), "reset in-progress item");
  tx->Commit();
  Publish(phase, external_id, JOB_STATUS_PENDING);
  return true;
}

bool ItemStore::RequeueFailed(const std::string& external_id, Phase phase, uint32_t max_attempts) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetItem(*tx, external_id);
  if (!record) {
    return false;
  }

  const bool is_relay = phase == PHASE_RELAY;
  auto&      status   = is_relay ? record->relay_status : record->retrieval_status;
  if (status != JOB_STATUS_ERROR) {
    return false;
  }
  const uint32_t attempts = is_relay ? record->relay_attempts : record->retrieval_attempts;
  if (max_attempts > 0 && attempts >= max_attempts) {
    return false;
  }
  status = JOB_STATUS_PENDING;
  (is_relay ? record->relay_error : record->retrieval_error).clear();

  ThrowIfDbError(repository_->UpdateItem(*tx, *record), "requeue failed item");
  tx->Commit();
  Publish(phase, external_id, JOB_STATUS_PENDING);
  return true;
}

// ------------------------------------------------------------
// Queries / operator actions
// ------------------------------------------------------------

std::vector<db::model::ItemRecord> ItemStore::List() {
  auto tx = repository_->Begin();
  return repository_->ListItems(*tx);
}

std::vector<db::model::ItemRecord> ItemStore::ListByRetrievalStatus(JobStatus status) {
  auto tx = repository_->Begin();
  return repository_->ListItemsByRetrievalStatus(*tx, status);
}

std::vector<db::model::ItemRecord> ItemStore::ListByRelayStatus(JobStatus status) {
  auto tx = repository_->Begin();
  return repository_->ListItemsByRelayStatus(*tx, status);
}

db::model::ItemRecord ItemStore::Delete(const std::string& external_id) {
  auto tx     = repository_->Begin();
  auto record = RequireItem(*repository_, *tx, external_id);
  if (record.retrieval_status == JOB_STATUS_IN_PROGRESS || record.relay_status == JOB_STATUS_IN_PROGRESS) {
    throw util::InvalidState("item " + external_id + " is owned by a running job");
  }

  ThrowIfDbError(repository_->DeleteItem(*tx, external_id), "delete item");
  tx->Commit();
  return record;
}

// ------------------------------------------------------------
// Conversion
// ------------------------------------------------------------

Item ToItemProto(const db::model::ItemRecord& record) {
  Item item;
  item.set_external_id(record.external_id);
  item.set_title(record.title);
  item.set_source_name(record.source_name);
  item.set_duration_seconds(record.duration_seconds);
  item.set_thumbnail(record.thumbnail);

  item.set_retrieval_status(record.retrieval_status);
  item.set_retrieval_attempts(record.retrieval_attempts);
  item.set_retrieval_error(record.retrieval_error);
  item.set_local_path(record.local_path);
  item.set_local_size(record.local_size);
  if (record.retrieved_at_ms > 0) *item.mutable_retrieved_at() = util::MillisToProto(record.retrieved_at_ms);

  item.set_relay_status(record.relay_status);
  item.set_relay_attempts(record.relay_attempts);
  item.set_relay_error(record.relay_error);
  item.set_remote_ref(record.remote_ref);
  if (record.relayed_at_ms > 0) *item.mutable_relayed_at() = util::MillisToProto(record.relayed_at_ms);

  *item.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return item;
}

} // namespace relay::core
