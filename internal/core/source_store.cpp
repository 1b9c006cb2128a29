#include "source_store.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::core {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StoreError(message);
  }
}

} // namespace

SourceStore::SourceStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::SourceRecord SourceStore::UpsertSource(const std::string& source_id, const std::string& name, const std::string& thumbnail) {
  auto tx = repository_->Begin();

  db::model::SourceRecord record;
  if (auto existing = repository_->GetSource(*tx, source_id)) {
    record = *existing;
  } else {
    record.source_id = source_id;
    record.enabled   = true;
  }
  record.name      = name;
  record.thumbnail = thumbnail;

  ThrowIfDbError(repository_->UpsertSource(*tx, record), "upsert source");
  tx->Commit();
  return record;
}

std::optional<db::model::SourceRecord> SourceStore::GetSource(const std::string& source_id) {
  auto tx = repository_->Begin();
  return repository_->GetSource(*tx, source_id);
}

std::vector<db::model::SourceRecord> SourceStore::ListSources() {
  auto tx = repository_->Begin();
  return repository_->ListSources(*tx);
}

std::vector<db::model::SourceRecord> SourceStore::ListScanOrder() {
  auto sources = ListSources();
  sources.erase(std::remove_if(sources.begin(), sources.end(), [](const auto& s) { return !s.enabled; }), sources.end());

  // 0 (never scanned) sorts first
  std::stable_sort(sources.begin(), sources.end(),
                   [](const auto& a, const auto& b) { return a.last_scanned_at_ms < b.last_scanned_at_ms; });
  return sources;
}

void SourceStore::AdvanceCheckpoint(const std::string& source_id, const std::string& newest_item_id, uint64_t newest_published_at_ms,
                                    uint64_t scanned_at_ms) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetSource(*tx, source_id);
  if (!record) {
    throw util::NotFound("source not found: " + source_id);
  }

  if (!newest_item_id.empty()) {
    record->last_seen_item_id = newest_item_id;
    record->last_seen_at_ms   = newest_published_at_ms;
  }
  record->last_scanned_at_ms = scanned_at_ms;

  ThrowIfDbError(repository_->UpsertSource(*tx, *record), "advance checkpoint");
  tx->Commit();
}

void SourceStore::SetSourceEnabled(const std::string& source_id, bool enabled) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetSource(*tx, source_id);
  if (!record) {
    throw util::NotFound("source not found: " + source_id);
  }

  record->enabled = enabled;
  ThrowIfDbError(repository_->UpsertSource(*tx, *record), "set source enabled");
  tx->Commit();
}

void SourceStore::PutState(const std::string& key, const std::string& value) {
  auto tx = repository_->Begin();

  db::model::StateRecord record;
  record.key           = key;
  record.value         = value;
  record.updated_at_ms = util::ToUnixMillis(util::Now());

  ThrowIfDbError(repository_->PutState(*tx, record), "put state " + key);
  tx->Commit();
}

std::optional<std::string> SourceStore::GetState(const std::string& key) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetState(*tx, key);
  if (!record) return std::nullopt;
  return record->value;
}

relay::manager::v1::Source ToSourceProto(const db::model::SourceRecord& record) {
  relay::manager::v1::Source source;
  source.set_source_id(record.source_id);
  source.set_name(record.name);
  source.set_thumbnail(record.thumbnail);
  source.set_last_seen_item_id(record.last_seen_item_id);
  if (record.last_seen_at_ms > 0) *source.mutable_last_seen_at() = util::MillisToProto(record.last_seen_at_ms);
  if (record.last_scanned_at_ms > 0) *source.mutable_last_scanned_at() = util::MillisToProto(record.last_scanned_at_ms);
  source.set_enabled(record.enabled);
  return source;
}

} // namespace relay::core
