#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace relay::db::memory {

using relay::manager::v1::JobStatus;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

namespace {

template <typename Predicate>
std::vector<model::ItemRecord> SortedItems(const std::unordered_map<std::string, model::ItemRecord>& items,
                                           const std::unordered_map<std::string, uint64_t>& sequence, Predicate keep) {
  std::vector<const model::ItemRecord*> selected;
  for (const auto& [_, record] : items) {
    if (keep(record)) selected.push_back(&record);
  }

  std::sort(selected.begin(), selected.end(), [&sequence](const model::ItemRecord* a, const model::ItemRecord* b) {
    if (a->created_at_ms != b->created_at_ms) return a->created_at_ms < b->created_at_ms;
    return sequence.at(a->external_id) < sequence.at(b->external_id);
  });

  std::vector<model::ItemRecord> out;
  out.reserve(selected.size());
  for (const auto* record : selected) out.push_back(*record);
  return out;
}

} // namespace

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result MemoryRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.items.contains(r.external_id)) return Result::Err(ErrorCode::AlreadyExists, r.external_id);
  s.items[r.external_id]    = r;
  s.sequence[r.external_id] = s.next_sequence++;
  return Result::Ok();
}

std::optional<model::ItemRecord> MemoryRepository::GetItem(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.items.find(id);
  if (it == s.items.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.items.find(r.external_id);
  if (it == s.items.end()) return Result::Err(ErrorCode::NotFound, r.external_id);
  const auto created_at_ms = it->second.created_at_ms;
  it->second               = r;
  it->second.created_at_ms = created_at_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteItem(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  s.items.erase(id);
  s.sequence.erase(id);
  return Result::Ok();
}

std::vector<model::ItemRecord> MemoryRepository::ListItems(Transaction& t) {
  const auto& s = TX(t).View();
  return SortedItems(s.items, s.sequence, [](const model::ItemRecord&) { return true; });
}

std::vector<model::ItemRecord> MemoryRepository::ListItemsByRetrievalStatus(Transaction& t, JobStatus status) {
  const auto& s = TX(t).View();
  return SortedItems(s.items, s.sequence, [status](const model::ItemRecord& r) { return r.retrieval_status == status; });
}

std::vector<model::ItemRecord> MemoryRepository::ListItemsByRelayStatus(Transaction& t, JobStatus status) {
  const auto& s = TX(t).View();
  return SortedItems(s.items, s.sequence, [status](const model::ItemRecord& r) { return r.relay_status == status; });
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSource(Transaction& t, const model::SourceRecord& r) {
  TX(t).Mutable().sources[r.source_id] = r;
  return Result::Ok();
}

std::optional<model::SourceRecord> MemoryRepository::GetSource(Transaction& t, const std::string& source_id) {
  const auto& s  = TX(t).View();
  auto        it = s.sources.find(source_id);
  if (it == s.sources.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SourceRecord> MemoryRepository::ListSources(Transaction& t) {
  std::vector<model::SourceRecord> out;
  for (const auto& [_, record] : TX(t).View().sources) out.push_back(record);
  return out;
}

// ------------------------------------------------------------------
// Key/value state
// ------------------------------------------------------------------

Result MemoryRepository::PutState(Transaction& t, const model::StateRecord& r) {
  TX(t).Mutable().state[r.key] = r;
  return Result::Ok();
}

std::optional<model::StateRecord> MemoryRepository::GetState(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.state.find(key);
  if (it == s.state.end()) return std::nullopt;
  return it->second;
}

} // namespace relay::db::memory
