#include "internal/core/item_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fakes.hpp"

namespace {

using namespace relay::manager::v1;
using relay::core::ItemStore;
using relay::db::model::ItemRecord;

struct Fixture {
  std::shared_ptr<relay::testing::RecordingSink> sink = std::make_shared<relay::testing::RecordingSink>();
  std::shared_ptr<ItemStore> store = std::make_shared<ItemStore>(std::make_shared<relay::db::memory::MemoryRepository>(), sink);
};

ItemRecord Candidate(const std::string& id, uint32_t duration = 120) {
  ItemRecord record;
  record.external_id      = id;
  record.title            = "title " + id;
  record.source_name      = "source";
  record.duration_seconds = duration;
  return record;
}

void TestDiscoverCreatesSkipsAndRequeues() {
  Fixture f;

  assert(f.store->RecordDiscovered(Candidate("v1")) == ItemStore::DiscoverOutcome::kCreated);
  assert(f.store->RecordDiscovered(Candidate("v1")) == ItemStore::DiscoverOutcome::kSkipped);

  auto record = f.store->Get("v1");
  assert(record.has_value());
  assert(record->retrieval_status == JOB_STATUS_PENDING);
  assert(record->relay_status == JOB_STATUS_PENDING);
  assert(record->created_at_ms > 0);

  assert(f.store->BeginRetrieval("v1").has_value());
  assert(f.store->FailRetrieval("v1", "HTTP Error 404: Not Found"));
  assert(f.store->Get("v1")->retrieval_status == JOB_STATUS_ERROR);

  auto rediscovered  = Candidate("v1", 33);
  rediscovered.title = "renamed";
  assert(f.store->RecordDiscovered(rediscovered) == ItemStore::DiscoverOutcome::kRequeued);

  record = f.store->Get("v1");
  assert(record->retrieval_status == JOB_STATUS_PENDING);
  assert(record->retrieval_error.empty());
  assert(record->title == "renamed");
  assert(record->duration_seconds == 33);
  assert(record->retrieval_attempts == 1);
}

void TestRetrievalLifecycle() {
  Fixture f;
  f.store->RecordDiscovered(Candidate("v2"));

  auto claimed = f.store->BeginRetrieval("v2");
  assert(claimed.has_value());
  assert(claimed->retrieval_status == JOB_STATUS_IN_PROGRESS);
  assert(claimed->retrieval_attempts == 1);

  // a second claim of the same row is refused
  assert(!f.store->BeginRetrieval("v2").has_value());
  assert(!f.store->BeginRetrieval("missing").has_value());

  auto done = f.store->CompleteRetrieval("v2", "/tmp/v2.mp4", 42);
  assert(done.retrieval_status == JOB_STATUS_COMPLETED);
  assert(done.local_path == "/tmp/v2.mp4");
  assert(done.local_size == 42);
  assert(done.retrieved_at_ms > 0);

  // completed is terminal
  bool threw = false;
  try {
    f.store->CompleteRetrieval("v2", "/tmp/other.mp4", 1);
  } catch (const relay::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(!f.store->FailRetrieval("v2", "late failure"));
}

void TestRelayRequiresCompletedRetrieval() {
  Fixture f;
  f.store->RecordDiscovered(Candidate("v3"));

  bool threw = false;
  try {
    f.store->BeginRelay("v3");
  } catch (const relay::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.store->Get("v3")->relay_status == JOB_STATUS_PENDING);

  f.store->BeginRetrieval("v3");
  f.store->CompleteRetrieval("v3", "/tmp/v3.mp4", 10);

  auto relay = f.store->BeginRelay("v3");
  assert(relay.has_value());
  assert(relay->relay_attempts == 1);
  assert(!f.store->BeginRelay("v3").has_value());

  f.store->CompleteRelay("v3", "videos/v3.mp4", true);
  auto record = f.store->Get("v3");
  assert(record->relay_status == JOB_STATUS_COMPLETED);
  assert(record->remote_ref == "videos/v3.mp4");
  assert(record->local_path.empty());
  assert(record->relayed_at_ms > 0);
}

void TestFailureMessageIsTruncated() {
  Fixture f;
  f.store->RecordDiscovered(Candidate("v4"));
  f.store->BeginRetrieval("v4");
  assert(f.store->FailRetrieval("v4", std::string(5000, 'e')));
  assert(f.store->Get("v4")->retrieval_error.size() == 1000);
}

void TestResetStuckIsIdempotent() {
  Fixture f;
  for (const auto* id : {"a", "b", "c"}) {
    f.store->RecordDiscovered(Candidate(id));
  }
  f.store->BeginRetrieval("a");
  f.store->BeginRetrieval("b");
  f.store->BeginRetrieval("c");
  f.store->CompleteRetrieval("c", "/tmp/c.mp4", 1);
  f.store->BeginRelay("c");

  auto first = f.store->ResetStuck();
  assert(first.retrieval == 2);
  assert(first.relay == 1);

  auto second = f.store->ResetStuck();
  assert(second.retrieval == 0);
  assert(second.relay == 0);

  for (const auto& record : f.store->List()) {
    assert(record.retrieval_status != JOB_STATUS_IN_PROGRESS);
    assert(record.relay_status != JOB_STATUS_IN_PROGRESS);
  }
  assert(f.store->Get("c")->retrieval_status == JOB_STATUS_COMPLETED);
  assert(f.store->Get("c")->relay_status == JOB_STATUS_PENDING);
}

void TestRequeueFailedOnlyFromError() {
  Fixture f;
  f.store->RecordDiscovered(Candidate("v5"));
  assert(!f.store->RequeueFailed("v5", PHASE_RETRIEVAL));

  f.store->BeginRetrieval("v5");
  f.store->FailRetrieval("v5", "Connection reset by peer");
  assert(f.store->RequeueFailed("v5", PHASE_RETRIEVAL));
  assert(f.store->Get("v5")->retrieval_status == JOB_STATUS_PENDING);
  assert(f.store->Get("v5")->retrieval_error.empty());
  assert(!f.store->RequeueFailed("v5", PHASE_RELAY));
}

void TestRequeueRechecksAttemptCeiling() {
  Fixture f;
  f.store->RecordDiscovered(Candidate("v8"));
  for (int i = 0; i < 3; ++i) {
    f.store->BeginRetrieval("v8");
    f.store->FailRetrieval("v8", "Connection reset by peer");
    if (i < 2) assert(f.store->RequeueFailed("v8", PHASE_RETRIEVAL, 3));
  }

  // third attempt failed: the ceiling is read from the current row
  assert(f.store->Get("v8")->retrieval_attempts == 3);
  assert(!f.store->RequeueFailed("v8", PHASE_RETRIEVAL, 3));
  assert(f.store->Get("v8")->retrieval_status == JOB_STATUS_ERROR);
  assert(f.store->Get("v8")->retrieval_error == "Connection reset by peer");

  // operator retry has no ceiling
  assert(f.store->RequeueFailed("v8", PHASE_RETRIEVAL));
  assert(f.store->Get("v8")->retrieval_status == JOB_STATUS_PENDING);
}

void TestDuplicateRelayAfterCompletionIsSkipped() {
  Fixture f;
  f.store->RecordDiscovered(Candidate("v9"));
  f.store->BeginRetrieval("v9");
  f.store->CompleteRetrieval("v9", "/data/v9.mp4", 10);
  assert(f.store->BeginRelay("v9").has_value());
  f.store->CompleteRelay("v9", "videos/v9.mp4", true);
  assert(f.store->Get("v9")->local_path.empty());

  // a second queue entry for the same item is a quiet no-op
  assert(!f.store->BeginRelay("v9").has_value());
  assert(f.store->Get("v9")->relay_status == JOB_STATUS_COMPLETED);
  assert(f.store->Get("v9")->relay_attempts == 1);
}

void TestDeleteRefusesRunningItems() {
  Fixture f;
  f.store->RecordDiscovered(Candidate("v6"));
  f.store->BeginRetrieval("v6");

  bool threw = false;
  try {
    f.store->Delete("v6");
  } catch (const relay::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  f.store->FailRetrieval("v6", "boom");
  const auto removed = f.store->Delete("v6");
  assert(removed.external_id == "v6");
  assert(!f.store->Get("v6").has_value());

  threw = false;
  try {
    f.store->Delete("v6");
  } catch (const relay::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestStatusChangesArePublished() {
  Fixture f;
  f.store->RecordDiscovered(Candidate("v7"));
  f.store->BeginRetrieval("v7");
  f.store->FailRetrieval("v7", "boom");

  std::lock_guard lock(f.sink->mutex_);
  assert(f.sink->events.size() == 3);
  assert(f.sink->events[0].status() == JOB_STATUS_PENDING);
  assert(f.sink->events[1].status() == JOB_STATUS_IN_PROGRESS);
  assert(f.sink->events[2].status() == JOB_STATUS_ERROR);
  assert(f.sink->events[2].error() == "boom");
  for (const auto& event : f.sink->events) {
    assert(event.type() == Event::TYPE_STATUS_CHANGED);
    assert(event.phase() == PHASE_RETRIEVAL);
    assert(event.item_id() == "v7");
  }
}

} // namespace

int main() {
  TestDiscoverCreatesSkipsAndRequeues();
  TestRetrievalLifecycle();
  TestRelayRequiresCompletedRetrieval();
  TestFailureMessageIsTruncated();
  TestResetStuckIsIdempotent();
  TestRequeueFailedOnlyFromError();
  TestRequeueRechecksAttemptCeiling();
  TestDuplicateRelayAfterCompletionIsSkipped();
  TestDeleteRefusesRunningItems();
  TestStatusChangesArePublished();

  std::cout << "relay_manager_unit_item_store: pass\n";
  return 0;
}
