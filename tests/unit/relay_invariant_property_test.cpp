#include <cassert>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "internal/core/item_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace relay::manager::v1;
using relay::core::ItemStore;

void CheckInvariant(ItemStore& store) {
  for (const auto& record : store.List()) {
    if (record.relay_status != JOB_STATUS_PENDING) {
      assert(record.retrieval_status == JOB_STATUS_COMPLETED);
    }
    if (record.retrieval_status == JOB_STATUS_COMPLETED) {
      assert(record.retrieved_at_ms > 0);
    }
  }
}

void ApplyRandomOperation(ItemStore& store, const std::string& id, int op) {
  try {
    switch (op) {
      case 0: {
        relay::db::model::ItemRecord candidate;
        candidate.external_id = id;
        candidate.title       = "item " + id;
        store.RecordDiscovered(candidate);
        break;
      }
      case 1:
        store.BeginRetrieval(id);
        break;
      case 2:
        store.CompleteRetrieval(id, "/tmp/" + id + ".mp4", 100);
        break;
      case 3:
        store.FailRetrieval(id, "Connection reset by peer");
        break;
      case 4:
        store.BeginRelay(id);
        break;
      case 5:
        store.CompleteRelay(id, "videos/" + id + ".mp4", true);
        break;
      case 6:
        store.FailRelay(id, "share unreachable");
        break;
      case 7:
        store.ResetInProgress(id, PHASE_RETRIEVAL);
        break;
      case 8:
        store.ResetInProgress(id, PHASE_RELAY);
        break;
      case 9:
        store.RequeueFailed(id, PHASE_RETRIEVAL);
        break;
      case 10:
        store.RequeueFailed(id, PHASE_RELAY);
        break;
      default:
        store.ResetStuck();
        break;
    }
  } catch (const relay::util::InvalidState&) {
    // refused transition; state must be unchanged
  } catch (const relay::util::NotFound&) {
  }
}

void TestRelayNeverLeavesPendingBeforeRetrievalCompletes() {
  std::mt19937                       rng(20240501);
  std::uniform_int_distribution<int> pick_item(0, 7);
  std::uniform_int_distribution<int> pick_op(0, 11);

  for (int round = 0; round < 20; ++round) {
    ItemStore store(std::make_shared<relay::db::memory::MemoryRepository>(), nullptr);

    for (int step = 0; step < 400; ++step) {
      const auto id = "item-" + std::to_string(pick_item(rng));
      ApplyRandomOperation(store, id, pick_op(rng));
      CheckInvariant(store);
    }
  }
}

void TestTransitionTable() {
  using relay::model::CanTransition;

  assert(CanTransition(JOB_STATUS_PENDING, JOB_STATUS_IN_PROGRESS));
  assert(!CanTransition(JOB_STATUS_PENDING, JOB_STATUS_COMPLETED));
  assert(CanTransition(JOB_STATUS_IN_PROGRESS, JOB_STATUS_COMPLETED));
  assert(CanTransition(JOB_STATUS_IN_PROGRESS, JOB_STATUS_ERROR));
  assert(CanTransition(JOB_STATUS_IN_PROGRESS, JOB_STATUS_PENDING));
  assert(CanTransition(JOB_STATUS_ERROR, JOB_STATUS_PENDING));
  assert(!CanTransition(JOB_STATUS_COMPLETED, JOB_STATUS_PENDING));
  assert(!CanTransition(JOB_STATUS_COMPLETED, JOB_STATUS_ERROR));

  assert(relay::model::RelayEligible(JOB_STATUS_COMPLETED, true));
  assert(!relay::model::RelayEligible(JOB_STATUS_COMPLETED, false));
  assert(!relay::model::RelayEligible(JOB_STATUS_IN_PROGRESS, true));
}

void TestRouting() {
  using relay::model::RouteRetrieval;

  assert(RouteRetrieval(45, 60) == PIPELINE_RETRIEVAL_SHORT);
  assert(RouteRetrieval(60, 60) == PIPELINE_RETRIEVAL_SHORT);
  assert(RouteRetrieval(61, 60) == PIPELINE_RETRIEVAL_STANDARD);
  // unknown duration
  assert(RouteRetrieval(0, 60) == PIPELINE_RETRIEVAL_STANDARD);
}

} // namespace

int main() {
  TestRelayNeverLeavesPendingBeforeRetrievalCompletes();
  TestTransitionTable();
  TestRouting();

  std::cout << "relay_manager_unit_relay_invariant_property: pass\n";
  return 0;
}
