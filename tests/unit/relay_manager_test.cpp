#include "internal/core/relay_manager.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/recovery/crash_recovery.hpp"
#include "internal/recovery/retry_classifier.hpp"
#include "tests/unit/fakes.hpp"

namespace {

using namespace relay::manager::v1;
using relay::core::ItemStore;
using relay::core::ManagerOptions;
using relay::core::RelayManager;

struct Harness {
  explicit Harness(const std::string& name, ManagerOptions options = {}) : dir(relay::testing::TempDir(name)) {
    options.download_dir     = (dir / "downloads").string();
    options.standard_workers = 2;
    options.short_workers    = 1;
    options.relay_workers    = 1;
    std::filesystem::create_directories(options.download_dir);

    transfer = std::make_shared<relay::testing::FakeTransfer>(dir / "share");
    manager  = std::make_unique<RelayManager>(options, store, progress, sink, fetcher, transfer);
  }

  relay::db::model::ItemRecord Discover(const std::string& id, uint32_t duration) {
    relay::db::model::ItemRecord candidate;
    candidate.external_id      = id;
    candidate.title            = "clip " + id;
    candidate.duration_seconds = duration;
    store->RecordDiscovered(candidate);
    return *store->Get(id);
  }

  uint32_t QueueDepth(Pipeline pipeline) const {
    for (const auto& stats : manager->ListPipelineStats()) {
      if (stats.pipeline() == pipeline) return stats.queue_depth();
    }
    return 0;
  }

  std::filesystem::path                             dir;
  std::shared_ptr<relay::testing::RecordingSink>    sink     = std::make_shared<relay::testing::RecordingSink>();
  std::shared_ptr<ItemStore>                        store    = std::make_shared<ItemStore>(std::make_shared<relay::db::memory::MemoryRepository>(), sink);
  std::shared_ptr<relay::progress::ProgressTracker> progress = std::make_shared<relay::progress::ProgressTracker>(std::chrono::milliseconds(0));
  std::shared_ptr<relay::testing::FakeFetcher>      fetcher  = std::make_shared<relay::testing::FakeFetcher>(2048);
  std::shared_ptr<relay::testing::FakeTransfer>     transfer;
  std::unique_ptr<RelayManager>                     manager;
};

void TestRoutingByDuration() {
  Harness h("manager_routing");

  h.manager->DispatchRetrieval(h.Discover("short-45", 45));
  h.manager->DispatchRetrieval(h.Discover("short-60", 60));
  h.manager->DispatchRetrieval(h.Discover("long-61", 61));
  h.manager->DispatchRetrieval(h.Discover("unknown-0", 0));

  assert(h.QueueDepth(PIPELINE_RETRIEVAL_SHORT) == 2);
  assert(h.QueueDepth(PIPELINE_RETRIEVAL_STANDARD) == 2);
  assert(h.QueueDepth(PIPELINE_RELAY) == 0);
}

void TestRetrievalThenRelay() {
  Harness h("manager_end_to_end");
  h.manager->Start();

  h.manager->DispatchRetrieval(h.Discover("v-short", 45));
  h.manager->DispatchRetrieval(h.Discover("v-long", 600));

  assert(relay::testing::WaitUntil([&] {
    auto a = h.store->Get("v-short");
    auto b = h.store->Get("v-long");
    return a->relay_status == JOB_STATUS_COMPLETED && b->relay_status == JOB_STATUS_COMPLETED;
  }));
  h.manager->Stop();

  const auto short_item = *h.store->Get("v-short");
  assert(short_item.retrieval_status == JOB_STATUS_COMPLETED);
  assert(short_item.remote_ref == "shorts/v-short_clip v-short.mp4");
  assert(short_item.local_path.empty());
  assert(short_item.retrieval_attempts == 1 && short_item.relay_attempts == 1);

  const auto long_item = *h.store->Get("v-long");
  assert(long_item.remote_ref == "videos/v-long_clip v-long.mp4");

  // local copies removed after a verified relay
  assert(std::filesystem::is_empty(h.dir / "downloads"));
  assert(h.transfer->Sent().size() == 2);
  assert(h.progress->List().empty());
}

void TestSizeMismatchFailsRelay() {
  Harness h("manager_size_mismatch");
  h.transfer->size_skew = 1;
  h.manager->Start();

  h.manager->DispatchRetrieval(h.Discover("mismatch", 300));
  assert(relay::testing::WaitUntil([&] { return h.store->Get("mismatch")->relay_status == JOB_STATUS_ERROR; }));
  h.manager->Stop();

  const auto item = *h.store->Get("mismatch");
  assert(item.retrieval_status == JOB_STATUS_COMPLETED);
  assert(item.relay_error.find("Size mismatch") != std::string::npos);
  // kept for a later retry
  assert(std::filesystem::exists(item.local_path));
}

void TestRetrievalFailureStopsBeforeRelay() {
  Harness h("manager_retrieval_failure");
  h.fetcher->FailWith("broken", "ERROR: Video unavailable");
  h.manager->Start();

  h.manager->DispatchRetrieval(h.Discover("broken", 300));
  assert(relay::testing::WaitUntil([&] { return h.store->Get("broken")->retrieval_status == JOB_STATUS_ERROR; }));
  h.manager->Stop();

  const auto item = *h.store->Get("broken");
  assert(item.retrieval_error == "ERROR: Video unavailable");
  assert(item.relay_status == JOB_STATUS_PENDING);
  assert(h.transfer->Sent().empty());
}

void TestRelayRefusedBeforeRetrieval() {
  Harness h("manager_relay_refused");
  h.manager->Start();
  h.Discover("early", 300);

  h.manager->DispatchRelay("early");
  assert(relay::testing::WaitUntil([&] {
    for (const auto& stats : h.manager->ListPipelineStats()) {
      if (stats.pipeline() == PIPELINE_RELAY) return stats.queue_depth() == 0 && stats.active() == 0;
    }
    return false;
  }));
  h.manager->Stop();

  const auto item = *h.store->Get("early");
  assert(item.relay_status == JOB_STATUS_PENDING);
  assert(item.relay_attempts == 0);
  assert(h.transfer->Sent().empty());
}

void TestMissingLocalFileIsTerminal() {
  Harness h("manager_missing_local_file");
  h.Discover("gone", 300);
  h.store->BeginRetrieval("gone");
  const auto local_path = h.dir / "downloads" / "gone.mp4";
  h.store->CompleteRetrieval("gone", local_path.string(), 2048);
  assert(!std::filesystem::exists(local_path));

  h.manager->Start();
  h.manager->DispatchRelay("gone");
  assert(relay::testing::WaitUntil([&] { return h.store->Get("gone")->relay_status == JOB_STATUS_ERROR; }));
  h.manager->Stop();

  const auto item = *h.store->Get("gone");
  assert(item.relay_error == "Local file not found");
  assert(item.relay_attempts == 1);
  assert(h.transfer->Sent().empty());

  // not a transient failure: the retry sweep leaves it alone
  relay::testing::RecordingDispatcher dispatcher;
  relay::recovery::CrashRecovery      recovery{h.store, h.progress,
                                          relay::recovery::RetryClassifier({"Connection reset", "timed out", "503", "500"}, 3), dispatcher};
  assert(recovery.RetryTransient() == 0);
  assert(h.store->Get("gone")->relay_status == JOB_STATUS_ERROR);
  assert(dispatcher.relay.empty());
}

void TestRelayDisabled() {
  ManagerOptions options;
  options.relay_enabled = false;
  Harness h("manager_relay_disabled", options);
  h.manager->Start();

  h.manager->DispatchRetrieval(h.Discover("kept", 300));
  assert(relay::testing::WaitUntil([&] { return h.store->Get("kept")->retrieval_status == JOB_STATUS_COMPLETED; }));
  h.manager->Stop();

  const auto item = *h.store->Get("kept");
  assert(item.relay_status == JOB_STATUS_PENDING);
  assert(std::filesystem::exists(item.local_path));
  assert(h.QueueDepth(PIPELINE_RELAY) == 0);
}

void TestLoadPendingRequeuesStoredWork() {
  Harness h("manager_load_pending");
  h.Discover("p1", 30);
  h.Discover("p2", 900);

  h.Discover("r1", 900);
  h.store->BeginRetrieval("r1");
  h.store->CompleteRetrieval("r1", (h.dir / "downloads" / "r1.mp4").string(), 10);

  const auto counts = h.manager->LoadPending();
  assert(counts.retrieval == 2);
  assert(counts.relay == 1);
  assert(h.QueueDepth(PIPELINE_RETRIEVAL_SHORT) == 1);
  assert(h.QueueDepth(PIPELINE_RETRIEVAL_STANDARD) == 1);
  assert(h.QueueDepth(PIPELINE_RELAY) == 1);
}

void TestPauseState() {
  Harness h("manager_pause");
  h.manager->Pause({PIPELINE_RELAY});
  assert(h.manager->IsPaused(PIPELINE_RELAY));
  assert(!h.manager->IsPaused(PIPELINE_RETRIEVAL_SHORT));

  h.manager->Pause({});
  assert(h.manager->IsPaused(PIPELINE_RETRIEVAL_STANDARD));
  h.manager->Resume({PIPELINE_RETRIEVAL_STANDARD});
  assert(!h.manager->IsPaused(PIPELINE_RETRIEVAL_STANDARD));
  assert(h.manager->IsPaused(PIPELINE_RETRIEVAL_SHORT));
}

} // namespace

int main() {
  TestRoutingByDuration();
  TestRetrievalThenRelay();
  TestSizeMismatchFailsRelay();
  TestRetrievalFailureStopsBeforeRelay();
  TestRelayRefusedBeforeRetrieval();
  TestMissingLocalFileIsTerminal();
  TestRelayDisabled();
  TestLoadPendingRequeuesStoredWork();
  TestPauseState();

  std::cout << "relay_manager_unit_relay_manager: pass\n";
  return 0;
}
