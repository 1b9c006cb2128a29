#include "internal/discovery/scanner.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"
#include "tests/unit/fakes.hpp"

namespace {

using namespace relay::manager::v1;
using relay::discovery::Scanner;

uint64_t MinutesAgo(int minutes) {
  return relay::util::ToUnixMillis(relay::util::Now() - std::chrono::minutes(minutes));
}

struct Fixture {
  Fixture() {
    relay::discovery::ScannerOptions options;
    options.source_delay = std::chrono::milliseconds(0);
    scanner              = std::make_unique<Scanner>(options, provider, items, sources, dispatcher);
  }

  void AddSource(const std::string& id) {
    provider->subscriptions.push_back({id, "name " + id, ""});
  }

  std::shared_ptr<relay::db::memory::MemoryRepository> repository = std::make_shared<relay::db::memory::MemoryRepository>();
  std::shared_ptr<relay::core::ItemStore>              items      = std::make_shared<relay::core::ItemStore>(repository, nullptr);
  std::shared_ptr<relay::core::SourceStore>            sources    = std::make_shared<relay::core::SourceStore>(repository);
  std::shared_ptr<relay::testing::FakeProvider>        provider   = std::make_shared<relay::testing::FakeProvider>();
  relay::testing::RecordingDispatcher                  dispatcher;
  std::unique_ptr<Scanner>                             scanner;
};

void TestScanStopsAtCheckpoint() {
  Fixture f;
  f.AddSource("chan");
  f.sources->UpsertSource("chan", "name chan", "");
  f.sources->AdvanceCheckpoint("chan", "V0", MinutesAgo(400), MinutesAgo(300));

  f.provider->AddItem("chan", "V3", MinutesAgo(10));
  f.provider->AddItem("chan", "V2", MinutesAgo(20));
  f.provider->AddItem("chan", "V1", MinutesAgo(30));
  f.provider->AddItem("chan", "V0", MinutesAgo(400));

  assert(f.scanner->Run() == Scanner::RunOutcome::kCompleted);

  assert(f.dispatcher.retrieval.size() == 3);
  assert(f.dispatcher.retrieval[0] == "V3");
  assert(!f.items->Get("V0"));

  const auto source = *f.sources->GetSource("chan");
  assert(source.last_seen_item_id == "V3");
  assert(source.last_scanned_at_ms > 0);

  const auto status = f.scanner->Status();
  assert(!status.running());
  assert(status.items_found() == 3);
  assert(status.items_queued() == 3);
  assert(status.sources_scanned() == 1);
  assert(status.recent_results_size() == 1);

  // nothing new on a rescan
  assert(f.scanner->Run() == Scanner::RunOutcome::kCompleted);
  assert(f.dispatcher.retrieval.size() == 3);
  assert(f.sources->GetSource("chan")->last_seen_item_id == "V3");
}

void TestLookbackLiveAndFailedItems() {
  Fixture f;
  f.AddSource("chan");

  f.provider->AddItem("chan", "fresh", MinutesAgo(5));
  f.provider->AddItem("chan", "stream", MinutesAgo(6));
  f.provider->details["stream"].live = true;
  f.provider->AddItem("chan", "retry-me", MinutesAgo(7));
  f.provider->AddItem("chan", "ancient", MinutesAgo(60 * 24 * 30));

  relay::db::model::ItemRecord failed;
  failed.external_id = "retry-me";
  f.items->RecordDiscovered(failed);
  f.items->BeginRetrieval("retry-me");
  f.items->FailRetrieval("retry-me", "HTTP Error 403: Forbidden");

  assert(f.scanner->Run() == Scanner::RunOutcome::kCompleted);

  std::set<std::string> dispatched(f.dispatcher.retrieval.begin(), f.dispatcher.retrieval.end());
  assert(dispatched == (std::set<std::string>{"fresh", "retry-me"}));
  assert(!f.items->Get("stream"));
  assert(!f.items->Get("ancient"));
  assert(f.items->Get("retry-me")->retrieval_status == JOB_STATUS_PENDING);
  assert(f.items->Get("fresh")->duration_seconds == 300);
  assert(f.sources->GetSource("chan")->last_seen_item_id == "fresh");
}

void TestItemsWithoutDetailsAreKept() {
  Fixture f;
  f.AddSource("chan");
  f.provider->AddItem("chan", "V2", MinutesAgo(10), 45);
  f.provider->AddItem("chan", "V1", MinutesAgo(20));
  f.provider->details.erase("V1");

  assert(f.scanner->Run() == Scanner::RunOutcome::kCompleted);

  std::set<std::string> dispatched(f.dispatcher.retrieval.begin(), f.dispatcher.retrieval.end());
  assert(dispatched == (std::set<std::string>{"V1", "V2"}));
  assert(f.sources->GetSource("chan")->last_seen_item_id == "V2");

  const auto stub = f.items->Get("V1");
  assert(stub.has_value());
  assert(stub->retrieval_status == JOB_STATUS_PENDING);
  assert(stub->title == "title V1");
  assert(stub->thumbnail == "thumb V1");
  assert(stub->source_name == "name chan");
  assert(stub->duration_seconds == 0);
  assert(f.items->Get("V2")->duration_seconds == 45);
  assert(f.scanner->Status().items_found() == 2);

  // already recorded; a rescan stops at the checkpoint and adds nothing
  assert(f.scanner->Run() == Scanner::RunOutcome::kCompleted);
  assert(f.dispatcher.retrieval.size() == 2);
  assert(f.items->Get("V1").has_value());
}

void TestQuotaAbortLeavesRemainingSourcesForNextScan() {
  Fixture f;
  for (int i = 0; i < 10; ++i) {
    const auto id = "src-" + std::to_string(i);
    f.AddSource(id);
    f.provider->AddItem(id, id + "-new", MinutesAgo(15));
  }
  f.provider->quota_after_sources = 3;

  assert(f.scanner->Run() == Scanner::RunOutcome::kQuotaAborted);
  assert(f.dispatcher.retrieval.size() == 3);
  assert(f.scanner->Status().quota_exceeded());

  std::set<std::string> advanced;
  std::set<std::string> untouched;
  for (const auto& source : f.sources->ListSources()) {
    if (source.last_scanned_at_ms > 0) {
      assert(source.last_seen_item_id == source.source_id + "-new");
      advanced.insert(source.source_id);
    } else {
      assert(source.last_seen_item_id.empty());
      untouched.insert(source.source_id);
    }
  }
  assert(advanced.size() == 3);
  assert(untouched.size() == 7);

  // quota reset: the untouched sources are scanned first
  f.provider->quota_after_sources = 0;
  f.provider->exceeded            = false;
  f.provider->listed_sources.clear();

  assert(f.scanner->Run() == Scanner::RunOutcome::kCompleted);
  assert(f.provider->listed_sources.size() == 10);
  for (std::size_t i = 0; i < 7; ++i) {
    assert(untouched.contains(f.provider->listed_sources[i]));
  }
  assert(f.dispatcher.retrieval.size() == 10);
  assert(!f.scanner->Status().quota_exceeded());
}

void TestSkipsWhenQuotaAlreadyExceeded() {
  Fixture f;
  f.AddSource("chan");
  f.provider->AddItem("chan", "v", MinutesAgo(1));
  f.provider->exceeded = true;

  assert(f.scanner->Run() == Scanner::RunOutcome::kSkippedQuota);
  assert(f.provider->listed == 0);
  assert(f.dispatcher.retrieval.empty());
  assert(f.scanner->Status().quota_exceeded());
}

void TestDisabledSourcesAreNotScanned() {
  Fixture f;
  f.AddSource("on");
  f.AddSource("off");
  f.provider->AddItem("on", "on-1", MinutesAgo(1));
  f.provider->AddItem("off", "off-1", MinutesAgo(1));

  f.sources->UpsertSource("off", "name off", "");
  f.sources->SetSourceEnabled("off", false);

  assert(f.scanner->Run() == Scanner::RunOutcome::kCompleted);
  assert(f.dispatcher.retrieval.size() == 1);
  assert(f.dispatcher.retrieval[0] == "on-1");
  // subscription refresh keeps the operator's choice
  assert(!f.sources->GetSource("off")->enabled);
}

void TestLastScanSurvivesRestart() {
  Fixture f;
  f.AddSource("chan");
  f.provider->AddItem("chan", "a", MinutesAgo(1));
  assert(f.scanner->Run() == Scanner::RunOutcome::kCompleted);

  relay::testing::RecordingDispatcher other;
  Scanner                             restarted({}, f.provider, f.items, f.sources, other);
  restarted.LoadLastScan();
  const auto status = restarted.Status();
  assert(status.has_last_run());
  assert(status.last_queued() == 1);
}

void TestFailedRunKeepsPreviousLastScan() {
  Fixture f;
  f.AddSource("chan");
  f.provider->AddItem("chan", "a", MinutesAgo(1));
  assert(f.scanner->Run() == Scanner::RunOutcome::kCompleted);

  const auto before       = f.scanner->Status();
  const auto before_state = f.sources->GetState(relay::discovery::kLastScanStateKey);
  assert(before.last_queued() == 1);
  assert(before_state.has_value());

  f.provider->subscriptions_error = "HTTP 500: backend error";
  assert(f.scanner->Run() == Scanner::RunOutcome::kFailed);

  const auto after = f.scanner->Status();
  assert(!after.running());
  assert(after.last_error() == "HTTP 500: backend error");
  assert(after.last_run().seconds() == before.last_run().seconds());
  assert(after.last_run().nanos() == before.last_run().nanos());
  assert(after.last_queued() == 1);
  assert(f.sources->GetState(relay::discovery::kLastScanStateKey) == before_state);
}

} // namespace

int main() {
  TestScanStopsAtCheckpoint();
  TestLookbackLiveAndFailedItems();
  TestItemsWithoutDetailsAreKept();
  TestQuotaAbortLeavesRemainingSourcesForNextScan();
  TestSkipsWhenQuotaAlreadyExceeded();
  TestDisabledSourcesAreNotScanned();
  TestLastScanSurvivesRestart();
  TestFailedRunKeepsPreviousLastScan();

  std::cout << "relay_manager_unit_scanner: pass\n";
  return 0;
}
