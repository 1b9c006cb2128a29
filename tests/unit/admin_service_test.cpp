#include "internal/service/admin_service.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/unit/service_fixture.hpp"

namespace {

using namespace relay::manager::v1;
using relay::testing::ServiceFixture;

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestStatsCountsEveryPhase() {
  ServiceFixture f("admin_stats");

  f.Discover("pending");
  f.Discover("failed");
  f.ctx.items->BeginRetrieval("failed");
  f.ctx.items->FailRetrieval("failed", "boom");

  f.Discover("local");
  f.ctx.items->BeginRetrieval("local");
  f.ctx.items->CompleteRetrieval("local", "/tmp/local.mp4", 700);

  f.Discover("relayed");
  f.ctx.items->BeginRetrieval("relayed");
  f.ctx.items->CompleteRetrieval("relayed", "/tmp/relayed.mp4", 300);
  f.ctx.items->BeginRelay("relayed");
  f.ctx.items->CompleteRelay("relayed", "videos/relayed.mp4", true);

  f.Discover("relay-failed");
  f.ctx.items->BeginRetrieval("relay-failed");
  f.ctx.items->CompleteRetrieval("relay-failed", "/tmp/rf.mp4", 50);
  f.ctx.items->BeginRelay("relay-failed");
  f.ctx.items->FailRelay("relay-failed", "Size mismatch");

  f.ctx.sources->UpsertSource("UC_a", "Alpha", "");
  f.ctx.sources->UpsertSource("UC_b", "Beta", "");
  f.ctx.sources->SetSourceEnabled("UC_b", false);

  const auto resp  = f.service->Stats(StatsRequest{});
  const auto stats = resp.stats();
  assert(stats.total_items() == 5);
  assert(stats.retrieval_pending() == 1);
  assert(stats.retrieval_error() == 1);
  assert(stats.retrieval_completed() == 3);
  assert(stats.retrieved_today() == 3);
  assert(stats.relay_completed() == 1);
  assert(stats.relayed_today() == 1);
  assert(stats.relay_pending() == 1);
  assert(stats.relay_error() == 1);
  assert(stats.local_bytes() == 750);
  assert(stats.enabled_sources() == 1);
  assert(stats.pipelines_size() == 3);
  assert(stats.quota().limit() == 10000);
  assert(!resp.scan().running());
}

void TestPauseAndResume() {
  ServiceFixture f("admin_pause");

  PauseRequest pause;
  pause.add_pipelines(PIPELINE_RELAY);
  auto state = f.service->Pause(pause);
  for (const auto& pipeline : state.pipelines()) {
    assert(pipeline.paused() == (pipeline.pipeline() == PIPELINE_RELAY));
  }

  state = f.service->Pause(PauseRequest{});
  for (const auto& pipeline : state.pipelines()) assert(pipeline.paused());

  ResumeRequest resume;
  resume.add_pipelines(PIPELINE_RETRIEVAL_SHORT);
  f.service->Resume(resume);
  assert(!f.ctx.manager->IsPaused(PIPELINE_RETRIEVAL_SHORT));
  assert(f.ctx.manager->IsPaused(PIPELINE_RETRIEVAL_STANDARD));

  f.service->Resume(ResumeRequest{});
  for (const auto& pipeline : f.service->GetPauseState(GetPauseStateRequest{}).pipelines()) assert(!pipeline.paused());

  PauseRequest bad;
  bad.add_pipelines(PIPELINE_UNSPECIFIED);
  assert(Throws<std::invalid_argument>([&] { f.service->Pause(bad); }));
}

void TestListItemsFiltersAndPages() {
  ServiceFixture f("admin_list");
  for (int i = 0; i < 7; ++i) f.Discover("item-" + std::to_string(i));
  f.ctx.items->BeginRetrieval("item-3");
  f.ctx.items->FailRetrieval("item-3", "nope");

  ListItemsRequest all;
  assert(f.service->ListItems(all).items_size() == 7);

  ListItemsRequest pending;
  pending.set_retrieval_status(JOB_STATUS_PENDING);
  pending.set_offset(2);
  pending.set_limit(3);
  const auto page = f.service->ListItems(pending);
  assert(page.total() == 6);
  assert(page.items_size() == 3);

  ListItemsRequest failed;
  failed.set_retrieval_status(JOB_STATUS_ERROR);
  const auto errors = f.service->ListItems(failed);
  assert(errors.total() == 1);
  assert(errors.items(0).retrieval_error() == "nope");
}

void TestGetAndRetryItem() {
  ServiceFixture f("admin_retry");

  GetItemRequest missing;
  missing.set_external_id("nope");
  assert(Throws<relay::util::NotFound>([&] { f.service->GetItem(missing); }));

  f.Discover("short", 30);
  f.ctx.items->BeginRetrieval("short");
  f.ctx.items->FailRetrieval("short", "HTTP Error 404");

  RetryItemRequest retry;
  retry.set_external_id("short");
  const auto item = f.service->RetryItem(retry);
  assert(item.retrieval_status() == JOB_STATUS_PENDING);
  assert(item.retrieval_error().empty());
  assert(f.QueueDepth(PIPELINE_RETRIEVAL_SHORT) == 1);

  // nothing failed any more
  assert(Throws<relay::util::InvalidState>([&] { f.service->RetryItem(retry); }));

  f.Discover("relay");
  f.ctx.items->BeginRetrieval("relay");
  f.ctx.items->CompleteRetrieval("relay", "/tmp/relay.mp4", 10);
  f.ctx.items->BeginRelay("relay");
  f.ctx.items->FailRelay("relay", "Connection reset");

  RetryItemRequest relay_retry;
  relay_retry.set_external_id("relay");
  const auto requeued = f.service->RetryItem(relay_retry);
  assert(requeued.relay_status() == JOB_STATUS_PENDING);
  assert(f.QueueDepth(PIPELINE_RELAY) == 1);

  RetryItemRequest wrong_phase;
  wrong_phase.set_external_id("relay");
  wrong_phase.set_phase(PHASE_RETRIEVAL);
  assert(Throws<relay::util::InvalidState>([&] { f.service->RetryItem(wrong_phase); }));
}

void TestDeleteItem() {
  ServiceFixture f("admin_delete");

  const auto local = f.dir / "downloads" / "done.mp4";
  std::ofstream(local) << "data";

  f.Discover("done");
  f.ctx.items->BeginRetrieval("done");
  f.ctx.items->CompleteRetrieval("done", local.string(), 4);

  DeleteItemRequest keep_file;
  keep_file.set_external_id("done");
  f.service->DeleteItem(keep_file);
  assert(!f.ctx.items->Get("done"));
  assert(std::filesystem::exists(local));

  f.Discover("done");
  f.ctx.items->BeginRetrieval("done");
  f.ctx.items->CompleteRetrieval("done", local.string(), 4);

  DeleteItemRequest drop_file;
  drop_file.set_external_id("done");
  drop_file.set_delete_file(true);
  f.service->DeleteItem(drop_file);
  assert(!std::filesystem::exists(local));

  f.Discover("busy");
  f.ctx.items->BeginRetrieval("busy");
  DeleteItemRequest busy;
  busy.set_external_id("busy");
  assert(Throws<relay::util::InvalidState>([&] { f.service->DeleteItem(busy); }));

  DeleteItemRequest missing;
  missing.set_external_id("ghost");
  assert(Throws<relay::util::NotFound>([&] { f.service->DeleteItem(missing); }));
}

void TestSources() {
  ServiceFixture f("admin_sources");
  f.ctx.sources->UpsertSource("UC_a", "Alpha", "https://img/a");

  SetSourceEnabledRequest disable;
  disable.set_source_id("UC_a");
  disable.set_enabled(false);
  const auto source = f.service->SetSourceEnabled(disable);
  assert(!source.enabled());
  assert(source.name() == "Alpha");

  const auto listed = f.service->ListSources(ListSourcesRequest{});
  assert(listed.sources_size() == 1);
  assert(!listed.sources(0).enabled());

  SetSourceEnabledRequest unknown;
  unknown.set_source_id("UC_zzz");
  assert(Throws<relay::util::NotFound>([&] { f.service->SetSourceEnabled(unknown); }));
}

void TestTriggerScan() {
  ServiceFixture f("admin_scan");
  f.provider->subscriptions.push_back({"UC_a", "Alpha", ""});
  f.provider->AddItem("UC_a", "fresh", relay::util::ToUnixMillis(relay::util::Now()) - 60'000, 30);

  // loop not started yet
  auto resp = f.service->TriggerScan(TriggerScanRequest{});
  assert(!resp.started());
  assert(!resp.reason().empty());

  f.ctx.scan_loop->Start();
  resp = f.service->TriggerScan(TriggerScanRequest{});
  assert(resp.started());

  assert(relay::testing::WaitUntil([&] { return f.service->ScanStatus(ScanStatusRequest{}).status().has_last_run(); }));
  f.ctx.scan_loop->Stop();

  const auto status = f.service->ScanStatus(ScanStatusRequest{}).status();
  assert(status.last_queued() == 1);
  assert(f.QueueDepth(PIPELINE_RETRIEVAL_SHORT) == 1);
  assert(f.service->ListSources(ListSourcesRequest{}).sources(0).last_seen_item_id() == "fresh");
}

void TestWatchEvents() {
  ServiceFixture f("admin_watch");

  WatchEventsRequest req;
  req.set_phase(PHASE_RETRIEVAL);
  auto subscription = f.service->WatchEvents(req);

  f.Discover("watched");
  f.ctx.items->BeginRetrieval("watched");

  auto first = subscription->Next(std::chrono::milliseconds(100));
  assert(first && first->status() == JOB_STATUS_PENDING);
  auto second = subscription->Next(std::chrono::milliseconds(100));
  assert(second && second->status() == JOB_STATUS_IN_PROGRESS);

  f.service->StopWatching(subscription);
  assert(subscription->Closed());
}

} // namespace

int main() {
  TestStatsCountsEveryPhase();
  TestPauseAndResume();
  TestListItemsFiltersAndPages();
  TestGetAndRetryItem();
  TestDeleteItem();
  TestSources();
  TestTriggerScan();
  TestWatchEvents();

  std::cout << "relay_manager_unit_admin_service: pass\n";
  return 0;
}
