#include "scanner.hpp"

#include <google/protobuf/util/json_util.h>

#include <exception>
#include <unordered_map>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::discovery {

using namespace relay::manager::v1;

Scanner::Scanner(ScannerOptions options, std::shared_ptr<collab::Provider> provider, std::shared_ptr<core::ItemStore> items,
                 std::shared_ptr<core::SourceStore> sources, pipeline::JobDispatcher& dispatcher)
    : options_(options), provider_(std::move(provider)), items_(std::move(items)), sources_(std::move(sources)), dispatcher_(dispatcher) {
}

ScanStatus Scanner::Status() const {
  std::lock_guard lock(status_mutex_);
  return status_;
}

void Scanner::LoadLastScan() {
  auto raw = sources_->GetState(kLastScanStateKey);
  if (!raw) return;

  LastScanState last;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  if (!google::protobuf::util::JsonStringToMessage(*raw, &last, options).ok()) {
    RELAY_LOG_WARN("last scan state unreadable");
    return;
  }

  std::lock_guard lock(status_mutex_);
  *status_.mutable_last_run() = last.time();
  status_.set_last_queued(last.queued());
}

void Scanner::Cancel() {
  {
    std::lock_guard lock(cancel_mutex_);
    cancelled_ = true;
  }
  cancel_cv_.notify_all();
}

bool Scanner::WaitBetweenSources() {
  std::unique_lock lock(cancel_mutex_);
  if (options_.source_delay.count() > 0) {
    cancel_cv_.wait_for(lock, options_.source_delay, [&] { return cancelled_; });
  }
  return !cancelled_;
}

Scanner::RunOutcome Scanner::Run() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return RunOutcome::kSkippedBusy;
  }

  {
    std::lock_guard lock(cancel_mutex_);
    cancelled_ = false;
  }

  observability::SpanScope span("relay.scan");

  {
    std::lock_guard lock(status_mutex_);
    status_.set_running(true);
    status_.set_current(0);
    status_.set_total(0);
    status_.clear_current_source();
    status_.set_sources_scanned(0);
    status_.set_sources_with_items(0);
    status_.set_items_found(0);
    status_.set_items_queued(0);
    status_.set_quota_exceeded(false);
    status_.clear_recent_results();
    status_.clear_last_error();
  }

  RunOutcome  outcome = RunOutcome::kCompleted;
  std::string error;

  try {
    if (provider_->QuotaExceeded()) {
      RELAY_LOG_INFO("scan skipped: provider quota exceeded");
      FinishRun(RunOutcome::kSkippedQuota, {});
      return RunOutcome::kSkippedQuota;
    }

    for (const auto& subscription : provider_->ListSubscriptions()) {
      sources_->UpsertSource(subscription.source_id, subscription.name, subscription.thumbnail);
    }

    const auto sources   = sources_->ListScanOrder();
    const auto now       = util::Now();
    const auto cutoff_ms = util::ToUnixMillis(now - std::chrono::hours(24) * options_.lookback_days);

    {
      std::lock_guard lock(status_mutex_);
      status_.set_total(static_cast<uint32_t>(sources.size()));
    }
    RELAY_LOG_INFO("scan started", {observability::IntField("sources", static_cast<std::int64_t>(sources.size()))});

    for (std::size_t i = 0; i < sources.size(); ++i) {
      const auto& source = sources[i];

      if (i > 0 && !WaitBetweenSources()) {
        outcome = RunOutcome::kCancelled;
        break;
      }

      {
        std::lock_guard lock(status_mutex_);
        status_.set_current(static_cast<uint32_t>(i + 1));
        status_.set_current_source(source.name);
      }

      if (provider_->QuotaExceeded()) {
        outcome = RunOutcome::kQuotaAborted;
        break;
      }

      SourceScanResult result;
      result.set_source_id(source.source_id);
      result.set_source_name(source.name);

      try {
        ScanSource(source, cutoff_ms, result);
      } catch (const util::QuotaExceeded& e) {
        result.set_error(e.what());
        RecordResult(result);
        outcome = RunOutcome::kQuotaAborted;
        break;
      } catch (const std::exception& e) {
        result.set_error(e.what());
        RELAY_LOG_WARN("source scan failed", {observability::StringField("source_id", source.source_id), observability::StringField("error", e.what())});
      }

      RecordResult(result);
    }
  } catch (const util::QuotaExceeded&) {
    outcome = RunOutcome::kQuotaAborted;
  } catch (const std::exception& e) {
    outcome = RunOutcome::kFailed;
    error   = e.what();
    span.RecordException(error);
    RELAY_LOG_ERROR("scan failed", {observability::StringField("error", error)});
  }

  FinishRun(outcome, error);
  return outcome;
}

void Scanner::ScanSource(const db::model::SourceRecord& source, uint64_t cutoff_ms, SourceScanResult& result) {
  const auto recent = provider_->ListRecentItems(source.source_id, options_.max_items_per_source, source.last_seen_item_id, cutoff_ms);

  // newest first; stop at the checkpoint or the lookback cutoff
  std::vector<collab::RecentItem> candidates;
  for (const auto& item : recent) {
    if (!source.last_seen_item_id.empty() && item.item_id == source.last_seen_item_id) break;
    if (item.published_at_ms > 0 && item.published_at_ms < cutoff_ms) break;
    candidates.push_back(item);
  }

  std::unordered_map<std::string, collab::ItemDetails> details;
  if (!candidates.empty()) {
    std::vector<std::string> ids;
    ids.reserve(candidates.size());
    for (const auto& item : candidates) ids.push_back(item.item_id);
    for (auto& detail : provider_->GetDetails(ids)) {
      auto id = detail.item_id;
      details.emplace(std::move(id), std::move(detail));
    }
  }

  const collab::RecentItem* newest = nullptr;
  uint32_t                  found  = 0;
  uint32_t                  queued = 0;

  for (const auto& item : candidates) {
    auto it = details.find(item.item_id);
    if (it != details.end() && it->second.live) continue;

    if (!newest) newest = &item;
    ++found;

    // no details (private, removed, still processing): keep the stub, duration 0 routes to standard
    db::model::ItemRecord record;
    record.external_id = item.item_id;
    record.title       = item.title;
    record.source_name = source.name;
    record.thumbnail   = item.thumbnail;
    if (it != details.end()) {
      const auto& detail = it->second;
      if (!detail.title.empty()) record.title = detail.title;
      if (!detail.source_name.empty()) record.source_name = detail.source_name;
      if (!detail.thumbnail.empty()) record.thumbnail = detail.thumbnail;
      record.duration_seconds = detail.duration_seconds;
    }

    const auto discovered = items_->RecordDiscovered(record);
    if (discovered == core::ItemStore::DiscoverOutcome::kSkipped) continue;

    dispatcher_.DispatchRetrieval(record);
    ++queued;
  }

  sources_->AdvanceCheckpoint(source.source_id, newest ? newest->item_id : std::string{}, newest ? newest->published_at_ms : 0,
                              util::ToUnixMillis(util::Now()));

  result.set_found(found);
  result.set_queued(queued);

  if (queued > 0) {
    RELAY_LOG_INFO("source scanned", {observability::StringField("source", source.name), observability::IntField("found", found),
                                      observability::IntField("queued", queued)});
  }
}

void Scanner::RecordResult(const SourceScanResult& result) {
  std::lock_guard lock(status_mutex_);
  status_.set_sources_scanned(status_.sources_scanned() + 1);
  if (result.found() > 0) status_.set_sources_with_items(status_.sources_with_items() + 1);
  status_.set_items_found(status_.items_found() + result.found());
  status_.set_items_queued(status_.items_queued() + result.queued());

  *status_.add_recent_results() = result;
  auto* recent                  = status_.mutable_recent_results();
  if (static_cast<std::size_t>(recent->size()) > options_.recent_results_limit) {
    recent->erase(recent->begin(), recent->begin() + (recent->size() - static_cast<int>(options_.recent_results_limit)));
  }
}

void Scanner::FinishRun(RunOutcome outcome, const std::string& error) {
  const bool quota = outcome == RunOutcome::kSkippedQuota || outcome == RunOutcome::kQuotaAborted;
  // skipped and failed runs leave the previous last_scan in place
  const bool record_run = outcome != RunOutcome::kSkippedQuota && outcome != RunOutcome::kFailed;

  uint32_t queued = 0;
  {
    std::lock_guard lock(status_mutex_);
    status_.set_running(false);
    status_.clear_current_source();
    status_.set_quota_exceeded(quota);
    status_.set_last_error(error);
    queued = status_.items_queued();

    if (record_run) {
      *status_.mutable_last_run() = util::ToProto(util::Now());
      status_.set_last_queued(queued);
    }
  }

  if (record_run) {
    LastScanState last;
    *last.mutable_time() = util::ToProto(util::Now());
    last.set_queued(queued);

    std::string json;
    if (google::protobuf::util::MessageToJsonString(last, &json).ok()) {
      try {
        sources_->PutState(kLastScanStateKey, json);
      } catch (const std::exception& e) {
        RELAY_LOG_ERROR("last scan state persist failed", {observability::StringField("error", e.what())});
      }
    }
  }

  if (outcome != RunOutcome::kSkippedQuota) {
    observability::Metrics::Instance().RecordScan(queued, quota);
    RELAY_LOG_INFO("scan finished", {observability::IntField("queued", queued), observability::BoolField("quota_exceeded", quota)});
  }

  running_ = false;
}

} // namespace relay::discovery
