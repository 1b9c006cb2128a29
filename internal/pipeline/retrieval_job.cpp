#include "retrieval_job.hpp"

#include <chrono>
#include <cstdint>
#include <exception>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/naming.hpp"

namespace relay::pipeline {

using namespace relay::manager::v1;

RetrievalJob::RetrievalJob(Pipeline pipeline, RetrievalOptions options, std::shared_ptr<core::ItemStore> store,
                           std::shared_ptr<progress::ProgressTracker> progress, std::shared_ptr<events::EventSink> events,
                           std::shared_ptr<collab::Fetcher> fetcher, JobDispatcher& dispatcher)
    : pipeline_(pipeline),
      options_(std::move(options)),
      store_(std::move(store)),
      progress_(std::move(progress)),
      events_(std::move(events)),
      fetcher_(std::move(fetcher)),
      dispatcher_(dispatcher) {
}

void RetrievalJob::Execute(uint32_t slot, const std::string& item_id) {
  const auto pipeline_name = model::PipelineName(pipeline_);

  auto record = store_->Get(item_id);
  if (!record) {
    RELAY_LOG_WARN("retrieval skipped: item missing", {observability::StringField("item_id", item_id)});
    return;
  }

  // slot must exist before the row turns in_progress, or the watchdog
  // would treat the item as orphaned
  progress_->Open(slot, pipeline_, item_id, record->title);
  progress::SlotGuard guard(*progress_, slot);

  auto claimed = store_->BeginRetrieval(item_id);
  if (!claimed) {
    RELAY_LOG_DEBUG("retrieval skipped: item not pending", {observability::StringField("item_id", item_id)});
    return;
  }

  observability::SpanScope span("relay.retrieval");
  span.SetAttribute("item_id", item_id);
  span.SetAttribute("pipeline", pipeline_name);

  const auto started = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&started] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  };

  RELAY_LOG_INFO("retrieval started", {observability::StringField("item_id", item_id), observability::StringField("pipeline", pipeline_name),
                                       observability::IntField("attempt", claimed->retrieval_attempts)});

  try {
    collab::FetchRequest request;
    request.item_id          = item_id;
    request.title            = claimed->title;
    request.destination_stem = util::LocalStem(options_.download_dir, item_id, claimed->title).string();

    auto result = fetcher_->Fetch(request, [&](uint64_t done, uint64_t total, double rate) {
      if (progress_->Update(slot, done, total, rate)) {
        const double percent = total > 0 ? static_cast<double>(done) * 100.0 / static_cast<double>(total) : 0.0;
        events_->Publish(events::ProgressEvent(PHASE_RETRIEVAL, item_id, percent, rate));
      }
    });

    store_->CompleteRetrieval(item_id, result.local_path, result.local_size);

    observability::Metrics::Instance().AddTransferredBytes(model::PhaseName(PHASE_RETRIEVAL), result.local_size);
    observability::Metrics::Instance().RecordJob(pipeline_name, "completed");
    observability::Metrics::Instance().ObserveJobDurationMs(pipeline_name, elapsed_ms());
    RELAY_LOG_INFO("retrieval completed", {observability::StringField("item_id", item_id),
                                           observability::StringField("local_path", result.local_path),
                                           observability::IntField("local_size", static_cast<std::int64_t>(result.local_size))});
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordJob(pipeline_name, "error");
    observability::Metrics::Instance().ObserveJobDurationMs(pipeline_name, elapsed_ms());
    RELAY_LOG_ERROR("retrieval failed", {observability::StringField("item_id", item_id), observability::StringField("error", e.what())});

    if (!store_->FailRetrieval(item_id, e.what())) {
      RELAY_LOG_WARN("retrieval failure not recorded: item no longer in_progress", {observability::StringField("item_id", item_id)});
    }
    return;
  }

  if (options_.relay_enabled) {
    dispatcher_.DispatchRelay(item_id);
  }
}

} // namespace relay::pipeline
