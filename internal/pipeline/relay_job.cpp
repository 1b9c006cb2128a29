#include "relay_job.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"

namespace relay::pipeline {

using namespace relay::manager::v1;

RelayJob::RelayJob(RelayOptions options, std::shared_ptr<core::ItemStore> store, std::shared_ptr<progress::ProgressTracker> progress,
                   std::shared_ptr<events::EventSink> events, std::shared_ptr<collab::Transfer> transfer)
    : options_(options), store_(std::move(store)), progress_(std::move(progress)), events_(std::move(events)), transfer_(std::move(transfer)) {
}

void RelayJob::Execute(uint32_t slot, const std::string& item_id) {
  const auto pipeline_name = model::PipelineName(PIPELINE_RELAY);

  auto record = store_->Get(item_id);
  if (!record) {
    RELAY_LOG_WARN("relay skipped: item missing", {observability::StringField("item_id", item_id)});
    return;
  }

  progress_->Open(slot, PIPELINE_RELAY, item_id, record->title);
  progress::SlotGuard guard(*progress_, slot);

  std::optional<db::model::ItemRecord> claimed;
  try {
    claimed = store_->BeginRelay(item_id);
  } catch (const util::InvalidState& e) {
    RELAY_LOG_WARN("relay refused", {observability::StringField("item_id", item_id), observability::StringField("reason", e.what())});
    return;
  }
  if (!claimed) {
    RELAY_LOG_DEBUG("relay skipped: item not pending", {observability::StringField("item_id", item_id)});
    return;
  }

  observability::SpanScope span("relay.transfer");
  span.SetAttribute("item_id", item_id);

  const auto started    = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&started] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  };

  const std::filesystem::path local_path(claimed->local_path);

  try {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(local_path, ec)) {
      throw util::InvariantViolation("Local file not found");
    }
    const uint64_t local_size = std::filesystem::file_size(local_path);

    const auto remote_name = util::RemoteName(item_id, claimed->title, local_path.extension().string());
    const bool short_form =
        model::RouteRetrieval(claimed->duration_seconds, options_.short_max_duration_seconds) == PIPELINE_RETRIEVAL_SHORT;

    RELAY_LOG_INFO("relay started", {observability::StringField("item_id", item_id), observability::StringField("remote_name", remote_name),
                                     observability::BoolField("short_form", short_form)});

    auto result = transfer_->Send(local_path.string(), remote_name, short_form, [&](uint64_t done, uint64_t total, double rate) {
      if (progress_->Update(slot, done, total, rate)) {
        const double percent = total > 0 ? static_cast<double>(done) * 100.0 / static_cast<double>(total) : 0.0;
        events_->Publish(events::ProgressEvent(PHASE_RELAY, item_id, percent, rate));
      }
    });

    const uint64_t remote_size = transfer_->RemoteSize(result.remote_ref);
    if (remote_size != local_size) {
      throw std::runtime_error("Size mismatch: local=" + std::to_string(local_size) + ", remote=" + std::to_string(remote_size));
    }

    store_->CompleteRelay(item_id, result.remote_ref, options_.delete_after_relay);

    if (options_.delete_after_relay) {
      std::filesystem::remove(local_path, ec);
      if (ec) {
        RELAY_LOG_WARN("local file removal failed", {observability::StringField("path", local_path.string()),
                                                     observability::StringField("error", ec.message())});
      }
    }

    observability::Metrics::Instance().AddTransferredBytes(model::PhaseName(PHASE_RELAY), local_size);
    observability::Metrics::Instance().RecordJob(pipeline_name, "completed");
    observability::Metrics::Instance().ObserveJobDurationMs(pipeline_name, elapsed_ms());
    RELAY_LOG_INFO("relay completed", {observability::StringField("item_id", item_id), observability::StringField("remote_ref", result.remote_ref)});
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordJob(pipeline_name, "error");
    observability::Metrics::Instance().ObserveJobDurationMs(pipeline_name, elapsed_ms());
    RELAY_LOG_ERROR("relay failed", {observability::StringField("item_id", item_id), observability::StringField("error", e.what())});

    if (!store_->FailRelay(item_id, e.what())) {
      RELAY_LOG_WARN("relay failure not recorded: item no longer in_progress", {observability::StringField("item_id", item_id)});
    }
  }
}

} // namespace relay::pipeline
