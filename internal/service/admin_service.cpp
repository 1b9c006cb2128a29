#include "admin_service.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

#include "internal/core/item_store.hpp"
#include "internal/core/relay_manager.hpp"
#include "internal/core/source_store.hpp"
#include "internal/discovery/quota_tracker.hpp"
#include "internal/discovery/scan_loop.hpp"
#include "internal/discovery/scanner.hpp"
#include "internal/events/event_broadcaster.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/progress/progress_tracker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::service {

using namespace relay::manager::v1;

namespace {

std::vector<Pipeline> RequestedPipelines(const google::protobuf::RepeatedField<int>& values) {
  std::vector<Pipeline> out;
  for (int value : values) {
    if (!Pipeline_IsValid(value) || value == PIPELINE_UNSPECIFIED) {
      throw std::invalid_argument("unknown pipeline: " + std::to_string(value));
    }
    out.push_back(static_cast<Pipeline>(value));
  }
  return out;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

template <typename Fn>
auto AdminService::Instrumented(const char* route, Fn&& fn) -> decltype(fn()) {
  relay::observability::SpanScope span(route);
  const auto                      started_at = std::chrono::steady_clock::now();
  const auto                      elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<decltype(fn())>) {
      fn();
      relay::observability::Metrics::Instance().RecordRequest(route, true);
      relay::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    } else {
      auto result = fn();
      relay::observability::Metrics::Instance().RecordRequest(route, true);
      relay::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RELAY_LOG_ERROR("RPC failed", {relay::observability::StringField("route", route), relay::observability::StringField("error", ex.what())});
    relay::observability::Metrics::Instance().RecordRequest(route, false);
    relay::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

// ------------------------------------------------------------
// Pause control
// ------------------------------------------------------------

PauseResponse AdminService::PauseState() const {
  PauseResponse resp;
  for (auto& stats : ctx_.manager->ListPipelineStats()) {
    *resp.add_pipelines() = std::move(stats);
  }
  return resp;
}

PauseResponse AdminService::Pause(const PauseRequest& req) {
  return Instrumented("AdminService.Pause", [&] {
    ctx_.manager->Pause(RequestedPipelines(req.pipelines()));
    return PauseState();
  });
}

PauseResponse AdminService::Resume(const ResumeRequest& req) {
  return Instrumented("AdminService.Resume", [&] {
    ctx_.manager->Resume(RequestedPipelines(req.pipelines()));
    return PauseState();
  });
}

PauseResponse AdminService::GetPauseState(const GetPauseStateRequest&) {
  return Instrumented("AdminService.GetPauseState", [&] { return PauseState(); });
}

// ------------------------------------------------------------
// Stats / progress
// ------------------------------------------------------------

StatsResponse AdminService::Stats(const StatsRequest&) {
  return Instrumented("AdminService.Stats", [&] {
    StatsResponse resp;
    auto*         stats = resp.mutable_stats();

    const auto today_ms = util::ToUnixMillis(util::StartOfUtcDay(util::Now()));

    for (const auto& item : ctx_.items->List()) {
      stats->set_total_items(stats->total_items() + 1);

      switch (item.retrieval_status) {
        case JOB_STATUS_PENDING:
          stats->set_retrieval_pending(stats->retrieval_pending() + 1);
          break;
        case JOB_STATUS_IN_PROGRESS:
          stats->set_retrieval_in_progress(stats->retrieval_in_progress() + 1);
          break;
        case JOB_STATUS_COMPLETED:
          stats->set_retrieval_completed(stats->retrieval_completed() + 1);
          break;
        case JOB_STATUS_ERROR:
          stats->set_retrieval_error(stats->retrieval_error() + 1);
          break;
        default:
          break;
      }
      if (item.retrieved_at_ms >= today_ms) {
        stats->set_retrieved_today(stats->retrieved_today() + 1);
      }

      if (item.relay_status == JOB_STATUS_COMPLETED) {
        stats->set_relay_completed(stats->relay_completed() + 1);
        if (item.relayed_at_ms >= today_ms) {
          stats->set_relayed_today(stats->relayed_today() + 1);
        }
      } else if (item.relay_status == JOB_STATUS_ERROR) {
        stats->set_relay_error(stats->relay_error() + 1);
      } else if (item.retrieval_status == JOB_STATUS_COMPLETED) {
        // retrieved, waiting for (or in) relay
        stats->set_relay_pending(stats->relay_pending() + 1);
      }

      if (!item.local_path.empty()) {
        stats->set_local_bytes(stats->local_bytes() + item.local_size);
      }
    }

    for (const auto& source : ctx_.sources->ListSources()) {
      if (source.enabled) {
        stats->set_enabled_sources(stats->enabled_sources() + 1);
      }
    }

    for (auto& pipeline : ctx_.manager->ListPipelineStats()) {
      *stats->add_pipelines() = std::move(pipeline);
    }
    *stats->mutable_quota() = ctx_.quota->Snapshot();
    *resp.mutable_scan()    = ctx_.scanner->Status();
    return resp;
  });
}

ListProgressResponse AdminService::ListProgress(const ListProgressRequest& req) {
  return Instrumented("AdminService.ListProgress", [&] {
    ListProgressResponse resp;
    for (auto& slot : ctx_.progress->List(req.phase())) {
      *resp.add_slots() = std::move(slot);
    }
    return resp;
  });
}

// ------------------------------------------------------------
// Discovery
// ------------------------------------------------------------

TriggerScanResponse AdminService::TriggerScan(const TriggerScanRequest&) {
  return Instrumented("AdminService.TriggerScan", [&] {
    TriggerScanResponse resp;
    std::string         reason;
    resp.set_started(ctx_.scan_loop->TriggerNow(&reason));
    resp.set_reason(reason);
    return resp;
  });
}

ScanStatusResponse AdminService::ScanStatus(const ScanStatusRequest&) {
  return Instrumented("AdminService.ScanStatus", [&] {
    ScanStatusResponse resp;
    *resp.mutable_status() = ctx_.scanner->Status();
    return resp;
  });
}

// ------------------------------------------------------------
// Items
// ------------------------------------------------------------

ListItemsResponse AdminService::ListItems(const ListItemsRequest& req) {
  return Instrumented("AdminService.ListItems", [&] {
    ListItemsResponse resp;
    uint64_t          matched = 0;

    for (const auto& item : ctx_.items->List()) {
      if (req.retrieval_status() != JOB_STATUS_UNSPECIFIED && item.retrieval_status != req.retrieval_status()) continue;
      if (req.relay_status() != JOB_STATUS_UNSPECIFIED && item.relay_status != req.relay_status()) continue;

      const auto index = matched++;
      if (index < req.offset()) continue;
      if (req.limit() > 0 && static_cast<uint64_t>(resp.items_size()) >= req.limit()) continue;
      *resp.add_items() = core::ToItemProto(item);
    }
    resp.set_total(matched);
    return resp;
  });
}

Item AdminService::GetItem(const GetItemRequest& req) {
  return Instrumented("AdminService.GetItem", [&] {
    auto record = ctx_.items->Get(req.external_id());
    if (!record) {
      throw util::NotFound("item not found: " + req.external_id());
    }
    return core::ToItemProto(*record);
  });
}

Item AdminService::RetryItem(const RetryItemRequest& req) {
  return Instrumented("AdminService.RetryItem", [&] {
    auto record = ctx_.items->Get(req.external_id());
    if (!record) {
      throw util::NotFound("item not found: " + req.external_id());
    }

    auto phase = req.phase();
    if (phase == PHASE_UNSPECIFIED) {
      phase = record->retrieval_status == JOB_STATUS_ERROR ? PHASE_RETRIEVAL : PHASE_RELAY;
    }

    if (!ctx_.items->RequeueFailed(req.external_id(), phase)) {
      throw util::InvalidState("item " + req.external_id() + " has no failed " + std::string(model::PhaseName(phase)) + " job");
    }

    auto updated = ctx_.items->Get(req.external_id());
    if (!updated) {
      throw util::NotFound("item not found: " + req.external_id());
    }

    if (phase == PHASE_RETRIEVAL) {
      ctx_.manager->DispatchRetrieval(*updated);
    } else {
      ctx_.manager->DispatchRelay(updated->external_id);
    }

    RELAY_LOG_INFO("item requeued by operator", {relay::observability::StringField("item_id", req.external_id()),
                                                 relay::observability::StringField("phase", model::PhaseName(phase))});
    return core::ToItemProto(*updated);
  });
}

void AdminService::DeleteItem(const DeleteItemRequest& req) {
  Instrumented("AdminService.DeleteItem", [&] {
    const auto removed = ctx_.items->Delete(req.external_id());

    if (req.delete_file() && !removed.local_path.empty()) {
      std::error_code ec;
      std::filesystem::remove(removed.local_path, ec);
      if (ec) {
        RELAY_LOG_WARN("local file not removed", {relay::observability::StringField("path", removed.local_path),
                                                  relay::observability::StringField("error", ec.message())});
      }
    }
  });
}

// ------------------------------------------------------------
// Sources
// ------------------------------------------------------------

ListSourcesResponse AdminService::ListSources(const ListSourcesRequest&) {
  return Instrumented("AdminService.ListSources", [&] {
    ListSourcesResponse resp;
    for (const auto& source : ctx_.sources->ListSources()) {
      *resp.add_sources() = core::ToSourceProto(source);
    }
    return resp;
  });
}

Source AdminService::SetSourceEnabled(const SetSourceEnabledRequest& req) {
  return Instrumented("AdminService.SetSourceEnabled", [&] {
    ctx_.sources->SetSourceEnabled(req.source_id(), req.enabled());
    auto source = ctx_.sources->GetSource(req.source_id());
    if (!source) {
      throw util::NotFound("source not found: " + req.source_id());
    }
    return core::ToSourceProto(*source);
  });
}

// ------------------------------------------------------------
// Events
// ------------------------------------------------------------

std::shared_ptr<events::Subscription> AdminService::WatchEvents(const WatchEventsRequest& req) {
  return Instrumented("AdminService.WatchEvents", [&] { return ctx_.events->Subscribe(req.phase()); });
}

void AdminService::StopWatching(const std::shared_ptr<events::Subscription>& subscription) {
  ctx_.events->Unsubscribe(subscription);
}

} // namespace relay::service
