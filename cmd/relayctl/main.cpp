#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "api/relay/manager/v1.hpp"

using namespace relay::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  relayctl <addr> stats\n"
            << "  relayctl <addr> pause [standard|short|relay]...\n"
            << "  relayctl <addr> resume [standard|short|relay]...\n"
            << "  relayctl <addr> pause-state\n"
            << "  relayctl <addr> progress [retrieval|relay]\n"
            << "  relayctl <addr> scan\n"
            << "  relayctl <addr> scan-status\n"
            << "  relayctl <addr> items [retrieval_status] [limit]\n"
            << "  relayctl <addr> get <item_id>\n"
            << "  relayctl <addr> retry <item_id> [retrieval|relay]\n"
            << "  relayctl <addr> delete <item_id> [--delete-file]\n"
            << "  relayctl <addr> sources\n"
            << "  relayctl <addr> enable <source_id>\n"
            << "  relayctl <addr> disable <source_id>\n"
            << "  relayctl <addr> watch [retrieval|relay]\n";
}

static std::optional<Pipeline> ParsePipeline(const std::string& value) {
  if (value == "standard") return PIPELINE_RETRIEVAL_STANDARD;
  if (value == "short") return PIPELINE_RETRIEVAL_SHORT;
  if (value == "relay") return PIPELINE_RELAY;
  return std::nullopt;
}

static std::optional<Phase> ParsePhase(const std::string& value) {
  if (value == "retrieval") return PHASE_RETRIEVAL;
  if (value == "relay") return PHASE_RELAY;
  return std::nullopt;
}

static std::optional<JobStatus> ParseStatus(const std::string& value) {
  if (value == "pending") return JOB_STATUS_PENDING;
  if (value == "in_progress") return JOB_STATUS_IN_PROGRESS;
  if (value == "completed") return JOB_STATUS_COMPLETED;
  if (value == "error") return JOB_STATUS_ERROR;
  return std::nullopt;
}

static std::string StatusText(JobStatus status) {
  switch (status) {
    case JOB_STATUS_PENDING:
      return "pending";
    case JOB_STATUS_IN_PROGRESS:
      return "in_progress";
    case JOB_STATUS_COMPLETED:
      return "completed";
    case JOB_STATUS_ERROR:
      return "error";
    default:
      return "-";
  }
}

static std::string PipelineText(Pipeline pipeline) {
  switch (pipeline) {
    case PIPELINE_RETRIEVAL_STANDARD:
      return "standard";
    case PIPELINE_RETRIEVAL_SHORT:
      return "short";
    case PIPELINE_RELAY:
      return "relay";
    default:
      return "-";
  }
}

static void PrintPipelines(const google::protobuf::RepeatedPtrField<PipelineStats>& pipelines) {
  for (const auto& p : pipelines) {
    std::cout << PipelineText(p.pipeline()) << ": active=" << p.active() << "/" << p.workers() << " queued=" << p.queue_depth()
              << (p.paused() ? " paused" : "") << "\n";
  }
}

static void PrintItem(const Item& item) {
  std::cout << item.external_id() << "  retrieval=" << StatusText(item.retrieval_status()) << " relay=" << StatusText(item.relay_status())
            << "  " << item.title() << "\n";
  if (!item.retrieval_error().empty()) std::cout << "  retrieval_error: " << item.retrieval_error() << "\n";
  if (!item.relay_error().empty()) std::cout << "  relay_error: " << item.relay_error() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = RelayAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsResponse resp;
    auto          status = stub->Stats(&ctx, StatsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    const auto& s = resp.stats();
    std::cout << "items=" << s.total_items() << " pending=" << s.retrieval_pending() << " in_progress=" << s.retrieval_in_progress()
              << " completed=" << s.retrieval_completed() << " error=" << s.retrieval_error() << "\n"
              << "retrieved_today=" << s.retrieved_today() << " local_bytes=" << s.local_bytes() << "\n"
              << "relayed=" << s.relay_completed() << " relay_pending=" << s.relay_pending() << " relay_error=" << s.relay_error()
              << " relayed_today=" << s.relayed_today() << "\n"
              << "sources=" << s.enabled_sources() << " quota=" << s.quota().used() << "/" << s.quota().limit()
              << (s.quota().exceeded() ? " exceeded" : "") << "\n"
              << "scan=" << (resp.scan().running() ? "running" : "idle") << " last_queued=" << resp.scan().last_queued() << "\n";
    PrintPipelines(s.pipelines());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pause" || cmd == "resume") {
    PauseRequest req;
    for (int i = 3; i < argc; ++i) {
      auto parsed = ParsePipeline(argv[i]);
      if (!parsed.has_value()) {
        std::cerr << "unknown pipeline: " << argv[i] << "\n";
        return 1;
      }
      req.add_pipelines(parsed.value());
    }

    PauseResponse resp;
    grpc::Status  status;
    if (cmd == "pause") {
      status = stub->Pause(&ctx, req, &resp);
    } else {
      ResumeRequest resume;
      *resume.mutable_pipelines() = req.pipelines();
      status                      = stub->Resume(&ctx, resume, &resp);
    }
    if (!status.ok()) return Fail(status);

    PrintPipelines(resp.pipelines());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pause-state") {
    PauseResponse resp;
    auto          status = stub->GetPauseState(&ctx, GetPauseStateRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    PrintPipelines(resp.pipelines());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "progress") {
    ListProgressRequest req;
    if (argc >= 4) {
      auto parsed = ParsePhase(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unknown phase: " << argv[3] << "\n";
        return 1;
      }
      req.set_phase(parsed.value());
    }

    ListProgressResponse resp;
    auto                 status = stub->ListProgress(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& slot : resp.slots()) {
      std::cout << "#" << slot.slot() << " " << PipelineText(slot.pipeline()) << " " << slot.item_id() << " " << std::fixed
                << std::setprecision(1) << slot.percent() << "% " << slot.label() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "scan") {
    TriggerScanResponse resp;
    auto                status = stub->TriggerScan(&ctx, TriggerScanRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.started()) {
      std::cout << "not started: " << resp.reason() << "\n";
      return 3;
    }
    std::cout << "scan requested\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "scan-status") {
    ScanStatusResponse resp;
    auto               status = stub->ScanStatus(&ctx, ScanStatusRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    const auto& s = resp.status();
    std::cout << (s.running() ? "running" : "idle") << " " << s.current() << "/" << s.total() << " " << s.current_source() << "\n"
              << "found=" << s.items_found() << " queued=" << s.items_queued() << (s.quota_exceeded() ? " quota_exceeded" : "") << "\n";
    if (!s.last_error().empty()) std::cout << "last_error: " << s.last_error() << "\n";
    for (const auto& r : s.recent_results()) {
      std::cout << "  " << r.source_name() << ": found=" << r.found() << " queued=" << r.queued()
                << (r.error().empty() ? "" : " error=" + r.error()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "items") {
    ListItemsRequest req;
    if (argc >= 4) {
      auto parsed = ParseStatus(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unknown status: " << argv[3] << "\n";
        return 1;
      }
      req.set_retrieval_status(parsed.value());
    }
    req.set_limit(argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 50);

    ListItemsResponse resp;
    auto              status = stub->ListItems(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& item : resp.items()) PrintItem(item);
    std::cout << "total=" << resp.total() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetItemRequest req;
    req.set_external_id(argv[3]);

    Item resp;
    auto status = stub->GetItem(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintItem(resp);
    if (!resp.local_path().empty()) std::cout << "  local: " << resp.local_path() << " (" << resp.local_size() << " bytes)\n";
    if (!resp.remote_ref().empty()) std::cout << "  remote: " << resp.remote_ref() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "retry") {
    if (argc < 4) return 1;

    RetryItemRequest req;
    req.set_external_id(argv[3]);
    if (argc >= 5) {
      auto parsed = ParsePhase(argv[4]);
      if (!parsed.has_value()) {
        std::cerr << "unknown phase: " << argv[4] << "\n";
        return 1;
      }
      req.set_phase(parsed.value());
    }

    Item resp;
    auto status = stub->RetryItem(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintItem(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteItemRequest req;
    req.set_external_id(argv[3]);
    req.set_delete_file(argc >= 5 && std::string(argv[4]) == "--delete-file");

    google::protobuf::Empty resp;
    auto                    status = stub->DeleteItem(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sources") {
    ListSourcesResponse resp;
    auto                status = stub->ListSources(&ctx, ListSourcesRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& source : resp.sources()) {
      std::cout << source.source_id() << (source.enabled() ? "  " : "  [disabled] ") << source.name()
                << "  last_seen=" << (source.last_seen_item_id().empty() ? "-" : source.last_seen_item_id()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "enable" || cmd == "disable") {
    if (argc < 4) return 1;

    SetSourceEnabledRequest req;
    req.set_source_id(argv[3]);
    req.set_enabled(cmd == "enable");

    Source resp;
    auto   status = stub->SetSourceEnabled(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.source_id() << (resp.enabled() ? " enabled" : " disabled") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    WatchEventsRequest req;
    if (argc >= 4) {
      auto parsed = ParsePhase(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unknown phase: " << argv[3] << "\n";
        return 1;
      }
      req.set_phase(parsed.value());
    }

    auto  reader = stub->WatchEvents(&ctx, req);
    Event event;
    while (reader->Read(&event)) {
      const char* phase = event.phase() == PHASE_RELAY ? "relay" : "retrieval";
      if (event.type() == Event::TYPE_PROGRESS) {
        std::cout << phase << " " << event.item_id() << " " << std::fixed << std::setprecision(1) << event.percent() << "%\n";
      } else {
        std::cout << phase << " " << event.item_id() << " -> " << StatusText(event.status())
                  << (event.error().empty() ? "" : " (" + event.error() + ")") << "\n";
      }
    }

    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);
    return 0;
  }

  Usage();
  return 1;
}
