#include "admin_server.hpp"

#include <chrono>
#include <cstdint>

#include "grpc_error.hpp"
#include "internal/events/event_broadcaster.hpp"
#include "internal/observability/logging.hpp"

namespace relay::grpc {

using namespace relay::manager::v1;

namespace {

// Poll interval of the event stream; bounds how long a cancelled
// client keeps its subscription.
constexpr std::chrono::milliseconds kWatchPoll{200};

template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<relay::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Pause(::grpc::ServerContext*, const PauseRequest* req, PauseResponse* resp) {
  return Invoke([&] { *resp = service_->Pause(*req); });
}

::grpc::Status AdminServer::Resume(::grpc::ServerContext*, const ResumeRequest* req, PauseResponse* resp) {
  return Invoke([&] { *resp = service_->Resume(*req); });
}

::grpc::Status AdminServer::GetPauseState(::grpc::ServerContext*, const GetPauseStateRequest* req, PauseResponse* resp) {
  return Invoke([&] { *resp = service_->GetPauseState(*req); });
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Invoke([&] { *resp = service_->Stats(*req); });
}

::grpc::Status AdminServer::ListProgress(::grpc::ServerContext*, const ListProgressRequest* req, ListProgressResponse* resp) {
  return Invoke([&] { *resp = service_->ListProgress(*req); });
}

::grpc::Status AdminServer::TriggerScan(::grpc::ServerContext*, const TriggerScanRequest* req, TriggerScanResponse* resp) {
  return Invoke([&] { *resp = service_->TriggerScan(*req); });
}

::grpc::Status AdminServer::ScanStatus(::grpc::ServerContext*, const ScanStatusRequest* req, ScanStatusResponse* resp) {
  return Invoke([&] { *resp = service_->ScanStatus(*req); });
}

::grpc::Status AdminServer::ListItems(::grpc::ServerContext*, const ListItemsRequest* req, ListItemsResponse* resp) {
  return Invoke([&] { *resp = service_->ListItems(*req); });
}

::grpc::Status AdminServer::GetItem(::grpc::ServerContext*, const GetItemRequest* req, Item* resp) {
  return Invoke([&] { *resp = service_->GetItem(*req); });
}

::grpc::Status AdminServer::RetryItem(::grpc::ServerContext*, const RetryItemRequest* req, Item* resp) {
  return Invoke([&] { *resp = service_->RetryItem(*req); });
}

::grpc::Status AdminServer::DeleteItem(::grpc::ServerContext*, const DeleteItemRequest* req, google::protobuf::Empty*) {
  return Invoke([&] { service_->DeleteItem(*req); });
}

::grpc::Status AdminServer::ListSources(::grpc::ServerContext*, const ListSourcesRequest* req, ListSourcesResponse* resp) {
  return Invoke([&] { *resp = service_->ListSources(*req); });
}

::grpc::Status AdminServer::SetSourceEnabled(::grpc::ServerContext*, const SetSourceEnabledRequest* req, Source* resp) {
  return Invoke([&] { *resp = service_->SetSourceEnabled(*req); });
}

::grpc::Status AdminServer::WatchEvents(::grpc::ServerContext* ctx, const WatchEventsRequest* req, ::grpc::ServerWriter<Event>* writer) {
  std::shared_ptr<events::Subscription> subscription;
  try {
    subscription = service_->WatchEvents(*req);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  while (!ctx->IsCancelled() && !subscription->Closed()) {
    auto event = subscription->Next(kWatchPoll);
    if (!event) continue;
    if (!writer->Write(*event)) break;
  }

  if (subscription->Dropped() > 0) {
    RELAY_LOG_WARN("event watcher fell behind", {observability::IntField("dropped", static_cast<std::int64_t>(subscription->Dropped()))});
  }
  service_->StopWatching(subscription);
  return ::grpc::Status::OK;
}

} // namespace relay::grpc
