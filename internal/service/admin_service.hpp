#pragma once

#include <memory>

#include "api/relay/manager/v1.hpp"
#include "service_context.hpp"

namespace relay::events { class Subscription; }

namespace relay::service {

/*
  Operator controls. Transport-independent; exceptions from util/errors.hpp
  are mapped to status codes by the gRPC adapter.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  relay::manager::v1::PauseResponse Pause(const relay::manager::v1::PauseRequest& req);
  relay::manager::v1::PauseResponse Resume(const relay::manager::v1::ResumeRequest& req);
  relay::manager::v1::PauseResponse GetPauseState(const relay::manager::v1::GetPauseStateRequest& req);

  relay::manager::v1::StatsResponse        Stats(const relay::manager::v1::StatsRequest& req);
  relay::manager::v1::ListProgressResponse ListProgress(const relay::manager::v1::ListProgressRequest& req);

  relay::manager::v1::TriggerScanResponse TriggerScan(const relay::manager::v1::TriggerScanRequest& req);
  relay::manager::v1::ScanStatusResponse  ScanStatus(const relay::manager::v1::ScanStatusRequest& req);

  relay::manager::v1::ListItemsResponse ListItems(const relay::manager::v1::ListItemsRequest& req);
  relay::manager::v1::Item              GetItem(const relay::manager::v1::GetItemRequest& req);
  relay::manager::v1::Item              RetryItem(const relay::manager::v1::RetryItemRequest& req);
  void                                  DeleteItem(const relay::manager::v1::DeleteItemRequest& req);

  relay::manager::v1::ListSourcesResponse ListSources(const relay::manager::v1::ListSourcesRequest& req);
  relay::manager::v1::Source              SetSourceEnabled(const relay::manager::v1::SetSourceEnabledRequest& req);

  // Caller drains the subscription and unsubscribes when the stream ends.
  std::shared_ptr<relay::events::Subscription> WatchEvents(const relay::manager::v1::WatchEventsRequest& req);
  void                                          StopWatching(const std::shared_ptr<relay::events::Subscription>& subscription);

 private:
  template <typename Fn>
  auto Instrumented(const char* route, Fn&& fn) -> decltype(fn());

  relay::manager::v1::PauseResponse PauseState() const;

  ServiceContext ctx_;
};

} // namespace relay::service
