#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "relay/manager/v1/admin_service.grpc.pb.h"

namespace relay::grpc {

class AdminServer final : public relay::manager::v1::RelayAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<relay::service::AdminService> svc);

  ::grpc::Status Pause(::grpc::ServerContext*, const relay::manager::v1::PauseRequest*, relay::manager::v1::PauseResponse*) override;
  ::grpc::Status Resume(::grpc::ServerContext*, const relay::manager::v1::ResumeRequest*, relay::manager::v1::PauseResponse*) override;
  ::grpc::Status GetPauseState(::grpc::ServerContext*, const relay::manager::v1::GetPauseStateRequest*,
                               relay::manager::v1::PauseResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const relay::manager::v1::StatsRequest*, relay::manager::v1::StatsResponse*) override;
  ::grpc::Status ListProgress(::grpc::ServerContext*, const relay::manager::v1::ListProgressRequest*,
                              relay::manager::v1::ListProgressResponse*) override;

  ::grpc::Status TriggerScan(::grpc::ServerContext*, const relay::manager::v1::TriggerScanRequest*,
                             relay::manager::v1::TriggerScanResponse*) override;
  ::grpc::Status ScanStatus(::grpc::ServerContext*, const relay::manager::v1::ScanStatusRequest*,
                            relay::manager::v1::ScanStatusResponse*) override;

  ::grpc::Status ListItems(::grpc::ServerContext*, const relay::manager::v1::ListItemsRequest*, relay::manager::v1::ListItemsResponse*) override;
  ::grpc::Status GetItem(::grpc::ServerContext*, const relay::manager::v1::GetItemRequest*, relay::manager::v1::Item*) override;
  ::grpc::Status RetryItem(::grpc::ServerContext*, const relay::manager::v1::RetryItemRequest*, relay::manager::v1::Item*) override;
  ::grpc::Status DeleteItem(::grpc::ServerContext*, const relay::manager::v1::DeleteItemRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ListSources(::grpc::ServerContext*, const relay::manager::v1::ListSourcesRequest*,
                             relay::manager::v1::ListSourcesResponse*) override;
  ::grpc::Status SetSourceEnabled(::grpc::ServerContext*, const relay::manager::v1::SetSourceEnabledRequest*,
                                  relay::manager::v1::Source*) override;

  ::grpc::Status WatchEvents(::grpc::ServerContext*, const relay::manager::v1::WatchEventsRequest*,
                             ::grpc::ServerWriter<relay::manager::v1::Event>*) override;

 private:
  std::shared_ptr<relay::service::AdminService> service_;
};

} // namespace relay::grpc
