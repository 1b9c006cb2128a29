#pragma once

#include <memory>

namespace relay::core {
class ItemStore;
class SourceStore;
class RelayManager;
} // namespace relay::core
namespace relay::progress { class ProgressTracker; }
namespace relay::events { class EventBroadcaster; }
namespace relay::discovery {
class QuotaTracker;
class Scanner;
class ScanLoop;
} // namespace relay::discovery

namespace relay::service {

/*
  Dependency container shared by the admin service.
*/
struct ServiceContext {
  std::shared_ptr<relay::core::ItemStore>           items;
  std::shared_ptr<relay::core::SourceStore>         sources;
  std::shared_ptr<relay::core::RelayManager>        manager;
  std::shared_ptr<relay::progress::ProgressTracker> progress;
  std::shared_ptr<relay::events::EventBroadcaster>  events;
  std::shared_ptr<relay::discovery::QuotaTracker>   quota;
  std::shared_ptr<relay::discovery::Scanner>        scanner;
  std::shared_ptr<relay::discovery::ScanLoop>       scan_loop;
};

} // namespace relay::service
