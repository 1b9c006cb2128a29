#pragma once

#include <chrono>
#include <memory>

#include "internal/core/item_store.hpp"
#include "internal/core/relay_manager.hpp"
#include "internal/core/source_store.hpp"
#include "internal/discovery/quota_tracker.hpp"
#include "internal/discovery/scan_loop.hpp"
#include "internal/discovery/scanner.hpp"
#include "internal/events/event_broadcaster.hpp"
#include "internal/progress/progress_tracker.hpp"
#include "internal/recovery/crash_recovery.hpp"

namespace relay::runtime {

/*
  Engine

  Owns every long-lived component and sequences their lifecycle:

    Start: stuck-reset -> queue reload -> worker pools -> transient
           retry pass -> watchdog -> quota/scan state -> scan loop
    Stop:  scan loop -> watchdog -> worker pools -> event subscribers

  Stuck-reset runs before any worker so no live job can be reset.
*/
class Engine {
 public:
  struct Components {
    std::shared_ptr<core::ItemStore>             items;
    std::shared_ptr<core::SourceStore>           sources;
    std::shared_ptr<progress::ProgressTracker>   progress;
    std::shared_ptr<events::EventBroadcaster>    events;
    std::shared_ptr<core::RelayManager>          manager;
    std::shared_ptr<recovery::CrashRecovery>     recovery;
    std::shared_ptr<discovery::QuotaTracker>     quota;
    std::shared_ptr<discovery::Scanner>          scanner;
    std::shared_ptr<discovery::ScanLoop>         scan_loop;
    std::chrono::seconds                         watchdog_interval{300};
  };

  explicit Engine(Components components);
  ~Engine();

  Engine(const Engine&)            = delete;
  Engine& operator=(const Engine&) = delete;

  void Start();
  void Stop();

  const Components& Parts() const {
    return parts_;
  }

 private:
  Components parts_;
  bool       started_ = false;
};

} // namespace relay::runtime
