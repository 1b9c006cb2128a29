#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/core/item_store.hpp"
#include "internal/pipeline/job_dispatcher.hpp"
#include "internal/progress/progress_tracker.hpp"
#include "retry_classifier.hpp"

namespace relay::recovery {

/*
  Reconciles persisted job state with what workers actually hold.

  - ResetStuck: startup only, before any worker runs.
  - SweepOrphans: in_progress rows without a progress slot are reset
    and re-dispatched.
  - RetryTransient: error rows the classifier accepts are re-queued.

  The watchdog thread runs SweepOrphans + RetryTransient every interval.
*/
class CrashRecovery {
 public:
  CrashRecovery(std::shared_ptr<core::ItemStore> store, std::shared_ptr<progress::ProgressTracker> progress, RetryClassifier classifier,
                pipeline::JobDispatcher& dispatcher, bool relay_enabled = true);
  ~CrashRecovery();

  core::ItemStore::ResetCounts ResetStuck();

  uint32_t SweepOrphans();

  uint32_t RetryTransient();

  void StartWatchdog(std::chrono::seconds interval);
  void StopWatchdog();

 private:
  void WatchdogLoop(std::chrono::seconds interval);

  std::shared_ptr<core::ItemStore>           store_;
  std::shared_ptr<progress::ProgressTracker> progress_;
  RetryClassifier                            classifier_;
  pipeline::JobDispatcher&                   dispatcher_;
  const bool                                 relay_enabled_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace relay::recovery
