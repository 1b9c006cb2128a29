#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include "internal/collab/provider.hpp"
#include "internal/core/item_store.hpp"
#include "internal/core/source_store.hpp"
#include "internal/db/model/source_record.hpp"
#include "internal/pipeline/job_dispatcher.hpp"
#include "relay/manager/v1/types.pb.h"

namespace relay::discovery {

inline constexpr const char* kLastScanStateKey = "last_scan";

struct ScannerOptions {
  uint32_t                  lookback_days        = 5;
  uint32_t                  max_items_per_source = 50;
  std::chrono::milliseconds source_delay{200};
  std::size_t               recent_results_limit = 20;
};

/*
  Incremental, quota-aware discovery.

  One run: reconcile subscriptions into sources, then scan each enabled
  source newest-first down to its checkpoint or the lookback cutoff.
  New items (and items whose retrieval failed) are recorded pending and
  dispatched. A source's checkpoint moves to the newest retained item
  only after its items are recorded.

  Single-flight: Run() while a run is active returns kSkippedBusy.
*/
class Scanner {
 public:
  enum class RunOutcome {
    kCompleted,
    kSkippedBusy,
    kSkippedQuota,
    kQuotaAborted,
    kCancelled,
    kFailed,
  };

  Scanner(ScannerOptions options, std::shared_ptr<collab::Provider> provider, std::shared_ptr<core::ItemStore> items,
          std::shared_ptr<core::SourceStore> sources, pipeline::JobDispatcher& dispatcher);

  RunOutcome Run();

  bool Running() const {
    return running_;
  }

  relay::manager::v1::ScanStatus Status() const;

  // Restores last run time / queued count from persisted state.
  void LoadLastScan();

  // Interrupts the inter-source delay and stops the active run early.
  void Cancel();

 private:
  void ScanSource(const db::model::SourceRecord& source, uint64_t cutoff_ms, relay::manager::v1::SourceScanResult& result);
  void RecordResult(const relay::manager::v1::SourceScanResult& result);
  void FinishRun(RunOutcome outcome, const std::string& error);
  bool WaitBetweenSources();

  const ScannerOptions               options_;
  std::shared_ptr<collab::Provider>  provider_;
  std::shared_ptr<core::ItemStore>   items_;
  std::shared_ptr<core::SourceStore> sources_;
  pipeline::JobDispatcher&           dispatcher_;

  std::atomic<bool> running_{false};

  mutable std::mutex             status_mutex_;
  relay::manager::v1::ScanStatus status_;

  std::mutex              cancel_mutex_;
  std::condition_variable cancel_cv_;
  bool                    cancelled_ = false;
};

} // namespace relay::discovery
