#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/collab/fetcher.hpp"
#include "internal/collab/transfer.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/pipeline/job_dispatcher.hpp"
#include "internal/progress/progress_tracker.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/queue/pause_gate.hpp"
#include "internal/queue/worker_pool.hpp"
#include "item_store.hpp"

namespace relay::core {

struct ManagerOptions {
  std::string download_dir;
  uint32_t    standard_workers           = 3;
  uint32_t    short_workers              = 3;
  uint32_t    relay_workers              = 3;
  uint32_t    short_max_duration_seconds = 60;
  bool        relay_enabled              = true;
  bool        delete_after_relay         = true;

  static ManagerOptions FromConfig(const relay::runtime::config::RuntimeConfig& config);
};

/*
  Owns the three pipelines (retrieval-standard, retrieval-short, relay):
  one queue, pause gate and worker pool each.

  Also the JobDispatcher for executors, recovery and the scanner.
*/
class RelayManager final : public pipeline::JobDispatcher {
 public:
  struct LoadCounts {
    uint32_t retrieval = 0;
    uint32_t relay     = 0;
  };

  RelayManager(ManagerOptions options, std::shared_ptr<ItemStore> store, std::shared_ptr<progress::ProgressTracker> progress,
               std::shared_ptr<events::EventSink> events, std::shared_ptr<collab::Fetcher> fetcher,
               std::shared_ptr<collab::Transfer> transfer);
  ~RelayManager() override;

  void Start();
  void Stop();

  void DispatchRetrieval(const db::model::ItemRecord& record) override;
  void DispatchRelay(const std::string& item_id) override;

  // Re-feeds queues from pending rows. Startup only.
  LoadCounts LoadPending();

  // Empty list means every pipeline.
  void Pause(const std::vector<relay::manager::v1::Pipeline>& pipelines);
  void Resume(const std::vector<relay::manager::v1::Pipeline>& pipelines);
  bool IsPaused(relay::manager::v1::Pipeline pipeline) const;

  std::vector<relay::manager::v1::PipelineStats> ListPipelineStats() const;

  const ManagerOptions& Options() const {
    return options_;
  }

 private:
  struct Lane {
    relay::manager::v1::Pipeline       pipeline;
    std::shared_ptr<queue::JobQueue>   queue;
    std::shared_ptr<queue::PauseGate>  gate;
    std::unique_ptr<queue::WorkerPool> pool;
  };

  Lane&       LaneFor(relay::manager::v1::Pipeline pipeline);
  const Lane& LaneFor(relay::manager::v1::Pipeline pipeline) const;

  void Enqueue(relay::manager::v1::Pipeline pipeline, const std::string& item_id);

  const ManagerOptions                       options_;
  std::shared_ptr<ItemStore>                 store_;
  std::shared_ptr<progress::ProgressTracker> progress_;
  std::array<Lane, 3>                        lanes_;
  bool                                       started_ = false;
};

} // namespace relay::core
