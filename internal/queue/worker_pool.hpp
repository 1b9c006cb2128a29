#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

#include "job_executor.hpp"
#include "job_queue.hpp"
#include "pause_gate.hpp"
#include "relay/manager/v1/types.pb.h"

namespace relay::queue {

/*
  N dedicated threads consuming one pipeline's queue.

  Loop: wait on gate -> dequeue -> re-check gate -> execute.
  Worker i owns progress slot base_slot + i.
*/
class WorkerPool {
 public:
  WorkerPool(relay::manager::v1::Pipeline pipeline, uint32_t workers, uint32_t base_slot, std::shared_ptr<JobQueue> queue,
             std::shared_ptr<PauseGate> gate, std::shared_ptr<JobExecutor> executor);
  ~WorkerPool();

  void Start();

  // Releases blocked workers and joins them. In-flight jobs finish first.
  void Stop();

  uint32_t Workers() const {
    return workers_;
  }

  relay::manager::v1::Pipeline Pipeline() const {
    return pipeline_;
  }

 private:
  void Loop(uint32_t slot);

  const relay::manager::v1::Pipeline pipeline_;
  const uint32_t                     workers_;
  const uint32_t                     base_slot_;
  std::shared_ptr<JobQueue>          queue_;
  std::shared_ptr<PauseGate>         gate_;
  std::shared_ptr<JobExecutor>       executor_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace relay::queue
