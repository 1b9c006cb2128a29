#include "worker_pool.hpp"

#include <exception>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace relay::queue {

WorkerPool::WorkerPool(relay::manager::v1::Pipeline pipeline, uint32_t workers, uint32_t base_slot, std::shared_ptr<JobQueue> queue,
                       std::shared_ptr<PauseGate> gate, std::shared_ptr<JobExecutor> executor)
    : pipeline_(pipeline),
      workers_(workers),
      base_slot_(base_slot),
      queue_(std::move(queue)),
      gate_(std::move(gate)),
      executor_(std::move(executor)) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;

  threads_.reserve(workers_);
  for (uint32_t i = 0; i < workers_; ++i) {
    threads_.emplace_back(&WorkerPool::Loop, this, base_slot_ + i);
  }

  RELAY_LOG_INFO("worker pool started", {observability::StringField("pipeline", model::PipelineName(pipeline_)),
                                         observability::IntField("workers", workers_)});
}

void WorkerPool::Stop() {
  if (!running_.exchange(false) && threads_.empty()) return;

  queue_->Shutdown();
  gate_->Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Loop(uint32_t slot) {
  const auto pipeline_name = model::PipelineName(pipeline_);

  while (running_) {
    if (!gate_->WaitUntilOpen()) break;

    auto item_id = queue_->Dequeue();
    if (!item_id) break;

    observability::Metrics::Instance().SetQueueDepth(pipeline_name, queue_->Size());

    // pause may have been requested while this worker sat in Dequeue
    if (!gate_->WaitUntilOpen()) break;

    try {
      executor_->Execute(slot, *item_id);
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("job failed outside executor handling", {observability::StringField("pipeline", pipeline_name),
                                                               observability::StringField("item_id", *item_id),
                                                               observability::StringField("error", e.what())});
    }
  }
}

} // namespace relay::queue
