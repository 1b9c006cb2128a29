#include "job_queue.hpp"

namespace relay::queue {

void JobQueue::Enqueue(const std::string& item_id) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(item_id);
  }
  cv_.notify_one();
}

std::optional<std::string> JobQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  std::string item_id = std::move(queue_.front());
  queue_.pop();
  ++dequeued_;
  return item_id;
}

void JobQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t JobQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

uint64_t JobQueue::DequeuedCount() const {
  std::lock_guard lock(mutex_);
  return dequeued_;
}

} // namespace relay::queue
