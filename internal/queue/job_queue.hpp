#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace relay::queue {

/*
  Thread-safe unbounded FIFO of item ids for one pipeline.

  Entries are ephemeral; duplicates are allowed and filtered later by the
  item's persisted status.
*/
class JobQueue {
 public:
  void Enqueue(const std::string& item_id);

  // blocking wait
  std::optional<std::string> Dequeue();

  void Shutdown();

  std::size_t Size() const;

  // Total entries handed to workers since construction.
  uint64_t DequeuedCount() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  bool                    shutdown_ = false;
  uint64_t                dequeued_ = 0;
};

} // namespace relay::queue
