#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "event_sink.hpp"

namespace relay::events {

class EventBroadcaster;

/*
  One observer's view of the event stream.

  Buffer is bounded; when full the oldest event is discarded so a slow
  reader never stalls publishers.
*/
class Subscription {
 public:
  Subscription(std::size_t capacity, relay::manager::v1::Phase phase_filter);

  // Waits up to timeout for the next event. nullopt on timeout or close.
  std::optional<relay::manager::v1::Event> Next(std::chrono::milliseconds timeout);

  void Close();

  bool Closed() const;

  uint64_t Dropped() const;

 private:
  friend class EventBroadcaster;

  void Push(const relay::manager::v1::Event& event);

  const std::size_t                         capacity_;
  const relay::manager::v1::Phase           phase_filter_;
  mutable std::mutex                        mutex_;
  std::condition_variable                   cv_;
  std::deque<relay::manager::v1::Event>     buffer_;
  bool                                      closed_  = false;
  uint64_t                                  dropped_ = 0;
};

/*
  Fan-out sink. Publish copies the event into every live subscription.
*/
class EventBroadcaster final : public EventSink {
 public:
  explicit EventBroadcaster(std::size_t subscriber_buffer = 256);
  ~EventBroadcaster() override;

  void Publish(const relay::manager::v1::Event& event) override;

  // PHASE_UNSPECIFIED subscribes to both phases.
  std::shared_ptr<Subscription> Subscribe(relay::manager::v1::Phase phase_filter = relay::manager::v1::PHASE_UNSPECIFIED);

  void Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  std::size_t SubscriberCount() const;

  // Closes every subscription; later Subscribe calls return closed ones.
  void Shutdown();

 private:
  const std::size_t                          subscriber_buffer_;
  mutable std::mutex                         mutex_;
  std::vector<std::shared_ptr<Subscription>> subscribers_;
  bool                                       shutdown_ = false;
};

} // namespace relay::events
