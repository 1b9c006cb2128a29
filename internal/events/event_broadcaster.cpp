#include "event_broadcaster.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace relay::events {

using namespace relay::manager::v1;

Event StatusEvent(Phase phase, const std::string& item_id, JobStatus status, const std::string& error) {
  Event event;
  event.set_type(Event::TYPE_STATUS_CHANGED);
  event.set_phase(phase);
  event.set_item_id(item_id);
  event.set_status(status);
  event.set_error(error);
  *event.mutable_at() = util::ToProto(util::Now());
  return event;
}

Event ProgressEvent(Phase phase, const std::string& item_id, double percent, double rate) {
  Event event;
  event.set_type(Event::TYPE_PROGRESS);
  event.set_phase(phase);
  event.set_item_id(item_id);
  event.set_percent(percent);
  event.set_rate(rate);
  *event.mutable_at() = util::ToProto(util::Now());
  return event;
}

// ------------------------------------------------------------
// Subscription
// ------------------------------------------------------------

Subscription::Subscription(std::size_t capacity, Phase phase_filter) : capacity_(std::max<std::size_t>(capacity, 1)), phase_filter_(phase_filter) {
}

void Subscription::Push(const Event& event) {
  if (phase_filter_ != PHASE_UNSPECIFIED && event.phase() != phase_filter_) {
    return;
  }

  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    if (buffer_.size() >= capacity_) {
      buffer_.pop_front();
      ++dropped_;
    }
    buffer_.push_back(event);
  }
  cv_.notify_one();
}

std::optional<Event> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return closed_ || !buffer_.empty(); });

  if (buffer_.empty()) return std::nullopt;

  Event event = std::move(buffer_.front());
  buffer_.pop_front();
  return event;
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

uint64_t Subscription::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

// ------------------------------------------------------------
// EventBroadcaster
// ------------------------------------------------------------

EventBroadcaster::EventBroadcaster(std::size_t subscriber_buffer) : subscriber_buffer_(subscriber_buffer) {
}

EventBroadcaster::~EventBroadcaster() {
  Shutdown();
}

void EventBroadcaster::Publish(const Event& event) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard lock(mutex_);
    targets = subscribers_;
  }

  for (const auto& subscription : targets) {
    subscription->Push(event);
  }
}

std::shared_ptr<Subscription> EventBroadcaster::Subscribe(Phase phase_filter) {
  auto subscription = std::make_shared<Subscription>(subscriber_buffer_, phase_filter);

  std::lock_guard lock(mutex_);
  if (shutdown_) {
    subscription->Close();
    return subscription;
  }
  subscribers_.push_back(subscription);
  return subscription;
}

void EventBroadcaster::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  if (!subscription) return;
  subscription->Close();

  std::lock_guard lock(mutex_);
  subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscription), subscribers_.end());
}

std::size_t EventBroadcaster::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

void EventBroadcaster::Shutdown() {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    targets.swap(subscribers_);
  }
  for (const auto& subscription : targets) {
    subscription->Close();
  }
}

} // namespace relay::events
