#include "internal/events/event_broadcaster.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace {

using namespace relay::manager::v1;
using relay::events::EventBroadcaster;

constexpr std::chrono::milliseconds kShort{20};

void TestFanOutToEverySubscriber() {
  EventBroadcaster broadcaster(16);
  auto             a = broadcaster.Subscribe();
  auto             b = broadcaster.Subscribe();
  assert(broadcaster.SubscriberCount() == 2);

  broadcaster.Publish(relay::events::StatusEvent(PHASE_RETRIEVAL, "v1", JOB_STATUS_IN_PROGRESS));

  auto from_a = a->Next(kShort);
  auto from_b = b->Next(kShort);
  assert(from_a && from_a->item_id() == "v1");
  assert(from_b && from_b->status() == JOB_STATUS_IN_PROGRESS);
  assert(from_a->type() == Event::TYPE_STATUS_CHANGED);
  assert(!a->Next(kShort));
}

void TestSlowSubscriberDropsOldest() {
  EventBroadcaster broadcaster(3);
  auto             slow = broadcaster.Subscribe();

  for (int i = 0; i < 5; ++i) {
    broadcaster.Publish(relay::events::ProgressEvent(PHASE_RELAY, "v" + std::to_string(i), i * 10.0, 1.0));
  }

  assert(slow->Dropped() == 2);
  assert(slow->Next(kShort)->item_id() == "v2");
  assert(slow->Next(kShort)->item_id() == "v3");
  assert(slow->Next(kShort)->item_id() == "v4");
  assert(!slow->Next(kShort));
}

void TestPhaseFilter() {
  EventBroadcaster broadcaster(16);
  auto             relay_only = broadcaster.Subscribe(PHASE_RELAY);

  broadcaster.Publish(relay::events::StatusEvent(PHASE_RETRIEVAL, "r", JOB_STATUS_COMPLETED));
  broadcaster.Publish(relay::events::StatusEvent(PHASE_RELAY, "s", JOB_STATUS_ERROR, "Size mismatch"));

  auto event = relay_only->Next(kShort);
  assert(event && event->item_id() == "s");
  assert(event->error() == "Size mismatch");
  assert(!relay_only->Next(kShort));
}

void TestNextWakesOnPublish() {
  EventBroadcaster broadcaster(16);
  auto             subscription = broadcaster.Subscribe();

  std::thread publisher([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    broadcaster.Publish(relay::events::StatusEvent(PHASE_RETRIEVAL, "late", JOB_STATUS_PENDING));
  });

  auto event = subscription->Next(std::chrono::seconds(5));
  publisher.join();
  assert(event && event->item_id() == "late");
}

void TestUnsubscribeAndShutdown() {
  EventBroadcaster broadcaster(16);
  auto             first  = broadcaster.Subscribe();
  auto             second = broadcaster.Subscribe();

  broadcaster.Unsubscribe(first);
  assert(first->Closed());
  assert(broadcaster.SubscriberCount() == 1);

  broadcaster.Publish(relay::events::StatusEvent(PHASE_RETRIEVAL, "x", JOB_STATUS_PENDING));
  assert(!first->Next(kShort));

  broadcaster.Shutdown();
  assert(second->Closed());
  assert(broadcaster.SubscriberCount() == 0);

  // buffered events remain readable after close
  assert(second->Next(kShort)->item_id() == "x");
  assert(!second->Next(kShort));

  auto late = broadcaster.Subscribe();
  assert(late->Closed());
}

} // namespace

int main() {
  TestFanOutToEverySubscriber();
  TestSlowSubscriberDropsOldest();
  TestPhaseFilter();
  TestNextWakesOnPublish();
  TestUnsubscribeAndShutdown();

  std::cout << "relay_manager_unit_event_broadcaster: pass\n";
  return 0;
}
