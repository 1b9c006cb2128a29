#pragma once

#include <string>

#include "relay/manager/v1/types.pb.h"

namespace relay::events {

/*
  Observer sink for job lifecycle and progress events.

  Publish must never block the caller for longer than a short lock;
  delivery is best-effort.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const relay::manager::v1::Event& event) = 0;
};

// Drops every event. Used where no observer is wired.
class NullEventSink final : public EventSink {
 public:
  void Publish(const relay::manager::v1::Event&) override {
  }
};

relay::manager::v1::Event StatusEvent(relay::manager::v1::Phase phase, const std::string& item_id, relay::manager::v1::JobStatus status,
                                      const std::string& error = {});

relay::manager::v1::Event ProgressEvent(relay::manager::v1::Phase phase, const std::string& item_id, double percent, double rate);

} // namespace relay::events
