#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "relay/manager/v1/types.pb.h"

namespace relay::progress {

/*
  Live progress of active worker slots.

  Purely in-memory: slots exist only while a worker processes an item
  and never touch the durable store. The watchdog compares
  ActiveItemIds() with in_progress rows to find orphans.
*/
class ProgressTracker {
 public:
  explicit ProgressTracker(std::chrono::milliseconds throttle = std::chrono::milliseconds(500));

  void Open(uint32_t slot, relay::manager::v1::Pipeline pipeline, const std::string& item_id, const std::string& label);

  // Returns true when a progress broadcast is due for this slot.
  bool Update(uint32_t slot, uint64_t bytes_done, uint64_t bytes_total, double rate);

  void Close(uint32_t slot);

  // PHASE_UNSPECIFIED lists every slot.
  std::vector<relay::manager::v1::ProgressSlot> List(relay::manager::v1::Phase phase = relay::manager::v1::PHASE_UNSPECIFIED) const;

  std::unordered_set<std::string> ActiveItemIds(relay::manager::v1::Phase phase) const;

  uint32_t ActiveCount(relay::manager::v1::Pipeline pipeline) const;

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct Slot {
    relay::manager::v1::ProgressSlot info;
    SteadyClock::time_point          last_broadcast{};
    bool                             broadcast_once = false;
  };

  const std::chrono::milliseconds throttle_;
  mutable std::shared_mutex       mutex_;
  std::map<uint32_t, Slot>        slots_;
};

// Closes the slot on scope exit, whatever the job outcome.
class SlotGuard {
 public:
  SlotGuard(ProgressTracker& tracker, uint32_t slot) : tracker_(tracker), slot_(slot) {
  }
  ~SlotGuard() {
    tracker_.Close(slot_);
  }

  SlotGuard(const SlotGuard&)            = delete;
  SlotGuard& operator=(const SlotGuard&) = delete;

 private:
  ProgressTracker& tracker_;
  uint32_t         slot_;
};

} // namespace relay::progress
