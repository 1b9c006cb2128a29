#include "progress_tracker.hpp"

#include <mutex>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace relay::progress {

using namespace relay::manager::v1;

ProgressTracker::ProgressTracker(std::chrono::milliseconds throttle) : throttle_(throttle) {
}

void ProgressTracker::Open(uint32_t slot, Pipeline pipeline, const std::string& item_id, const std::string& label) {
  Slot entry;
  entry.info.set_slot(slot);
  entry.info.set_pipeline(pipeline);
  entry.info.set_phase(model::PhaseOf(pipeline));
  entry.info.set_item_id(item_id);
  entry.info.set_label(label);
  *entry.info.mutable_started_at() = util::ToProto(util::Now());

  std::unique_lock lock(mutex_);
  slots_[slot] = std::move(entry);
}

bool ProgressTracker::Update(uint32_t slot, uint64_t bytes_done, uint64_t bytes_total, double rate) {
  std::unique_lock lock(mutex_);
  auto             it = slots_.find(slot);
  if (it == slots_.end()) return false;

  auto& entry = it->second;
  entry.info.set_bytes_done(bytes_done);
  entry.info.set_bytes_total(bytes_total);
  entry.info.set_rate(rate);
  entry.info.set_percent(bytes_total > 0 ? static_cast<double>(bytes_done) * 100.0 / static_cast<double>(bytes_total) : 0.0);

  const auto now = SteadyClock::now();
  if (entry.broadcast_once && now - entry.last_broadcast < throttle_) {
    return false;
  }
  entry.broadcast_once = true;
  entry.last_broadcast = now;
  return true;
}

void ProgressTracker::Close(uint32_t slot) {
  std::unique_lock lock(mutex_);
  slots_.erase(slot);
}

std::vector<ProgressSlot> ProgressTracker::List(Phase phase) const {
  std::shared_lock          lock(mutex_);
  std::vector<ProgressSlot> out;
  out.reserve(slots_.size());
  for (const auto& [_, entry] : slots_) {
    if (phase == PHASE_UNSPECIFIED || entry.info.phase() == phase) out.push_back(entry.info);
  }
  return out;
}

std::unordered_set<std::string> ProgressTracker::ActiveItemIds(Phase phase) const {
  std::shared_lock                lock(mutex_);
  std::unordered_set<std::string> ids;
  for (const auto& [_, entry] : slots_) {
    if (entry.info.phase() == phase) ids.insert(entry.info.item_id());
  }
  return ids;
}

uint32_t ProgressTracker::ActiveCount(Pipeline pipeline) const {
  std::shared_lock lock(mutex_);
  uint32_t         count = 0;
  for (const auto& [_, entry] : slots_) {
    if (entry.info.pipeline() == pipeline) ++count;
  }
  return count;
}

} // namespace relay::progress
