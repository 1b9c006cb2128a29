#include "pause_gate.hpp"

namespace relay::queue {

bool PauseGate::WaitUntilOpen() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !paused_; });

  return !shutdown_;
}

void PauseGate::Pause() {
  std::lock_guard lock(mutex_);
  paused_ = true;
}

void PauseGate::Resume() {
  {
    std::lock_guard lock(mutex_);
    paused_ = false;
  }
  cv_.notify_all();
}

void PauseGate::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool PauseGate::IsPaused() const {
  std::lock_guard lock(mutex_);
  return paused_;
}

} // namespace relay::queue
