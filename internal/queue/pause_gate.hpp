#pragma once

#include <condition_variable>
#include <mutex>

namespace relay::queue {

/*
  Per-pipeline running/paused switch.

  Workers call WaitUntilOpen() once per dequeue cycle. Pausing never
  interrupts a job already running.
*/
class PauseGate {
 public:
  // Blocks while paused. false once Shutdown() was called.
  bool WaitUntilOpen();

  void Pause();
  void Resume();
  void Shutdown();

  bool IsPaused() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    paused_   = false;
  bool                    shutdown_ = false;
};

} // namespace relay::queue
