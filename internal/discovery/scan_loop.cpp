#include "scan_loop.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace relay::discovery {

ScanLoop::ScanLoop(std::shared_ptr<Scanner> scanner, std::chrono::seconds interval, std::chrono::seconds initial_delay, bool periodic)
    : scanner_(std::move(scanner)), interval_(interval), initial_delay_(initial_delay), periodic_(periodic) {
}

ScanLoop::~ScanLoop() {
  Stop();
}

void ScanLoop::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ScanLoop::Loop, this);

  RELAY_LOG_INFO("scan loop started", {observability::BoolField("periodic", periodic_),
                                       observability::IntField("interval_seconds", interval_.count())});
}

void ScanLoop::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  scanner_->Cancel();
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool ScanLoop::TriggerNow(std::string* reason) {
  std::lock_guard lock(mutex_);
  if (!running_) {
    if (reason) *reason = "scan loop is not running";
    return false;
  }
  if (scanner_->Running()) {
    if (reason) *reason = "scan already running";
    return false;
  }
  if (triggered_) {
    if (reason) *reason = "scan already requested";
    return false;
  }
  triggered_ = true;
  cv_.notify_all();
  return true;
}

void ScanLoop::Loop() {
  using Clock = std::chrono::steady_clock;

  auto next_run = Clock::now() + initial_delay_;

  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (periodic_) {
        cv_.wait_until(lock, next_run, [&] { return !running_ || triggered_; });
      } else {
        cv_.wait(lock, [&] { return !running_ || triggered_; });
      }
      if (!running_) return;
      if (!triggered_ && Clock::now() < next_run) continue;
      triggered_ = false;
    }

    try {
      scanner_->Run();
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("scan run failed", {observability::StringField("error", e.what())});
    }

    next_run = Clock::now() + interval_;
  }
}

} // namespace relay::discovery
