#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "scanner.hpp"

namespace relay::discovery {

/*
  Background thread driving the scanner.

  With periodic runs enabled the first run happens after initial_delay
  and then every interval. Manual triggers are served either way.
*/
class ScanLoop {
 public:
  ScanLoop(std::shared_ptr<Scanner> scanner, std::chrono::seconds interval, std::chrono::seconds initial_delay, bool periodic);
  ~ScanLoop();

  void Start();
  void Stop();

  // Requests an immediate run. false (with reason) when one is already
  // running or pending.
  bool TriggerNow(std::string* reason = nullptr);

 private:
  void Loop();

  std::shared_ptr<Scanner>   scanner_;
  const std::chrono::seconds interval_;
  const std::chrono::seconds initial_delay_;
  const bool                 periodic_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    triggered_ = false;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace relay::discovery
