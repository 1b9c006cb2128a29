#include "engine.hpp"

#include "internal/observability/logging.hpp"

namespace relay::runtime {

Engine::Engine(Components components) : parts_(std::move(components)) {
}

Engine::~Engine() {
  Stop();
}

void Engine::Start() {
  if (started_) return;

  // ------------------------------------------------------------
  // Recovery before any worker can claim a job
  // ------------------------------------------------------------
  const auto reset = parts_.recovery->ResetStuck();
  if (reset.retrieval > 0 || reset.relay > 0) {
    RELAY_LOG_WARN("reset jobs left in_progress by previous run",
                   {observability::IntField("retrieval", reset.retrieval), observability::IntField("relay", reset.relay)});
  }

  const auto loaded = parts_.manager->LoadPending();
  RELAY_LOG_INFO("pending jobs queued",
                 {observability::IntField("retrieval", loaded.retrieval), observability::IntField("relay", loaded.relay)});

  parts_.manager->Start();

  const auto retried = parts_.recovery->RetryTransient();
  if (retried > 0) {
    RELAY_LOG_INFO("transient failures requeued", {observability::IntField("count", retried)});
  }
  parts_.recovery->StartWatchdog(parts_.watchdog_interval);

  // ------------------------------------------------------------
  // Discovery
  // ------------------------------------------------------------
  parts_.quota->Load();
  parts_.scanner->LoadLastScan();
  parts_.scan_loop->Start();

  started_ = true;
  RELAY_LOG_INFO("engine started");
}

void Engine::Stop() {
  if (!started_) return;
  started_ = false;

  parts_.scan_loop->Stop();
  parts_.recovery->StopWatchdog();
  parts_.manager->Stop();
  parts_.events->Shutdown();

  RELAY_LOG_INFO("engine stopped");
}

} // namespace relay::runtime
