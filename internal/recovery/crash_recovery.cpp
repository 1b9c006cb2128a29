#include "crash_recovery.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace relay::recovery {

using namespace relay::manager::v1;

CrashRecovery::CrashRecovery(std::shared_ptr<core::ItemStore> store, std::shared_ptr<progress::ProgressTracker> progress,
                             RetryClassifier classifier, pipeline::JobDispatcher& dispatcher, bool relay_enabled)
    : store_(std::move(store)),
      progress_(std::move(progress)),
      classifier_(std::move(classifier)),
      dispatcher_(dispatcher),
      relay_enabled_(relay_enabled) {
}

CrashRecovery::~CrashRecovery() {
  StopWatchdog();
}

core::ItemStore::ResetCounts CrashRecovery::ResetStuck() {
  auto counts = store_->ResetStuck();
  if (counts.retrieval > 0 || counts.relay > 0) {
    RELAY_LOG_INFO("reset stuck jobs", {observability::IntField("retrieval", counts.retrieval), observability::IntField("relay", counts.relay)});
  }
  return counts;
}

uint32_t CrashRecovery::SweepOrphans() {
  uint32_t reset = 0;

  // in_progress rows are read before the slot snapshot: a job that
  // finishes in between is no longer in_progress and the reset is a no-op
  const auto retrieving = store_->ListByRetrievalStatus(JOB_STATUS_IN_PROGRESS);
  const auto active     = progress_->ActiveItemIds(PHASE_RETRIEVAL);
  for (const auto& record : retrieving) {
    if (active.contains(record.external_id)) continue;
    if (!store_->ResetInProgress(record.external_id, PHASE_RETRIEVAL)) continue;

    RELAY_LOG_WARN("orphaned retrieval reset", {observability::StringField("item_id", record.external_id)});
    dispatcher_.DispatchRetrieval(record);
    ++reset;
  }

  const auto relaying      = store_->ListByRelayStatus(JOB_STATUS_IN_PROGRESS);
  const auto active_relays = progress_->ActiveItemIds(PHASE_RELAY);
  for (const auto& record : relaying) {
    if (active_relays.contains(record.external_id)) continue;
    if (!store_->ResetInProgress(record.external_id, PHASE_RELAY)) continue;

    RELAY_LOG_WARN("orphaned relay reset", {observability::StringField("item_id", record.external_id)});
    if (relay_enabled_) dispatcher_.DispatchRelay(record.external_id);
    ++reset;
  }

  return reset;
}

uint32_t CrashRecovery::RetryTransient() {
  uint32_t requeued = 0;

  for (const auto& record : store_->ListByRetrievalStatus(JOB_STATUS_ERROR)) {
    if (!classifier_.ShouldRetry(record.retrieval_attempts, record.retrieval_error)) continue;
    if (!store_->RequeueFailed(record.external_id, PHASE_RETRIEVAL, classifier_.MaxAttempts())) continue;

    RELAY_LOG_INFO("transient retrieval error requeued", {observability::StringField("item_id", record.external_id),
                                                          observability::IntField("attempts", record.retrieval_attempts)});
    dispatcher_.DispatchRetrieval(record);
    ++requeued;
  }

  if (relay_enabled_) {
    for (const auto& record : store_->ListByRelayStatus(JOB_STATUS_ERROR)) {
      if (!classifier_.ShouldRetry(record.relay_attempts, record.relay_error)) continue;
      if (!store_->RequeueFailed(record.external_id, PHASE_RELAY, classifier_.MaxAttempts())) continue;

      RELAY_LOG_INFO("transient relay error requeued", {observability::StringField("item_id", record.external_id),
                                                        observability::IntField("attempts", record.relay_attempts)});
      dispatcher_.DispatchRelay(record.external_id);
      ++requeued;
    }
  }

  return requeued;
}

void CrashRecovery::StartWatchdog(std::chrono::seconds interval) {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&CrashRecovery::WatchdogLoop, this, interval);
}

void CrashRecovery::StopWatchdog() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void CrashRecovery::WatchdogLoop(std::chrono::seconds interval) {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, interval, [&] { return !running_; });
      if (!running_) return;
    }

    try {
      const auto orphans  = SweepOrphans();
      const auto requeued = RetryTransient();
      if (orphans > 0 || requeued > 0) {
        RELAY_LOG_INFO("watchdog pass", {observability::IntField("orphans_reset", orphans), observability::IntField("requeued", requeued)});
      }
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("watchdog pass failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace relay::recovery
