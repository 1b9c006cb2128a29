#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/collab/transfer.hpp"
#include "internal/core/item_store.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/progress/progress_tracker.hpp"
#include "internal/queue/job_executor.hpp"

namespace relay::pipeline {

struct RelayOptions {
  bool     delete_after_relay         = true;
  uint32_t short_max_duration_seconds = 60;
};

/*
  Relay worker body.

  Items whose retrieval has not produced a local file are refused and
  left untouched. A missing local file is an invariant violation and
  ends the relay in error.
*/
class RelayJob final : public queue::JobExecutor {
 public:
  RelayJob(RelayOptions options, std::shared_ptr<core::ItemStore> store, std::shared_ptr<progress::ProgressTracker> progress,
           std::shared_ptr<events::EventSink> events, std::shared_ptr<collab::Transfer> transfer);

  void Execute(uint32_t slot, const std::string& item_id) override;

 private:
  const RelayOptions                         options_;
  std::shared_ptr<core::ItemStore>           store_;
  std::shared_ptr<progress::ProgressTracker> progress_;
  std::shared_ptr<events::EventSink>         events_;
  std::shared_ptr<collab::Transfer>          transfer_;
};

} // namespace relay::pipeline
