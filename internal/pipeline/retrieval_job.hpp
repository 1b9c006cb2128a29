#pragma once

#include <memory>
#include <string>

#include "internal/collab/fetcher.hpp"
#include "internal/core/item_store.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/progress/progress_tracker.hpp"
#include "internal/queue/job_executor.hpp"
#include "job_dispatcher.hpp"

namespace relay::pipeline {

struct RetrievalOptions {
  std::string download_dir;
  bool        relay_enabled = true;
};

/*
  Retrieval worker body, shared by the standard and short pipelines.

  On success the item is handed to the relay pipeline when relay is
  enabled.
*/
class RetrievalJob final : public queue::JobExecutor {
 public:
  RetrievalJob(relay::manager::v1::Pipeline pipeline, RetrievalOptions options, std::shared_ptr<core::ItemStore> store,
               std::shared_ptr<progress::ProgressTracker> progress, std::shared_ptr<events::EventSink> events,
               std::shared_ptr<collab::Fetcher> fetcher, JobDispatcher& dispatcher);

  void Execute(uint32_t slot, const std::string& item_id) override;

 private:
  const relay::manager::v1::Pipeline         pipeline_;
  const RetrievalOptions                     options_;
  std::shared_ptr<core::ItemStore>           store_;
  std::shared_ptr<progress::ProgressTracker> progress_;
  std::shared_ptr<events::EventSink>         events_;
  std::shared_ptr<collab::Fetcher>           fetcher_;
  JobDispatcher&                             dispatcher_;
};

} // namespace relay::pipeline
