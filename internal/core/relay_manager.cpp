#include "relay_manager.hpp"

#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/relay_job.hpp"
#include "internal/pipeline/retrieval_job.hpp"

namespace relay::core {

using namespace relay::manager::v1;

namespace {

constexpr uint32_t kStandardSlotBase = 1;
constexpr uint32_t kShortSlotBase    = 101;
constexpr uint32_t kRelaySlotBase    = 201;

std::size_t LaneIndex(Pipeline pipeline) {
  switch (pipeline) {
    case PIPELINE_RETRIEVAL_STANDARD:
      return 0;
    case PIPELINE_RETRIEVAL_SHORT:
      return 1;
    case PIPELINE_RELAY:
      return 2;
    default:
      throw std::invalid_argument("unknown pipeline");
  }
}

} // namespace

ManagerOptions ManagerOptions::FromConfig(const relay::runtime::config::RuntimeConfig& config) {
  ManagerOptions options;
  options.download_dir               = config.retrieval().download_dir();
  options.standard_workers           = config.retrieval().standard_workers();
  options.short_workers              = config.retrieval().short_workers();
  options.short_max_duration_seconds = config.retrieval().short_max_duration_seconds();
  options.relay_workers              = config.relay().workers();
  options.relay_enabled              = config.relay().enabled();
  options.delete_after_relay         = config.relay().delete_after_relay();
  return options;
}

RelayManager::RelayManager(ManagerOptions options, std::shared_ptr<ItemStore> store, std::shared_ptr<progress::ProgressTracker> progress,
                           std::shared_ptr<events::EventSink> events, std::shared_ptr<collab::Fetcher> fetcher,
                           std::shared_ptr<collab::Transfer> transfer)
    : options_(std::move(options)), store_(std::move(store)), progress_(std::move(progress)) {
  pipeline::RetrievalOptions retrieval_options;
  retrieval_options.download_dir  = options_.download_dir;
  retrieval_options.relay_enabled = options_.relay_enabled;

  pipeline::RelayOptions relay_options;
  relay_options.delete_after_relay         = options_.delete_after_relay;
  relay_options.short_max_duration_seconds = options_.short_max_duration_seconds;

  const struct {
    Pipeline                              pipeline;
    uint32_t                              workers;
    uint32_t                              base_slot;
    std::shared_ptr<queue::JobExecutor>   executor;
  } specs[] = {
      {PIPELINE_RETRIEVAL_STANDARD, options_.standard_workers, kStandardSlotBase,
       std::make_shared<pipeline::RetrievalJob>(PIPELINE_RETRIEVAL_STANDARD, retrieval_options, store_, progress_, events, fetcher, *this)},
      {PIPELINE_RETRIEVAL_SHORT, options_.short_workers, kShortSlotBase,
       std::make_shared<pipeline::RetrievalJob>(PIPELINE_RETRIEVAL_SHORT, retrieval_options, store_, progress_, events, fetcher, *this)},
      {PIPELINE_RELAY, options_.relay_workers, kRelaySlotBase,
       std::make_shared<pipeline::RelayJob>(relay_options, store_, progress_, events, transfer)},
  };

  for (const auto& spec : specs) {
    auto& lane    = lanes_[LaneIndex(spec.pipeline)];
    lane.pipeline = spec.pipeline;
    lane.queue    = std::make_shared<queue::JobQueue>();
    lane.gate     = std::make_shared<queue::PauseGate>();
    lane.pool     = std::make_unique<queue::WorkerPool>(spec.pipeline, spec.workers, spec.base_slot, lane.queue, lane.gate, spec.executor);
  }
}

RelayManager::~RelayManager() {
  Stop();
}

RelayManager::Lane& RelayManager::LaneFor(Pipeline pipeline) {
  return lanes_[LaneIndex(pipeline)];
}

const RelayManager::Lane& RelayManager::LaneFor(Pipeline pipeline) const {
  return lanes_[LaneIndex(pipeline)];
}

void RelayManager::Start() {
  if (started_) return;
  started_ = true;

  LaneFor(PIPELINE_RETRIEVAL_STANDARD).pool->Start();
  LaneFor(PIPELINE_RETRIEVAL_SHORT).pool->Start();
  if (options_.relay_enabled) {
    LaneFor(PIPELINE_RELAY).pool->Start();
  }
}

void RelayManager::Stop() {
  if (!started_) return;
  started_ = false;

  for (auto& lane : lanes_) {
    lane.pool->Stop();
  }
}

void RelayManager::Enqueue(Pipeline pipeline, const std::string& item_id) {
  auto& lane = LaneFor(pipeline);
  lane.queue->Enqueue(item_id);
  observability::Metrics::Instance().SetQueueDepth(model::PipelineName(pipeline), lane.queue->Size());
}

void RelayManager::DispatchRetrieval(const db::model::ItemRecord& record) {
  Enqueue(model::RouteRetrieval(record.duration_seconds, options_.short_max_duration_seconds), record.external_id);
}

void RelayManager::DispatchRelay(const std::string& item_id) {
  if (!options_.relay_enabled) return;
  Enqueue(PIPELINE_RELAY, item_id);
}

RelayManager::LoadCounts RelayManager::LoadPending() {
  LoadCounts counts;

  for (const auto& record : store_->ListByRetrievalStatus(JOB_STATUS_PENDING)) {
    DispatchRetrieval(record);
    ++counts.retrieval;
  }

  if (options_.relay_enabled) {
    for (const auto& record : store_->ListByRelayStatus(JOB_STATUS_PENDING)) {
      if (!model::RelayEligible(record.retrieval_status, !record.local_path.empty())) continue;
      DispatchRelay(record.external_id);
      ++counts.relay;
    }
  }

  RELAY_LOG_INFO("pending jobs loaded", {observability::IntField("retrieval", counts.retrieval), observability::IntField("relay", counts.relay)});
  return counts;
}

void RelayManager::Pause(const std::vector<Pipeline>& pipelines) {
  if (pipelines.empty()) {
    for (auto& lane : lanes_) lane.gate->Pause();
    RELAY_LOG_INFO("all pipelines paused");
    return;
  }
  for (auto pipeline : pipelines) {
    LaneFor(pipeline).gate->Pause();
    RELAY_LOG_INFO("pipeline paused", {observability::StringField("pipeline", model::PipelineName(pipeline))});
  }
}

void RelayManager::Resume(const std::vector<Pipeline>& pipelines) {
  if (pipelines.empty()) {
    for (auto& lane : lanes_) lane.gate->Resume();
    RELAY_LOG_INFO("all pipelines resumed");
    return;
  }
  for (auto pipeline : pipelines) {
    LaneFor(pipeline).gate->Resume();
    RELAY_LOG_INFO("pipeline resumed", {observability::StringField("pipeline", model::PipelineName(pipeline))});
  }
}

bool RelayManager::IsPaused(Pipeline pipeline) const {
  return LaneFor(pipeline).gate->IsPaused();
}

std::vector<relay::manager::v1::PipelineStats> RelayManager::ListPipelineStats() const {
  std::vector<relay::manager::v1::PipelineStats> out;
  out.reserve(lanes_.size());
  for (const auto& lane : lanes_) {
    relay::manager::v1::PipelineStats stats;
    stats.set_pipeline(lane.pipeline);
    stats.set_workers(lane.pool->Workers());
    stats.set_active(progress_->ActiveCount(lane.pipeline));
    stats.set_queue_depth(lane.queue->Size());
    stats.set_paused(lane.gate->IsPaused());
    out.push_back(std::move(stats));
  }
  return out;
}

} // namespace relay::core
