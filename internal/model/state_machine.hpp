#pragma once

#include <cstdint>
#include <string_view>

#include "relay/manager/v1/types.pb.h"

namespace relay::model {

using relay::manager::v1::JobStatus;
using relay::manager::v1::Phase;
using relay::manager::v1::Pipeline;

/*
  Per-phase job lifecycle:

    pending -> in_progress -> completed
                          \-> error -> pending (retry / rediscovery)
    in_progress -> pending (crash recovery)

  completed is terminal.
*/

constexpr bool IsTerminal(JobStatus status) {
  return status == relay::manager::v1::JOB_STATUS_COMPLETED;
}

constexpr bool CanTransition(JobStatus from, JobStatus to) {
  using namespace relay::manager::v1;
  switch (from) {
    case JOB_STATUS_PENDING:
      return to == JOB_STATUS_IN_PROGRESS;
    case JOB_STATUS_IN_PROGRESS:
      return to == JOB_STATUS_COMPLETED || to == JOB_STATUS_ERROR || to == JOB_STATUS_PENDING;
    case JOB_STATUS_ERROR:
      return to == JOB_STATUS_PENDING;
    default:
      return false;
  }
}

// Relay may leave pending only once retrieval produced a local file.
constexpr bool RelayEligible(JobStatus retrieval_status, bool has_local_path) {
  return retrieval_status == relay::manager::v1::JOB_STATUS_COMPLETED && has_local_path;
}

constexpr std::string_view StatusName(JobStatus status) {
  using namespace relay::manager::v1;
  switch (status) {
    case JOB_STATUS_PENDING:
      return "pending";
    case JOB_STATUS_IN_PROGRESS:
      return "in_progress";
    case JOB_STATUS_COMPLETED:
      return "completed";
    case JOB_STATUS_ERROR:
      return "error";
    default:
      return "unspecified";
  }
}

constexpr std::string_view PipelineName(Pipeline pipeline) {
  using namespace relay::manager::v1;
  switch (pipeline) {
    case PIPELINE_RETRIEVAL_STANDARD:
      return "retrieval-standard";
    case PIPELINE_RETRIEVAL_SHORT:
      return "retrieval-short";
    case PIPELINE_RELAY:
      return "relay";
    default:
      return "unspecified";
  }
}

constexpr std::string_view PhaseName(Phase phase) {
  using namespace relay::manager::v1;
  switch (phase) {
    case PHASE_RETRIEVAL:
      return "retrieval";
    case PHASE_RELAY:
      return "relay";
    default:
      return "unspecified";
  }
}

constexpr Phase PhaseOf(Pipeline pipeline) {
  return pipeline == relay::manager::v1::PIPELINE_RELAY ? relay::manager::v1::PHASE_RELAY : relay::manager::v1::PHASE_RETRIEVAL;
}

// Short-form when 0 < duration <= threshold.
constexpr Pipeline RouteRetrieval(std::uint32_t duration_seconds, std::uint32_t short_max_duration_seconds) {
  return duration_seconds > 0 && duration_seconds <= short_max_duration_seconds ? relay::manager::v1::PIPELINE_RETRIEVAL_SHORT
                                                                                : relay::manager::v1::PIPELINE_RETRIEVAL_STANDARD;
}

} // namespace relay::model
