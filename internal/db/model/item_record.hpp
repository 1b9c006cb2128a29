#pragma once

#include <cstdint>
#include <string>

#include "relay/manager/v1/types.pb.h"

namespace relay::db::model {

/*
  Persistent item row.

  IMPORTANT:
  - external_id is the natural key assigned by the discovery source.
  - retrieval and relay are independent lifecycles; relay may leave
    pending only after retrieval completed with a local_path.
  - Empty strings / 0 timestamps mean "unset".
*/

struct ItemRecord {
  std::string external_id;
  std::string title;
  std::string source_name;
  uint32_t    duration_seconds = 0;
  std::string thumbnail;

  relay::manager::v1::JobStatus retrieval_status = relay::manager::v1::JOB_STATUS_PENDING;

  uint32_t    retrieval_attempts = 0;
  std::string retrieval_error;
  std::string local_path;
  uint64_t    local_size      = 0;
  uint64_t    retrieved_at_ms = 0;

  relay::manager::v1::JobStatus relay_status = relay::manager::v1::JOB_STATUS_PENDING;

  uint32_t    relay_attempts = 0;
  std::string relay_error;
  std::string remote_ref;
  uint64_t    relayed_at_ms = 0;

  // Immutable after insert.
  uint64_t created_at_ms = 0;
};

} // namespace relay::db::model
