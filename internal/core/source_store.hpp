#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/source_record.hpp"
#include "internal/db/model/state_record.hpp"
#include "relay/manager/v1/types.pb.h"

namespace relay::core {

/*
  Tracked sources, their scan checkpoints and the small persistent
  key/value state (last scan summary, provider quota).
*/
class SourceStore {
 public:
  explicit SourceStore(std::shared_ptr<db::Repository> repository);

  // Creates the source or refreshes name/thumbnail. Checkpoint and the
  // enabled flag of an existing source are preserved.
  db::model::SourceRecord UpsertSource(const std::string& source_id, const std::string& name, const std::string& thumbnail);

  std::optional<db::model::SourceRecord> GetSource(const std::string& source_id);

  std::vector<db::model::SourceRecord> ListSources();

  // Enabled sources, never-scanned first, then least recently scanned.
  std::vector<db::model::SourceRecord> ListScanOrder();

  // Records a finished scan of one source. An empty newest_item_id only
  // touches last_scanned_at.
  void AdvanceCheckpoint(const std::string& source_id, const std::string& newest_item_id, uint64_t newest_published_at_ms,
                         uint64_t scanned_at_ms);

  void SetSourceEnabled(const std::string& source_id, bool enabled);

  void                       PutState(const std::string& key, const std::string& value);
  std::optional<std::string> GetState(const std::string& key);

 private:
  std::shared_ptr<db::Repository> repository_;
};

relay::manager::v1::Source ToSourceProto(const db::model::SourceRecord& record);

} // namespace relay::core
