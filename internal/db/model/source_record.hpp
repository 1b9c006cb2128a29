#pragma once

#include <cstdint>
#include <string>

namespace relay::db::model {

/*
  Tracked discovery source plus its incremental scan checkpoint.

  The checkpoint only moves forward, and only after the items found in
  that scan are durably recorded.
*/

struct SourceRecord {
  std::string source_id;
  std::string name;
  std::string thumbnail;

  std::string last_seen_item_id;
  uint64_t    last_seen_at_ms    = 0;
  uint64_t    last_scanned_at_ms = 0;

  bool enabled = true;
};

} // namespace relay::db::model
