#pragma once

#include <cstdint>
#include <string>

namespace relay::db::model {

// Small persistent key/value entry (scan summary, provider quota).
struct StateRecord {
  std::string key;
  std::string value;
  uint64_t    updated_at_ms = 0;
};

} // namespace relay::db::model
