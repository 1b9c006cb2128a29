#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include "internal/core/source_store.hpp"
#include "internal/util/time.hpp"
#include "relay/manager/v1/types.pb.h"

namespace relay::discovery {

inline constexpr const char* kQuotaStateKey = "provider_quota";

/*
  Daily provider quota bookkeeping.

  The quota day rolls over at midnight in a fixed UTC offset (the
  provider's reset time). State is persisted under kQuotaStateKey after
  every change so a restart keeps an exceeded flag until the reset.
*/
class QuotaTracker {
 public:
  QuotaTracker(std::shared_ptr<core::SourceStore> store, uint32_t daily_limit, int utc_offset_hours);

  // Restores persisted state; a stale day starts fresh.
  void Load(util::TimePoint now = util::Now());

  void AddUsage(uint32_t units, util::TimePoint now = util::Now());

  // Provider refused a call: exceeded until the next reset.
  void MarkExceeded(util::TimePoint now = util::Now());

  // Clears itself once the reset deadline has passed.
  bool IsExceeded(util::TimePoint now = util::Now());

  relay::manager::v1::QuotaState Snapshot(util::TimePoint now = util::Now());

 private:
  void RollDayLocked(util::TimePoint now);
  void PersistLocked();

  std::shared_ptr<core::SourceStore> store_;
  const uint32_t                     daily_limit_;
  const std::chrono::hours           utc_offset_;

  std::mutex                     mutex_;
  relay::manager::v1::QuotaState state_;
};

} // namespace relay::discovery
