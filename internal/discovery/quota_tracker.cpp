#include "quota_tracker.hpp"

#include <google/protobuf/util/json_util.h>

#include <exception>
#include <optional>
#include <string>

#include "internal/observability/logging.hpp"

namespace relay::discovery {

QuotaTracker::QuotaTracker(std::shared_ptr<core::SourceStore> store, uint32_t daily_limit, int utc_offset_hours)
    : store_(std::move(store)), daily_limit_(daily_limit), utc_offset_(utc_offset_hours) {
  state_.set_limit(daily_limit_);
}

void QuotaTracker::Load(util::TimePoint now) {
  std::lock_guard lock(mutex_);

  std::optional<std::string> raw;
  try {
    raw = store_->GetState(kQuotaStateKey);
  } catch (const std::exception& e) {
    RELAY_LOG_WARN("quota state unavailable", {observability::StringField("error", e.what())});
  }

  if (raw) {
    relay::manager::v1::QuotaState loaded;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status                   = google::protobuf::util::JsonStringToMessage(*raw, &loaded, options);
    if (status.ok()) {
      state_ = loaded;
    } else {
      RELAY_LOG_WARN("quota state unreadable, starting fresh", {observability::StringField("error", std::string(status.message()))});
    }
  }

  state_.set_limit(daily_limit_);
  RollDayLocked(now);
}

void QuotaTracker::AddUsage(uint32_t units, util::TimePoint now) {
  std::lock_guard lock(mutex_);
  RollDayLocked(now);

  state_.set_used(state_.used() + units);
  if (state_.used() >= daily_limit_ && !state_.exceeded()) {
    state_.set_exceeded(true);
    *state_.mutable_reset_time() = util::ToProto(util::NextMidnightAtOffset(now, utc_offset_));
    RELAY_LOG_WARN("provider quota spent", {observability::IntField("used", state_.used()), observability::IntField("limit", daily_limit_)});
  }
  PersistLocked();
}

void QuotaTracker::MarkExceeded(util::TimePoint now) {
  std::lock_guard lock(mutex_);
  RollDayLocked(now);

  const auto reset = util::NextMidnightAtOffset(now, utc_offset_);
  state_.set_exceeded(true);
  *state_.mutable_reset_time() = util::ToProto(reset);
  PersistLocked();

  RELAY_LOG_WARN("provider quota exceeded", {observability::StringField("reset_time", util::FormatIso8601(reset))});
}

bool QuotaTracker::IsExceeded(util::TimePoint now) {
  std::lock_guard lock(mutex_);
  RollDayLocked(now);
  return state_.exceeded();
}

relay::manager::v1::QuotaState QuotaTracker::Snapshot(util::TimePoint now) {
  std::lock_guard lock(mutex_);
  RollDayLocked(now);
  return state_;
}

void QuotaTracker::RollDayLocked(util::TimePoint now) {
  bool changed = false;

  if (state_.exceeded() && state_.has_reset_time() && now >= util::FromProto(state_.reset_time())) {
    state_.set_exceeded(false);
    state_.clear_reset_time();
    changed = true;
    RELAY_LOG_INFO("provider quota reset");
  }

  const auto today = util::DateAtOffset(now, utc_offset_);
  if (state_.date() != today) {
    state_.set_date(today);
    state_.set_used(0);
    state_.set_exceeded(false);
    state_.clear_reset_time();
    changed = true;
  }

  if (changed) PersistLocked();
}

void QuotaTracker::PersistLocked() {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(state_, &json);
  if (!status.ok()) {
    RELAY_LOG_ERROR("quota state serialization failed", {observability::StringField("error", std::string(status.message()))});
    return;
  }

  try {
    store_->PutState(kQuotaStateKey, json);
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("quota state persist failed", {observability::StringField("error", e.what())});
  }
}

} // namespace relay::discovery
