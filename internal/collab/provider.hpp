#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace relay::collab {

struct SubscriptionInfo {
  std::string source_id;
  std::string name;
  std::string thumbnail;
};

struct RecentItem {
  std::string item_id;
  std::string title;
  std::string thumbnail;
  uint64_t    published_at_ms = 0;
};

struct ItemDetails {
  std::string item_id;
  std::string title;
  std::string source_name;
  std::string thumbnail;
  uint32_t    duration_seconds = 0;
  // live or upcoming broadcast
  bool        live             = false;
};

/*
  Discovery-source API client.

  Calls that hit a spent daily quota throw util::QuotaExceeded.
*/
class Provider {
 public:
  virtual ~Provider() = default;

  virtual std::vector<SubscriptionInfo> ListSubscriptions() = 0;

  // Newest first. May stop early at stop_at_item_id or items published
  // before published_after_ms; callers re-check both.
  virtual std::vector<RecentItem> ListRecentItems(const std::string& source_id, uint32_t max_items, const std::string& stop_at_item_id,
                                                  uint64_t published_after_ms) = 0;

  // Batched lookup; unknown ids are omitted from the result.
  virtual std::vector<ItemDetails> GetDetails(const std::vector<std::string>& item_ids) = 0;

  virtual bool QuotaExceeded() = 0;
};

} // namespace relay::collab
