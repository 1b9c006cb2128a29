#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "internal/discovery/quota_tracker.hpp"
#include "provider.hpp"

namespace relay::collab {

struct YoutubeProviderOptions {
  std::string token_file   = "token.json";
  std::string api_base_url = "https://www.googleapis.com/youtube/v3";
  std::string token_url    = "https://oauth2.googleapis.com/token";
};

/*
  Provider over the YouTube Data API v3.

  Credentials come from an authorized-user token file written by the
  consent flow; the access token is refreshed with the stored refresh
  token and written back. Every call is charged to the QuotaTracker; a
  quotaExceeded refusal marks the tracker and throws util::QuotaExceeded.
*/
class YoutubeProvider final : public Provider {
 public:
  YoutubeProvider(YoutubeProviderOptions options, std::shared_ptr<HttpClient> http, std::shared_ptr<discovery::QuotaTracker> quota);

  std::vector<SubscriptionInfo> ListSubscriptions() override;

  std::vector<RecentItem> ListRecentItems(const std::string& source_id, uint32_t max_items, const std::string& stop_at_item_id,
                                          uint64_t published_after_ms) override;

  std::vector<ItemDetails> GetDetails(const std::vector<std::string>& item_ids) override;

  bool QuotaExceeded() override;

  // ISO 8601 duration (PT1H2M3S, P1DT2H) to seconds; 0 when unparseable.
  static uint32_t ParseDurationSeconds(const std::string& duration);

 private:
  template <typename Message>
  Message Call(const std::string& resource, const std::vector<std::pair<std::string, std::string>>& query);

  std::string AccessToken(bool force_refresh);
  std::string UploadsPlaylist(const std::string& channel_id);

  YoutubeProviderOptions                   options_;
  std::shared_ptr<HttpClient>              http_;
  std::shared_ptr<discovery::QuotaTracker> quota_;

  std::mutex                         token_mutex_;
  std::string                        access_token_;
  util::TimePoint                    access_token_expiry_{};
  std::mutex                         playlist_mutex_;
  std::map<std::string, std::string> uploads_playlists_;
};

} // namespace relay::collab
