#include "youtube_provider.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "relay/youtube/v1/youtube.pb.h"

namespace relay::collab {

namespace yt = relay::youtube::v1;

namespace {

constexpr std::size_t kDetailsBatch = 50;
constexpr uint32_t    kPageSize     = 50;

template <typename Message>
Message ParseJson(const std::string& json, const std::string& context) {
  Message                                  message;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status                   = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw std::runtime_error("unparseable " + context + " response: " + std::string(status.message()));
  }
  return message;
}

bool IsQuotaError(const yt::ErrorResponse& error) {
  for (const auto& detail : error.error().errors()) {
    if (detail.reason() == "quotaExceeded" || detail.reason() == "dailyLimitExceeded") return true;
  }
  return false;
}

std::string BestThumbnail(const yt::Thumbnails& thumbnails) {
  if (!thumbnails.high().url().empty()) return thumbnails.high().url();
  if (!thumbnails.medium().url().empty()) return thumbnails.medium().url();
  return thumbnails.default_thumbnail().url();
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("token file not found: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

} // namespace

YoutubeProvider::YoutubeProvider(YoutubeProviderOptions options, std::shared_ptr<HttpClient> http,
                                 std::shared_ptr<discovery::QuotaTracker> quota)
    : options_(std::move(options)), http_(std::move(http)), quota_(std::move(quota)) {
}

bool YoutubeProvider::QuotaExceeded() {
  return quota_->IsExceeded();
}

// ------------------------------------------------------------
// Credentials
// ------------------------------------------------------------

std::string YoutubeProvider::AccessToken(bool force_refresh) {
  std::lock_guard lock(token_mutex_);

  const auto now = util::Now();
  if (!force_refresh && !access_token_.empty() && now + std::chrono::seconds(60) < access_token_expiry_) {
    return access_token_;
  }

  auto user = ParseJson<yt::AuthorizedUser>(ReadFile(options_.token_file), "token file");

  if (!force_refresh && !user.token().empty()) {
    const auto expiry = util::ParseIso8601(user.expiry());
    if (expiry && now + std::chrono::seconds(60) < *expiry) {
      access_token_        = user.token();
      access_token_expiry_ = *expiry;
      return access_token_;
    }
  }

  if (user.refresh_token().empty()) {
    throw std::runtime_error("token file has no refresh token");
  }

  const auto& token_uri = user.token_uri().empty() ? options_.token_url : user.token_uri();
  auto        response  = http_->PostForm(token_uri, {
                                                   {"grant_type", "refresh_token"},
                                                   {"refresh_token", user.refresh_token()},
                                                   {"client_id", user.client_id()},
                                                   {"client_secret", user.client_secret()},
                                               });
  if (!response.ok()) {
    throw std::runtime_error("token refresh failed with HTTP " + std::to_string(response.status));
  }

  auto token           = ParseJson<yt::TokenResponse>(response.body, "token");
  access_token_        = token.access_token();
  access_token_expiry_ = now + std::chrono::seconds(token.expires_in() > 0 ? token.expires_in() : 3600);

  user.set_token(access_token_);
  user.set_expiry(util::FormatIso8601(access_token_expiry_));

  std::string                                json;
  google::protobuf::util::JsonPrintOptions print_options;
  print_options.preserve_proto_field_names = true;
  print_options.add_whitespace             = true;
  if (google::protobuf::util::MessageToJsonString(user, &json, print_options).ok()) {
    std::ofstream out(options_.token_file, std::ios::trunc);
    out << json;
    if (!out) {
      RELAY_LOG_WARN("refreshed token not written back", {observability::StringField("path", options_.token_file)});
    }
  }

  RELAY_LOG_INFO("provider access token refreshed");
  return access_token_;
}

// ------------------------------------------------------------
// Calls
// ------------------------------------------------------------

template <typename Message>
Message YoutubeProvider::Call(const std::string& resource, const std::vector<std::pair<std::string, std::string>>& query) {
  if (quota_->IsExceeded()) {
    throw util::QuotaExceeded("provider quota exceeded");
  }

  std::string url = options_.api_base_url + "/" + resource;
  char        separator = '?';
  for (const auto& [key, value] : query) {
    url += separator;
    url += UrlEncode(key) + "=" + UrlEncode(value);
    separator = '&';
  }

  HttpResponse response;
  for (int attempt = 0; attempt < 2; ++attempt) {
    response = http_->Get(url, {"Authorization: Bearer " + AccessToken(attempt > 0), "Accept: application/json"});
    quota_->AddUsage(1);
    if (response.status != 401) break;
  }

  if (response.ok()) {
    return ParseJson<Message>(response.body, resource);
  }

  yt::ErrorResponse                        error;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  (void)google::protobuf::util::JsonStringToMessage(response.body, &error, options).ok();

  if (response.status == 403 && IsQuotaError(error)) {
    quota_->MarkExceeded();
    throw util::QuotaExceeded("provider quota exceeded");
  }

  const auto& message = error.error().message().empty() ? response.body : error.error().message();
  throw std::runtime_error("YouTube API " + resource + " failed with HTTP " + std::to_string(response.status) + ": " + message);
}

std::vector<SubscriptionInfo> YoutubeProvider::ListSubscriptions() {
  std::vector<SubscriptionInfo> out;
  std::string                   page_token;

  do {
    std::vector<std::pair<std::string, std::string>> query = {
        {"part", "snippet"},
        {"mine", "true"},
        {"maxResults", std::to_string(kPageSize)},
    };
    if (!page_token.empty()) query.emplace_back("pageToken", page_token);

    auto response = Call<yt::SubscriptionListResponse>("subscriptions", query);
    for (const auto& subscription : response.items()) {
      const auto& snippet = subscription.snippet();
      if (snippet.resource_id().channel_id().empty()) continue;

      SubscriptionInfo info;
      info.source_id = snippet.resource_id().channel_id();
      info.name      = snippet.title();
      info.thumbnail = snippet.thumbnails().default_thumbnail().url();
      out.push_back(std::move(info));
    }
    page_token = response.next_page_token();
  } while (!page_token.empty());

  RELAY_LOG_INFO("subscriptions listed", {observability::IntField("count", static_cast<std::int64_t>(out.size()))});
  return out;
}

std::string YoutubeProvider::UploadsPlaylist(const std::string& channel_id) {
  {
    std::lock_guard lock(playlist_mutex_);
    auto            it = uploads_playlists_.find(channel_id);
    if (it != uploads_playlists_.end()) return it->second;
  }

  auto response = Call<yt::ChannelListResponse>("channels", {{"part", "contentDetails"}, {"id", channel_id}});
  if (response.items().empty()) {
    throw std::runtime_error("channel not found: " + channel_id);
  }
  const auto uploads = response.items(0).content_details().related_playlists().uploads();

  std::lock_guard lock(playlist_mutex_);
  uploads_playlists_[channel_id] = uploads;
  return uploads;
}

std::vector<RecentItem> YoutubeProvider::ListRecentItems(const std::string& source_id, uint32_t max_items, const std::string& stop_at_item_id,
                                                         uint64_t published_after_ms) {
  const auto playlist = UploadsPlaylist(source_id);
  auto       response = Call<yt::PlaylistItemListResponse>("playlistItems", {
                                                                          {"part", "snippet,contentDetails"},
                                                                          {"playlistId", playlist},
                                                                          {"maxResults", std::to_string(std::min(max_items, kPageSize))},
                                                                      });

  std::vector<RecentItem> out;
  for (const auto& entry : response.items()) {
    const auto& video_id = entry.content_details().video_id();
    if (video_id.empty()) continue;
    if (!stop_at_item_id.empty() && video_id == stop_at_item_id) break;

    const auto& published_text =
        entry.content_details().video_published_at().empty() ? entry.snippet().published_at() : entry.content_details().video_published_at();
    const auto published = util::ParseIso8601(published_text);
    const auto published_ms = published ? util::ToUnixMillis(*published) : util::ToUnixMillis(util::Now());
    if (published_after_ms > 0 && published_ms < published_after_ms) continue;

    RecentItem item;
    item.item_id         = video_id;
    item.title           = entry.snippet().title();
    item.thumbnail       = BestThumbnail(entry.snippet().thumbnails());
    item.published_at_ms = published_ms;
    out.push_back(std::move(item));
  }
  return out;
}

std::vector<ItemDetails> YoutubeProvider::GetDetails(const std::vector<std::string>& item_ids) {
  std::vector<ItemDetails> out;

  for (std::size_t offset = 0; offset < item_ids.size(); offset += kDetailsBatch) {
    std::string ids;
    const auto  end = std::min(item_ids.size(), offset + kDetailsBatch);
    for (std::size_t i = offset; i < end; ++i) {
      if (!ids.empty()) ids += ',';
      ids += item_ids[i];
    }

    auto response = Call<yt::VideoListResponse>("videos", {{"part", "contentDetails,snippet"}, {"id", ids}});
    for (const auto& video : response.items()) {
      const auto& live = video.snippet().live_broadcast_content();

      ItemDetails details;
      details.item_id          = video.id();
      details.title            = video.snippet().title();
      details.source_name      = video.snippet().channel_title();
      details.duration_seconds = ParseDurationSeconds(video.content_details().duration());
      details.live             = live == "live" || live == "upcoming";
      details.thumbnail        = video.snippet().thumbnails().medium().url().empty() ? video.snippet().thumbnails().default_thumbnail().url()
                                                                                      : video.snippet().thumbnails().medium().url();
      out.push_back(std::move(details));
    }
  }
  return out;
}

uint32_t YoutubeProvider::ParseDurationSeconds(const std::string& duration) {
  if (duration.empty() || duration[0] != 'P') return 0;

  uint32_t total   = 0;
  uint32_t value   = 0;
  bool     in_time = false;
  bool     digits  = false;

  for (std::size_t i = 1; i < duration.size(); ++i) {
    const char c = duration[i];
    if (c >= '0' && c <= '9') {
      value  = value * 10 + static_cast<uint32_t>(c - '0');
      digits = true;
      continue;
    }
    if (c == 'T') {
      in_time = true;
      continue;
    }
    if (!digits) return 0;

    switch (c) {
      case 'D':
        total += value * 86400;
        break;
      case 'H':
        total += value * 3600;
        break;
      case 'M':
        total += in_time ? value * 60 : value * 30 * 86400;
        break;
      case 'S':
        total += value;
        break;
      case 'W':
        total += value * 7 * 86400;
        break;
      default:
        return 0;
    }
    value  = 0;
    digits = false;
  }
  return total;
}

} // namespace relay::collab
