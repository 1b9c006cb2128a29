#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace relay::config {

namespace {

constexpr const char* kDefaultTransientMarkers[] = {
    "Broken pipe", "timed out", "Connection reset", "Connection refused", "Network is unreachable", "Temporary failure", "503", "502", "500",
};

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("503", "true")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

relay::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  relay::runtime::config::RuntimeConfig config;

  // an empty document yields an all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

relay::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

relay::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(relay::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");

  if (config.database().has_sqlite()) {
    auto* sqlite = config.mutable_database()->mutable_sqlite();
    if (sqlite->path().empty()) sqlite->set_path("relay.db");
    if (!sqlite->has_wal_mode()) sqlite->set_wal_mode(true);
  }
  if (config.database().has_postgres()) {
    auto* postgres = config.mutable_database()->mutable_postgres();
    if (postgres->max_connections() == 0) postgres->set_max_connections(8);
  }

  auto* retrieval = config.mutable_retrieval();
  if (retrieval->download_dir().empty()) retrieval->set_download_dir("downloads");
  if (retrieval->standard_workers() == 0) retrieval->set_standard_workers(3);
  if (retrieval->short_workers() == 0) retrieval->set_short_workers(3);
  if (retrieval->short_max_duration_seconds() == 0) retrieval->set_short_max_duration_seconds(60);

  auto* fetcher = retrieval->mutable_fetcher();
  if (fetcher->program().empty()) fetcher->set_program("yt-dlp");
  if (fetcher->quality().empty()) fetcher->set_quality("best");

  auto* relay = config.mutable_relay();
  if (!relay->has_enabled()) relay->set_enabled(true);
  if (!relay->has_delete_after_relay()) relay->set_delete_after_relay(true);
  if (relay->workers() == 0) relay->set_workers(3);
  if (relay->chunk_size_bytes() == 0) relay->set_chunk_size_bytes(1024 * 1024);
  if (relay->standard_dir().empty()) relay->set_standard_dir("videos");
  if (relay->short_dir().empty()) relay->set_short_dir("shorts");

  auto* recovery = config.mutable_recovery();
  if (recovery->max_attempts() == 0) recovery->set_max_attempts(3);
  if (recovery->watchdog_interval_seconds() == 0) recovery->set_watchdog_interval_seconds(300);
  if (recovery->transient_markers_size() == 0) {
    for (const char* marker : kDefaultTransientMarkers) {
      recovery->add_transient_markers(marker);
    }
  }

  auto* discovery = config.mutable_discovery();
  if (!discovery->has_enabled()) discovery->set_enabled(true);
  if (discovery->interval_seconds() == 0) discovery->set_interval_seconds(3600);
  if (discovery->initial_delay_seconds() == 0) discovery->set_initial_delay_seconds(30);
  if (discovery->lookback_days() == 0) discovery->set_lookback_days(5);
  if (discovery->max_items_per_source() == 0) discovery->set_max_items_per_source(50);
  if (!discovery->has_source_delay_ms()) discovery->set_source_delay_ms(200);

  auto* provider = discovery->mutable_provider();
  if (provider->token_file().empty()) provider->set_token_file("token.json");
  if (provider->api_base_url().empty()) provider->set_api_base_url("https://www.googleapis.com/youtube/v3");
  if (provider->token_url().empty()) provider->set_token_url("https://oauth2.googleapis.com/token");
  if (provider->daily_quota_units() == 0) provider->set_daily_quota_units(10000);
  if (!provider->has_quota_reset_utc_offset_hours()) provider->set_quota_reset_utc_offset_hours(-8);
  if (provider->request_timeout_seconds() == 0) provider->set_request_timeout_seconds(30);

  auto* events = config.mutable_events();
  if (events->subscriber_buffer() == 0) events->set_subscriber_buffer(256);
  if (events->progress_throttle_ms() == 0) events->set_progress_throttle_ms(500);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
  if (logging->max_file_bytes() == 0) logging->set_max_file_bytes(10 * 1024 * 1024);
  if (logging->max_files() == 0) logging->set_max_files(3);
}

} // namespace relay::config
