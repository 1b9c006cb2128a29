#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "relay_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\relay\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\relay\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_markers",
                                   R"(recovery:
  max_attempts: 5
  transient_markers: ["503", "Broken pipe", "true"]
)");

  auto config = relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.recovery().max_attempts() == 5);
  assert(config.recovery().transient_markers_size() == 3);
  assert(config.recovery().transient_markers(0) == "503");
  assert(config.recovery().transient_markers(2) == "true");
}

void TestDefaultsFillMissingSections() {
  auto config = relay::config::ConfigLoader::LoadFromString("retrieval:\n  download_dir: /data/in\n");

  assert(config.retrieval().download_dir() == "/data/in");
  assert(config.retrieval().standard_workers() == 3);
  assert(config.retrieval().short_workers() == 3);
  assert(config.retrieval().short_max_duration_seconds() == 60);
  assert(config.relay().enabled());
  assert(config.relay().delete_after_relay());
  assert(config.relay().chunk_size_bytes() == 1024 * 1024);
  assert(config.recovery().max_attempts() == 3);
  assert(config.recovery().watchdog_interval_seconds() == 300);
  assert(config.recovery().transient_markers_size() == 9);
  assert(config.discovery().interval_seconds() == 3600);
  assert(config.discovery().initial_delay_seconds() == 30);
  assert(config.discovery().lookback_days() == 5);
  assert(config.discovery().max_items_per_source() == 50);
  assert(config.discovery().source_delay_ms() == 200);
  assert(config.discovery().provider().daily_quota_units() == 10000);
  assert(config.discovery().provider().quota_reset_utc_offset_hours() == -8);
  assert(config.events().progress_throttle_ms() == 500);
  assert(config.logging().level() == "info");
  assert(config.logging().file().empty());
  assert(config.logging().max_file_bytes() == 10 * 1024 * 1024);
  assert(config.logging().max_files() == 3);
}

void TestExplicitFalseAndZeroAreKept() {
  auto config = relay::config::ConfigLoader::LoadFromString(R"(relay:
  enabled: false
  delete_after_relay: false
discovery:
  enabled: false
  source_delay_ms: 0
  provider:
    quota_reset_utc_offset_hours: 0
)");

  assert(!config.relay().enabled());
  assert(!config.relay().delete_after_relay());
  assert(!config.discovery().enabled());
  assert(config.discovery().source_delay_ms() == 0);
  assert(config.discovery().provider().quota_reset_utc_offset_hours() == 0);
}

void TestEmptyDocumentYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");
  auto       config    = relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.relay().workers() == 3);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)relay::config::ConfigLoader::LoadFromYaml("/nonexistent/relay/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestDefaultsFillMissingSections();
  TestExplicitFalseAndZeroAreKept();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileThrows();

  std::cout << "relay_manager_unit_config_loader: pass\n";
  return 0;
}
