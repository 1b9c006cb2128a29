#include "internal/observability/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace relay::observability {
namespace {

constexpr const char* kLoggerName     = "relay-manager";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Effective logger settings; RELAY_LOG_* environment variables override the config file.
struct LoggerSettings {
  std::string level   = "info";
  std::string pattern = kDefaultPattern;
  std::string file;
  std::size_t max_file_bytes = 10 * 1024 * 1024;
  std::size_t max_files      = 3;
  bool        trace_context  = false;
};

std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? std::string(value) : fallback;
}

LoggerSettings ResolveSettings(const relay::runtime::config::RuntimeConfig& config) {
  const auto&    logging = config.logging();
  LoggerSettings settings;

  if (!logging.level().empty()) settings.level = logging.level();
  if (!logging.pattern().empty()) settings.pattern = logging.pattern();
  if (logging.max_file_bytes() > 0) settings.max_file_bytes = logging.max_file_bytes();
  if (logging.max_files() > 0) settings.max_files = logging.max_files();
  settings.file          = logging.file();
  settings.trace_context = logging.include_trace_context();

  settings.level   = EnvOr("RELAY_LOG_LEVEL", settings.level);
  settings.pattern = EnvOr("RELAY_LOG_PATTERN", settings.pattern);
  settings.file    = EnvOr("RELAY_LOG_FILE", settings.file);

  const auto trace = EnvOr("RELAY_LOG_INCLUDE_TRACE_CONTEXT", "");
  if (!trace.empty()) settings.trace_context = trace == "1" || trace == "true";
  return settings;
}

bool g_include_trace_context{false};

void AppendFields(std::string& line, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    line.append(field.value);
  }
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& out, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  const auto context = span->GetContext();
  if (!context.IsValid() || !context.trace_id().IsValid() || !context.span_id().IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  line.append(" trace_id=");
  AppendHex(line, trace_bytes, sizeof(trace_bytes));
  line.append(" span_id=");
  AppendHex(line, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", value);
  return {std::string(key), buf};
}

void InitializeLogging(const relay::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveSettings(config);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!settings.file.empty()) {
    // throws spdlog::spdlog_ex when the directory is not writable
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(settings.file, settings.max_file_bytes, settings.max_files));
  }

  // tests and tools may initialize more than once
  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = settings.trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::default_logger_raw()->should_log(level)) {
    return;
  }

  std::string line(message);
  AppendFields(line, fields);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace relay::observability
