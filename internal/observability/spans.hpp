#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace relay::runtime::config {
class RuntimeConfig;
}

namespace relay::observability {

// Both return false when disabled in config; exporters are OTLP.
bool InitializeTracing(const relay::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const relay::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // outcome: completed | error
  void RecordJob(std::string_view pipeline, std::string_view outcome);
  void ObserveJobDurationMs(std::string_view pipeline, double duration_ms);
  void SetQueueDepth(std::string_view pipeline, std::uint64_t depth);

  // Bytes written to disk (retrieval) or copied to the share (relay).
  void AddTransferredBytes(std::string_view phase, std::uint64_t bytes);

  void RecordScan(std::uint64_t items_queued, bool quota_exceeded);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const relay::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const relay::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordJob(std::string_view, std::string_view) {
}

inline void Metrics::ObserveJobDurationMs(std::string_view, double) {
}

inline void Metrics::SetQueueDepth(std::string_view, std::uint64_t) {
}

inline void Metrics::AddTransferredBytes(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordScan(std::uint64_t, bool) {
}
#endif

} // namespace relay::observability
