#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define RELAY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define RELAY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp_common.hpp"

namespace relay::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool request_metrics_enabled{true};
  bool job_metrics_enabled{true};
  bool scan_metrics_enabled{true};
};

MetricsOptions g_metrics_options;

template <typename Provider>
void ConfigureResource(Provider& provider, const opentelemetry::sdk::resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveOtlpEndpoint(config, "metrics");
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

bool InstallProvider(const OtlpConfig& config, const sdkmetrics::PeriodicExportingMetricReaderOptions& reader_options) {
#ifdef RELAY_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(config), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(BuildExporter(config), reader_options);
#endif

  auto resource = BuildOtlpResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> job_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      job_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transferred_bytes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> scan_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> scan_items_queued;

  std::mutex                                    queue_depth_mutex;
  std::unordered_map<std::string, std::int64_t> queue_depth_values;
};

bool InitializeMetrics(const relay::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto                                       otlp_config   = OtlpConfigFrom(config);
  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto                                       min_interval_ms = metric_config.min_collection_interval_ms();
  const auto configured_interval_ms     = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max(min_interval_ms, configured_interval_ms));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  InstallProvider(otlp_config, reader_options);

  g_metrics_options.request_metrics_enabled = metric_config.request_metrics_enabled();
  g_metrics_options.job_metrics_enabled     = metric_config.job_metrics_enabled();
  g_metrics_options.scan_metrics_enabled    = metric_config.scan_metrics_enabled();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("relay-manager", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("relay.request.count", "1", "Total number of admin requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("relay.request.latency_ms", "ms", "Admin request latency in milliseconds");
  impl_->job_count          = impl_->meter->CreateUInt64Counter("relay.job.count", "1", "Finished jobs by pipeline and outcome");
  impl_->job_duration_ms    = impl_->meter->CreateDoubleHistogram("relay.job.duration_ms", "ms", "Job execution time in milliseconds");
  impl_->scan_count         = impl_->meter->CreateUInt64Counter("relay.scan.count", "1", "Discovery scan runs");
  impl_->scan_items_queued  = impl_->meter->CreateUInt64Counter("relay.scan.items_queued", "1", "Items queued by discovery scans");
  impl_->transferred_bytes  = impl_->meter->CreateUInt64Counter("relay.transfer.bytes", "By", "Media bytes moved per phase");
  impl_->queue_depth_gauge  = impl_->meter->CreateInt64ObservableGauge("relay.queue.depth", "Entries waiting per pipeline", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->queue_depth_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [pipeline, depth] : impl->queue_depth_values) {
          const std::initializer_list<AttributePair> attributes = {{"pipeline", pipeline}};
          int_result->Observe(depth, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordJob(std::string_view pipeline, std::string_view outcome) {
  if (!impl_ || !impl_->job_count || !g_metrics_options.job_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"pipeline", std::string(pipeline)}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->job_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveJobDurationMs(std::string_view pipeline, double duration_ms) {
  if (!impl_ || !impl_->job_duration_ms || !g_metrics_options.job_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"pipeline", std::string(pipeline)}};
  RecordWithAttributes(impl_->job_duration_ms, duration_ms, attributes);
}

void Metrics::SetQueueDepth(std::string_view pipeline, std::uint64_t depth) {
  if (!impl_ || !impl_->queue_depth_gauge || !g_metrics_options.job_metrics_enabled) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->queue_depth_mutex);
  impl_->queue_depth_values[std::string(pipeline)] = static_cast<std::int64_t>(depth);
}

void Metrics::AddTransferredBytes(std::string_view phase, std::uint64_t bytes) {
  if (!impl_ || !impl_->transferred_bytes || !g_metrics_options.job_metrics_enabled || bytes == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"phase", std::string(phase)}};
  AddWithAttributes(impl_->transferred_bytes, bytes, attributes);
}

void Metrics::RecordScan(std::uint64_t items_queued, bool quota_exceeded) {
  if (!impl_ || !impl_->scan_count || !g_metrics_options.scan_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"quota_exceeded", quota_exceeded}};
  AddWithAttributes(impl_->scan_count, static_cast<std::uint64_t>(1), attributes);
  AddWithAttributes(impl_->scan_items_queued, items_queued, std::initializer_list<AttributePair>{});
}

} // namespace relay::observability

#endif
