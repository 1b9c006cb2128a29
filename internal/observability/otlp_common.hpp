#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace relay::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  std::string   service_name{"relay-manager"};
  std::string   service_version{"0.1.0"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

inline OtlpConfig OtlpConfigFrom(const relay::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == relay::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                            : OtlpTransport::kGrpc;
  return otlp;
}

/*
  Endpoint precedence: explicit config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
  signal is "traces" or "metrics".
*/
inline std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  std::string signal_var = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) {
    signal_var.push_back(static_cast<char>(c >= 'a' && c <= 'z' ? c - 'a' + 'A' : c));
  }
  signal_var += "_ENDPOINT";

  if (const char* endpoint = std::getenv(signal_var.c_str())) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return "http://localhost:4318/v1/" + std::string(signal);
  }
  return "localhost:4317";
}

inline opentelemetry::sdk::resource::Resource BuildOtlpResource(const OtlpConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", config.service_name},
      {"service.version", config.service_version},
  };
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace relay::observability

#endif
