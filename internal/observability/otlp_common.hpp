#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace ledger::observability::otlp_common {

// Per-signal endpoint: explicit config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default.
inline std::string ResolveEndpoint(const OtlpConfig& config, const char* signal_env, const char* http_path) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }
  if (const char* endpoint = std::getenv(signal_env)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return std::string("http://localhost:4318") + http_path;
  }
  return "localhost:4317";
}

inline opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", config.service_name},
      {"service.namespace", std::string("ledger")},
      {"service.version", std::string(kServiceVersion)},
  };
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

inline OtlpConfig FromRuntimeConfig(const ledger::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == ledger::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                             : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  }
  if (observability.metrics_export_interval_ms() > 0) {
    otlp.export_interval_ms = observability.metrics_export_interval_ms();
  }
  if (observability.trace_sample_ratio() > 0) {
    otlp.sample_ratio = observability.trace_sample_ratio();
  }
  return otlp;
}

} // namespace ledger::observability::otlp_common

#endif
