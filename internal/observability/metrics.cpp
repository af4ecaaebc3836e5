#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "internal/observability/otlp_common.hpp"

namespace ledger::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

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

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operation_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      operation_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> version_conflicts;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      apply_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> quarantines;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> redrives;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   quarantined_gauge;

  std::atomic<std::int64_t> quarantined_streams{0};
};

bool InitializeMetrics(const OtlpConfig& config) {
  const auto endpoint = otlp_common::ResolveEndpoint(config, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max<std::uint32_t>(config.export_interval_ms, 100));
  auto reader                           = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           otlp_common::BuildResource(config));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const ledger::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }
  return InitializeMetrics(otlp_common::FromRuntimeConfig(config));
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
  impl_->meter  = provider->GetMeter("event-ledger", "0.1.0");

  impl_->operation_count      = impl_->meter->CreateUInt64Counter("ledger.operation.count", "Total number of ledger operations", "1");
  impl_->operation_latency_ms = impl_->meter->CreateDoubleHistogram("ledger.operation.latency_ms", "Ledger operation latency", "ms");
  impl_->version_conflicts    = impl_->meter->CreateUInt64Counter("ledger.journal.version_conflicts", "Optimistic append conflicts", "1");
  impl_->apply_latency_ms     = impl_->meter->CreateDoubleHistogram("ledger.projection.apply_latency_ms", "Projection apply latency", "ms");
  impl_->quarantines          = impl_->meter->CreateUInt64Counter("ledger.dlq.quarantines", "Streams moved to quarantine", "1");
  impl_->redrives             = impl_->meter->CreateUInt64Counter("ledger.dlq.redrives", "Redrive attempts by outcome", "1");
  impl_->quarantined_gauge    = impl_->meter->CreateInt64ObservableGauge("ledger.dlq.quarantined_streams", "Currently quarantined streams", "1");
  impl_->quarantined_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->quarantined_streams.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view op, bool success) {
  if (!impl_ || !impl_->operation_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"op", std::string(op)}, {"success", success}};
  AddWithAttributes(impl_->operation_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveOperationLatencyMs(std::string_view op, double latency_ms) {
  if (!impl_ || !impl_->operation_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"op", std::string(op)}};
  RecordWithAttributes(impl_->operation_latency_ms, latency_ms, attributes);
}

void Metrics::RecordVersionConflict(std::string_view stream_id) {
  if (!impl_ || !impl_->version_conflicts) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"stream", std::string(stream_id)}};
  AddWithAttributes(impl_->version_conflicts, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveApplyLatencyMs(std::string_view projection, double latency_ms) {
  if (!impl_ || !impl_->apply_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"projection", std::string(projection)}};
  RecordWithAttributes(impl_->apply_latency_ms, latency_ms, attributes);
}

void Metrics::RecordQuarantine(std::string_view projection) {
  if (!impl_ || !impl_->quarantines) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"projection", std::string(projection)}};
  AddWithAttributes(impl_->quarantines, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRedrive(std::string_view projection, std::string_view outcome) {
  if (!impl_ || !impl_->redrives) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"projection", std::string(projection)}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->redrives, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetQuarantinedStreams(std::uint64_t count) {
  if (!impl_) {
    return;
  }
  impl_->quarantined_streams.store(static_cast<std::int64_t>(count));
}

} // namespace ledger::observability

#endif
