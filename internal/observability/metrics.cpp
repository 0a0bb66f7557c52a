#include "internal/observability/metrics.hpp"

#ifdef LEDGER_ENABLE_OTEL

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
#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace ledger::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
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

template <typename Instrument, typename Value>
void RecordValue(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value) {
  if constexpr (requires { instrument->Record(value, opentelemetry::context::Context{}); }) {
    instrument->Record(value, opentelemetry::context::Context{});
  } else {
    instrument->Record(value);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> allocation_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> evicted_bytes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      sweep_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      defragment_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   ledger_bytes_gauge;
};

bool InitializeMetrics(const ledger::runtime::config::RuntimeConfig& config) {
  const auto& metric_config = config.metrics();
  if (!metric_config.enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = metric_config.otlp_endpoint();
  otlp_config.transport =
      metric_config.transport() == ledger::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms                = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max<std::uint32_t>(interval_ms, 100));

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  auto resource = BuildResource(otlp_config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
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
  impl_->meter  = provider->GetMeter("resource-ledger", "0.1.0");

  impl_->allocation_count       = impl_->meter->CreateUInt64Counter("ledger.allocation.count", "Allocation attempts by outcome", "1");
  impl_->evicted_bytes          = impl_->meter->CreateUInt64Counter("ledger.eviction.bytes", "Bytes removed from the ledger by reason", "By");
  impl_->sweep_duration_ms      = impl_->meter->CreateDoubleHistogram("ledger.sweep.duration_ms", "Liveness sweep duration in milliseconds", "ms");
  impl_->defragment_duration_ms = impl_->meter->CreateDoubleHistogram("ledger.defragment.duration_ms", "Defragment duration in milliseconds", "ms");
  impl_->ledger_bytes_gauge     = impl_->meter->CreateInt64ObservableGauge("ledger.bytes", "Tracked bytes by kind", "By");
  impl_->ledger_bytes_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* self       = static_cast<Metrics*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        const std::initializer_list<AttributePair> allocated = {{"kind", "allocated"}};
        const std::initializer_list<AttributePair> used      = {{"kind", "used"}};
        const auto bytes = self->CurrentLedgerBytes();
        int_result->Observe(bytes.allocated, allocated);
        int_result->Observe(bytes.used, used);
      },
      this);
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordAllocation(bool success) {
  if (!impl_ || !impl_->allocation_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->allocation_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordEviction(std::string_view reason, std::uint64_t bytes) {
  if (!impl_ || !impl_->evicted_bytes) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"reason", opentelemetry::nostd::string_view(reason.data(), reason.size())}};
  AddWithAttributes(impl_->evicted_bytes, bytes, attributes);
}

void Metrics::ObserveSweepDurationMs(double duration_ms) {
  if (!impl_ || !impl_->sweep_duration_ms) {
    return;
  }

  RecordValue(impl_->sweep_duration_ms, duration_ms);
}

void Metrics::ObserveDefragmentDurationMs(double duration_ms) {
  if (!impl_ || !impl_->defragment_duration_ms) {
    return;
  }

  RecordValue(impl_->defragment_duration_ms, duration_ms);
}

} // namespace ledger::observability

#endif
