#include "internal/observability/metrics.hpp"

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

#include <chrono>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace upload::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using Attribute  = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes = std::initializer_list<Attribute>;

constexpr std::chrono::milliseconds kExportInterval{1000};

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

opentelemetry::nostd::string_view View(std::string_view value) {
  return {value.data(), value.size()};
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const otlp_settings::Settings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.use_ssl;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

/*
  opentelemetry-cpp changed AddMetricReader to take a shared_ptr and dropped
  the explicit Context argument from Add/Record across releases.
*/
template <typename Provider>
void AttachReader(Provider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename T>
void Add(metrics_api::Counter<T>& counter, T value, Attributes attributes) {
  if constexpr (requires { counter.Add(value, attributes, opentelemetry::context::Context{}); }) {
    counter.Add(value, attributes, opentelemetry::context::Context{});
  } else {
    counter.Add(value, attributes);
  }
}

template <typename T>
void Record(metrics_api::Histogram<T>& histogram, T value, Attributes attributes) {
  if constexpr (requires { histogram.Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram.Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram.Record(value, attributes);
  }
}

} // namespace

struct Metrics::Instruments {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> store_calls;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      store_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> uploaded_bytes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> file_outcomes;
};

bool InitializeMetrics(const upload::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  auto settings = otlp_settings::Resolve(config.observability(), otlp_settings::Signal::kMetrics);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = kExportInterval;

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), otlp_settings::ServiceResource());
  AttachReader(*g_provider, sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), reader_options));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

// Instruments bind to whichever provider is global on first use.
Metrics::Metrics() : instruments_(std::make_unique<Instruments>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter(otlp_settings::kServiceName, otlp_settings::kServiceVersion);

  instruments_->store_calls       = meter->CreateUInt64Counter("upload.store.calls", "Object store calls", "1");
  instruments_->store_duration_ms = meter->CreateDoubleHistogram("upload.store.duration_ms", "Object store call latency", "ms");
  instruments_->uploaded_bytes    = meter->CreateUInt64Counter("upload.bytes", "Bytes accepted by the object store", "By");
  instruments_->file_outcomes     = meter->CreateUInt64Counter("upload.files", "Files reaching a terminal status", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordStoreCall(std::string_view op, bool success, double duration_ms) {
  if (instruments_->store_calls) {
    Add<std::uint64_t>(*instruments_->store_calls, 1, {{"op", View(op)}, {"success", success}});
  }
  if (instruments_->store_duration_ms) {
    Record<double>(*instruments_->store_duration_ms, duration_ms, {{"op", View(op)}});
  }
}

void Metrics::AddUploadedBytes(std::uint64_t bytes) {
  if (instruments_->uploaded_bytes) {
    Add<std::uint64_t>(*instruments_->uploaded_bytes, bytes, {});
  }
}

void Metrics::RecordFileOutcome(std::string_view outcome) {
  if (instruments_->file_outcomes) {
    Add<std::uint64_t>(*instruments_->file_outcomes, 1, {{"outcome", View(outcome)}});
  }
}

} // namespace upload::observability

#endif
