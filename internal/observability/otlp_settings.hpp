#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace upload::observability::otlp_settings {

inline constexpr char kServiceName[]    = "upload-engine";
inline constexpr char kServiceVersion[] = "0.1.0";

enum class Signal {
  kTraces,
  kMetrics,
};

struct Settings {
  std::string endpoint;
  bool        http    = false;
  bool        use_ssl = false;
};

/*
  Endpoint precedence:
    observability.otlp_endpoint
    OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT
    OTEL_EXPORTER_OTLP_ENDPOINT
    local collector default for the transport
*/
inline Settings Resolve(const upload::runtime::config::ObservabilityConfig& config, Signal signal) {
  Settings settings;
  settings.http = config.transport() == upload::runtime::config::OTLP_TRANSPORT_HTTP;

  const char* signal_env = signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (!config.otlp_endpoint().empty()) {
    settings.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_env)) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else if (settings.http) {
    settings.endpoint = signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    settings.endpoint = "localhost:4317";
  }

  settings.use_ssl = settings.endpoint.rfind("https://", 0) == 0;
  return settings;
}

inline opentelemetry::sdk::resource::Resource ServiceResource() {
  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", std::string(kServiceName)},
                                                                 {"service.version", std::string(kServiceVersion)}};
  return opentelemetry::sdk::resource::Resource::Create(attributes);
}

} // namespace upload::observability::otlp_settings

#endif
