#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace upload::runtime::config {
class RuntimeConfig;
}

namespace upload::observability {

bool InitializeMetrics(const upload::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process wide instruments.

    upload.store.calls        counter   {op, success}
    upload.store.duration_ms  histogram {op}
    upload.bytes              counter
    upload.files              counter   {outcome}
*/
class Metrics {
 public:
  static Metrics& Instance();

  // op is the store operation, e.g. "upload_part" or "list_parts"
  void RecordStoreCall(std::string_view op, bool success, double duration_ms);
  void AddUploadedBytes(std::uint64_t bytes);
  void RecordFileOutcome(std::string_view outcome);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Instruments;
  std::unique_ptr<Instruments> instruments_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const upload::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordStoreCall(std::string_view, bool, double) {
}

inline void Metrics::AddUploadedBytes(std::uint64_t) {
}

inline void Metrics::RecordFileOutcome(std::string_view) {
}
#endif

} // namespace upload::observability
