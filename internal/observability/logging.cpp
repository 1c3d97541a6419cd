#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/byte_size.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace upload::observability {
namespace {

constexpr char kLoggerName[]     = "upload-engine";
constexpr char kDefaultLevel[]   = "info";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context = false;

// environment first, then config, then the built-in default
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value && *value) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool TraceContextSetting(const upload::runtime::config::LoggingConfig& logging) {
  const char* value = std::getenv("UPLOAD_LOG_INCLUDE_TRACE_CONTEXT");
  if (value == nullptr) {
    return logging.include_trace_context();
  }
  std::string_view flag(value);
  return flag == "1" || flag == "true";
}

void AppendFields(fmt::memory_buffer& out, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    // quoted so that a line still splits cleanly on spaces
    if (field.value.find(' ') != std::string::npos) {
      fmt::format_to(std::back_inserter(out), " {}=\"{}\"", field.key, field.value);
    } else {
      fmt::format_to(std::back_inserter(out), " {}={}", field.key, field.value);
    }
  }
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string Hex(const std::uint8_t (&bytes)[N]) {
  std::string out;
  out.reserve(N * 2);
  for (auto byte : bytes) {
    fmt::format_to(std::back_inserter(out), "{:02x}", byte);
  }
  return out;
}

void AppendTraceContext(fmt::memory_buffer& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  std::uint8_t trace_id[16];
  std::uint8_t span_id[8];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  fmt::format_to(std::back_inserter(out), " trace_id={} span_id={}", Hex(trace_id), Hex(span_id));
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
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

LogField BytesField(std::string_view key, std::uint64_t bytes) {
  return {std::string(key), fmt::format("{}({})", bytes, util::FormatByteSize(bytes))};
}

void InitializeLogging(const upload::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  // stdout belongs to the progress table
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(Setting("UPLOAD_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("UPLOAD_LOG_LEVEL", logging.level(), kDefaultLevel)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  g_include_trace_context = TraceContextSetting(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  line.append(message.data(), message.data() + message.size());
  AppendFields(line, fields);
  AppendTraceContext(line);

  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace upload::observability
