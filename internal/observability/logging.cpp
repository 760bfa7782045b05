#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iterator>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/model/location.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace ridedispatch::observability {
namespace {

constexpr const char* kLoggerName     = "ride-dispatch";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_include_trace_context{false};

// env wins over config, config over the built-in default
std::string Resolve(const char* env_name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env_name); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool Truthy(const std::string& value) {
  return value == "1" || value == "true" || value == "yes";
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '=' || c == '"') return true;
  }
  return false;
}

void AppendField(fmt::memory_buffer& out, std::string_view key, const std::string& value) {
  if (out.size() > 0) out.push_back(' ');
  fmt::format_to(std::back_inserter(out), "{}=", key);
  if (!NeedsQuoting(value)) {
    out.append(value.data(), value.data() + value.size());
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
template <typename Id>
std::string HexId(const Id& id) {
  char buffer[2 * Id::kSize];
  id.ToLowerBase16(buffer);
  return std::string(buffer, sizeof(buffer));
}

void AppendTraceContext(fmt::memory_buffer& out) {
  if (!g_include_trace_context.load(std::memory_order_relaxed)) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  AppendField(out, "trace_id", HexId(context.trace_id()));
  AppendField(out, "span_id", HexId(context.span_id()));
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

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

LogField GeoField(std::string_view key, const ridedispatch::model::GeoPoint& point) {
  return {std::string(key), fmt::format("{:.6f},{:.6f}", point.latitude, point.longitude)};
}

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), fmt::format("{}ms", value.count())};
}

void InitializeLogging(const ridedispatch::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  const auto level_name = Resolve("RIDEDISPATCH_LOG_LEVEL", logging.level(), kDefaultLevel);
  auto       level      = spdlog::level::from_str(level_name);
  // from_str maps unknown names to off; only an explicit "off" silences the logger
  const bool unknown_level = level == spdlog::level::off && level_name != "off";
  if (unknown_level) level = spdlog::level::info;

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(Resolve("RIDEDISPATCH_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  const char* trace_env = std::getenv("RIDEDISPATCH_LOG_INCLUDE_TRACE_CONTEXT");
  g_include_trace_context = trace_env != nullptr ? Truthy(trace_env) : logging.include_trace_context();

  if (unknown_level) {
    LogWarn("unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) return;

  fmt::memory_buffer tail;
  for (const auto& field : fields) AppendField(tail, field.key, field.value);
  AppendTraceContext(tail);

  if (tail.size() == 0) {
    logger->log(level, "{}", message);
    return;
  }
  logger->log(level, "{} {}", message, std::string_view(tail.data(), tail.size()));
}

} // namespace ridedispatch::observability
