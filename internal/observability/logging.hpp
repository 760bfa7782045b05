#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace ridedispatch::runtime::config {
class RuntimeConfig;
}

namespace ridedispatch::model {
struct GeoPoint;
}

namespace ridedispatch::observability {

// Rendered as key=value; values containing whitespace or '=' are quoted.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);
// "lat,lon" with 6 decimals (~0.1 m)
LogField GeoField(std::string_view key, const ridedispatch::model::GeoPoint& point);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

// Installs the "ride-dispatch" logger as the spdlog default. Environment
// (RIDEDISPATCH_LOG_LEVEL, RIDEDISPATCH_LOG_PATTERN,
// RIDEDISPATCH_LOG_INCLUDE_TRACE_CONTEXT) overrides the config.
void InitializeLogging(const ridedispatch::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace ridedispatch::observability

#define RIDEDISPATCH_LOG_DEBUG(message, ...) ::ridedispatch::observability::LogDebug((message), ##__VA_ARGS__)
#define RIDEDISPATCH_LOG_INFO(message, ...) ::ridedispatch::observability::LogInfo((message), ##__VA_ARGS__)
#define RIDEDISPATCH_LOG_WARN(message, ...) ::ridedispatch::observability::LogWarn((message), ##__VA_ARGS__)
#define RIDEDISPATCH_LOG_ERROR(message, ...) ::ridedispatch::observability::LogError((message), ##__VA_ARGS__)
