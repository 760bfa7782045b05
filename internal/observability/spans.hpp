#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ridedispatch::runtime::config {
class RuntimeConfig;
}

namespace ridedispatch::observability {

// Both return false (and leave the no-op providers installed) when the
// signal is disabled in config or the build lacks ENABLE_OTEL.
bool InitializeTracing(const ridedispatch::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const ridedispatch::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for the enclosing scope; ends on destruction.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide dispatch instruments:

    dispatch.request.count / .latency_ms     per RPC route
    dispatch.accept.outcomes                 won, already_matched, busy, ...
    dispatch.notifications                   push delivery results
    dispatch.broadcast.fanout                drivers notified per round
    dispatch.radius.expansions               by trigger (request | sweep)
    dispatch.driver.cancellations            by whether it suspended the driver
    dispatch.ride.final_fare                 completed fares, by fare protection
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordArbitrationOutcome(std::string_view outcome);
  void RecordNotification(bool delivered);
  void ObserveBroadcastFanout(std::string_view phase, std::uint64_t notified_drivers);
  void RecordRadiusExpansion(std::string_view trigger);
  void RecordDriverCancellation(bool suspended);
  void ObserveCompletedFare(double final_fare, bool fare_protected);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const ridedispatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const ridedispatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordArbitrationOutcome(std::string_view) {
}

inline void Metrics::RecordNotification(bool) {
}

inline void Metrics::ObserveBroadcastFanout(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordRadiusExpansion(std::string_view) {
}

inline void Metrics::RecordDriverCancellation(bool) {
}

inline void Metrics::ObserveCompletedFare(double, bool) {
}
#endif

} // namespace ridedispatch::observability
