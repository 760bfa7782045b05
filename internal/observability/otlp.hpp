#pragma once

#include <chrono>
#include <string>

#ifdef ENABLE_OTEL
#include <opentelemetry/sdk/resource/resource.h>
#endif

namespace ridedispatch::runtime::config {
class RuntimeConfig;
}

namespace ridedispatch::observability {

inline constexpr const char* kServiceName    = "ride-dispatch";
inline constexpr const char* kServiceVersion = "0.1.0";

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string               service_name{kServiceName};
  std::string               endpoint{};
  OtlpTransport             transport{OtlpTransport::kGrpc};
  bool                      insecure{true};
  std::chrono::milliseconds export_interval{1000};
};

/*
  Exporter settings for one signal.

  endpoint:  observability.otlp_endpoint, then
             OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then
             OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default
             (localhost:4317 for grpc, http://localhost:4318/v1/<signal> for http)
  transport: observability.transport, "grpc" (default), "http" or "http/protobuf"
  insecure:  OTEL_EXPORTER_OTLP_INSECURE, default true
  interval:  OTEL_METRIC_EXPORT_INTERVAL in milliseconds, default 1s

  Throws util::InvalidArgument on an unknown transport.
*/
OtlpConfig ResolveOtlpConfig(const ridedispatch::runtime::config::RuntimeConfig& config, OtlpSignal signal);

#ifdef ENABLE_OTEL
opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config);
#endif

} // namespace ridedispatch::observability
