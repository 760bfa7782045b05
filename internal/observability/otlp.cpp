#include "internal/observability/otlp.hpp"

#include <cstdlib>
#include <string_view>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace ridedispatch::observability {
namespace {

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

OtlpTransport ParseTransport(std::string_view name) {
  if (name.empty() || name == "grpc") return OtlpTransport::kGrpc;
  if (name == "http" || name == "http/protobuf") return OtlpTransport::kHttpProtobuf;
  throw util::InvalidArgument("unknown OTLP transport: " + std::string(name));
}

std::string DefaultEndpoint(OtlpTransport transport, OtlpSignal signal) {
  if (transport == OtlpTransport::kGrpc) return "localhost:4317";
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

OtlpConfig ResolveOtlpConfig(const ridedispatch::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpConfig out;
  out.transport = ParseTransport(observability.transport());
  if (!observability.service_name().empty()) out.service_name = observability.service_name();

  const char* signal_env =
      signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (!observability.otlp_endpoint().empty()) {
    out.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = Env(signal_env)) {
    out.endpoint = endpoint;
  } else if (const char* endpoint = Env("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    out.endpoint = endpoint;
  } else {
    out.endpoint = DefaultEndpoint(out.transport, signal);
  }

  if (const char* insecure = Env("OTEL_EXPORTER_OTLP_INSECURE")) {
    const std::string_view v(insecure);
    out.insecure = !(v == "false" || v == "0");
  }

  if (const char* interval = Env("OTEL_METRIC_EXPORT_INTERVAL")) {
    char*      end = nullptr;
    const long ms  = std::strtol(interval, &end, 10);
    if (end != interval && *end == '\0' && ms > 0) out.export_interval = std::chrono::milliseconds(ms);
  }

  return out;
}

#ifdef ENABLE_OTEL
opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config) {
  namespace resource = opentelemetry::sdk::resource;
  resource::ResourceAttributes attrs = {
      {"service.name", config.service_name},
      {"service.version", std::string(kServiceVersion)},
  };
  return resource::Resource::Create(attrs);
}
#endif

} // namespace ridedispatch::observability
