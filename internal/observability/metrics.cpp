#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define RIDEDISPATCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define RIDEDISPATCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp.hpp"

namespace ridedispatch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Provider>
void ConfigureResource(Provider& provider, const opentelemetry::sdk::resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
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

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> arbitration_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> notifications;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      broadcast_fanout;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> radius_expansions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> driver_cancellations;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      final_fare;
};

namespace {

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& otlp_config) {
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = otlp_config.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = otlp_config.endpoint;
  options.use_ssl_credentials = !otlp_config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const ridedispatch::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config, OtlpSignal::kMetrics);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = otlp_config.export_interval;
  // the export timeout may not exceed the interval
  if (reader_options.export_timeout_millis > otlp_config.export_interval) {
    reader_options.export_timeout_millis = otlp_config.export_interval;
  }

#ifdef RIDEDISPATCH_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(otlp_config), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeMetricExporter(otlp_config), reader_options);
#endif

  const auto resource = BuildResource(otlp_config);
  g_provider          = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  LogInfo("metrics enabled", {StringField("endpoint", otlp_config.endpoint),
                              DurationField("export_interval", otlp_config.export_interval)});
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
  auto& meter   = impl_->meter;
  meter         = provider->GetMeter(kServiceName, kServiceVersion);

  impl_->request_count        = meter->CreateUInt64Counter("dispatch.request.count", "1", "RPCs handled, by route and success");
  impl_->request_latency_ms   = meter->CreateDoubleHistogram("dispatch.request.latency_ms", "ms", "RPC handling latency");
  impl_->arbitration_outcomes = meter->CreateUInt64Counter("dispatch.accept.outcomes", "1", "Accept attempts by arbitration outcome");
  impl_->notifications        = meter->CreateUInt64Counter("dispatch.notifications", "1", "Push notifications by delivery result");
  impl_->broadcast_fanout     = meter->CreateDoubleHistogram("dispatch.broadcast.fanout", "1", "Drivers notified per broadcast round");
  impl_->radius_expansions    = meter->CreateUInt64Counter("dispatch.radius.expansions", "1", "Broadcast radius expansions by trigger");
  impl_->driver_cancellations = meter->CreateUInt64Counter("dispatch.driver.cancellations", "1", "Driver cancellations of matched rides");
  impl_->final_fare           = meter->CreateDoubleHistogram("dispatch.ride.final_fare", "1", "Final fare of completed rides");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordArbitrationOutcome(std::string_view outcome) {
  if (!impl_ || !impl_->arbitration_outcomes) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->arbitration_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordNotification(bool delivered) {
  if (!impl_ || !impl_->notifications) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"delivered", delivered}};
  AddWithAttributes(impl_->notifications, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveBroadcastFanout(std::string_view phase, std::uint64_t notified_drivers) {
  if (!impl_ || !impl_->broadcast_fanout) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"phase", std::string(phase)}};
  RecordWithAttributes(impl_->broadcast_fanout, static_cast<double>(notified_drivers), attributes);
}

void Metrics::RecordRadiusExpansion(std::string_view trigger) {
  if (!impl_ || !impl_->radius_expansions) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"trigger", std::string(trigger)}};
  AddWithAttributes(impl_->radius_expansions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordDriverCancellation(bool suspended) {
  if (!impl_ || !impl_->driver_cancellations) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"suspended", suspended}};
  AddWithAttributes(impl_->driver_cancellations, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveCompletedFare(double final_fare, bool fare_protected) {
  if (!impl_ || !impl_->final_fare) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"fare_protected", fare_protected}};
  RecordWithAttributes(impl_->final_fare, final_fare, attributes);
}

} // namespace ridedispatch::observability

#endif
