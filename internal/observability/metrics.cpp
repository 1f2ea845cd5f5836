#include "internal/observability/spans.hpp"

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
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace jobmeter::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool job_metrics_enabled{true};
  bool quota_metrics_enabled{true};
  bool llm_metrics_enabled{true};
  bool retention_metrics_enabled{true};
  bool module_labels_enabled{true};
};

MetricsOptions g_metrics_options;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
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

std::string ModuleLabel(std::string_view module) {
  return g_metrics_options.module_labels_enabled ? std::string(module) : std::string("all");
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> jobs_finished;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> quota_rejections;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      llm_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> purged_jobs;
};

bool InitializeMetrics(const jobmeter::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == jobmeter::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto configured_interval_ms     = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max(metric_config.min_collection_interval_ms(), configured_interval_ms));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_metrics_options.job_metrics_enabled       = metric_config.job_metrics_enabled();
  g_metrics_options.quota_metrics_enabled     = metric_config.quota_metrics_enabled();
  g_metrics_options.llm_metrics_enabled       = metric_config.llm_metrics_enabled();
  g_metrics_options.retention_metrics_enabled = metric_config.retention_metrics_enabled();
  g_metrics_options.module_labels_enabled     = metric_config.module_labels_enabled();

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
  impl_->meter  = provider->GetMeter("jobmeter", "0.1.0");

  impl_->jobs_finished    = impl_->meter->CreateUInt64Counter("jobmeter.job.completed", "1", "Jobs that reached a terminal state");
  impl_->quota_rejections = impl_->meter->CreateUInt64Counter("jobmeter.quota.rejected", "1", "Submissions rejected at admission");
  impl_->llm_latency_ms   = impl_->meter->CreateDoubleHistogram("jobmeter.llm.latency_ms", "ms", "Provider call latency in milliseconds");
  impl_->purged_jobs      = impl_->meter->CreateUInt64Counter("jobmeter.retention.purged", "1", "Jobs whose artifacts were purged");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordJobFinished(std::string_view module, std::string_view status) {
  if (!impl_ || !impl_->jobs_finished || !g_metrics_options.job_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"module", ModuleLabel(module)}, {"status", std::string(status)}};
  AddWithAttributes(impl_->jobs_finished, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordQuotaRejection(std::string_view module, std::string_view reason) {
  if (!impl_ || !impl_->quota_rejections || !g_metrics_options.quota_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"module", ModuleLabel(module)}, {"reason", std::string(reason)}};
  AddWithAttributes(impl_->quota_rejections, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveLlmLatencyMs(std::string_view module, double latency_ms) {
  if (!impl_ || !impl_->llm_latency_ms || !g_metrics_options.llm_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"module", ModuleLabel(module)}};
  RecordWithAttributes(impl_->llm_latency_ms, latency_ms, attributes);
}

void Metrics::RecordPurged(std::string_view module, std::uint64_t jobs) {
  if (!impl_ || !impl_->purged_jobs || !g_metrics_options.retention_metrics_enabled || jobs == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"module", ModuleLabel(module)}};
  AddWithAttributes(impl_->purged_jobs, jobs, attributes);
}

} // namespace jobmeter::observability

#endif
