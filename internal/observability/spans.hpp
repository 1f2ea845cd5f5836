#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace jobmeter::runtime::config {
class RuntimeConfig;
}

namespace jobmeter::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"jobmeter"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const jobmeter::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const jobmeter::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordJobFinished(std::string_view module, std::string_view status);
  void RecordQuotaRejection(std::string_view module, std::string_view reason);
  void ObserveLlmLatencyMs(std::string_view module, double latency_ms);
  void RecordPurged(std::string_view module, std::uint64_t jobs);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const jobmeter::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const jobmeter::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordJobFinished(std::string_view, std::string_view) {
}

inline void Metrics::RecordQuotaRejection(std::string_view, std::string_view) {
}

inline void Metrics::ObserveLlmLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordPurged(std::string_view, std::uint64_t) {
}
#endif

} // namespace jobmeter::observability
