#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace tracebrain::runtime::config {
class RuntimeConfig;
}

namespace tracebrain::observability {

/*
  Optional OpenTelemetry export of the service's own operations.
  Without ENABLE_OTEL every call below is an inline no-op.
*/

bool InitializeTracing(const tracebrain::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const tracebrain::runtime::config::RuntimeConfig& config);
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

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordSpansIngested(std::uint64_t added, std::uint64_t skipped);
  void RecordProviderCall(std::string_view provider, bool success);
  void ObserveEvaluationDurationMs(double duration_ms, bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const tracebrain::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const tracebrain::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordSpansIngested(std::uint64_t, std::uint64_t) {
}

inline void Metrics::RecordProviderCall(std::string_view, bool) {
}

inline void Metrics::ObserveEvaluationDurationMs(double, bool) {
}
#endif

} // namespace tracebrain::observability
