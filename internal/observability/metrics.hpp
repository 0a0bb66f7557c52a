#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ledger::runtime::config {
class RuntimeConfig;
}

namespace ledger::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"resource-ledger"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const ledger::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

struct LedgerBytes {
  std::int64_t allocated = 0;
  std::int64_t used      = 0;
};

/*
  Process-wide ledger instruments. Exporting is a no-op unless the build
  enables OpenTelemetry and InitializeMetrics() installed a provider.

  Ledgers report byte deltas, so the ledger.bytes gauge is the sum over
  every live ledger in the process.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordAllocation(bool success);
  void RecordEviction(std::string_view reason, std::uint64_t bytes);
  void AdjustLedgerBytes(std::int64_t allocated_delta, std::int64_t used_delta);
  void ObserveSweepDurationMs(double duration_ms);
  void ObserveDefragmentDurationMs(double duration_ms);

  LedgerBytes CurrentLedgerBytes() const;

 private:
  Metrics();

  std::atomic<std::int64_t> allocated_bytes_{0};
  std::atomic<std::int64_t> used_bytes_{0};

#ifdef LEDGER_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef LEDGER_ENABLE_OTEL
inline bool InitializeMetrics(const ledger::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordAllocation(bool) {
}

inline void Metrics::RecordEviction(std::string_view, std::uint64_t) {
}

inline void Metrics::ObserveSweepDurationMs(double) {
}

inline void Metrics::ObserveDefragmentDurationMs(double) {
}
#endif

inline void Metrics::AdjustLedgerBytes(std::int64_t allocated_delta, std::int64_t used_delta) {
  allocated_bytes_ += allocated_delta;
  used_bytes_ += used_delta;
}

inline LedgerBytes Metrics::CurrentLedgerBytes() const {
  return {allocated_bytes_.load(), used_bytes_.load()};
}

} // namespace ledger::observability
