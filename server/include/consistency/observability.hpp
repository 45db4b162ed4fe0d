/*
 * 설명: 구조화 로그(JSON 한 줄)와 브로커 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace consistency {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view value);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::string trace_id;
  std::optional<std::uint64_t> session_id;
  std::optional<std::string> uri;
  std::string detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t connections_accepted{0};
  std::uint64_t websocket_active{0};
  std::uint64_t protocol_errors{0};
  std::uint64_t backend_reports{0};
  std::uint64_t backend_rejected{0};
  std::uint64_t invalidations_delivered{0};
  std::uint64_t messages_dropped{0};
  std::uint64_t backpressure_closes{0};
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest() { request_total_.fetch_add(1); }
  void IncrementError() { request_errors_.fetch_add(1); }
  void IncrementAccepted() { connections_accepted_.fetch_add(1); }
  void SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }
  void IncrementProtocolError() { protocol_errors_.fetch_add(1); }
  void IncrementBackendReport() { backend_reports_.fetch_add(1); }
  void IncrementBackendRejected() { backend_rejected_.fetch_add(1); }
  void AddDelivered(std::uint64_t count) { invalidations_delivered_.fetch_add(count); }
  void AddDropped(std::uint64_t count) { messages_dropped_.fetch_add(count); }
  void IncrementBackpressureClose() { backpressure_closes_.fetch_add(1); }

  MetricsSnapshot Snapshot() const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream* sink_;
  std::atomic<std::uint64_t> trace_counter_{0};
  std::atomic<std::uint64_t> connections_accepted_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> protocol_errors_{0};
  std::atomic<std::uint64_t> backend_reports_{0};
  std::atomic<std::uint64_t> backend_rejected_{0};
  std::atomic<std::uint64_t> invalidations_delivered_{0};
  std::atomic<std::uint64_t> messages_dropped_{0};
  std::atomic<std::uint64_t> backpressure_closes_{0};
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
};

}  // namespace consistency
