/*
 * 설명: 구조화 로그와 브로커 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "consistency/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace consistency {
namespace {
std::mutex& SinkMutex() {
  static std::mutex mutex;
  return mutex;
}

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

Observability::Observability(LogLevel min_level, std::ostream* sink)
    : min_level_(min_level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.connections_accepted = connections_accepted_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.protocol_errors = protocol_errors_.load();
  snapshot.backend_reports = backend_reports_.load();
  snapshot.backend_rejected = backend_rejected_.load();
  snapshot.invalidations_delivered = invalidations_delivered_.load();
  snapshot.messages_dropped = messages_dropped_.load();
  snapshot.backpressure_closes = backpressure_closes_.load();
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.uri) {
    log_json["uri"] = *ctx.uri;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  if (ctx.latency_ms > 0) {
    log_json["latencyMs"] = ctx.latency_ms;
  }
  // 여러 워커 스레드가 같은 스트림에 쓰므로 줄 단위로 직렬화한다.
  std::lock_guard<std::mutex> lock(SinkMutex());
  *sink_ << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace consistency
