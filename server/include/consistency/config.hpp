/*
 * 설명: 브로커 환경설정 로딩, 명령행 덮어쓰기와 기본값을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "consistency/observability.hpp"
#include "consistency/session.hpp"

namespace consistency {

struct AppConfig {
  std::string public_host;
  unsigned short public_port;
  std::string backend_host;
  unsigned short backend_port;
  std::string log_level;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::string ws_overflow_policy;
  bool ingest_coalesce;
  std::size_t worker_threads;
};

AppConfig DefaultConfig();
AppConfig LoadConfigFromEnv();

enum class CommandLineResult { kRun, kHelp, kError };

// -h/--public-hostname, -p/--public-port, -s/--backend-hostname, -c/--backend-port, --help
CommandLineResult ApplyCommandLine(AppConfig& config, int argc, const char* const* argv, std::string& error_message);
std::string UsageText(const std::string& program);

// 값 범위를 검사하고 큐 한도/로그 레벨을 해석한다.
bool ValidateConfig(const AppConfig& config, QueueLimits& limits, LogLevel& log_level, std::string& error_message);

}  // namespace consistency
