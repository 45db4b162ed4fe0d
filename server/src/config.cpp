/*
 * 설명: 환경변수와 명령행 인자로 브로커 설정을 구성하고 검증한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "consistency/config.hpp"

#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace consistency {
namespace {
std::optional<std::size_t> ParseUnsigned(const std::string& value) {
  if (value.empty() || value.front() == '-') {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    auto parsed = std::stoull(value, &idx);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<unsigned short> ParsePort(const std::string& value) {
  auto parsed = ParseUnsigned(value);
  if (!parsed || *parsed > std::numeric_limits<unsigned short>::max()) {
    return std::nullopt;
  }
  return static_cast<unsigned short>(*parsed);
}

bool ParseFlag(const std::string& value) { return !(value == "0" || value == "false" || value == "off"); }
}  // namespace

AppConfig DefaultConfig() {
  AppConfig cfg;
  cfg.public_host = "0.0.0.0";
  cfg.public_port = 4691;
  cfg.backend_host = "127.0.0.1";
  cfg.backend_port = 1991;
  cfg.log_level = "info";
  cfg.ws_queue_limit_messages = 64;
  cfg.ws_queue_limit_bytes = 262144;
  cfg.ws_overflow_policy = "drop_oldest";
  cfg.ingest_coalesce = true;
  cfg.worker_threads = 0;
  return cfg;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const std::string& def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : def;
  };
  // 숫자 변환에 실패하면 기본값을 유지하고, 범위 검사는 ValidateConfig가 맡는다.
  auto get_size = [&get_env](const char* key, std::size_t def) -> std::size_t {
    auto parsed = ParseUnsigned(get_env(key, ""));
    return parsed ? *parsed : def;
  };
  auto get_port = [&get_env](const char* key, unsigned short def) -> unsigned short {
    auto parsed = ParsePort(get_env(key, ""));
    return parsed ? *parsed : def;
  };

  AppConfig cfg = DefaultConfig();
  cfg.public_host = get_env("PUBLIC_HOST", cfg.public_host);
  cfg.public_port = get_port("PUBLIC_PORT", cfg.public_port);
  cfg.backend_host = get_env("BACKEND_HOST", cfg.backend_host);
  cfg.backend_port = get_port("BACKEND_PORT", cfg.backend_port);
  cfg.log_level = get_env("LOG_LEVEL", cfg.log_level);
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", cfg.ws_queue_limit_messages);
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", cfg.ws_queue_limit_bytes);
  cfg.ws_overflow_policy = get_env("WS_OVERFLOW_POLICY", cfg.ws_overflow_policy);
  cfg.ingest_coalesce = ParseFlag(get_env("INGEST_COALESCE", "1"));
  cfg.worker_threads = get_size("WORKER_THREADS", cfg.worker_threads);
  return cfg;
}

CommandLineResult ApplyCommandLine(AppConfig& config, int argc, const char* const* argv, std::string& error_message) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help") {
      return CommandLineResult::kHelp;
    }
    const bool is_public_host = arg == "-h" || arg == "--public-hostname";
    const bool is_public_port = arg == "-p" || arg == "--public-port";
    const bool is_backend_host = arg == "-s" || arg == "--backend-hostname";
    const bool is_backend_port = arg == "-c" || arg == "--backend-port";
    if (!is_public_host && !is_public_port && !is_backend_host && !is_backend_port) {
      error_message = "알 수 없는 인자: " + arg;
      return CommandLineResult::kError;
    }
    if (i + 1 >= argc) {
      error_message = arg + " 옵션에 값이 필요합니다";
      return CommandLineResult::kError;
    }
    const std::string value = argv[++i];
    if (is_public_host) {
      config.public_host = value;
    } else if (is_backend_host) {
      config.backend_host = value;
    } else {
      auto port = ParsePort(value);
      if (!port) {
        error_message = "잘못된 포트 번호: " + value;
        return CommandLineResult::kError;
      }
      (is_public_port ? config.public_port : config.backend_port) = *port;
    }
  }
  return CommandLineResult::kRun;
}

std::string UsageText(const std::string& program) {
  std::ostringstream oss;
  oss << "usage: " << program << " [options]\n"
      << "  -h, --public-hostname HOST   클라이언트 WebSocket 바인드 주소 (기본 0.0.0.0)\n"
      << "  -p, --public-port PORT       클라이언트 포트 (기본 4691)\n"
      << "  -s, --backend-hostname HOST  백엔드 변경 보고 바인드 주소 (기본 127.0.0.1)\n"
      << "  -c, --backend-port PORT      백엔드 포트 (기본 1991)\n"
      << "      --help                   이 도움말을 출력한다\n"
      << "환경변수: PUBLIC_HOST PUBLIC_PORT BACKEND_HOST BACKEND_PORT LOG_LEVEL WS_QUEUE_LIMIT_MESSAGES\n"
      << "          WS_QUEUE_LIMIT_BYTES WS_OVERFLOW_POLICY INGEST_COALESCE WORKER_THREADS\n"
      << "CTRL-C 또는 SIGINT/SIGTERM으로 종료한다.\n";
  return oss.str();
}

bool ValidateConfig(const AppConfig& config, QueueLimits& limits, LogLevel& log_level, std::string& error_message) {
  auto policy = ParseOverflowPolicy(config.ws_overflow_policy);
  if (!policy) {
    error_message = "WS_OVERFLOW_POLICY는 drop_oldest 또는 close여야 합니다: " + config.ws_overflow_policy;
    return false;
  }
  auto level = ParseLogLevel(config.log_level);
  if (!level) {
    error_message = "LOG_LEVEL은 debug, info, warn, error 중 하나여야 합니다: " + config.log_level;
    return false;
  }
  if (config.ws_queue_limit_messages == 0 || config.ws_queue_limit_bytes == 0) {
    error_message = "송신 큐 한도는 0보다 커야 합니다";
    return false;
  }
  if (config.public_port != 0 && config.public_port == config.backend_port &&
      config.public_host == config.backend_host) {
    error_message = "클라이언트 포트와 백엔드 포트가 같습니다";
    return false;
  }
  limits.max_messages = config.ws_queue_limit_messages;
  limits.max_bytes = config.ws_queue_limit_bytes;
  limits.policy = *policy;
  log_level = *level;
  return true;
}

}  // namespace consistency
