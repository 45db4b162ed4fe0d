/*
 * 설명: 백엔드 대신 브로커에 변경 보고를 한 번 보내고 종료하는 점검용 도구.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "consistency/backend_client.hpp"

namespace {
void PrintUsage(const char* program) {
  std::cerr << "usage: " << program << " [--host HOST] [--port PORT] uri [payload]\n";
}
}  // namespace

int main(int argc, char** argv) {
  consistency::BackendClientConfig config;
  if (const char* host = std::getenv("BACKEND_HOST")) {
    config.host = host;
  }
  std::string port_text = std::getenv("BACKEND_PORT") ? std::getenv("BACKEND_PORT") : "";
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--host" || arg == "--port") && i + 1 < argc) {
      (arg == "--host" ? config.host : port_text) = argv[++i];
    } else if (arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.empty() || positional.size() > 2) {
    PrintUsage(argv[0]);
    return 2;
  }
  if (!port_text.empty()) {
    char* end = nullptr;
    auto port = std::strtoul(port_text.c_str(), &end, 10);
    if (*end != '\0' || port == 0 || port > 65535) {
      std::cerr << "잘못된 포트 번호: " << port_text << "\n";
      return 2;
    }
    config.port = static_cast<unsigned short>(port);
  }

  std::optional<std::string> payload;
  if (positional.size() == 2) {
    payload = positional[1];
  }
  std::string error_code;
  std::string error_message;
  consistency::BackendClient client(config);
  if (!client.ReportChange(positional[0], payload, error_code, error_message)) {
    std::cerr << error_code << ": " << error_message << "\n";
    return 1;
  }
  std::cout << "ok " << positional[0] << "\n";
  return 0;
}
