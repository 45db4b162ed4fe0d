/*
 * 설명: 브로커 진입점으로 환경설정과 명령행 인자를 적용해 서버를 실행한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#include <exception>
#include <iostream>
#include <string>

#include "consistency/app.hpp"

int main(int argc, char** argv) {
  using namespace consistency;
  AppConfig config = LoadConfigFromEnv();
  std::string error_message;
  switch (ApplyCommandLine(config, argc, argv, error_message)) {
    case CommandLineResult::kHelp:
      std::cout << UsageText(argv[0]);
      return 0;
    case CommandLineResult::kError:
      std::cerr << error_message << "\n" << UsageText(argv[0]);
      return 2;
    case CommandLineResult::kRun:
      break;
  }

  try {
    ServerApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
