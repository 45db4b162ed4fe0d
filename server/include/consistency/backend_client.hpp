/*
 * 설명: 백엔드 프로세스가 브로커에 리소스 변경을 보고할 때 쓰는 동기식 클라이언트.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <optional>
#include <string>

namespace consistency {

struct BackendClientConfig {
  std::string host{"127.0.0.1"};
  unsigned short port{1991};
};

class BackendClient {
 public:
  explicit BackendClient(const BackendClientConfig& config);

  // 브로커에 닿지 못하면 error_code는 backend_unavailable이 된다. 브로커가 거절하면 그 오류 코드를 돌려준다.
  bool ReportChange(const std::string& uri, const std::optional<std::string>& payload, std::string& error_code,
                    std::string& error_message) const;

 private:
  BackendClientConfig config_;
};

}  // namespace consistency
