/*
 * 설명: 클라이언트 세션 생성/조회/해제와 세션별 프로토콜 프레임 처리를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_manager_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>

#include "consistency/observability.hpp"
#include "consistency/protocol.hpp"
#include "consistency/registry.hpp"
#include "consistency/session.hpp"

namespace consistency {

enum class FrameOutcome { kContinue, kClose };

class ConnectionManager : public std::enable_shared_from_this<ConnectionManager> {
 public:
  ConnectionManager(std::shared_ptr<SubscriptionRegistry> registry, const QueueLimits& limits,
                    std::shared_ptr<Observability> observability);

  std::shared_ptr<Session> Accept();
  FrameOutcome HandleFrame(const std::shared_ptr<Session>& session, std::string_view frame);
  FrameOutcome HandleCommand(const std::shared_ptr<Session>& session, const ClientCommand& command);
  void ReportProtocolError(const std::shared_ptr<Session>& session, std::string code, std::string reason);

  // 큐를 닫은 뒤 레지스트리 항목을 제거하므로, 이후의 디스패치는 이 세션에 아무것도 넣지 못한다.
  bool Release(SessionId session_id);
  std::shared_ptr<Session> Find(SessionId session_id) const;
  void Shutdown();

  std::size_t ActiveSessions() const;
  const QueueLimits& Limits() const { return limits_; }
  std::shared_ptr<SubscriptionRegistry> Registry() const { return registry_; }

 private:
  void ReleaseAfterOverflow(SessionId session_id);

  std::shared_ptr<SubscriptionRegistry> registry_;
  QueueLimits limits_;
  std::shared_ptr<Observability> observability_;
  std::atomic<SessionId> next_session_id_{1};
  std::unordered_map<SessionId, std::shared_ptr<Session>> sessions_;
  mutable std::mutex mutex_;
};

}  // namespace consistency
