/*
 * 설명: 세션 수명주기를 관리하고 구독/구독 해제/종료 프레임을 레지스트리 변경과 응답으로 바꾼다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_manager_test.cpp, server/tests/e2e/broker_flow_test.cpp
 */
#include "consistency/connection_manager.hpp"

#include <string>
#include <vector>

namespace consistency {

ConnectionManager::ConnectionManager(std::shared_ptr<SubscriptionRegistry> registry, const QueueLimits& limits,
                                     std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), limits_(limits), observability_(std::move(observability)) {}

std::shared_ptr<Session> ConnectionManager::Accept() {
  const auto session_id = next_session_id_.fetch_add(1);
  auto session = std::make_shared<Session>(session_id, limits_);
  std::size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.emplace(session_id, session);
    active = sessions_.size();
  }
  if (observability_) {
    observability_->IncrementAccepted();
    observability_->SetWebsocketActive(active);
    observability_->Log(LogContext{.level = LogLevel::kInfo, .name = "session.accepted", .session_id = session_id});
  }
  return session;
}

FrameOutcome ConnectionManager::HandleFrame(const std::shared_ptr<Session>& session, std::string_view frame) {
  std::string error_code;
  std::string error_message;
  auto command = ParseClientFrame(frame, error_code, error_message);
  if (!command) {
    ReportProtocolError(session, std::move(error_code), std::move(error_message));
    return FrameOutcome::kContinue;
  }
  return HandleCommand(session, *command);
}

FrameOutcome ConnectionManager::HandleCommand(const std::shared_ptr<Session>& session, const ClientCommand& command) {
  const auto session_id = session->Id();
  switch (command.kind) {
    case CommandKind::kSubscribe: {
      if (session->IsClosed()) {
        return FrameOutcome::kClose;
      }
      const bool added = registry_->Subscribe(session_id, command.uri);
      // Release와 경합해 이미 정리된 세션이면 방금 추가한 항목을 되돌린다.
      if (session->IsClosed()) {
        registry_->Unsubscribe(session_id, command.uri);
        return FrameOutcome::kClose;
      }
      if (session->Enqueue(SubscribeAck{command.uri}) == EnqueueResult::kRejectedOverflow) {
        ReleaseAfterOverflow(session_id);
        return FrameOutcome::kClose;
      }
      if (observability_) {
        observability_->Log(LogContext{.level = LogLevel::kDebug,
                                       .name = added ? "subscription.added" : "subscription.duplicate",
                                       .session_id = session_id,
                                       .uri = command.uri});
      }
      return FrameOutcome::kContinue;
    }
    case CommandKind::kUnsubscribe: {
      const bool removed = registry_->Unsubscribe(session_id, command.uri);
      if (observability_ && removed) {
        observability_->Log(LogContext{.level = LogLevel::kDebug,
                                       .name = "subscription.removed",
                                       .session_id = session_id,
                                       .uri = command.uri});
      }
      return FrameOutcome::kContinue;
    }
    case CommandKind::kClose:
      return FrameOutcome::kClose;
  }
  return FrameOutcome::kContinue;
}

void ConnectionManager::ReportProtocolError(const std::shared_ptr<Session>& session, std::string code,
                                            std::string reason) {
  if (observability_) {
    observability_->IncrementProtocolError();
    observability_->Log(LogContext{.level = LogLevel::kWarn,
                                   .name = "protocol.error",
                                   .session_id = session->Id(),
                                   .detail = code + ": " + reason});
  }
  if (session->Enqueue(ErrorNotice{std::move(code), std::move(reason)}) == EnqueueResult::kRejectedOverflow) {
    ReleaseAfterOverflow(session->Id());
  }
}

void ConnectionManager::ReleaseAfterOverflow(SessionId session_id) {
  if (observability_) {
    observability_->IncrementBackpressureClose();
  }
  Release(session_id);
}

bool ConnectionManager::Release(SessionId session_id) {
  std::shared_ptr<Session> session;
  std::size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return false;
    }
    session = std::move(it->second);
    sessions_.erase(it);
    active = sessions_.size();
  }
  session->Close();
  const auto removed = registry_->RemoveSession(session_id);
  if (observability_) {
    observability_->SetWebsocketActive(active);
    observability_->Log(LogContext{.level = LogLevel::kInfo,
                                   .name = "session.released",
                                   .session_id = session_id,
                                   .detail = "subscriptions=" + std::to_string(removed)});
  }
  return true;
}

std::shared_ptr<Session> ConnectionManager::Find(SessionId session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

void ConnectionManager::Shutdown() {
  std::vector<std::shared_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions.reserve(sessions_.size());
    for (const auto& [session_id, session] : sessions_) {
      sessions.push_back(session);
    }
  }
  for (const auto& session : sessions) {
    session->Terminate("server_shutdown");
    Release(session->Id());
  }
}

std::size_t ConnectionManager::ActiveSessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace consistency
