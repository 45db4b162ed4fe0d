/*
 * 설명: 레지스트리 스냅샷으로 구독 세션을 찾아 Invalidated 메시지를 넣고, 세션별 실패는 격리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dispatcher_test.cpp
 */
#include "consistency/dispatcher.hpp"

#include <string>

namespace consistency {

Dispatcher::Dispatcher(std::shared_ptr<SubscriptionRegistry> registry, std::shared_ptr<ConnectionManager> connections,
                       std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), connections_(std::move(connections)), observability_(std::move(observability)) {}

DispatchReport Dispatcher::Dispatch(const InvalidationEvent& event) {
  DispatchReport report;
  const auto subscribers = registry_->SubscribersOf(event.uri);
  report.matched = subscribers.size();
  for (auto session_id : subscribers) {
    auto session = connections_->Find(session_id);
    if (!session) {
      ++report.stale;
      continue;
    }
    switch (session->Enqueue(Invalidated{event.uri, event.payload})) {
      case EnqueueResult::kQueued:
        ++report.delivered;
        break;
      case EnqueueResult::kQueuedAfterDrop:
        // 새 메시지는 들어갔고 대신 오래된 메시지가 빠졌다.
        ++report.delivered;
        ++report.dropped;
        break;
      case EnqueueResult::kRejectedOverflow:
        if (observability_) {
          observability_->IncrementBackpressureClose();
        }
        // 전송 계층이 없거나 늦게 정리되더라도 구독은 여기서 바로 해제한다.
        connections_->Release(session_id);
        ++report.dropped;
        break;
      case EnqueueResult::kRejectedClosed:
        ++report.dropped;
        break;
    }
  }

  if (observability_) {
    observability_->AddDelivered(report.delivered);
    observability_->AddDropped(report.dropped);
    observability_->Log(LogContext{.level = LogLevel::kDebug,
                                   .name = "invalidation.dispatched",
                                   .uri = event.uri,
                                   .detail = "matched=" + std::to_string(report.matched) +
                                             " delivered=" + std::to_string(report.delivered) +
                                             " dropped=" + std::to_string(report.dropped)});
  }
  return report;
}

}  // namespace consistency
