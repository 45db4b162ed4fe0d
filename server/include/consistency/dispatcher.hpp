/*
 * 설명: 무효화 이벤트 하나를 현재 구독 중인 모든 세션의 송신 큐로 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>

#include "consistency/connection_manager.hpp"
#include "consistency/observability.hpp"
#include "consistency/protocol.hpp"
#include "consistency/registry.hpp"

namespace consistency {

struct DispatchReport {
  std::size_t matched{0};
  std::size_t delivered{0};
  // 큐가 넘쳐 다른 메시지를 밀어냈거나 세션이 닫혀 전달되지 않은 경우
  std::size_t dropped{0};
  // 스냅샷 이후 이미 해제된 세션
  std::size_t stale{0};
};

class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<SubscriptionRegistry> registry, std::shared_ptr<ConnectionManager> connections,
             std::shared_ptr<Observability> observability);

  DispatchReport Dispatch(const InvalidationEvent& event);

 private:
  std::shared_ptr<SubscriptionRegistry> registry_;
  std::shared_ptr<ConnectionManager> connections_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace consistency
