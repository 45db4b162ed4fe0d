/*
 * 설명: 리소스 URI와 세션 간의 구독 관계를 정방향/역방향 인덱스로 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "consistency/protocol.hpp"

namespace consistency {

// 모든 변경은 이 클래스의 메서드 안에서 단일 뮤텍스로 직렬화된다.
// 불변식: id ∈ forward_[uri] ⇔ uri ∈ reverse_[id]. 빈 집합은 즉시 제거한다.
class SubscriptionRegistry {
 public:
  // 새로 추가되었으면 true. 이미 있는 쌍은 변경 없이 false를 반환한다.
  bool Subscribe(SessionId session_id, const ResourceUri& uri);
  bool Unsubscribe(SessionId session_id, const ResourceUri& uri);
  std::size_t RemoveSession(SessionId session_id);

  std::vector<SessionId> SubscribersOf(const ResourceUri& uri) const;
  std::vector<ResourceUri> SubscriptionsOf(SessionId session_id) const;
  bool IsSubscribed(SessionId session_id, const ResourceUri& uri) const;

  std::size_t ResourceCount() const;
  std::size_t SessionCount() const;
  std::size_t SubscriptionCount() const;
  bool IsConsistent() const;

 private:
  std::unordered_map<ResourceUri, std::unordered_set<SessionId>> forward_;
  std::unordered_map<SessionId, std::unordered_set<ResourceUri>> reverse_;
  std::size_t subscription_count_{0};
  mutable std::mutex mutex_;
};

}  // namespace consistency
