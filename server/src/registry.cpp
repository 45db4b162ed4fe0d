/*
 * 설명: 구독 레지스트리의 정방향/역방향 인덱스를 함께 갱신하고 빈 항목을 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/registry_test.cpp
 */
#include "consistency/registry.hpp"

namespace consistency {

bool SubscriptionRegistry::Subscribe(SessionId session_id, const ResourceUri& uri) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto inserted = forward_[uri].insert(session_id).second;
  if (!inserted) {
    return false;
  }
  reverse_[session_id].insert(uri);
  ++subscription_count_;
  return true;
}

bool SubscriptionRegistry::Unsubscribe(SessionId session_id, const ResourceUri& uri) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto forward_it = forward_.find(uri);
  if (forward_it == forward_.end() || forward_it->second.erase(session_id) == 0) {
    return false;
  }
  if (forward_it->second.empty()) {
    forward_.erase(forward_it);
  }
  auto reverse_it = reverse_.find(session_id);
  if (reverse_it != reverse_.end()) {
    reverse_it->second.erase(uri);
    if (reverse_it->second.empty()) {
      reverse_.erase(reverse_it);
    }
  }
  --subscription_count_;
  return true;
}

std::size_t SubscriptionRegistry::RemoveSession(SessionId session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto reverse_it = reverse_.find(session_id);
  if (reverse_it == reverse_.end()) {
    return 0;
  }
  std::size_t removed = 0;
  for (const auto& uri : reverse_it->second) {
    auto forward_it = forward_.find(uri);
    if (forward_it == forward_.end()) {
      continue;
    }
    removed += forward_it->second.erase(session_id);
    if (forward_it->second.empty()) {
      forward_.erase(forward_it);
    }
  }
  reverse_.erase(reverse_it);
  subscription_count_ -= removed;
  return removed;
}

std::vector<SessionId> SubscriptionRegistry::SubscribersOf(const ResourceUri& uri) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = forward_.find(uri);
  if (it == forward_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

std::vector<ResourceUri> SubscriptionRegistry::SubscriptionsOf(SessionId session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = reverse_.find(session_id);
  if (it == reverse_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

bool SubscriptionRegistry::IsSubscribed(SessionId session_id, const ResourceUri& uri) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = forward_.find(uri);
  return it != forward_.end() && it->second.count(session_id) > 0;
}

std::size_t SubscriptionRegistry::ResourceCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return forward_.size();
}

std::size_t SubscriptionRegistry::SessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reverse_.size();
}

std::size_t SubscriptionRegistry::SubscriptionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscription_count_;
}

bool SubscriptionRegistry::IsConsistent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t forward_pairs = 0;
  for (const auto& [uri, sessions] : forward_) {
    if (sessions.empty()) {
      return false;
    }
    for (auto session_id : sessions) {
      auto reverse_it = reverse_.find(session_id);
      if (reverse_it == reverse_.end() || reverse_it->second.count(uri) == 0) {
        return false;
      }
    }
    forward_pairs += sessions.size();
  }
  std::size_t reverse_pairs = 0;
  for (const auto& [session_id, uris] : reverse_) {
    if (uris.empty()) {
      return false;
    }
    reverse_pairs += uris.size();
  }
  return forward_pairs == reverse_pairs && forward_pairs == subscription_count_;
}

}  // namespace consistency
