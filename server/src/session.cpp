/*
 * 설명: 세션 송신 큐의 한도 검사와 오버플로 정책(가장 오래된 메시지 폐기 또는 세션 종료)을 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_queue_test.cpp
 */
#include "consistency/session.hpp"

#include <iterator>

namespace consistency {

std::optional<OverflowPolicy> ParseOverflowPolicy(std::string_view value) {
  if (value == "drop_oldest") {
    return OverflowPolicy::kDropOldest;
  }
  if (value == "close") {
    return OverflowPolicy::kCloseSession;
  }
  return std::nullopt;
}

std::string_view OverflowPolicyName(OverflowPolicy policy) {
  return policy == OverflowPolicy::kDropOldest ? "drop_oldest" : "close";
}

Session::Session(SessionId id, const QueueLimits& limits) : id_(id), limits_(limits) {}

void Session::AttachTransport(std::weak_ptr<SessionTransport> transport) {
  std::lock_guard<std::mutex> lock(mutex_);
  transport_ = std::move(transport);
}

std::shared_ptr<SessionTransport> Session::LockTransport() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transport_.lock();
}

EnqueueResult Session::Enqueue(OutboundMessage message) {
  const auto weight = MessageWeight(message);
  EnqueueResult result = EnqueueResult::kQueued;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return EnqueueResult::kRejectedClosed;
    }
    const bool overflow = queue_.size() >= limits_.max_messages || queued_bytes_ + weight > limits_.max_bytes;
    if (overflow && limits_.policy == OverflowPolicy::kCloseSession) {
      closed_ = true;
      dropped_ += queue_.size() + 1;
      queue_.clear();
      queued_bytes_ = 0;
      result = EnqueueResult::kRejectedOverflow;
    } else {
      // 무효화 신호는 멱등이므로 오래된 것부터 버려도 최신 상태 재조회는 보장된다.
      while (!queue_.empty() &&
             (queue_.size() >= limits_.max_messages || queued_bytes_ + weight > limits_.max_bytes)) {
        queued_bytes_ -= MessageWeight(queue_.front());
        queue_.pop_front();
        ++dropped_;
        result = EnqueueResult::kQueuedAfterDrop;
      }
      queue_.push_back(std::move(message));
      queued_bytes_ += weight;
    }
  }

  auto transport = LockTransport();
  if (!transport) {
    return result;
  }
  if (result == EnqueueResult::kRejectedOverflow) {
    transport->Terminate("backpressure_exceeded");
  } else {
    transport->NotifyWritable();
  }
  return result;
}

std::optional<OutboundMessage> Session::PopNext() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto message = std::move(queue_.front());
  queue_.pop_front();
  queued_bytes_ -= MessageWeight(message);
  return message;
}

std::vector<OutboundMessage> Session::DrainAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<OutboundMessage> drained(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
  queue_.clear();
  queued_bytes_ = 0;
  return drained;
}

bool Session::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  closed_ = true;
  return true;
}

void Session::Terminate(std::string_view reason) {
  if (auto transport = LockTransport()) {
    transport->Terminate(reason);
  }
}

bool Session::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t Session::QueuedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::size_t Session::QueuedBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queued_bytes_;
}

std::uint64_t Session::DroppedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

}  // namespace consistency
