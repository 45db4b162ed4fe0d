/*
 * 설명: 클라이언트 연결 하나의 브로커 측 상태(세션 ID, 제한된 송신 큐, 오버플로 정책)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_queue_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "consistency/protocol.hpp"

namespace consistency {

enum class OverflowPolicy { kDropOldest, kCloseSession };

std::optional<OverflowPolicy> ParseOverflowPolicy(std::string_view value);
std::string_view OverflowPolicyName(OverflowPolicy policy);

struct QueueLimits {
  std::size_t max_messages{64};
  std::size_t max_bytes{262144};
  OverflowPolicy policy{OverflowPolicy::kDropOldest};
};

enum class EnqueueResult { kQueued, kQueuedAfterDrop, kRejectedClosed, kRejectedOverflow };

// 세션이 소켓 구현을 모른 채 송신 작업을 깨우거나 연결을 끊을 수 있게 하는 최소 인터페이스.
class SessionTransport {
 public:
  virtual ~SessionTransport() = default;
  virtual void NotifyWritable() = 0;
  virtual void Terminate(std::string_view reason) = 0;
};

class Session {
 public:
  Session(SessionId id, const QueueLimits& limits);

  SessionId Id() const { return id_; }
  void AttachTransport(std::weak_ptr<SessionTransport> transport);

  // 어느 스레드에서나 호출 가능하며 절대 블록하지 않는다.
  EnqueueResult Enqueue(OutboundMessage message);
  std::optional<OutboundMessage> PopNext();
  std::vector<OutboundMessage> DrainAll();

  // 닫힌 뒤의 Enqueue는 모두 kRejectedClosed가 된다. 두 번째 호출부터는 false.
  bool Close();
  bool IsClosed() const;
  // 연결된 전송 계층에 종료를 요청한다. 전송 계층이 없으면 아무 일도 하지 않는다.
  void Terminate(std::string_view reason);

  std::size_t QueuedCount() const;
  std::size_t QueuedBytes() const;
  std::uint64_t DroppedCount() const;

 private:
  std::shared_ptr<SessionTransport> LockTransport() const;

  const SessionId id_;
  const QueueLimits limits_;
  std::deque<OutboundMessage> queue_;
  std::size_t queued_bytes_{0};
  std::uint64_t dropped_{0};
  bool closed_{false};
  std::weak_ptr<SessionTransport> transport_;
  mutable std::mutex mutex_;
};

}  // namespace consistency
