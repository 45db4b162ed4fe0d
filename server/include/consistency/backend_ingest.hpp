/*
 * 설명: 백엔드가 보고한 리소스 변경을 대기열에 넣고 단일 스트랜드에서 디스패처로 넘긴다.
 *       같은 URI의 변경이 아직 디스패치 전이면 하나로 합친다(설정으로 끌 수 있음).
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/backend_ingest_test.cpp
 */
#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include "consistency/dispatcher.hpp"
#include "consistency/observability.hpp"
#include "consistency/protocol.hpp"

namespace consistency {

class BackendIngest : public std::enable_shared_from_this<BackendIngest> {
 public:
  BackendIngest(boost::asio::io_context& ioc, std::shared_ptr<Dispatcher> dispatcher, bool coalesce,
                std::shared_ptr<Observability> observability);

  // 접수되면 true. 이 호출이 반환된 뒤 최소 한 번은 최신 변경을 반영한 알림이 나간다.
  bool ReportChange(const ResourceUri& uri, std::optional<std::string> payload, std::string& error_code,
                    std::string& error_message);
  // 새 보고를 거절하고, 대기 중이던 보고는 반환 전에 모두 디스패치한다.
  void Stop();

  std::size_t PendingCount() const;
  bool Coalescing() const { return coalesce_; }

 private:
  void Drain();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::shared_ptr<Dispatcher> dispatcher_;
  const bool coalesce_;
  std::shared_ptr<Observability> observability_;
  std::list<InvalidationEvent> pending_;
  std::unordered_map<ResourceUri, std::list<InvalidationEvent>::iterator> pending_index_;
  bool drain_scheduled_{false};
  bool stopped_{false};
  mutable std::mutex mutex_;
  // Drain과 Stop의 디스패치를 직렬화해 같은 URI의 순서를 지킨다. mutex_보다 먼저 잡는다.
  std::mutex dispatch_mutex_;
};

}  // namespace consistency
