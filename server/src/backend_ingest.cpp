/*
 * 설명: 변경 보고를 접수 순서대로 디스패치하며, 대기 중인 같은 URI 보고는 최신 페이로드로 합친다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/backend_ingest_test.cpp
 */
#include "consistency/backend_ingest.hpp"

#include <iterator>
#include <string>

#include <boost/asio/post.hpp>

namespace consistency {

BackendIngest::BackendIngest(boost::asio::io_context& ioc, std::shared_ptr<Dispatcher> dispatcher, bool coalesce,
                             std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)), dispatcher_(std::move(dispatcher)), coalesce_(coalesce),
      observability_(std::move(observability)) {}

bool BackendIngest::ReportChange(const ResourceUri& uri, std::optional<std::string> payload, std::string& error_code,
                                 std::string& error_message) {
  if (uri.empty()) {
    error_code = "invalid_uri";
    error_message = "uri가 비어 있습니다";
    if (observability_) {
      observability_->IncrementBackendRejected();
    }
    return false;
  }

  bool schedule = false;
  bool coalesced = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      error_code = "backend_unavailable";
      error_message = "브로커가 변경 보고를 받지 않는 상태입니다";
      if (observability_) {
        observability_->IncrementBackendRejected();
      }
      return false;
    }
    auto index_it = coalesce_ ? pending_index_.find(uri) : pending_index_.end();
    if (index_it != pending_index_.end()) {
      // 대기열 위치는 유지하고 페이로드만 최신 값으로 바꾼다.
      index_it->second->payload = std::move(payload);
      coalesced = true;
    } else {
      pending_.push_back(InvalidationEvent{uri, std::move(payload)});
      if (coalesce_) {
        pending_index_[uri] = std::prev(pending_.end());
      }
    }
    if (!drain_scheduled_) {
      drain_scheduled_ = true;
      schedule = true;
    }
  }

  if (observability_) {
    observability_->IncrementBackendReport();
    observability_->Log(LogContext{.level = LogLevel::kDebug,
                                   .name = coalesced ? "backend.change_coalesced" : "backend.change_reported",
                                   .uri = uri});
  }
  if (schedule) {
    boost::asio::post(strand_, [self = shared_from_this()]() { self->Drain(); });
  }
  return true;
}

void BackendIngest::Drain() {
  for (;;) {
    std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
    InvalidationEvent event;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (pending_.empty() || stopped_) {
        drain_scheduled_ = false;
        return;
      }
      event = std::move(pending_.front());
      pending_.pop_front();
      if (coalesce_) {
        pending_index_.erase(event.uri);
      }
    }
    dispatcher_->Dispatch(event);
  }
}

void BackendIngest::Stop() {
  std::list<InvalidationEvent> flushed;
  {
    std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopped_) {
        return;
      }
      stopped_ = true;
      flushed.swap(pending_);
      pending_index_.clear();
    }
    // 이미 성공 응답을 보낸 보고는 버리지 않고 호출 스레드에서 마저 디스패치한다.
    for (const auto& event : flushed) {
      dispatcher_->Dispatch(event);
    }
  }
  if (observability_ && !flushed.empty()) {
    observability_->Log(LogContext{.level = LogLevel::kInfo,
                                   .name = "backend.ingest_flushed",
                                   .detail = "events=" + std::to_string(flushed.size())});
  }
}

std::size_t BackendIngest::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

}  // namespace consistency
