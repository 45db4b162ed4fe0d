/*
 * 설명: 백엔드 변경 보고 레코드를 줄 단위로 읽어 인제스트에 넘기고 ack/실패를 응답한다.
 *       개행 없이 EOF로 끝나는 마지막 레코드도 하나의 보고로 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#include "consistency/backend_session.hpp"

#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>

#include "consistency/protocol.hpp"

namespace consistency {

BackendSession::BackendSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<BackendIngest> ingest,
                               std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), ingest_(std::move(ingest)), observability_(std::move(observability)) {}

void BackendSession::Run() {
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  stream_.expires_never();
  DoRead();
}

void BackendSession::DoRead() {
  auto self = shared_from_this();
  boost::asio::async_read_until(stream_, boost::asio::dynamic_buffer(buffer_, kMaxBackendRecordBytes), '\n',
                                [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                  self->OnRead(ec, bytes_transferred);
                                });
}

void BackendSession::OnRead(boost::beast::error_code ec, std::size_t bytes_transferred) {
  if (ec == boost::asio::error::eof) {
    if (buffer_.find_first_not_of(" \t\r\n") == std::string::npos) {
      return Shutdown();
    }
    auto line = std::move(buffer_);
    buffer_.clear();
    return HandleRecord(line, true);
  }
  if (ec == boost::asio::error::not_found) {
    reply_ = DumpJson(MakeErrorEnvelope("record_too_large", "레코드가 최대 크기를 넘었습니다")) + "\n";
    auto self = shared_from_this();
    boost::asio::async_write(stream_, boost::asio::buffer(reply_),
                             [self](boost::beast::error_code write_ec, std::size_t) { self->OnWrite(write_ec, true); });
    return;
  }
  if (ec) {
    return;
  }

  auto line = buffer_.substr(0, bytes_transferred - 1);
  buffer_.erase(0, bytes_transferred);
  if (line.find_first_not_of(" \t\r") == std::string::npos) {
    return DoRead();
  }
  HandleRecord(line, false);
}

void BackendSession::HandleRecord(const std::string& line, bool last) {
  std::string error_code;
  std::string error_message;
  nlohmann::json reply;
  auto event = ParseBackendRecord(line, error_code, error_message);
  if (event && ingest_->ReportChange(event->uri, event->payload, error_code, error_message)) {
    reply = MakeSuccessEnvelope({{"uri", event->uri}});
  } else {
    if (!event && observability_) {
      observability_->IncrementBackendRejected();
    }
    if (observability_) {
      observability_->Log(LogContext{.level = LogLevel::kWarn,
                                     .name = "backend.record_rejected",
                                     .trace_id = trace_id_,
                                     .detail = error_code + ": " + error_message});
    }
    reply = MakeErrorEnvelope(error_code, error_message);
  }

  reply_ = DumpJson(reply) + "\n";
  auto self = shared_from_this();
  boost::asio::async_write(stream_, boost::asio::buffer(reply_),
                           [self, last](boost::beast::error_code ec, std::size_t) { self->OnWrite(ec, last); });
}

void BackendSession::OnWrite(boost::beast::error_code ec, bool last) {
  if (ec) {
    return;
  }
  if (last) {
    return Shutdown();
  }
  DoRead();
}

void BackendSession::Shutdown() {
  boost::beast::error_code ignored;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
}

}  // namespace consistency
