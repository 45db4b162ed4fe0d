/*
 * 설명: WebSocket 프레임을 읽어 연결 관리자에 넘기고, 세션 송신 큐를 순서대로 클라이언트에 쓴다.
 *       읽기/쓰기/종료 핸들러는 모두 연결의 스트랜드에서 실행된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#include "consistency/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace consistency {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<ConnectionManager> connections,
                                   std::shared_ptr<Observability> observability)
    : ws_(std::move(ws)), connections_(std::move(connections)), observability_(std::move(observability)) {}

WebSocketSession::~WebSocketSession() {
  if (session_ && !released_) {
    connections_->Release(session_->Id());
  }
}

void WebSocketSession::Run() {
  session_ = connections_->Accept();
  session_->AttachTransport(weak_from_this());
  DoRead();
}

void WebSocketSession::NotifyWritable() {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() { self->WriteNext(); });
}

void WebSocketSession::Terminate(std::string_view reason) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), reason = std::string(reason)]() {
    if (self->closing_) {
      return;
    }
    const bool backpressure = reason == "backpressure_exceeded";
    if (backpressure && self->observability_) {
      self->observability_->Log(LogContext{.level = LogLevel::kWarn,
                                           .name = "session.backpressure_close",
                                           .session_id = self->session_->Id()});
    }
    boost::beast::websocket::close_reason close_reason{backpressure
                                                           ? boost::beast::websocket::close_code::policy_error
                                                           : boost::beast::websocket::close_code::going_away};
    close_reason.reason = reason;
    self->CloseWith(close_reason);
  });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed) {
    return Teardown("client_closed");
  }
  if (ec) {
    return Teardown("transport_error");
  }
  if (closing_) {
    return;
  }

  if (!ws_.got_text()) {
    buffer_.consume(buffer_.size());
    connections_->ReportProtocolError(session_, "binary_not_supported", "텍스트 프레임만 지원합니다");
    return DoRead();
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (connections_->HandleFrame(session_, data) == FrameOutcome::kClose) {
    return CloseWith(boost::beast::websocket::close_reason{boost::beast::websocket::close_code::normal});
  }
  DoRead();
}

void WebSocketSession::WriteNext() {
  if (writing_ || closing_) {
    return;
  }
  auto next = session_->PopNext();
  if (!next) {
    return;
  }
  current_frame_ = EncodeFrame(*next);
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(current_frame_),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  writing_ = false;
  if (ec) {
    return Teardown("write_failed");
  }
  WriteNext();
}

void WebSocketSession::CloseWith(boost::beast::websocket::close_reason reason) {
  if (closing_) {
    return;
  }
  Teardown("server_close");
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::Teardown(const char* cause) {
  closing_ = true;
  if (released_) {
    return;
  }
  released_ = true;
  if (observability_) {
    observability_->Log(LogContext{.level = LogLevel::kDebug,
                                   .name = "session.teardown",
                                   .session_id = session_->Id(),
                                   .detail = cause});
  }
  connections_->Release(session_->Id());
}

}  // namespace consistency
