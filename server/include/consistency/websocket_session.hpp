/*
 * 설명: WebSocket 연결 하나의 수신 루프와 송신 큐 배출을 담당하는 전송 계층 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "consistency/connection_manager.hpp"
#include "consistency/observability.hpp"
#include "consistency/session.hpp"

namespace consistency {

class WebSocketSession : public SessionTransport, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<ConnectionManager> connections, std::shared_ptr<Observability> observability);
  ~WebSocketSession() override;
  void Run();

  void NotifyWritable() override;
  void Terminate(std::string_view reason) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void CloseWith(boost::beast::websocket::close_reason reason);
  void Teardown(const char* cause);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<ConnectionManager> connections_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<Session> session_;
  std::string current_frame_;
  bool writing_{false};
  bool closing_{false};
  bool released_{false};
};

}  // namespace consistency
