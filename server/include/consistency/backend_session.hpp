/*
 * 설명: 백엔드 TCP 연결에서 줄 단위 JSON 변경 보고를 읽고 결과 엔벨로프를 한 줄씩 응답한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include "consistency/backend_ingest.hpp"
#include "consistency/observability.hpp"

namespace consistency {

inline constexpr std::size_t kMaxBackendRecordBytes = 1024 * 1024;

class BackendSession : public std::enable_shared_from_this<BackendSession> {
 public:
  BackendSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<BackendIngest> ingest,
                 std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRecord(const std::string& line, bool last);
  void OnWrite(boost::beast::error_code ec, bool last);
  void Shutdown();

  boost::beast::tcp_stream stream_;
  std::string buffer_;
  std::string reply_;
  std::shared_ptr<BackendIngest> ingest_;
  std::shared_ptr<Observability> observability_;
  std::string trace_id_;
};

}  // namespace consistency
