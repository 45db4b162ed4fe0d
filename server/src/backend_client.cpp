/*
 * 설명: 변경 보고 레코드 한 줄을 보내고 응답 엔벨로프 한 줄을 읽어 성공/실패로 바꾼다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#include "consistency/backend_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <nlohmann/json.hpp>

#include "consistency/protocol.hpp"

namespace consistency {

BackendClient::BackendClient(const BackendClientConfig& config) : config_(config) {}

bool BackendClient::ReportChange(const std::string& uri, const std::optional<std::string>& payload,
                                 std::string& error_code, std::string& error_message) const {
  boost::asio::io_context ioc;
  boost::asio::ip::tcp::resolver resolver{ioc};
  boost::beast::tcp_stream stream{ioc};
  boost::beast::error_code ec;

  auto const results = resolver.resolve(config_.host, std::to_string(config_.port), ec);
  if (!ec) {
    stream.connect(results, ec);
  }
  if (ec) {
    error_code = "backend_unavailable";
    error_message = "브로커에 연결할 수 없습니다: " + ec.message();
    return false;
  }

  const auto record = EncodeBackendRecord(InvalidationEvent{uri, payload}) + "\n";
  boost::asio::write(stream.socket(), boost::asio::buffer(record), ec);
  std::string reply;
  if (!ec) {
    boost::asio::read_until(stream.socket(), boost::asio::dynamic_buffer(reply), '\n', ec);
  }
  boost::beast::error_code ignored;
  stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
  if (ec) {
    error_code = "backend_unavailable";
    error_message = "브로커 응답을 받지 못했습니다: " + ec.message();
    return false;
  }

  try {
    auto envelope = nlohmann::json::parse(reply);
    if (envelope.value("success", false)) {
      return true;
    }
    error_code = envelope["error"].value("code", "unknown");
    error_message = envelope["error"].value("message", "");
  } catch (const nlohmann::json::exception& ex) {
    error_code = "bad_response";
    error_message = ex.what();
  }
  return false;
}

}  // namespace consistency
