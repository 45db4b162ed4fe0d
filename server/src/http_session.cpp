/*
 * 설명: HTTP 요청을 읽어 헬스/메트릭 응답을 보내거나 WebSocket 세션으로 업그레이드한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/broker_flow_test.cpp
 */
#include "consistency/http_session.hpp"

#include <boost/beast/version.hpp>

#include "consistency/protocol.hpp"
#include "consistency/websocket_session.hpp"

namespace consistency {

namespace {
constexpr const char* kServerName = "consistency-broker";
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<ConnectionManager> connections,
                         std::shared_ptr<SubscriptionRegistry> registry, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), connections_(std::move(connections)), registry_(std::move(registry)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path.resize(qpos);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}, {"protocolVersion", kProtocolVersion}};
    auto body = MakeSuccessEnvelope(payload).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{
        {"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
        {"connections",
         {{"accepted", snapshot.connections_accepted},
          {"websocket", snapshot.websocket_active},
          {"sessions", connections_->ActiveSessions()}}},
        {"registry",
         {{"resources", registry_->ResourceCount()},
          {"sessions", registry_->SessionCount()},
          {"subscriptions", registry_->SubscriptionCount()}}},
        {"dispatch",
         {{"backendReports", snapshot.backend_reports},
          {"backendRejected", snapshot.backend_rejected},
          {"delivered", snapshot.invalidations_delivered},
          {"dropped", snapshot.messages_dropped},
          {"backpressureCloses", snapshot.backpressure_closes}}},
        {"protocolErrors", snapshot.protocol_errors}};
    auto body = MakeSuccessEnvelope(data).dump();
    res->result(http::status::ok);
    res->body() = body;
    res->content_length(body.size());
    return SendResponse(res);
  }

  res->result(http::status::not_found);
  auto body = MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다").dump();
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{.level = LogLevel::kDebug,
                                   .name = "http.request",
                                   .trace_id = trace_id_,
                                   .detail = std::string(req_.target()),
                                   .latency_ms = static_cast<long>(latency)});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  stream_.expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    if (observability_) {
      observability_->Log(LogContext{.level = LogLevel::kWarn, .name = "websocket.handshake_failed",
                                     .detail = ec.message()});
    }
    boost::beast::error_code ignored;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), connections_, observability_)->Run();
}

}  // namespace consistency
