/*
 * 설명: 클라이언트 WS 프레임과 백엔드 레코드를 JSON으로 해석/직렬화하고 HTTP 엔벨로프를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#include "consistency/protocol.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace consistency {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}

bool ParseJsonObject(std::string_view text, nlohmann::json& out, std::string& error_code,
                     std::string& error_message) {
  try {
    out = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error&) {
    error_code = "bad_request";
    error_message = "JSON 파싱 오류";
    return false;
  }
  if (!out.is_object()) {
    error_code = "bad_request";
    error_message = "잘못된 메시지 형식";
    return false;
  }
  auto version_it = out.find("v");
  if (version_it != out.end() &&
      (!version_it->is_number_integer() || version_it->get<std::int64_t>() != kProtocolVersion)) {
    error_code = "unsupported_version";
    error_message = "지원하지 않는 프로토콜 버전";
    return false;
  }
  return true;
}

// data.uri를 꺼낸다. 빈 문자열은 유효한 리소스 식별자가 아니다.
std::optional<ResourceUri> ExtractUri(const nlohmann::json& message, std::string& error_code,
                                      std::string& error_message) {
  auto data_it = message.find("data");
  if (data_it == message.end() || !data_it->is_object()) {
    error_code = "bad_request";
    error_message = "data가 누락되었습니다";
    return std::nullopt;
  }
  auto uri_it = data_it->find("uri");
  if (uri_it == data_it->end() || !uri_it->is_string()) {
    error_code = "bad_request";
    error_message = "uri 필드가 필요합니다";
    return std::nullopt;
  }
  auto uri = uri_it->get<std::string>();
  if (uri.empty()) {
    error_code = "invalid_uri";
    error_message = "uri가 비어 있습니다";
    return std::nullopt;
  }
  return uri;
}
}  // namespace

std::optional<ClientCommand> ParseClientFrame(std::string_view frame, std::string& error_code,
                                              std::string& error_message) {
  nlohmann::json message;
  if (!ParseJsonObject(frame, message, error_code, error_message)) {
    return std::nullopt;
  }
  auto type_it = message.find("message");
  if (type_it == message.end() || !type_it->is_string()) {
    error_code = "bad_request";
    error_message = "message 필드가 필요합니다";
    return std::nullopt;
  }
  const auto type = type_it->get<std::string>();
  if (type == "close") {
    return ClientCommand{CommandKind::kClose, {}};
  }

  CommandKind kind;
  // watch/unwatch는 v1 이전 클라이언트 호환용 별칭이다.
  if (type == "subscribe" || type == "watch") {
    kind = CommandKind::kSubscribe;
  } else if (type == "unsubscribe" || type == "unwatch") {
    kind = CommandKind::kUnsubscribe;
  } else {
    error_code = "unknown_message";
    error_message = "알 수 없는 메시지 유형";
    return std::nullopt;
  }

  auto uri = ExtractUri(message, error_code, error_message);
  if (!uri) {
    return std::nullopt;
  }
  return ClientCommand{kind, std::move(*uri)};
}

nlohmann::json ToWsJson(const OutboundMessage& message) {
  nlohmann::json j;
  j["v"] = kProtocolVersion;
  if (const auto* invalidated = std::get_if<Invalidated>(&message)) {
    j["message"] = "invalidate";
    j["data"] = {{"uri", invalidated->uri}};
    if (invalidated->payload) {
      j["data"]["payload"] = *invalidated->payload;
    }
  } else if (const auto* ack = std::get_if<SubscribeAck>(&message)) {
    j["message"] = "ack";
    j["data"] = {{"uri", ack->uri}};
  } else {
    const auto& error = std::get<ErrorNotice>(message);
    j["message"] = "error";
    j["data"] = {{"code", error.code}, {"reason", error.reason}};
  }
  return j;
}

std::string DumpJson(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string EncodeFrame(const OutboundMessage& message) { return DumpJson(ToWsJson(message)); }

std::size_t MessageWeight(const OutboundMessage& message) {
  if (const auto* invalidated = std::get_if<Invalidated>(&message)) {
    return invalidated->uri.size() + (invalidated->payload ? invalidated->payload->size() : 0);
  }
  if (const auto* ack = std::get_if<SubscribeAck>(&message)) {
    return ack->uri.size();
  }
  const auto& error = std::get<ErrorNotice>(message);
  return error.code.size() + error.reason.size();
}

std::optional<InvalidationEvent> ParseBackendRecord(std::string_view line, std::string& error_code,
                                                    std::string& error_message) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  nlohmann::json record;
  if (!ParseJsonObject(line, record, error_code, error_message)) {
    return std::nullopt;
  }
  auto type_it = record.find("message");
  if (type_it == record.end() || !type_it->is_string() || *type_it != "update") {
    error_code = "unknown_message";
    error_message = "update 메시지만 지원합니다";
    return std::nullopt;
  }
  auto uri = ExtractUri(record, error_code, error_message);
  if (!uri) {
    return std::nullopt;
  }

  InvalidationEvent event{std::move(*uri), std::nullopt};
  const auto& data = record["data"];
  auto payload_it = data.find("payload");
  if (payload_it != data.end() && !payload_it->is_null()) {
    // 페이로드는 불투명 데이터로 취급한다. 문자열이 아니면 직렬화한 텍스트를 그대로 전달한다.
    event.payload = payload_it->is_string() ? payload_it->get<std::string>() : payload_it->dump();
  }
  return event;
}

std::string EncodeBackendRecord(const InvalidationEvent& event) {
  nlohmann::json record{{"v", kProtocolVersion}, {"message", "update"}, {"data", {{"uri", event.uri}}}};
  if (event.payload) {
    record["data"]["payload"] = *event.payload;
  }
  return DumpJson(record);
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", std::string(code)}, {"message", std::string(message)}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

}  // namespace consistency
