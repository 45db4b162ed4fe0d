/*
 * 설명: 클라이언트 WS 프레임(v1), 백엔드 레코드, HTTP 응답 엔벨로프의 타입과 코덱을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace consistency {

inline constexpr int kProtocolVersion = 1;

using ResourceUri = std::string;
using SessionId = std::uint64_t;

struct InvalidationEvent {
  ResourceUri uri;
  std::optional<std::string> payload;
};

struct Invalidated {
  ResourceUri uri;
  std::optional<std::string> payload;
};

struct SubscribeAck {
  ResourceUri uri;
};

struct ErrorNotice {
  std::string code;
  std::string reason;
};

using OutboundMessage = std::variant<Invalidated, SubscribeAck, ErrorNotice>;

enum class CommandKind { kSubscribe, kUnsubscribe, kClose };

struct ClientCommand {
  CommandKind kind;
  ResourceUri uri;
};

// 클라이언트 프레임 하나를 해석한다. 실패 시 error_code/error_message를 채우고 nullopt를 반환한다.
std::optional<ClientCommand> ParseClientFrame(std::string_view frame, std::string& error_code,
                                              std::string& error_message);

// 전송용 직렬화. 페이로드와 URI는 임의 바이트일 수 있으므로 잘못된 UTF-8 바이트는 U+FFFD로 바꾼다.
std::string DumpJson(const nlohmann::json& value);

nlohmann::json ToWsJson(const OutboundMessage& message);
std::string EncodeFrame(const OutboundMessage& message);

// 큐 바이트 한도 계산에 쓰는 메시지 크기(문자열 필드 합).
std::size_t MessageWeight(const OutboundMessage& message);

// 백엔드 변경 보고 레코드 한 줄을 해석한다.
std::optional<InvalidationEvent> ParseBackendRecord(std::string_view line, std::string& error_code,
                                                    std::string& error_message);
std::string EncodeBackendRecord(const InvalidationEvent& event);

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

}  // namespace consistency
