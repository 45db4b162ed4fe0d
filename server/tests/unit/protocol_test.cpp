#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "consistency/protocol.hpp"

namespace {

struct ParseFailure {
  std::string code;
  std::string message;
};

ParseFailure ExpectClientFrameRejected(const std::string& frame) {
  ParseFailure failure;
  auto command = consistency::ParseClientFrame(frame, failure.code, failure.message);
  EXPECT_FALSE(command.has_value()) << frame;
  EXPECT_FALSE(failure.message.empty());
  return failure;
}

}  // namespace

TEST(ClientFrameTest, ParsesSubscribeAndUnsubscribe) {
  std::string code;
  std::string message;
  auto subscribe =
      consistency::ParseClientFrame(R"({"v":1,"message":"subscribe","data":{"uri":"/orders/42"}})", code, message);
  ASSERT_TRUE(subscribe.has_value()) << code;
  EXPECT_EQ(subscribe->kind, consistency::CommandKind::kSubscribe);
  EXPECT_EQ(subscribe->uri, "/orders/42");

  auto unsubscribe =
      consistency::ParseClientFrame(R"({"v":1,"message":"unsubscribe","data":{"uri":"/orders/42"}})", code, message);
  ASSERT_TRUE(unsubscribe.has_value()) << code;
  EXPECT_EQ(unsubscribe->kind, consistency::CommandKind::kUnsubscribe);
}

TEST(ClientFrameTest, AcceptsLegacyWatchWithoutVersion) {
  std::string code;
  std::string message;
  auto command = consistency::ParseClientFrame(R"({"message":"watch","data":{"uri":"my_uri"}})", code, message);
  ASSERT_TRUE(command.has_value()) << code;
  EXPECT_EQ(command->kind, consistency::CommandKind::kSubscribe);
  EXPECT_EQ(command->uri, "my_uri");
}

TEST(ClientFrameTest, ParsesClose) {
  std::string code;
  std::string message;
  auto command = consistency::ParseClientFrame(R"({"v":1,"message":"close"})", code, message);
  ASSERT_TRUE(command.has_value());
  EXPECT_EQ(command->kind, consistency::CommandKind::kClose);
}

TEST(ClientFrameTest, RejectsMalformedFrames) {
  EXPECT_EQ(ExpectClientFrameRejected("not json").code, "bad_request");
  EXPECT_EQ(ExpectClientFrameRejected("[1,2]").code, "bad_request");
  EXPECT_EQ(ExpectClientFrameRejected(R"({"data":{"uri":"/a"}})").code, "bad_request");
  EXPECT_EQ(ExpectClientFrameRejected(R"({"message":"subscribe"})").code, "bad_request");
  EXPECT_EQ(ExpectClientFrameRejected(R"({"message":"subscribe","data":{"uri":7}})").code, "bad_request");
  EXPECT_EQ(ExpectClientFrameRejected(R"({"message":"subscribe","data":{"uri":""}})").code, "invalid_uri");
  EXPECT_EQ(ExpectClientFrameRejected(R"({"message":"publish","data":{"uri":"/a"}})").code, "unknown_message");
  EXPECT_EQ(ExpectClientFrameRejected(R"({"v":2,"message":"subscribe","data":{"uri":"/a"}})").code,
            "unsupported_version");
  EXPECT_EQ(ExpectClientFrameRejected(R"({"v":"1","message":"subscribe","data":{"uri":"/a"}})").code,
            "unsupported_version");
}

TEST(OutboundFrameTest, EncodesEachMessageKind) {
  auto invalidated = nlohmann::json::parse(consistency::EncodeFrame(consistency::Invalidated{"/w/1", std::nullopt}));
  EXPECT_EQ(invalidated["v"], 1);
  EXPECT_EQ(invalidated["message"], "invalidate");
  EXPECT_EQ(invalidated["data"]["uri"], "/w/1");
  EXPECT_FALSE(invalidated["data"].contains("payload"));

  auto with_payload =
      nlohmann::json::parse(consistency::EncodeFrame(consistency::Invalidated{"/w/1", std::string("rev=3")}));
  EXPECT_EQ(with_payload["data"]["payload"], "rev=3");

  auto ack = nlohmann::json::parse(consistency::EncodeFrame(consistency::SubscribeAck{"/w/1"}));
  EXPECT_EQ(ack["message"], "ack");
  EXPECT_EQ(ack["data"]["uri"], "/w/1");

  auto error = nlohmann::json::parse(consistency::EncodeFrame(consistency::ErrorNotice{"bad_request", "이유"}));
  EXPECT_EQ(error["message"], "error");
  EXPECT_EQ(error["data"]["code"], "bad_request");
  EXPECT_EQ(error["data"]["reason"], "이유");
}

TEST(OutboundFrameTest, BinaryPayloadIsEncodedWithReplacementCharacters) {
  const std::string binary("\x89PNG\xff\xfe", 6);
  std::string frame;
  ASSERT_NO_THROW(frame = consistency::EncodeFrame(consistency::Invalidated{"/img/1", binary}));
  auto parsed = nlohmann::json::parse(frame);
  EXPECT_EQ(parsed["data"]["uri"], "/img/1");
  // 잘못된 바이트 하나마다 U+FFFD 하나로 바뀐다.
  EXPECT_EQ(parsed["data"]["payload"], "\xEF\xBF\xBDPNG\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(BackendRecordTest, BinaryPayloadAndUriDoNotThrow) {
  const std::string binary("\xff\x00\x01", 3);
  std::string line;
  ASSERT_NO_THROW(line = consistency::EncodeBackendRecord(consistency::InvalidationEvent{"/raw/\xc3", binary}));
  std::string code;
  std::string message;
  auto event = consistency::ParseBackendRecord(line, code, message);
  ASSERT_TRUE(event.has_value()) << code;
  EXPECT_EQ(event->uri, "/raw/\xEF\xBF\xBD");
  ASSERT_TRUE(event->payload.has_value());
  EXPECT_EQ(event->payload->size(), 5u);
}

TEST(BackendRecordTest, ParsesUpdateRecordWithoutVersion) {
  std::string code;
  std::string message;
  auto event = consistency::ParseBackendRecord(R"({"message": "update", "data":{"uri": "uri1"}})", code, message);
  ASSERT_TRUE(event.has_value()) << code;
  EXPECT_EQ(event->uri, "uri1");
  EXPECT_FALSE(event->payload.has_value());
}

TEST(BackendRecordTest, KeepsPayloadOpaque) {
  std::string code;
  std::string message;
  auto text = consistency::ParseBackendRecord(R"({"message":"update","data":{"uri":"/a","payload":"v2"}})" "\r",
                                              code, message);
  ASSERT_TRUE(text.has_value()) << code;
  EXPECT_EQ(*text->payload, "v2");

  auto object = consistency::ParseBackendRecord(R"({"message":"update","data":{"uri":"/a","payload":{"rev":3}}})",
                                                code, message);
  ASSERT_TRUE(object.has_value()) << code;
  EXPECT_EQ(nlohmann::json::parse(*object->payload), (nlohmann::json{{"rev", 3}}));
}

TEST(BackendRecordTest, RejectsUnknownMessages) {
  std::string code;
  std::string message;
  EXPECT_FALSE(consistency::ParseBackendRecord(R"({"message":"delete","data":{"uri":"/a"}})", code, message));
  EXPECT_EQ(code, "unknown_message");
  EXPECT_FALSE(consistency::ParseBackendRecord(R"({"message":"update","data":{}})", code, message));
  EXPECT_EQ(code, "bad_request");
}

TEST(BackendRecordTest, EncodedRecordParsesBack) {
  std::string code;
  std::string message;
  auto line = consistency::EncodeBackendRecord(consistency::InvalidationEvent{"/orders/42", std::string("p")});
  auto event = consistency::ParseBackendRecord(line, code, message);
  ASSERT_TRUE(event.has_value()) << code;
  EXPECT_EQ(event->uri, "/orders/42");
  EXPECT_EQ(*event->payload, "p");
}

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = consistency::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = consistency::MakeErrorEnvelope("backend_unavailable", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "backend_unavailable");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}
