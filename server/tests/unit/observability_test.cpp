#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "consistency/observability.hpp"

TEST(ObservabilityTest, WritesOneJsonLinePerEvent) {
  std::ostringstream sink;
  consistency::Observability obs(consistency::LogLevel::kInfo, &sink);

  obs.Log(consistency::LogContext{.level = consistency::LogLevel::kWarn,
                                  .name = "protocol.error",
                                  .session_id = 12,
                                  .uri = std::string("/a"),
                                  .detail = "bad_request: x"});

  auto line = sink.str();
  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  auto parsed = nlohmann::json::parse(line);
  EXPECT_EQ(parsed["level"], "warn");
  EXPECT_EQ(parsed["eventName"], "protocol.error");
  EXPECT_EQ(parsed["sessionId"], 12);
  EXPECT_EQ(parsed["uri"], "/a");
  EXPECT_EQ(parsed["detail"], "bad_request: x");
  EXPECT_FALSE(parsed.contains("traceId"));
}

TEST(ObservabilityTest, SuppressesEventsBelowMinimumLevel) {
  std::ostringstream sink;
  consistency::Observability obs(consistency::LogLevel::kWarn, &sink);

  obs.Log(consistency::LogContext{.level = consistency::LogLevel::kDebug, .name = "subscription.added"});
  obs.Log(consistency::LogContext{.level = consistency::LogLevel::kInfo, .name = "session.accepted"});
  EXPECT_TRUE(sink.str().empty());
  EXPECT_FALSE(obs.Enabled(consistency::LogLevel::kInfo));
  EXPECT_TRUE(obs.Enabled(consistency::LogLevel::kError));
}

TEST(ObservabilityTest, CountersAccumulate) {
  consistency::Observability obs(consistency::LogLevel::kError);
  obs.IncrementAccepted();
  obs.IncrementAccepted();
  obs.SetWebsocketActive(1);
  obs.AddDelivered(5);
  obs.AddDropped(2);
  obs.IncrementBackendReport();
  obs.IncrementBackendRejected();

  auto snapshot = obs.Snapshot();
  EXPECT_EQ(snapshot.connections_accepted, 2u);
  EXPECT_EQ(snapshot.websocket_active, 1u);
  EXPECT_EQ(snapshot.invalidations_delivered, 5u);
  EXPECT_EQ(snapshot.messages_dropped, 2u);
  EXPECT_EQ(snapshot.backend_reports, 1u);
  EXPECT_EQ(snapshot.backend_rejected, 1u);
}

TEST(ObservabilityTest, TraceIdsAreDistinct) {
  consistency::Observability obs;
  EXPECT_NE(obs.NextTraceId(), obs.NextTraceId());
}

TEST(LogLevelTest, ParsesNames) {
  EXPECT_EQ(consistency::ParseLogLevel("debug"), consistency::LogLevel::kDebug);
  EXPECT_EQ(consistency::ParseLogLevel("warning"), consistency::LogLevel::kWarn);
  EXPECT_FALSE(consistency::ParseLogLevel("trace").has_value());
}
