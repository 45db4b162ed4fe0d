#include <memory>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "consistency/backend_ingest.hpp"

namespace {

struct IngestFixture {
  explicit IngestFixture(bool coalesce)
      : registry(std::make_shared<consistency::SubscriptionRegistry>()),
        connections(std::make_shared<consistency::ConnectionManager>(registry, consistency::QueueLimits{}, nullptr)),
        dispatcher(std::make_shared<consistency::Dispatcher>(registry, connections, nullptr)),
        ingest(std::make_shared<consistency::BackendIngest>(ioc, dispatcher, coalesce, nullptr)) {
    session = connections->Accept();
    connections->HandleCommand(session, consistency::ClientCommand{consistency::CommandKind::kSubscribe, "/doc"});
    connections->HandleCommand(session, consistency::ClientCommand{consistency::CommandKind::kSubscribe, "/other"});
    session->DrainAll();
  }

  bool Report(const std::string& uri, std::optional<std::string> payload) {
    std::string code;
    std::string message;
    return ingest->ReportChange(uri, std::move(payload), code, message);
  }

  std::vector<consistency::Invalidated> Delivered() {
    std::vector<consistency::Invalidated> out;
    for (auto& message : session->DrainAll()) {
      out.push_back(std::get<consistency::Invalidated>(message));
    }
    return out;
  }

  boost::asio::io_context ioc;
  std::shared_ptr<consistency::SubscriptionRegistry> registry;
  std::shared_ptr<consistency::ConnectionManager> connections;
  std::shared_ptr<consistency::Dispatcher> dispatcher;
  std::shared_ptr<consistency::BackendIngest> ingest;
  std::shared_ptr<consistency::Session> session;
};

}  // namespace

TEST(BackendIngestTest, CoalescesPendingReportsForSameUri) {
  IngestFixture fx(true);
  EXPECT_TRUE(fx.Report("/doc", std::string("v1")));
  EXPECT_TRUE(fx.Report("/other", std::nullopt));
  EXPECT_TRUE(fx.Report("/doc", std::string("v2")));
  EXPECT_TRUE(fx.Report("/doc", std::string("v3")));
  EXPECT_EQ(fx.ingest->PendingCount(), 2u);

  fx.ioc.run();

  auto delivered = fx.Delivered();
  ASSERT_EQ(delivered.size(), 2u);
  // 합쳐진 보고는 처음 접수된 자리를 유지하고 최신 페이로드를 싣는다.
  EXPECT_EQ(delivered[0].uri, "/doc");
  EXPECT_EQ(delivered[0].payload, std::optional<std::string>("v3"));
  EXPECT_EQ(delivered[1].uri, "/other");
  EXPECT_EQ(fx.ingest->PendingCount(), 0u);
}

TEST(BackendIngestTest, WithoutCoalescingEveryReportIsDelivered) {
  IngestFixture fx(false);
  fx.Report("/doc", std::string("v1"));
  fx.Report("/doc", std::string("v2"));
  fx.Report("/doc", std::string("v3"));
  EXPECT_FALSE(fx.ingest->Coalescing());

  fx.ioc.run();

  auto delivered = fx.Delivered();
  ASSERT_EQ(delivered.size(), 3u);
  EXPECT_EQ(delivered[0].payload, std::optional<std::string>("v1"));
  EXPECT_EQ(delivered[2].payload, std::optional<std::string>("v3"));
}

TEST(BackendIngestTest, ReportAfterDrainIsDeliveredAgain) {
  IngestFixture fx(true);
  fx.Report("/doc", std::nullopt);
  fx.ioc.run();
  EXPECT_EQ(fx.Delivered().size(), 1u);

  fx.ioc.restart();
  fx.Report("/doc", std::nullopt);
  fx.ioc.run();
  EXPECT_EQ(fx.Delivered().size(), 1u);
}

TEST(BackendIngestTest, RejectsEmptyUri) {
  IngestFixture fx(true);
  std::string code;
  std::string message;
  EXPECT_FALSE(fx.ingest->ReportChange("", std::nullopt, code, message));
  EXPECT_EQ(code, "invalid_uri");
  EXPECT_EQ(fx.ingest->PendingCount(), 0u);
}

TEST(BackendIngestTest, StopDispatchesAcceptedReportsThenRefuses) {
  IngestFixture fx(true);
  ASSERT_TRUE(fx.Report("/doc", std::string("v1")));
  ASSERT_TRUE(fx.Report("/other", std::nullopt));
  ASSERT_TRUE(fx.Report("/doc", std::string("v2")));

  // io_context를 돌리지 않아도 Stop이 대기 중인 보고를 직접 디스패치한다.
  fx.ingest->Stop();
  EXPECT_EQ(fx.ingest->PendingCount(), 0u);
  auto delivered = fx.Delivered();
  ASSERT_EQ(delivered.size(), 2u);
  EXPECT_EQ(delivered[0].uri, "/doc");
  EXPECT_EQ(delivered[0].payload, std::optional<std::string>("v2"));
  EXPECT_EQ(delivered[1].uri, "/other");

  std::string code;
  std::string message;
  EXPECT_FALSE(fx.ingest->ReportChange("/doc", std::nullopt, code, message));
  EXPECT_EQ(code, "backend_unavailable");

  // 먼저 예약된 Drain은 아무것도 다시 보내지 않는다.
  fx.ioc.run();
  EXPECT_TRUE(fx.Delivered().empty());
  fx.ingest->Stop();
}

TEST(BackendIngestTest, BinaryPayloadIsDeliveredAndEncodable) {
  std::ostringstream sink;
  auto obs = std::make_shared<consistency::Observability>(consistency::LogLevel::kDebug, &sink);
  IngestFixture fx(true);
  fx.ingest = std::make_shared<consistency::BackendIngest>(fx.ioc, fx.dispatcher, true, obs);
  fx.connections->HandleCommand(fx.session,
                                consistency::ClientCommand{consistency::CommandKind::kSubscribe, "/img/\xff"});
  fx.session->DrainAll();

  const std::string binary("\x89PNG\xff\xfe", 6);
  ASSERT_TRUE(fx.Report("/img/\xff", binary));
  fx.ioc.run();

  auto queued = fx.session->DrainAll();
  ASSERT_EQ(queued.size(), 1u);
  EXPECT_EQ(std::get<consistency::Invalidated>(queued[0]).payload, std::optional<std::string>(binary));
  std::string frame;
  ASSERT_NO_THROW(frame = consistency::EncodeFrame(queued[0]));
  EXPECT_EQ(nlohmann::json::parse(frame)["message"], "invalidate");
  EXPECT_NE(sink.str().find("backend.change_reported"), std::string::npos);
}
