#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "consistency/config.hpp"

namespace {

consistency::CommandLineResult Apply(consistency::AppConfig& config, std::vector<const char*> args,
                                     std::string& error_message) {
  args.insert(args.begin(), "consistency-server");
  return consistency::ApplyCommandLine(config, static_cast<int>(args.size()), args.data(), error_message);
}

class ScopedEnv {
 public:
  ScopedEnv(const char* key, const char* value) : key_(key) { ::setenv(key, value, 1); }
  ~ScopedEnv() { ::unsetenv(key_); }

 private:
  const char* key_;
};

}  // namespace

TEST(ConfigTest, DefaultsMatchDocumentedPorts) {
  auto config = consistency::DefaultConfig();
  EXPECT_EQ(config.public_host, "0.0.0.0");
  EXPECT_EQ(config.public_port, 4691);
  EXPECT_EQ(config.backend_host, "127.0.0.1");
  EXPECT_EQ(config.backend_port, 1991);
  EXPECT_TRUE(config.ingest_coalesce);

  consistency::QueueLimits limits;
  consistency::LogLevel level = consistency::LogLevel::kDebug;
  std::string error;
  ASSERT_TRUE(consistency::ValidateConfig(config, limits, level, error)) << error;
  EXPECT_EQ(limits.max_messages, 64u);
  EXPECT_EQ(limits.max_bytes, 262144u);
  EXPECT_EQ(limits.policy, consistency::OverflowPolicy::kDropOldest);
  EXPECT_EQ(level, consistency::LogLevel::kInfo);
}

TEST(ConfigTest, CommandLineOverridesHostsAndPorts) {
  auto config = consistency::DefaultConfig();
  std::string error;
  auto result = Apply(config, {"-h", "127.0.0.1", "-p", "5000", "--backend-hostname", "10.0.0.2", "-c", "6000"},
                      error);
  ASSERT_EQ(result, consistency::CommandLineResult::kRun) << error;
  EXPECT_EQ(config.public_host, "127.0.0.1");
  EXPECT_EQ(config.public_port, 5000);
  EXPECT_EQ(config.backend_host, "10.0.0.2");
  EXPECT_EQ(config.backend_port, 6000);
}

TEST(ConfigTest, CommandLineErrors) {
  auto config = consistency::DefaultConfig();
  std::string error;
  EXPECT_EQ(Apply(config, {"--verbose"}, error), consistency::CommandLineResult::kError);
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(Apply(config, {"-p"}, error), consistency::CommandLineResult::kError);
  EXPECT_EQ(Apply(config, {"-p", "70000"}, error), consistency::CommandLineResult::kError);
  EXPECT_EQ(Apply(config, {"-c", "abc"}, error), consistency::CommandLineResult::kError);
  EXPECT_EQ(config.public_port, 4691);
  EXPECT_EQ(Apply(config, {"--help"}, error), consistency::CommandLineResult::kHelp);
}

TEST(ConfigTest, EnvironmentOverridesDefaults) {
  ScopedEnv port("PUBLIC_PORT", "14691");
  ScopedEnv policy("WS_OVERFLOW_POLICY", "close");
  ScopedEnv coalesce("INGEST_COALESCE", "0");
  ScopedEnv bad_limit("WS_QUEUE_LIMIT_MESSAGES", "many");

  auto config = consistency::LoadConfigFromEnv();
  EXPECT_EQ(config.public_port, 14691);
  EXPECT_EQ(config.ws_overflow_policy, "close");
  EXPECT_FALSE(config.ingest_coalesce);
  EXPECT_EQ(config.ws_queue_limit_messages, 64u);
}

TEST(ConfigTest, ValidateRejectsBadValues) {
  consistency::QueueLimits limits;
  consistency::LogLevel level = consistency::LogLevel::kInfo;
  std::string error;

  auto config = consistency::DefaultConfig();
  config.ws_overflow_policy = "block";
  EXPECT_FALSE(consistency::ValidateConfig(config, limits, level, error));

  config = consistency::DefaultConfig();
  config.log_level = "verbose";
  EXPECT_FALSE(consistency::ValidateConfig(config, limits, level, error));

  config = consistency::DefaultConfig();
  config.ws_queue_limit_bytes = 0;
  EXPECT_FALSE(consistency::ValidateConfig(config, limits, level, error));

  config = consistency::DefaultConfig();
  config.backend_host = config.public_host;
  config.backend_port = config.public_port;
  EXPECT_FALSE(consistency::ValidateConfig(config, limits, level, error));

  // 0번 포트는 양쪽 모두 임의 포트를 받으므로 충돌이 아니다.
  config.public_port = 0;
  config.backend_port = 0;
  EXPECT_TRUE(consistency::ValidateConfig(config, limits, level, error)) << error;
}

TEST(ConfigTest, UsageMentionsEveryFlag) {
  auto usage = consistency::UsageText("consistency-server");
  for (const char* flag : {"--public-hostname", "--public-port", "--backend-hostname", "--backend-port", "--help"}) {
    EXPECT_NE(usage.find(flag), std::string::npos) << flag;
  }
}
