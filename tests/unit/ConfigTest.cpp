#include "app/Config.h"

#include <cstdlib>
#include <gtest/gtest.h>

TEST(Config, DefaultsWhenSectionsAreMissing) {
  Config config;
  ASSERT_TRUE(config.loadFromNode(YAML::Load("log_level: DEBUG")));
  EXPECT_EQ(config.server.port, 8443);
  EXPECT_EQ(config.server.maxConnections, 100u);
  EXPECT_GT(config.server.threads, 0);
  EXPECT_EQ(config.audio.sampleRate, 16000);
  EXPECT_DOUBLE_EQ(config.vad.silenceDurationS, 0.8);
  EXPECT_EQ(config.backend.mode, BackendSettings::Mode::RIVA);
  EXPECT_EQ(config.session.partialPolicy, SessionSettings::PartialPolicy::REPLACE);
  EXPECT_EQ(config.logLevel, "DEBUG");
  EXPECT_TRUE(config.validate());
}

TEST(Config, ParsesEverySection) {
  Config config;
  ASSERT_TRUE(config.loadFromNode(YAML::Load(R"(
server:
  port: 9000
  max_connections: 5
  idle_timeout_s: 10
  max_pending_messages: 32
audio:
  max_segment_duration_s: 12.5
vad:
  threshold: 0.1
  silence_duration_s: 0.4
backend:
  mode: synthetic
  target: "riva:50051"
  max_retries: 5
  degraded_mode: synthetic
  synthetic_text: "hi there"
session:
  drain_timeout_ms: 500
  partial_policy: monotonic
)")));
  EXPECT_EQ(config.server.port, 9000);
  EXPECT_EQ(config.server.maxConnections, 5u);
  EXPECT_EQ(config.server.idleTimeoutS, 10);
  EXPECT_EQ(config.server.maxPendingMessages, 32u);
  EXPECT_DOUBLE_EQ(config.audio.maxSegmentDurationS, 12.5);
  EXPECT_DOUBLE_EQ(config.vad.threshold, 0.1);
  EXPECT_EQ(config.backend.mode, BackendSettings::Mode::SYNTHETIC);
  EXPECT_EQ(config.backend.target, "riva:50051");
  EXPECT_EQ(config.backend.maxRetries, 5);
  EXPECT_EQ(config.backend.degradedMode, BackendSettings::DegradedMode::SYNTHETIC);
  EXPECT_EQ(config.backend.syntheticText, "hi there");
  EXPECT_EQ(config.session.drainTimeoutMs, 500);
  EXPECT_EQ(config.session.partialPolicy, SessionSettings::PartialPolicy::MONOTONIC);
}

TEST(Config, RejectsOtherAudioFormats) {
  Config config;
  ASSERT_TRUE(config.loadFromNode(YAML::Load("audio:\n  sample_rate: 8000\n")));
  EXPECT_FALSE(config.validate());
}

TEST(Config, EnvironmentOverridesFile) {
  Config config;
  ASSERT_TRUE(config.loadFromNode(YAML::Load("backend:\n  target: \"riva:50051\"\n")));

  setenv("APP_PORT", "7000", 1);
  setenv("RIVA_PORT", "50052", 1);
  setenv("WS_MAX_CONNECTIONS", "3", 1);
  config.applyEnvironment();
  unsetenv("APP_PORT");
  unsetenv("RIVA_PORT");
  unsetenv("WS_MAX_CONNECTIONS");

  EXPECT_EQ(config.server.port, 7000);
  EXPECT_EQ(config.backend.target, "riva:50052");
  EXPECT_EQ(config.server.maxConnections, 3u);
}

TEST(Config, MissingFileFailsToLoad) {
  Config config;
  EXPECT_FALSE(config.load("/nonexistent/bridge.yaml"));
}

TEST(Config, RejectsEmptyOutboundQueue) {
  Config config;
  ASSERT_TRUE(config.loadFromNode(YAML::Load("server:\n  max_pending_messages: 0\n")));
  EXPECT_FALSE(config.validate());
}
