#include "TestSupport.h"
#include "asr/RecognitionSessionClient.h"
#include "asr/SyntheticBackend.h"

#include <gtest/gtest.h>

using namespace testing_support;
using namespace std::chrono_literals;

namespace {

struct Failure {
  uint64_t sequence;
  ErrorKind kind;
  std::string detail;
};

// Collects everything the client reports.
struct Recorder {
  std::mutex mutex;
  std::vector<RecognitionResult> partials;
  std::vector<RecognitionResult> finals;
  std::vector<Failure> failures;
  std::vector<std::string> degraded;

  void attach(RecognitionSessionClient &client) {
    client.setResultCallback([this](const RecognitionResult &r) {
      std::lock_guard<std::mutex> lock(mutex);
      (r.isFinal ? finals : partials).push_back(r);
    });
    client.setFailureCallback([this](uint64_t seq, ErrorKind kind,
                                     const std::string &detail) {
      std::lock_guard<std::mutex> lock(mutex);
      failures.push_back({seq, kind, detail});
    });
    client.setDegradedCallback([this](const std::string &detail) {
      std::lock_guard<std::mutex> lock(mutex);
      degraded.push_back(detail);
    });
  }

  size_t finalCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return finals.size();
  }
  size_t failureCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return failures.size();
  }
};

AudioSegment segmentOf(uint64_t sequence, double seconds) {
  AudioSegment s;
  s.sequence = sequence;
  s.frames = speech(seconds);
  s.reason = SealReason::SILENCE;
  return s;
}

class RecognitionSessionClientTest : public ::testing::Test {
protected:
  RecognitionSessionClientTest() {
    settings_.retryInitialDelayMs = 100;
    settings_.retryMaxDelayMs = 400;
    settings_.maxRetries = 2;
    settings_.requestTimeoutMs = 2000;
    backend_ = std::make_shared<ScriptedBackend>();
  }

  std::unique_ptr<RecognitionSessionClient>
  make(std::shared_ptr<RecognitionBackend> fallback = nullptr) {
    auto client = std::make_unique<RecognitionSessionClient>(backend_, fallback,
                                                             settings_, "test");
    recorder_.attach(*client);
    client->open(StreamOptions{});
    return client;
  }

  BackendSettings settings_;
  std::shared_ptr<ScriptedBackend> backend_;
  Recorder recorder_;
};

} // namespace

TEST_F(RecognitionSessionClientTest, DeliversPartialsThenOneFinal) {
  ScriptedBackend::Script script;
  script.partials = {"hel", "hello"};
  script.text = "hello there";
  backend_->setDefault(script);

  auto client = make();
  ASSERT_TRUE(client->send(segmentOf(1, 0.2)));
  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 1; }));

  std::lock_guard<std::mutex> lock(recorder_.mutex);
  ASSERT_EQ(recorder_.partials.size(), 2u);
  EXPECT_EQ(recorder_.partials[1].text, "hello");
  EXPECT_EQ(recorder_.partials[1].sequence, 1u);
  EXPECT_EQ(recorder_.finals[0].text, "hello there");
  EXPECT_EQ(recorder_.finals[0].sequence, 1u);
  EXPECT_TRUE(recorder_.failures.empty());
}

TEST_F(RecognitionSessionClientTest, RetryAfterFailedConnectStillDeliversOnce) {
  backend_->failOpens(1);
  auto client = make();
  ASSERT_TRUE(client->send(segmentOf(1, 0.2)));

  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 1; }));
  std::this_thread::sleep_for(200ms);

  std::lock_guard<std::mutex> lock(recorder_.mutex);
  ASSERT_EQ(recorder_.finals.size(), 1u);
  EXPECT_GE(recorder_.finals[0].latency.count(), settings_.retryInitialDelayMs);
  EXPECT_TRUE(recorder_.failures.empty());
  EXPECT_EQ(backend_->opens(), 2);
}

TEST_F(RecognitionSessionClientTest, ExhaustedRetriesReportBackendUnavailable) {
  backend_->failOpens(100);
  auto client = make();
  ASSERT_TRUE(client->send(segmentOf(1, 0.2)));

  ASSERT_TRUE(waitFor([&] { return recorder_.failureCount() == 1; }));
  std::lock_guard<std::mutex> lock(recorder_.mutex);
  EXPECT_EQ(recorder_.failures[0].sequence, 1u);
  EXPECT_EQ(recorder_.failures[0].kind, ErrorKind::BackendUnavailable);
  EXPECT_TRUE(recorder_.finals.empty());
  EXPECT_EQ(backend_->opens(), settings_.maxRetries + 1);
}

TEST_F(RecognitionSessionClientTest, DegradedModeServesMarkedSyntheticText) {
  backend_->failOpens(100);
  settings_.maxRetries = 0;
  settings_.degradedMode = BackendSettings::DegradedMode::SYNTHETIC;
  BackendSettings synthetic = settings_;
  synthetic.syntheticText = "fallback";
  synthetic.syntheticLatencyMs = 10;
  auto client = make(std::make_shared<SyntheticBackend>(synthetic, "[synthetic] "));

  ASSERT_TRUE(client->send(segmentOf(1, 0.2)));
  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 1; }));
  ASSERT_TRUE(client->send(segmentOf(2, 0.2)));
  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 2; }));

  std::lock_guard<std::mutex> lock(recorder_.mutex);
  EXPECT_EQ(recorder_.finals[0].text, "[synthetic] fallback");
  EXPECT_EQ(recorder_.finals[1].text, "[synthetic] fallback");
  // Announced once, not per segment.
  EXPECT_EQ(recorder_.degraded.size(), 1u);
  EXPECT_TRUE(recorder_.failures.empty());
}

TEST_F(RecognitionSessionClientTest, TimeoutFailsOnlyThatSegment) {
  settings_.requestTimeoutMs = 150;
  ScriptedBackend::Script hang;
  hang.behaviour = ScriptedBackend::Behaviour::HANG;
  backend_->push(hang);

  auto client = make();
  ASSERT_TRUE(client->send(segmentOf(1, 0.2)));
  ASSERT_TRUE(client->send(segmentOf(2, 0.2)));

  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 1; }));
  std::lock_guard<std::mutex> lock(recorder_.mutex);
  ASSERT_EQ(recorder_.failures.size(), 1u);
  EXPECT_EQ(recorder_.failures[0].sequence, 1u);
  EXPECT_EQ(recorder_.failures[0].kind, ErrorKind::SegmentTimeout);
  EXPECT_EQ(recorder_.finals[0].sequence, 2u);
}

TEST_F(RecognitionSessionClientTest, BrokenStreamIsNotReplayed) {
  ScriptedBackend::Script broken;
  broken.behaviour = ScriptedBackend::Behaviour::BREAK;
  backend_->push(broken);

  auto client = make();
  ASSERT_TRUE(client->send(segmentOf(1, 0.2)));
  ASSERT_TRUE(client->send(segmentOf(2, 0.2)));

  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 1; }));
  std::lock_guard<std::mutex> lock(recorder_.mutex);
  ASSERT_EQ(recorder_.failures.size(), 1u);
  EXPECT_EQ(recorder_.failures[0].sequence, 1u);
  EXPECT_EQ(recorder_.failures[0].kind, ErrorKind::TransportError);
  EXPECT_EQ(recorder_.finals[0].sequence, 2u);
  // One call per segment: the broken one was not retried.
  EXPECT_EQ(backend_->opens(), 2);
}

TEST_F(RecognitionSessionClientTest, FullQueueRejectsWithBusy) {
  settings_.maxPendingSegments = 1;
  auto client = make();

  // Left open so the worker keeps streaming it.
  auto first = client->beginSegment(1);
  ASSERT_TRUE(first);
  ASSERT_TRUE(waitFor([&] {
    return client->state() == RecognitionSessionClient::State::STREAMING;
  }));

  auto second = client->beginSegment(2);
  ASSERT_TRUE(second);
  EXPECT_EQ(client->queuedSegments(), 1u);
  EXPECT_FALSE(client->beginSegment(3));

  first->seal();
  second->seal();
  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 2; }));
}

TEST_F(RecognitionSessionClientTest, IncrementalAudioFlowsBeforeSeal) {
  auto client = make();
  auto ticket = client->beginSegment(1);
  ASSERT_TRUE(ticket);
  for (const auto &f : speech(0.2))
    ticket->append(f);
  ASSERT_TRUE(waitFor([&] { return backend_->opens() == 1; }));
  EXPECT_EQ(recorder_.finalCount(), 0u);

  ticket->seal();
  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 1; }));
}

TEST_F(RecognitionSessionClientTest, CloseCancelsCallInFlight) {
  ScriptedBackend::Script hang;
  hang.behaviour = ScriptedBackend::Behaviour::HANG;
  backend_->setDefault(hang);
  settings_.requestTimeoutMs = 60000;

  auto client = make();
  ASSERT_TRUE(client->send(segmentOf(1, 0.2)));
  ASSERT_TRUE(waitFor([&] {
    return client->state() == RecognitionSessionClient::State::CLOSING;
  }));

  auto started = Clock::now();
  EXPECT_TRUE(client->close(1000ms));
  EXPECT_LT(Clock::now() - started, 1000ms);
  EXPECT_FALSE(client->beginSegment(2));
  EXPECT_EQ(recorder_.finalCount(), 0u);
  EXPECT_EQ(recorder_.failureCount(), 0u);
}

TEST_F(RecognitionSessionClientTest, SilentBackendTimesOutBeforeSeal) {
  settings_.requestTimeoutMs = 150;
  backend_->setPartialsWhileStreaming(true);
  ScriptedBackend::Script hang;
  hang.behaviour = ScriptedBackend::Behaviour::HANG;
  backend_->push(hang);

  auto client = make();
  auto ticket = client->beginSegment(1);
  ASSERT_TRUE(ticket);

  // Audio keeps arriving well past the timeout and the segment stays open.
  bool failedWhileStreaming = false;
  for (const auto &f : speech(1.0)) {
    ticket->append(f);
    std::this_thread::sleep_for(20ms);
    if (recorder_.failureCount() > 0) {
      failedWhileStreaming = true;
      break;
    }
  }
  EXPECT_TRUE(failedWhileStreaming);
  {
    std::lock_guard<std::mutex> lock(recorder_.mutex);
    ASSERT_EQ(recorder_.failures.size(), 1u);
    EXPECT_EQ(recorder_.failures[0].sequence, 1u);
    EXPECT_EQ(recorder_.failures[0].kind, ErrorKind::SegmentTimeout);
  }

  // Sealing late is harmless and the next segment is served.
  ticket->seal();
  ASSERT_TRUE(client->send(segmentOf(2, 0.2)));
  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 1; }));
  std::lock_guard<std::mutex> lock(recorder_.mutex);
  EXPECT_EQ(recorder_.finals[0].sequence, 2u);
  EXPECT_EQ(recorder_.failures.size(), 1u);
}

TEST_F(RecognitionSessionClientTest, AnsweringBackendIsNotTimedOutWhileStreaming) {
  settings_.requestTimeoutMs = 150;
  backend_->setPartialsWhileStreaming(true);
  auto client = make();
  ASSERT_TRUE(client->send(segmentOf(1, 0.2)));
  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 1; }));
  EXPECT_EQ(recorder_.failureCount(), 0u);
}

TEST_F(RecognitionSessionClientTest, RetryBeforeSealCountsTowardsLatency) {
  settings_.retryInitialDelayMs = 300;
  backend_->failOpens(1);
  auto client = make();

  auto ticket = client->beginSegment(1);
  ASSERT_TRUE(ticket);
  for (const auto &f : speech(0.2))
    ticket->append(f);
  // The call is up before the segment ends.
  ASSERT_TRUE(waitFor([&] {
    return client->state() == RecognitionSessionClient::State::STREAMING;
  }));
  ticket->seal();

  ASSERT_TRUE(waitFor([&] { return recorder_.finalCount() == 1; }));
  std::lock_guard<std::mutex> lock(recorder_.mutex);
  EXPECT_GE(recorder_.finals[0].latency.count(), 300);
  EXPECT_EQ(backend_->opens(), 2);
}

TEST_F(RecognitionSessionClientTest, CancelDoesNotWaitForWorker) {
  backend_->setOpenDelay(800ms);
  auto client = make();
  ASSERT_TRUE(client->beginSegment(1));
  ASSERT_TRUE(waitFor([&] { return backend_->opens() == 1; }));

  auto started = Clock::now();
  client->cancel();
  EXPECT_LT(Clock::now() - started, 200ms);
  EXPECT_FALSE(client->stopped());
  EXPECT_FALSE(client->beginSegment(2));

  ASSERT_TRUE(waitFor([&] { return client->stopped(); }));
  EXPECT_TRUE(client->close(0ms));
}
