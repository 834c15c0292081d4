#include "TestSupport.h"
#include "asr/SyntheticBackend.h"
#include "session/TranscriptionSession.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <set>

using namespace testing_support;
using namespace std::chrono_literals;

namespace {

ControlMessage start() {
  return ControlMessage::parse(R"({"type":"start_recording","config":{"sample_rate":16000}})");
}

class TranscriptionSessionTest : public ::testing::Test {
protected:
  TranscriptionSessionTest() {
    config_.vad.silenceDurationS = 0.3;
    config_.backend.retryInitialDelayMs = 50;
    config_.session.drainTimeoutMs = 5000;
    backend_ = std::make_shared<ScriptedBackend>();
    out_ = std::make_shared<CapturingTransport>();
  }

  std::shared_ptr<TranscriptionSession>
  make(std::shared_ptr<RecognitionBackend> backend = nullptr) {
    auto out = out_;
    auto session = std::make_shared<TranscriptionSession>(
        "test", AudioFormat{}, config_, backend ? backend : backend_, nullptr,
        [out](const std::string &json) { out->sendText(json); });
    session->init();
    return session;
  }

  void feed(TranscriptionSession &session, const std::vector<AudioFrame> &frames) {
    for (const auto &f : frames)
      session.onAudio(f);
  }

  void utterances(TranscriptionSession &session, int n) {
    for (int i = 0; i < n; ++i) {
      feed(session, speech(0.3));
      feed(session, quiet(0.5));
    }
  }

  // Message types in the order they were sent.
  std::vector<std::string> types() {
    std::vector<std::string> out;
    for (auto &m : out_->messages())
      out.push_back(m["type"]);
    return out;
  }

  Config config_;
  std::shared_ptr<ScriptedBackend> backend_;
  std::shared_ptr<CapturingTransport> out_;
};

} // namespace

TEST_F(TranscriptionSessionTest, FramesOutsideRecordingAreDropped) {
  auto session = make();
  EXPECT_FALSE(session->onAudio(speech(0.02)[0]));
  EXPECT_TRUE(out_->messages().empty());
  EXPECT_EQ(session->counters().droppedFrames, 1u);
}

TEST_F(TranscriptionSessionTest, SegmentIdsAreGaplessAndOrdered) {
  auto session = make();
  session->startRecording(start());
  utterances(*session, 3);
  session->stopRecording();

  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));
  auto finals = out_->ofType("transcription");
  ASSERT_EQ(finals.size(), 3u);
  for (size_t i = 0; i < finals.size(); ++i)
    EXPECT_EQ(finals[i]["segment_id"], i + 1);
  EXPECT_EQ(out_->ofType("recording_stopped")[0]["total_segments"], 3);
}

TEST_F(TranscriptionSessionTest, StopWaitsForOutstandingSegments) {
  ScriptedBackend::Script slow;
  slow.latency = 300ms;
  backend_->setDefault(slow);

  auto session = make();
  session->startRecording(start());
  feed(*session, speech(0.5));
  session->stopRecording();

  EXPECT_EQ(session->state(), TranscriptionSession::State::DRAINING);
  EXPECT_EQ(out_->count("recording_stopped"), 0u);

  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));
  auto order = types();
  auto final = std::find(order.begin(), order.end(), "transcription");
  auto stopped = std::find(order.begin(), order.end(), "recording_stopped");
  ASSERT_NE(final, order.end());
  EXPECT_LT(final, stopped);
  EXPECT_EQ(session->state(), TranscriptionSession::State::READY);
}

TEST_F(TranscriptionSessionTest, NoPartialAfterItsFinal) {
  ScriptedBackend::Script script;
  script.partials = {"a", "a b", "a b c"};
  script.text = "a b c d";
  backend_->setDefault(script);

  auto session = make();
  session->startRecording(start());
  utterances(*session, 3);
  session->stopRecording();
  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));

  std::set<int> finished;
  for (auto &m : out_->messages()) {
    if (m["type"] == "transcription")
      finished.insert(m["segment_id"].get<int>());
    if (m["type"] == "partial")
      EXPECT_EQ(finished.count(m["segment_id"].get<int>()), 0u);
  }
  EXPECT_EQ(finished.size(), 3u);
  EXPECT_EQ(out_->count("partial"), 9u);
}

TEST_F(TranscriptionSessionTest, DuplicateStartIsNoOp) {
  auto session = make();
  session->startRecording(start());
  session->startRecording(start());
  EXPECT_EQ(out_->count("recording_started"), 1u);
  EXPECT_EQ(session->state(), TranscriptionSession::State::RECORDING);

  // Stop while ready is equally harmless.
  session->stopRecording();
  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));
  session->stopRecording();
  EXPECT_EQ(out_->count("recording_stopped"), 1u);
}

TEST_F(TranscriptionSessionTest, MismatchedSampleRateIsFormatError) {
  auto session = make();
  try {
    session->startRecording(ControlMessage::parse(
        R"({"type":"start_recording","config":{"sample_rate":44100}})"));
    FAIL() << "expected FormatError";
  } catch (const BridgeError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::FormatError);
  }
  EXPECT_EQ(session->state(), TranscriptionSession::State::READY);
}

TEST_F(TranscriptionSessionTest, SummaryConcatenatesFinalsDespiteJitter) {
  config_.backend.syntheticText = "hello world";
  config_.backend.syntheticLatencyMs = 5;
  config_.backend.syntheticJitterMs = 60;
  auto session = make(std::make_shared<SyntheticBackend>(config_.backend));

  session->startRecording(start());
  utterances(*session, 4);
  session->stopRecording();

  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));
  auto summary = out_->ofType("recording_stopped")[0];
  EXPECT_EQ(summary["final_transcript"],
            "hello world hello world hello world hello world");
  EXPECT_EQ(summary["total_segments"], 4);
  EXPECT_NEAR(summary["total_duration"].get<double>(), 3.2, 0.01);
}

TEST_F(TranscriptionSessionTest, ThreeSecondToneGivesOneSegmentAndOneFinal) {
  auto session = make();
  session->startRecording(start());
  feed(*session, speech(3.0));
  session->stopRecording();

  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));
  EXPECT_EQ(out_->count("transcription"), 1u);
  auto summary = out_->ofType("recording_stopped")[0];
  EXPECT_EQ(summary["total_segments"], 1);
  EXPECT_EQ(summary["final_transcript"], "scripted words");
}

TEST_F(TranscriptionSessionTest, SilentRecordingGivesEmptySummary) {
  auto session = make();
  session->startRecording(start());
  feed(*session, quiet(1.0));
  session->stopRecording();

  ASSERT_EQ(out_->count("recording_stopped"), 1u);
  auto summary = out_->ofType("recording_stopped")[0];
  EXPECT_EQ(summary["final_transcript"], "");
  EXPECT_EQ(summary["total_segments"], 0);
  EXPECT_EQ(backend_->opens(), 0);
}

TEST_F(TranscriptionSessionTest, DrainDeadlineForcesSummary) {
  ScriptedBackend::Script hang;
  hang.behaviour = ScriptedBackend::Behaviour::HANG;
  backend_->setDefault(hang);
  config_.backend.requestTimeoutMs = 60000;
  config_.session.drainTimeoutMs = 100;

  auto session = make();
  session->startRecording(start());
  feed(*session, speech(0.5));
  session->stopRecording();

  session->tick(Clock::now());
  EXPECT_EQ(out_->count("recording_stopped"), 0u);

  session->tick(Clock::now() + 200ms);
  ASSERT_EQ(out_->count("recording_stopped"), 1u);
  auto errors = out_->ofType("error");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0]["segment_id"], 1);
  EXPECT_EQ(errors[0]["error"].get<std::string>().rfind("SegmentTimeout:", 0), 0u);
  EXPECT_EQ(session->state(), TranscriptionSession::State::READY);
  EXPECT_TRUE(session->close(1000ms));
}

TEST_F(TranscriptionSessionTest, SegmentFailureKeepsSessionAlive) {
  ScriptedBackend::Script broken;
  broken.behaviour = ScriptedBackend::Behaviour::BREAK;
  backend_->push(broken);

  auto session = make();
  session->startRecording(start());
  utterances(*session, 2);
  session->stopRecording();

  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));
  auto errors = out_->ofType("error");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0]["segment_id"], 1);
  EXPECT_EQ(errors[0]["error"].get<std::string>().rfind("TransportError:", 0), 0u);
  auto finals = out_->ofType("transcription");
  ASSERT_EQ(finals.size(), 1u);
  EXPECT_EQ(finals[0]["segment_id"], 2);
}

TEST_F(TranscriptionSessionTest, MonotonicPolicyDropsShrinkingPartials) {
  config_.session.partialPolicy = SessionSettings::PartialPolicy::MONOTONIC;
  ScriptedBackend::Script script;
  script.partials = {"one two three", "one two", "one two three four"};
  script.text = "one two three four five";
  backend_->setDefault(script);

  auto session = make();
  session->startRecording(start());
  feed(*session, speech(0.3));
  session->stopRecording();
  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));

  auto partials = out_->ofType("partial");
  ASSERT_EQ(partials.size(), 2u);
  EXPECT_EQ(partials[0]["text"], "one two three");
  EXPECT_EQ(partials[1]["text"], "one two three four");
}

TEST_F(TranscriptionSessionTest, StartOptionsReachTheBackend) {
  auto session = make();
  session->startRecording(ControlMessage::parse(
      R"({"type":"start_recording","config":{"enable_partials":false,"hotwords":["riva"]}})"));
  feed(*session, speech(0.3));
  session->stopRecording();
  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));

  auto options = backend_->lastOptions();
  EXPECT_FALSE(options.enablePartials);
  EXPECT_EQ(options.hotwords, std::vector<std::string>{"riva"});
  EXPECT_EQ(out_->ofType("recording_started")[0]["config"]["enable_partials"], false);
}

TEST_F(TranscriptionSessionTest, TranscriptIsClearedBetweenRecordings) {
  auto session = make();
  session->startRecording(start());
  feed(*session, speech(0.3));
  session->stopRecording();
  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));

  session->startRecording(start());
  session->stopRecording();
  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 2; }));
  auto second = out_->ofType("recording_stopped")[1];
  EXPECT_EQ(second["final_transcript"], "");
  EXPECT_EQ(second["total_segments"], 0);
}

TEST_F(TranscriptionSessionTest, CloseAbandonsInFlightWork) {
  ScriptedBackend::Script hang;
  hang.behaviour = ScriptedBackend::Behaviour::HANG;
  backend_->setDefault(hang);
  config_.backend.requestTimeoutMs = 60000;

  auto session = make();
  session->startRecording(start());
  feed(*session, speech(0.5));
  ASSERT_TRUE(waitFor([&] { return backend_->opens() == 1; }));

  EXPECT_TRUE(session->close(1000ms));
  EXPECT_EQ(session->state(), TranscriptionSession::State::CLOSED);
  EXPECT_FALSE(session->onAudio(speech(0.02)[0]));
  EXPECT_EQ(out_->count("transcription"), 0u);
  EXPECT_EQ(out_->count("recording_stopped"), 0u);
}

TEST_F(TranscriptionSessionTest, ConnectRetryShowsInProcessingTime) {
  config_.backend.retryInitialDelayMs = 300;
  backend_->failOpens(1);
  auto session = make();
  session->startRecording(start());

  // Paced like a live microphone, so the retry is over before the seal.
  for (const auto &f : speech(0.6)) {
    session->onAudio(f);
    std::this_thread::sleep_for(20ms);
  }
  ASSERT_TRUE(waitFor([&] { return backend_->opens() == 2; }));
  feed(*session, quiet(0.5));
  session->stopRecording();

  ASSERT_TRUE(waitFor([&] { return out_->count("recording_stopped") == 1; }));
  auto finals = out_->ofType("transcription");
  ASSERT_EQ(finals.size(), 1u);
  EXPECT_GE(finals[0]["processing_time_ms"].get<int>(), 300);
  EXPECT_EQ(out_->count("error"), 0u);
}
