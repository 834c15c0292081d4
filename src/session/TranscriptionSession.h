#pragma once

#include "../app/BridgeError.h"
#include "../app/Config.h"
#include "../asr/RecognitionSessionClient.h"
#include "../audio/AudioFrameBuffer.h"
#include "../protocol/ControlMessage.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Per-connection orchestrator between the audio buffer and the recognition
// client. Everything the client sees is sent through the outbound sender.
class TranscriptionSession
    : public std::enable_shared_from_this<TranscriptionSession> {
public:
  enum class State { READY, RECORDING, DRAINING, CLOSED };

  using OutboundSender = std::function<void(const std::string &json)>;

  struct Counters {
    uint64_t audioFrames = 0;
    uint64_t droppedFrames = 0;
    uint64_t segments = 0;
    uint64_t finals = 0;
    uint64_t failures = 0;
  };

  TranscriptionSession(const std::string &connectionId, const AudioFormat &format,
                       const Config &config,
                       std::shared_ptr<RecognitionBackend> backend,
                       std::shared_ptr<RecognitionBackend> fallback,
                       OutboundSender sender);
  ~TranscriptionSession();

  // Wires the buffer and the recognition client back to this session. Call
  // once, right after construction.
  void init();

  // Throws BridgeError(FormatError) when the requested sample rate is not the
  // negotiated one, BridgeError(ProtocolError) while still draining.
  void startRecording(const ControlMessage &msg);
  void stopRecording();
  void configure(const ControlMessage &msg);

  // False when the frame was dropped because no recording is active. Throws
  // BridgeError(FormatError) on malformed audio.
  bool onAudio(const AudioFrame &frame);

  // Forces the summary out once the drain deadline has passed.
  void tick(Clock::time_point now);

  // Abandons in-flight work and cancels the backend call without waiting for
  // the backend worker.
  void cancel();
  // True once the backend worker has exited.
  bool backendStopped() const;

  // cancel(), then waits for the backend worker. False when it had to be left
  // behind.
  bool close(std::chrono::milliseconds grace);

  State state() const;
  Counters counters() const;

private:
  struct SegmentSlot {
    std::shared_ptr<SegmentTicket> ticket; // null when rejected as Busy
    std::string lastPartial;
    bool done = false;
  };

  void onSegmentOpened(uint64_t sequence);
  void onSegmentAudio(uint64_t sequence, const AudioFrame &frame);
  void onSegmentSealed(const AudioSegment &segment);

  void onResult(const RecognitionResult &result);
  void onFailure(uint64_t sequence, ErrorKind kind, const std::string &detail);
  void onDegraded(const std::string &detail);

  void settle(SegmentSlot &slot);
  void finishDrainIfIdle();
  void finishDrain();
  std::string transcript() const;

  std::string connectionId_;
  AudioFormat format_;
  SessionSettings settings_;
  BackendSettings backendSettings_;
  OutboundSender sender_;

  mutable std::mutex mutex_;
  State state_ = State::READY;
  std::unique_ptr<AudioFrameBuffer> buffer_;
  std::unique_ptr<RecognitionSessionClient> client_;

  uint64_t nextSequence_ = 1;
  bool partialsEnabled_ = true;
  std::map<uint64_t, SegmentSlot> slots_;
  std::map<uint64_t, std::string> finals_;
  size_t outstanding_ = 0;
  uint64_t recordingSegments_ = 0;
  double recordingDurationS_ = 0.0;
  Clock::time_point drainDeadline_;
  Counters counters_;
};

const char *sessionStateName(TranscriptionSession::State state);
