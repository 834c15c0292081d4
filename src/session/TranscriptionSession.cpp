#include "TranscriptionSession.h"
#include "../app/Logger.h"
#include "../protocol/Envelope.h"

const char *sessionStateName(TranscriptionSession::State state) {
  switch (state) {
  case TranscriptionSession::State::READY:
    return "Ready";
  case TranscriptionSession::State::RECORDING:
    return "Recording";
  case TranscriptionSession::State::DRAINING:
    return "Draining";
  case TranscriptionSession::State::CLOSED:
    return "Closed";
  }
  return "Unknown";
}

TranscriptionSession::TranscriptionSession(
    const std::string &connectionId, const AudioFormat &format,
    const Config &config, std::shared_ptr<RecognitionBackend> backend,
    std::shared_ptr<RecognitionBackend> fallback, OutboundSender sender)
    : connectionId_(connectionId), format_(format), settings_(config.session),
      backendSettings_(config.backend), sender_(std::move(sender)) {
  buffer_ = std::make_unique<AudioFrameBuffer>(
      format_, config.audio, config.vad, [this]() { return nextSequence_++; });
  client_ = std::make_unique<RecognitionSessionClient>(
      std::move(backend), std::move(fallback), config.backend, connectionId_);
}

TranscriptionSession::~TranscriptionSession() {
  close(std::chrono::milliseconds(0));
}

void TranscriptionSession::init() {
  buffer_->setOpenedCallback([this](uint64_t seq) { onSegmentOpened(seq); });
  buffer_->setAudioCallback([this](uint64_t seq, const AudioFrame &frame) {
    onSegmentAudio(seq, frame);
  });

  // The client's worker can outlive this session, so it only holds a weak
  // reference.
  std::weak_ptr<TranscriptionSession> weak = shared_from_this();
  client_->setResultCallback([weak](const RecognitionResult &result) {
    if (auto self = weak.lock())
      self->onResult(result);
  });
  client_->setFailureCallback(
      [weak](uint64_t seq, ErrorKind kind, const std::string &detail) {
        if (auto self = weak.lock())
          self->onFailure(seq, kind, detail);
      });
  client_->setDegradedCallback([weak](const std::string &detail) {
    if (auto self = weak.lock())
      self->onDegraded(detail);
  });
}

void TranscriptionSession::startRecording(const ControlMessage &msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::RECORDING) {
    LOG_DEBUG("[conn " << connectionId_ << "] already recording, start ignored");
    return;
  }
  if (state_ == State::DRAINING) {
    throw BridgeError(ErrorKind::ProtocolError,
                      "previous recording is still draining");
  }
  if (state_ == State::CLOSED)
    return;

  if (msg.sampleRate && *msg.sampleRate != format_.sampleRate) {
    throw BridgeError(ErrorKind::FormatError,
                      "sample_rate " + std::to_string(*msg.sampleRate) +
                          " does not match negotiated " +
                          std::to_string(format_.sampleRate));
  }

  StreamOptions options;
  options.format = format_;
  options.languageCode = backendSettings_.languageCode;
  options.model = backendSettings_.model;
  options.enablePunctuation = backendSettings_.enablePunctuation;
  options.enableWordOffsets = backendSettings_.enableWordOffsets;
  options.enablePartials = msg.enablePartials.value_or(backendSettings_.enablePartials);
  options.hotwords = msg.hotwords;
  client_->open(options);

  partialsEnabled_ = options.enablePartials;
  buffer_->reset();
  slots_.clear();
  finals_.clear();
  outstanding_ = 0;
  recordingSegments_ = 0;
  recordingDurationS_ = 0.0;
  state_ = State::RECORDING;

  LOG_INFO("[conn " << connectionId_ << "] recording started ("
           << format_.describe() << ", partials "
           << (partialsEnabled_ ? "on" : "off") << ")");
  sender_(Envelope::recordingStarted(format_.sampleRate, format_.channels,
                                     partialsEnabled_));
}

void TranscriptionSession::stopRecording() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::RECORDING) {
    LOG_DEBUG("[conn " << connectionId_ << "] not recording, stop ignored");
    return;
  }

  auto last = buffer_->flush();
  if (last)
    onSegmentSealed(*last);

  state_ = State::DRAINING;
  drainDeadline_ = Clock::now() + std::chrono::milliseconds(settings_.drainTimeoutMs);
  LOG_INFO("[conn " << connectionId_ << "] recording stopped, waiting for "
           << outstanding_ << " segment(s)");
  finishDrainIfIdle();
}

void TranscriptionSession::configure(const ControlMessage &msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::CLOSED)
    return;
  buffer_->configure(msg.vadThreshold, msg.silenceDuration);
  LOG_INFO("[conn " << connectionId_ << "] VAD threshold "
           << buffer_->vad().settings().threshold << ", silence "
           << buffer_->vad().settings().silenceDurationS << "s");
}

bool TranscriptionSession::onAudio(const AudioFrame &frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::RECORDING) {
    counters_.droppedFrames++;
    LOG_WARN("[conn " << connectionId_ << "] dropping " << frame.size()
             << " byte frame while " << sessionStateName(state_));
    return false;
  }

  auto sealed = buffer_->ingest(frame);
  counters_.audioFrames++;
  recordingDurationS_ += frame.durationS();
  for (const auto &segment : sealed)
    onSegmentSealed(segment);
  return true;
}

void TranscriptionSession::onSegmentOpened(uint64_t sequence) {
  SegmentSlot &slot = slots_[sequence];
  recordingSegments_++;
  counters_.segments++;

  slot.ticket = client_->beginSegment(sequence);
  if (!slot.ticket) {
    slot.done = true;
    counters_.failures++;
    LOG_WARN("[conn " << connectionId_ << "] segment " << sequence
             << " rejected, backend queue full");
    sender_(Envelope::error(
        std::string(errorKindName(ErrorKind::Busy)) +
            ": recognition backlog is full, segment dropped",
        sequence));
    return;
  }
  outstanding_++;
  LOG_DEBUG("[conn " << connectionId_ << "] segment " << sequence << " opened");
}

void TranscriptionSession::onSegmentAudio(uint64_t sequence,
                                          const AudioFrame &frame) {
  auto it = slots_.find(sequence);
  if (it != slots_.end() && it->second.ticket)
    it->second.ticket->append(frame);
}

void TranscriptionSession::onSegmentSealed(const AudioSegment &segment) {
  auto it = slots_.find(segment.sequence);
  if (it == slots_.end())
    return;
  if (it->second.ticket)
    it->second.ticket->seal();
  LOG_INFO("[conn " << connectionId_ << "] segment " << segment.sequence
           << " sealed (" << sealReasonName(segment.reason) << ", "
           << segment.durationS() << "s)");
}

void TranscriptionSession::onResult(const RecognitionResult &result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::CLOSED)
    return;
  auto it = slots_.find(result.sequence);
  if (it == slots_.end() || it->second.done)
    return;
  SegmentSlot &slot = it->second;

  if (!result.isFinal) {
    if (!partialsEnabled_)
      return;
    if (settings_.partialPolicy == SessionSettings::PartialPolicy::MONOTONIC &&
        result.text.size() < slot.lastPartial.size()) {
      LOG_DEBUG("[conn " << connectionId_ << "] shorter partial for segment "
                << result.sequence << " dropped");
      return;
    }
    slot.lastPartial = result.text;
    sender_(Envelope::partial(result));
    return;
  }

  finals_[result.sequence] = result.text;
  counters_.finals++;
  LOG_INFO("[conn " << connectionId_ << "] segment " << result.sequence
           << " final (" << result.latency.count() << "ms): \"" << result.text
           << "\"");
  sender_(Envelope::transcription(result));
  settle(slot);
  finishDrainIfIdle();
}

void TranscriptionSession::onFailure(uint64_t sequence, ErrorKind kind,
                                     const std::string &detail) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::CLOSED)
    return;
  auto it = slots_.find(sequence);
  if (it == slots_.end() || it->second.done)
    return;

  counters_.failures++;
  sender_(Envelope::error(std::string(errorKindName(kind)) + ": " + detail,
                          sequence));
  settle(it->second);
  finishDrainIfIdle();
}

void TranscriptionSession::onDegraded(const std::string &detail) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::CLOSED)
    return;
  sender_(Envelope::error(std::string(errorKindName(ErrorKind::BackendUnavailable)) +
                          ": " + detail + " (serving synthetic transcripts)"));
}

void TranscriptionSession::settle(SegmentSlot &slot) {
  slot.done = true;
  slot.ticket.reset();
  if (outstanding_ > 0)
    outstanding_--;
}

void TranscriptionSession::finishDrainIfIdle() {
  if (state_ == State::DRAINING && outstanding_ == 0)
    finishDrain();
}

void TranscriptionSession::finishDrain() {
  std::string text = transcript();
  LOG_INFO("[conn " << connectionId_ << "] recording summary: "
           << recordingSegments_ << " segment(s), " << recordingDurationS_
           << "s");
  sender_(Envelope::recordingStopped(text, recordingDurationS_,
                                     recordingSegments_));
  state_ = State::READY;
}

void TranscriptionSession::tick(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::DRAINING || now < drainDeadline_)
    return;

  LOG_WARN("[conn " << connectionId_ << "] drain deadline passed with "
           << outstanding_ << " segment(s) outstanding");
  for (auto &entry : slots_) {
    SegmentSlot &slot = entry.second;
    if (slot.done)
      continue;
    if (slot.ticket)
      slot.ticket->abandon();
    counters_.failures++;
    sender_(Envelope::error(std::string(errorKindName(ErrorKind::SegmentTimeout)) +
                                ": no final result before the drain deadline",
                            entry.first));
    settle(slot);
  }
  finishDrain();
}

void TranscriptionSession::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::CLOSED) {
      LOG_DEBUG("[conn " << connectionId_ << "] closing session in state "
                << sessionStateName(state_));
      state_ = State::CLOSED;
      for (auto &entry : slots_) {
        if (entry.second.ticket)
          entry.second.ticket->abandon();
      }
      slots_.clear();
      finals_.clear();
      outstanding_ = 0;
      buffer_->reset();
    }
  }
  // Not under the lock: the worker may be waiting on it in a callback.
  client_->cancel();
}

bool TranscriptionSession::backendStopped() const { return client_->stopped(); }

bool TranscriptionSession::close(std::chrono::milliseconds grace) {
  cancel();
  return client_->close(grace);
}

std::string TranscriptionSession::transcript() const {
  std::string out;
  for (const auto &entry : finals_) {
    if (entry.second.empty())
      continue;
    if (!out.empty())
      out += " ";
    out += entry.second;
  }
  return out;
}

TranscriptionSession::State TranscriptionSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

TranscriptionSession::Counters TranscriptionSession::counters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return counters_;
}
