#include "AudioFrameBuffer.h"
#include "../app/BridgeError.h"
#include "../app/Logger.h"
#include <algorithm>

AudioFrameBuffer::AudioFrameBuffer(const AudioFormat &format,
                                   const AudioSettings &audio,
                                   const VadSettings &vad,
                                   SequenceAllocator allocator)
    : format_(format), audio_(audio), vad_(vad, format.sampleRate),
      allocator_(std::move(allocator)) {}

void AudioFrameBuffer::validate(const AudioFrame &frame) const {
  if (frame.format != format_) {
    throw BridgeError(ErrorKind::FormatError,
                      "expected " + format_.describe() + ", got " +
                          frame.format.describe());
  }
  if (frame.size() % format_.bytesPerSample() != 0) {
    throw BridgeError(ErrorKind::FormatError,
                      "frame of " + std::to_string(frame.size()) +
                          " bytes is not a whole number of samples");
  }
}

std::vector<AudioSegment> AudioFrameBuffer::ingest(const AudioFrame &frame) {
  validate(frame);

  std::vector<AudioSegment> sealed;
  if (frame.size() == 0)
    return sealed;

  auto events = vad_.process(frame);
  bool started = std::find(events.begin(), events.end(),
                           VoiceActivityDetector::Event::SPEECH_START) !=
                 events.end();
  bool ended = std::find(events.begin(), events.end(),
                         VoiceActivityDetector::Event::SPEECH_END) !=
               events.end();

  if (!current_) {
    if (!started && !resumePending_) {
      pushPreRoll(frame);
      return sealed;
    }

    openSegment();
    if (!resumePending_) {
      // Audio heard during the onset hold belongs to the utterance.
      for (const auto &f : preRoll_)
        append(f);
    }
    preRoll_.clear();
    preRollS_ = 0.0;
    resumePending_ = false;
  }

  append(frame);

  if (ended) {
    sealed.push_back(seal(SealReason::SILENCE));
    resumePending_ = vad_.inSpeech();
  } else if (currentDurationS_ + 1e-9 >= audio_.maxSegmentDurationS) {
    sealed.push_back(seal(SealReason::MAX_DURATION));
    resumePending_ = vad_.inSpeech();
  }
  return sealed;
}

std::optional<AudioSegment> AudioFrameBuffer::flush() {
  std::optional<AudioSegment> out;
  if (current_)
    out = seal(SealReason::STOP);

  resumePending_ = false;
  preRoll_.clear();
  preRollS_ = 0.0;
  vad_.reset();
  return out;
}

void AudioFrameBuffer::reset() {
  if (current_) {
    LOG_DEBUG("Abandoning open segment " << current_->sequence);
  }
  current_.reset();
  currentDurationS_ = 0.0;
  resumePending_ = false;
  preRoll_.clear();
  preRollS_ = 0.0;
  vad_.reset();
}

void AudioFrameBuffer::configure(std::optional<double> threshold,
                                 std::optional<double> silenceDurationS) {
  if (threshold)
    vad_.setThreshold(*threshold);
  if (silenceDurationS)
    vad_.setSilenceDuration(*silenceDurationS);
}

void AudioFrameBuffer::openSegment() {
  current_.emplace();
  current_->sequence = allocator_();
  currentDurationS_ = 0.0;
  if (openedCb_)
    openedCb_(current_->sequence);
}

void AudioFrameBuffer::append(const AudioFrame &frame) {
  current_->frames.push_back(frame);
  currentDurationS_ += frame.durationS();
  if (audioCb_)
    audioCb_(current_->sequence, frame);
}

AudioSegment AudioFrameBuffer::seal(SealReason reason) {
  AudioSegment segment = std::move(*current_);
  current_.reset();
  currentDurationS_ = 0.0;
  segment.reason = reason;
  LOG_DEBUG("Sealed segment " << segment.sequence << " ("
            << sealReasonName(reason) << ", " << segment.durationS() << "s)");
  return segment;
}

void AudioFrameBuffer::pushPreRoll(const AudioFrame &frame) {
  preRoll_.push_back(frame);
  preRollS_ += frame.durationS();

  // Keep just enough to cover the onset hold plus the frame that crosses it.
  double keepS = vad_.settings().speechHoldMs / 1000.0;
  while (preRoll_.size() > 1 && preRollS_ - preRoll_.front().durationS() >= keepS) {
    preRollS_ -= preRoll_.front().durationS();
    preRoll_.pop_front();
  }
}
