#pragma once

#include "../app/Config.h"
#include "AudioTypes.h"
#include "VoiceActivityDetector.h"
#include <deque>
#include <functional>
#include <optional>
#include <vector>

// Per-connection PCM accumulator. Frames go in strictly in arrival order,
// sealed segments come out. Segment numbers are handed out by the owner.
class AudioFrameBuffer {
public:
  using SequenceAllocator = std::function<uint64_t()>;
  using OpenedCallback = std::function<void(uint64_t sequence)>;
  using AudioCallback =
      std::function<void(uint64_t sequence, const AudioFrame &frame)>;

  AudioFrameBuffer(const AudioFormat &format, const AudioSettings &audio,
                   const VadSettings &vad, SequenceAllocator allocator);

  // Live view of the open segment, for backends that take audio incrementally.
  void setOpenedCallback(OpenedCallback cb) { openedCb_ = cb; }
  void setAudioCallback(AudioCallback cb) { audioCb_ = cb; }

  // Throws BridgeError(FormatError) when the frame does not match the
  // negotiated format.
  std::vector<AudioSegment> ingest(const AudioFrame &frame);

  // Seals the open segment, even mid-utterance.
  std::optional<AudioSegment> flush();

  // Drops everything, including an open segment.
  void reset();

  void configure(std::optional<double> threshold,
                 std::optional<double> silenceDurationS);

  bool segmentOpen() const { return current_.has_value(); }
  const VoiceActivityDetector &vad() const { return vad_; }

private:
  void validate(const AudioFrame &frame) const;
  void openSegment();
  void append(const AudioFrame &frame);
  AudioSegment seal(SealReason reason);
  void pushPreRoll(const AudioFrame &frame);

  AudioFormat format_;
  AudioSettings audio_;
  VoiceActivityDetector vad_;
  SequenceAllocator allocator_;
  OpenedCallback openedCb_;
  AudioCallback audioCb_;

  std::optional<AudioSegment> current_;
  double currentDurationS_ = 0.0;
  bool resumePending_ = false;

  std::deque<AudioFrame> preRoll_;
  double preRollS_ = 0.0;

};
