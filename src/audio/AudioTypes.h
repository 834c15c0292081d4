#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct AudioFormat {
  int sampleRate = 16000;
  int channels = 1;
  int bitDepth = 16;

  bool operator==(const AudioFormat &other) const {
    return sampleRate == other.sampleRate && channels == other.channels &&
           bitDepth == other.bitDepth;
  }
  bool operator!=(const AudioFormat &other) const { return !(*this == other); }

  size_t bytesPerSample() const { return static_cast<size_t>(bitDepth / 8) * channels; }
  size_t bytesPerSecond() const { return bytesPerSample() * sampleRate; }

  std::string describe() const {
    return std::to_string(sampleRate) + "Hz/" + std::to_string(channels) +
           "ch/" + std::to_string(bitDepth) + "bit";
  }
};

using Clock = std::chrono::steady_clock;

// Raw little-endian PCM as delivered by the transport. Immutable once built.
struct AudioFrame {
  AudioFrame(AudioFormat fmt, std::vector<char> bytes,
             Clock::time_point arrived = Clock::now())
      : format(fmt),
        data(std::make_shared<const std::vector<char>>(std::move(bytes))),
        arrival(arrived) {}

  AudioFormat format;
  std::shared_ptr<const std::vector<char>> data;
  Clock::time_point arrival;

  size_t size() const { return data->size(); }
  size_t sampleCount() const { return size() / format.bytesPerSample(); }
  double durationS() const {
    return static_cast<double>(sampleCount()) / format.sampleRate;
  }
};

enum class SealReason { SILENCE, STOP, MAX_DURATION };

inline const char *sealReasonName(SealReason reason) {
  switch (reason) {
  case SealReason::SILENCE:
    return "silence";
  case SealReason::STOP:
    return "stop";
  case SealReason::MAX_DURATION:
    return "max-duration";
  }
  return "unknown";
}

// A VAD-delimited span of audio. Frames keep their arrival order.
struct AudioSegment {
  uint64_t sequence = 0;
  std::vector<AudioFrame> frames;
  SealReason reason = SealReason::SILENCE;

  size_t byteCount() const {
    size_t total = 0;
    for (const auto &f : frames)
      total += f.size();
    return total;
  }

  double durationS() const {
    double total = 0;
    for (const auto &f : frames)
      total += f.durationS();
    return total;
  }
};
