#pragma once

#include "../app/Config.h"
#include "AudioTypes.h"
#include <vector>

// Energy based speech detector. Works on fixed windows of windowMs, carrying
// partial windows across frames, and keeps an exponentially smoothed RMS.
class VoiceActivityDetector {
public:
  enum class Event { SPEECH_START, SPEECH_END };

  VoiceActivityDetector(const VadSettings &settings, int sampleRate);

  // Events raised while consuming the frame, in order.
  std::vector<Event> process(const AudioFrame &frame);

  void setThreshold(double threshold);
  void setSilenceDuration(double seconds);
  void reset();

  bool inSpeech() const { return inSpeech_; }
  double energy() const { return smoothed_; }
  const VadSettings &settings() const { return settings_; }

private:
  void closeWindow(std::vector<Event> &events);

  VadSettings settings_;
  size_t windowSamples_;

  double windowSumSquares_ = 0.0;
  size_t windowFill_ = 0;
  double smoothed_ = 0.0;

  bool inSpeech_ = false;
  int aboveMs_ = 0;
  int belowMs_ = 0;
};
