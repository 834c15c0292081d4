#include "VoiceActivityDetector.h"
#include "../util/PcmUtils.h"
#include <algorithm>
#include <cmath>

VoiceActivityDetector::VoiceActivityDetector(const VadSettings &settings,
                                             int sampleRate)
    : settings_(settings) {
  windowSamples_ =
      static_cast<size_t>(sampleRate) * static_cast<size_t>(settings_.windowMs) / 1000;
  if (windowSamples_ == 0)
    windowSamples_ = 1;
}

std::vector<VoiceActivityDetector::Event>
VoiceActivityDetector::process(const AudioFrame &frame) {
  std::vector<Event> events;
  const char *data = frame.data->data();
  size_t samples = frame.sampleCount();

  for (size_t i = 0; i < samples; ++i) {
    double s = PcmUtils::sampleAt(data, i) / 32768.0;
    windowSumSquares_ += s * s;
    if (++windowFill_ == windowSamples_) {
      closeWindow(events);
    }
  }
  return events;
}

void VoiceActivityDetector::closeWindow(std::vector<Event> &events) {
  double rms = std::sqrt(windowSumSquares_ / static_cast<double>(windowFill_));
  windowSumSquares_ = 0.0;
  windowFill_ = 0;

  smoothed_ = settings_.smoothing * rms + (1.0 - settings_.smoothing) * smoothed_;
  bool loud = smoothed_ > settings_.threshold;
  // Speech ends on a quiet window at the earliest, however short the setting.
  int silenceMs = std::max(
      settings_.windowMs,
      static_cast<int>(std::lround(settings_.silenceDurationS * 1000.0)));

  if (!inSpeech_) {
    aboveMs_ = loud ? aboveMs_ + settings_.windowMs : 0;
    // A zero hold time still needs one loud window.
    if (aboveMs_ >= settings_.speechHoldMs && aboveMs_ > 0) {
      inSpeech_ = true;
      belowMs_ = 0;
      events.push_back(Event::SPEECH_START);
    }
  } else {
    belowMs_ = loud ? 0 : belowMs_ + settings_.windowMs;
    if (belowMs_ >= silenceMs) {
      inSpeech_ = false;
      aboveMs_ = 0;
      events.push_back(Event::SPEECH_END);
    }
  }
}

void VoiceActivityDetector::setThreshold(double threshold) {
  settings_.threshold = threshold;
}

void VoiceActivityDetector::setSilenceDuration(double seconds) {
  settings_.silenceDurationS = seconds;
}

void VoiceActivityDetector::reset() {
  windowSumSquares_ = 0.0;
  windowFill_ = 0;
  smoothed_ = 0.0;
  inSpeech_ = false;
  aboveMs_ = 0;
  belowMs_ = 0;
}
