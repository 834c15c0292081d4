#pragma once

#include "../app/Config.h"
#include "RecognitionBackend.h"
#include <mutex>
#include <random>

// Local stand-in for the recognition service. Every segment is transcribed as
// the configured text, after the configured latency.
class SyntheticBackend : public RecognitionBackend {
public:
  SyntheticBackend(const BackendSettings &settings, std::string textPrefix = "");

  std::unique_ptr<RecognitionStream> open(const StreamOptions &options,
                                          std::string &error) override;
  bool supportsIncremental() const override { return incremental_; }
  std::string name() const override { return "synthetic"; }

private:
  std::string text_;
  int latencyMs_;
  int jitterMs_;
  int partials_;
  bool incremental_;

  std::mutex rngMutex_;
  std::mt19937 rng_;
};
