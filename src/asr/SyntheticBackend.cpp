#include "SyntheticBackend.h"
#include "../app/Logger.h"
#include <condition_variable>
#include <sstream>

namespace {

std::vector<std::string> splitWords(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream in(text);
  std::string w;
  while (in >> w)
    words.push_back(w);
  return words;
}

class SyntheticStream : public RecognitionStream {
public:
  SyntheticStream(std::string text, std::chrono::milliseconds latency,
                  int partials, const StreamOptions &options)
      : words_(splitWords(text)), text_(std::move(text)), latency_(latency),
        partials_(options.enablePartials ? partials : 0),
        format_(options.format) {}

  bool write(const std::vector<char> &pcm) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_ || done_)
      return false;
    bytes_ += pcm.size();
    return true;
  }

  bool writesDone() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_)
      return false;
    done_ = true;
    doneAt_ = Clock::now();
    cv_.notify_all();
    return true;
  }

  bool read(RecognitionResult &result) override {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return done_ || cancelled_; });
    if (cancelled_ || emitted_ > partials_)
      return false;

    // Partials are spread evenly over the latency, the final lands on it.
    auto due = doneAt_ + latency_ * (emitted_ + 1) / (partials_ + 1);
    if (cv_.wait_until(lock, due, [this] { return cancelled_; }))
      return false;

    result = RecognitionResult{};
    if (emitted_ < partials_) {
      size_t n = words_.size() * (emitted_ + 1) / (partials_ + 1);
      result.text = join(n);
      result.isFinal = false;
    } else {
      result.text = text_;
      result.isFinal = true;
      result.confidence = 0.9;
      double audioS = static_cast<double>(bytes_) / format_.bytesPerSecond();
      double step = words_.empty() ? 0.0 : audioS / words_.size();
      for (size_t i = 0; i < words_.size(); ++i) {
        result.words.push_back({words_[i], step * i, step * (i + 1), 0.9});
      }
    }
    ++emitted_;
    return true;
  }

  void cancel() override {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    cv_.notify_all();
  }

  std::string finishError() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_ ? "cancelled" : "";
  }

private:
  std::string join(size_t n) const {
    std::string out;
    for (size_t i = 0; i < n && i < words_.size(); ++i) {
      if (!out.empty())
        out += ' ';
      out += words_[i];
    }
    return out;
  }

  std::vector<std::string> words_;
  std::string text_;
  std::chrono::milliseconds latency_;
  int partials_;
  AudioFormat format_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool done_ = false;
  bool cancelled_ = false;
  int emitted_ = 0;
  size_t bytes_ = 0;
  Clock::time_point doneAt_;
};

} // namespace

SyntheticBackend::SyntheticBackend(const BackendSettings &settings,
                                   std::string textPrefix)
    : text_(textPrefix + settings.syntheticText),
      latencyMs_(settings.syntheticLatencyMs),
      jitterMs_(settings.syntheticJitterMs),
      partials_(settings.syntheticPartials), incremental_(settings.incremental),
      rng_(std::random_device{}()) {}

std::unique_ptr<RecognitionStream>
SyntheticBackend::open(const StreamOptions &options, std::string &error) {
  error.clear();
  int latency = latencyMs_;
  if (jitterMs_ > 0) {
    std::lock_guard<std::mutex> lock(rngMutex_);
    latency += std::uniform_int_distribution<int>(0, jitterMs_)(rng_);
  }
  LOG_DEBUG("Synthetic stream opened, latency " << latency << "ms");
  return std::make_unique<SyntheticStream>(
      text_, std::chrono::milliseconds(latency), partials_, options);
}
