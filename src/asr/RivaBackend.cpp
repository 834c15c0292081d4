#include "RivaBackend.h"
#include "../app/Logger.h"
#include <deque>
#include <mutex>

namespace asr = nvidia::riva::asr;

namespace {

class RivaStream : public RecognitionStream {
public:
  explicit RivaStream(RivaChannelPool::Handle channel)
      : channel_(std::move(channel)) {}

  ~RivaStream() override {
    if (stream_ && !finished_) {
      context_.TryCancel();
    }
  }

  bool start(const StreamOptions &options) {
    stream_ = channel_->stub->StreamingRecognize(&context_);
    if (!stream_)
      return false;

    asr::StreamingRecognizeRequest request;
    auto *streaming = request.mutable_streaming_config();
    streaming->set_interim_results(options.enablePartials);
    auto *cfg = streaming->mutable_config();
    cfg->set_encoding(asr::LINEAR_PCM);
    cfg->set_sample_rate_hertz(options.format.sampleRate);
    cfg->set_audio_channel_count(options.format.channels);
    cfg->set_language_code(options.languageCode);
    cfg->set_max_alternatives(1);
    cfg->set_enable_automatic_punctuation(options.enablePunctuation);
    cfg->set_enable_word_time_offsets(options.enableWordOffsets);
    if (!options.model.empty())
      cfg->set_model(options.model);
    if (!options.hotwords.empty()) {
      auto *context = cfg->add_speech_contexts();
      for (const auto &word : options.hotwords)
        context->add_phrases(word);
      context->set_boost(10.0f);
    }

    return stream_->Write(request);
  }

  bool write(const std::vector<char> &pcm) override {
    asr::StreamingRecognizeRequest request;
    request.set_audio_content(pcm.data(), pcm.size());
    return stream_->Write(request);
  }

  bool writesDone() override { return stream_->WritesDone(); }

  bool read(RecognitionResult &result) override {
    while (pending_.empty()) {
      asr::StreamingRecognizeResponse response;
      if (!stream_->Read(&response))
        return false;
      for (const auto &r : response.results()) {
        if (r.alternatives_size() == 0)
          continue;
        pending_.push_back(convert(r));
      }
    }
    result = std::move(pending_.front());
    pending_.pop_front();
    return true;
  }

  void cancel() override { context_.TryCancel(); }

  std::string finishError() override {
    std::lock_guard<std::mutex> lock(finishMutex_);
    if (!finished_) {
      status_ = stream_->Finish();
      finished_ = true;
    }
    if (status_.ok())
      return "";
    return std::to_string(status_.error_code()) + " " + status_.error_message();
  }

private:
  static RecognitionResult convert(const asr::StreamingRecognitionResult &r) {
    const auto &best = r.alternatives(0);
    RecognitionResult out;
    out.text = best.transcript();
    out.isFinal = r.is_final();
    out.confidence = best.confidence();
    for (const auto &w : best.words()) {
      out.words.push_back({w.word(), w.start_time() / 1000.0,
                           w.end_time() / 1000.0, w.confidence()});
    }
    return out;
  }

  RivaChannelPool::Handle channel_;
  grpc::ClientContext context_;
  std::unique_ptr<grpc::ClientReaderWriter<asr::StreamingRecognizeRequest,
                                           asr::StreamingRecognizeResponse>>
      stream_;
  std::deque<RecognitionResult> pending_;

  std::mutex finishMutex_;
  bool finished_ = false;
  grpc::Status status_;
};

} // namespace

RivaBackend::RivaBackend(const BackendSettings &settings,
                         std::shared_ptr<RivaChannelPool> pool)
    : pool_(std::move(pool)),
      connectTimeout_(settings.connectTimeoutMs),
      incremental_(settings.incremental) {}

std::shared_ptr<RivaChannelPool>
RivaBackend::createChannelPool(const BackendSettings &settings) {
  std::string target = settings.target;
  return std::make_shared<RivaChannelPool>(settings.channelPoolSize, [target]() {
    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, 30000);
    args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);
    auto rc = std::make_unique<RivaChannel>();
    rc->channel = grpc::CreateCustomChannel(
        target, grpc::InsecureChannelCredentials(), args);
    rc->stub = asr::RivaSpeechRecognition::NewStub(rc->channel);
    LOG_DEBUG("Created gRPC channel to " << target);
    return rc;
  });
}

std::unique_ptr<RecognitionStream>
RivaBackend::open(const StreamOptions &options, std::string &error) {
  auto channel = pool_->acquire();

  auto deadline = std::chrono::system_clock::now() + connectTimeout_;
  if (!channel->channel->WaitForConnected(deadline)) {
    error = "backend not reachable within " +
            std::to_string(connectTimeout_.count()) + "ms";
    return nullptr;
  }

  auto stream = std::make_unique<RivaStream>(std::move(channel));
  if (!stream->start(options)) {
    error = "stream setup rejected: " + stream->finishError();
    return nullptr;
  }
  return stream;
}
