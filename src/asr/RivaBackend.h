#pragma once

#include "../app/Config.h"
#include "../util/ObjectPool.h"
#include "RecognitionBackend.h"

#include "riva_asr.grpc.pb.h"
#include "riva_asr.pb.h"
#include <grpcpp/grpcpp.h>

// One pooled connection to the recognition service. The channel stays up
// between calls; a stream checks it out for exactly one call.
struct RivaChannel {
  std::shared_ptr<grpc::Channel> channel;
  std::unique_ptr<nvidia::riva::asr::RivaSpeechRecognition::Stub> stub;
};

using RivaChannelPool = ObjectPool<RivaChannel>;

class RivaBackend : public RecognitionBackend {
public:
  // The pool is shared by every session in the process.
  RivaBackend(const BackendSettings &settings,
              std::shared_ptr<RivaChannelPool> pool);

  std::unique_ptr<RecognitionStream> open(const StreamOptions &options,
                                          std::string &error) override;
  bool supportsIncremental() const override { return incremental_; }
  // interim_results makes Riva answer while audio is still arriving.
  bool partialsWhileStreaming() const override { return incremental_; }
  std::string name() const override { return "riva"; }

  static std::shared_ptr<RivaChannelPool>
  createChannelPool(const BackendSettings &settings);

private:
  std::shared_ptr<RivaChannelPool> pool_;
  std::chrono::milliseconds connectTimeout_;
  bool incremental_;
};
