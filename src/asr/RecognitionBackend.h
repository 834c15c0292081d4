#pragma once

#include "../audio/AudioTypes.h"
#include "RecognitionResult.h"
#include <memory>
#include <string>
#include <vector>

struct StreamOptions {
  AudioFormat format;
  std::string languageCode = "en-US";
  std::string model;
  bool enablePunctuation = true;
  bool enableWordOffsets = true;
  bool enablePartials = true;
  std::vector<std::string> hotwords;
};

// One backend call carrying one segment. write() and read() may be used from
// two different threads at the same time; everything else from the writer.
class RecognitionStream {
public:
  virtual ~RecognitionStream() = default;

  virtual bool write(const std::vector<char> &pcm) = 0;
  // No more audio for this call. Results keep flowing until the final.
  virtual bool writesDone() = 0;
  // Blocks for the next result. False once the call is over, successfully or
  // not; the sequence cannot be restarted.
  virtual bool read(RecognitionResult &result) = 0;
  // Unblocks a pending read().
  virtual void cancel() = 0;
  // Why the call ended, empty when it ended normally.
  virtual std::string finishError() = 0;
};

class RecognitionBackend {
public:
  virtual ~RecognitionBackend() = default;

  // Null when the backend cannot be reached; error explains why.
  virtual std::unique_ptr<RecognitionStream> open(const StreamOptions &options,
                                                  std::string &error) = 0;

  // True when audio can be sent before the segment is sealed.
  virtual bool supportsIncremental() const = 0;

  // True when partials arrive while audio is still being sent. Only then is
  // the wait for the first partial bounded from the moment the call opens.
  virtual bool partialsWhileStreaming() const { return false; }

  virtual std::string name() const = 0;
};
