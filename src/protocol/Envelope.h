#pragma once

#include "../asr/RecognitionResult.h"
#include "../gateway/Snapshot.h"
#include <cstdint>
#include <optional>
#include <string>

// Outbound JSON messages. Field names are a contract with deployed clients.
class Envelope {
public:
  static std::string connection(const std::string &clientId,
                                const std::string &protocolVersion);

  static std::string recordingStarted(int sampleRate, int channels,
                                      bool enablePartials);
  static std::string recordingStopped(const std::string &finalTranscript,
                                      double totalDurationS,
                                      uint64_t totalSegments);

  static std::string partial(const RecognitionResult &result);
  static std::string transcription(const RecognitionResult &result);

  static std::string error(const std::string &message,
                           std::optional<uint64_t> segmentId = std::nullopt);

  static std::string pong();
  static std::string metrics(const GatewaySnapshot &bridge,
                             const ConnectionSnapshot &connection);
  static std::string status(const GatewaySnapshot &snapshot);

  static std::string isoTimestamp();
};
