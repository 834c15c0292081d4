#pragma once

#include <cstddef>
#include <string>
#include <yaml-cpp/yaml.h>

struct ServerSettings {
  std::string bindIp = "0.0.0.0";
  int port = 8443;
  int threads = 0; // 0 = hardware concurrency
  size_t maxConnections = 100;
  int idleTimeoutS = 60;
  int maxSessionDurationS = 3600;
  size_t maxMessageSizeBytes = 10 * 1024 * 1024;
  size_t maxPendingMessages = 256; // outbound, per connection
  std::string protocolVersion = "1.0";
};

struct AudioSettings {
  int sampleRate = 16000;
  int channels = 1;
  int bitDepth = 16;
  double maxSegmentDurationS = 30.0;
};

struct VadSettings {
  double threshold = 0.02;      // normalised RMS, 0..1
  int speechHoldMs = 60;        // energy must stay above threshold this long
  double silenceDurationS = 0.8;
  int windowMs = 10;
  double smoothing = 0.5;       // weight of the newest window in the rolling estimate
};

struct BackendSettings {
  enum class Mode { RIVA, SYNTHETIC };
  enum class DegradedMode { REJECT, SYNTHETIC };

  Mode mode = Mode::RIVA;
  std::string target = "localhost:50051";
  std::string model;
  std::string languageCode = "en-US";
  bool enablePunctuation = true;
  bool enableWordOffsets = true;
  bool enablePartials = true;
  bool incremental = true;

  int connectTimeoutMs = 3000;
  int maxRetries = 3;
  int retryInitialDelayMs = 200;
  int retryMaxDelayMs = 5000;
  int requestTimeoutMs = 5000;
  size_t maxPendingSegments = 4;
  size_t channelPoolSize = 4;
  DegradedMode degradedMode = DegradedMode::REJECT;

  std::string syntheticText = "synthetic transcript";
  int syntheticLatencyMs = 50;
  int syntheticJitterMs = 0;
  int syntheticPartials = 2;
};

struct SessionSettings {
  enum class PartialPolicy { REPLACE, MONOTONIC };

  int drainTimeoutMs = 10000;
  int cancelGraceMs = 2000;
  PartialPolicy partialPolicy = PartialPolicy::REPLACE;
};

class Config {
public:
  static Config &instance();
  bool load(const std::string &path);

  // Parses an already loaded document. Used by load() and by tests.
  bool loadFromNode(const YAML::Node &config);

  // APP_HOST, APP_PORT, RIVA_HOST, RIVA_PORT, WS_MAX_CONNECTIONS, LOG_LEVEL
  void applyEnvironment();

  bool validate() const;

  ServerSettings server;
  AudioSettings audio;
  VadSettings vad;
  BackendSettings backend;
  SessionSettings session;
  std::string logLevel = "INFO";
  std::string logFile;
};

const char *backendModeName(BackendSettings::Mode mode);
