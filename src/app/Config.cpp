#include "Config.h"
#include "Logger.h"
#include <cstdlib>
#include <thread>

Config &Config::instance() {
  static Config instance;
  return instance;
}

const char *backendModeName(BackendSettings::Mode mode) {
  return mode == BackendSettings::Mode::SYNTHETIC ? "synthetic" : "riva";
}

bool Config::load(const std::string &path) {
  try {
    YAML::Node config = YAML::LoadFile(path);
    if (!loadFromNode(config))
      return false;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to load config " << path << ": " << e.what());
    return false;
  }

  applyEnvironment();
  return validate();
}

bool Config::loadFromNode(const YAML::Node &config) {
  try {
    const YAML::Node s = config["server"];
    if (s) {
      server.bindIp = s["bind_ip"].as<std::string>(server.bindIp);
      server.port = s["port"].as<int>(server.port);
      server.threads = s["threads"].as<int>(server.threads);
      server.maxConnections =
          s["max_connections"].as<size_t>(server.maxConnections);
      server.idleTimeoutS = s["idle_timeout_s"].as<int>(server.idleTimeoutS);
      server.maxSessionDurationS =
          s["max_session_duration_s"].as<int>(server.maxSessionDurationS);
      server.maxMessageSizeBytes =
          s["max_message_size_bytes"].as<size_t>(server.maxMessageSizeBytes);
      server.maxPendingMessages =
          s["max_pending_messages"].as<size_t>(server.maxPendingMessages);
      server.protocolVersion =
          s["protocol_version"].as<std::string>(server.protocolVersion);
    }
    if (server.threads <= 0) {
      server.threads = static_cast<int>(std::thread::hardware_concurrency());
      if (server.threads == 0)
        server.threads = 4;
    }

    const YAML::Node a = config["audio"];
    if (a) {
      audio.sampleRate = a["sample_rate"].as<int>(audio.sampleRate);
      audio.channels = a["channels"].as<int>(audio.channels);
      audio.bitDepth = a["bit_depth"].as<int>(audio.bitDepth);
      audio.maxSegmentDurationS =
          a["max_segment_duration_s"].as<double>(audio.maxSegmentDurationS);
    }

    const YAML::Node v = config["vad"];
    if (v) {
      vad.threshold = v["threshold"].as<double>(vad.threshold);
      vad.speechHoldMs = v["speech_hold_ms"].as<int>(vad.speechHoldMs);
      vad.silenceDurationS =
          v["silence_duration_s"].as<double>(vad.silenceDurationS);
      vad.windowMs = v["window_ms"].as<int>(vad.windowMs);
      vad.smoothing = v["smoothing"].as<double>(vad.smoothing);
    }

    const YAML::Node b = config["backend"];
    if (b) {
      std::string modeStr = b["mode"].as<std::string>("riva");
      if (modeStr == "synthetic" || modeStr == "mock") {
        backend.mode = BackendSettings::Mode::SYNTHETIC;
      } else {
        backend.mode = BackendSettings::Mode::RIVA;
      }

      backend.target = b["target"].as<std::string>(backend.target);
      backend.model = b["model"].as<std::string>(backend.model);
      backend.languageCode =
          b["language_code"].as<std::string>(backend.languageCode);
      backend.enablePunctuation =
          b["enable_punctuation"].as<bool>(backend.enablePunctuation);
      backend.enableWordOffsets =
          b["enable_word_offsets"].as<bool>(backend.enableWordOffsets);
      backend.enablePartials =
          b["enable_partials"].as<bool>(backend.enablePartials);
      backend.incremental = b["incremental"].as<bool>(backend.incremental);
      backend.connectTimeoutMs =
          b["connect_timeout_ms"].as<int>(backend.connectTimeoutMs);
      backend.maxRetries = b["max_retries"].as<int>(backend.maxRetries);
      backend.retryInitialDelayMs =
          b["retry_initial_delay_ms"].as<int>(backend.retryInitialDelayMs);
      backend.retryMaxDelayMs =
          b["retry_max_delay_ms"].as<int>(backend.retryMaxDelayMs);
      backend.requestTimeoutMs =
          b["request_timeout_ms"].as<int>(backend.requestTimeoutMs);
      backend.maxPendingSegments =
          b["max_pending_segments"].as<size_t>(backend.maxPendingSegments);
      backend.channelPoolSize =
          b["channel_pool_size"].as<size_t>(backend.channelPoolSize);

      std::string degraded = b["degraded_mode"].as<std::string>("reject");
      backend.degradedMode = degraded == "synthetic"
                                 ? BackendSettings::DegradedMode::SYNTHETIC
                                 : BackendSettings::DegradedMode::REJECT;

      backend.syntheticText =
          b["synthetic_text"].as<std::string>(backend.syntheticText);
      backend.syntheticLatencyMs =
          b["synthetic_latency_ms"].as<int>(backend.syntheticLatencyMs);
      backend.syntheticJitterMs =
          b["synthetic_jitter_ms"].as<int>(backend.syntheticJitterMs);
      backend.syntheticPartials =
          b["synthetic_partials"].as<int>(backend.syntheticPartials);
    }

    const YAML::Node se = config["session"];
    if (se) {
      session.drainTimeoutMs =
          se["drain_timeout_ms"].as<int>(session.drainTimeoutMs);
      session.cancelGraceMs =
          se["cancel_grace_ms"].as<int>(session.cancelGraceMs);
      std::string policy = se["partial_policy"].as<std::string>("replace");
      session.partialPolicy = policy == "monotonic"
                                  ? SessionSettings::PartialPolicy::MONOTONIC
                                  : SessionSettings::PartialPolicy::REPLACE;
    }

    logLevel = config["log_level"].as<std::string>(logLevel);
    logFile = config["log_file"].as<std::string>(logFile);
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid config: " << e.what());
    return false;
  }
}

void Config::applyEnvironment() {
  auto env = [](const char *name) -> const char * {
    const char *value = std::getenv(name);
    return (value && *value) ? value : nullptr;
  };

  try {
    if (const char *host = env("APP_HOST"))
      server.bindIp = host;
    if (const char *port = env("APP_PORT"))
      server.port = std::stoi(port);
    if (const char *maxConn = env("WS_MAX_CONNECTIONS"))
      server.maxConnections = static_cast<size_t>(std::stoul(maxConn));
    if (const char *level = env("LOG_LEVEL"))
      logLevel = level;

    const char *rivaHost = env("RIVA_HOST");
    const char *rivaPort = env("RIVA_PORT");
    if (rivaHost || rivaPort) {
      std::string host = backend.target.substr(0, backend.target.rfind(':'));
      std::string port = backend.target.substr(backend.target.rfind(':') + 1);
      backend.target = std::string(rivaHost ? rivaHost : host) + ":" +
                       (rivaPort ? rivaPort : port);
    }
  } catch (const std::exception &e) {
    LOG_WARN("Ignoring malformed environment override: " << e.what());
  }
}

bool Config::validate() const {
  if (audio.sampleRate != 16000 || audio.channels != 1 || audio.bitDepth != 16) {
    LOG_ERROR("Unsupported audio format " << audio.sampleRate << "Hz/"
              << audio.channels << "ch/" << audio.bitDepth
              << "bit, only 16000Hz mono 16-bit PCM is accepted");
    return false;
  }
  if (server.port <= 0 || server.port > 65535) {
    LOG_ERROR("Invalid server port " << server.port);
    return false;
  }
  if (server.maxConnections == 0 || server.idleTimeoutS <= 0 ||
      server.maxSessionDurationS <= 0 || server.maxPendingMessages == 0) {
    LOG_ERROR("Connection limits must be positive");
    return false;
  }
  if (audio.maxSegmentDurationS <= 0 || vad.windowMs <= 0 ||
      vad.silenceDurationS <= 0 || vad.threshold < 0 || vad.threshold > 1) {
    LOG_ERROR("Invalid VAD/segment settings");
    return false;
  }
  if (backend.maxRetries < 0 || backend.requestTimeoutMs <= 0 ||
      backend.maxPendingSegments == 0 || backend.channelPoolSize == 0) {
    LOG_ERROR("Invalid backend settings");
    return false;
  }
  return true;
}
