#pragma once

#include <optional>
#include <string>
#include <vector>

// Inbound JSON text frame.
struct ControlMessage {
  enum class Type { START_RECORDING, STOP_RECORDING, CONFIGURE, PING, GET_METRICS };

  Type type = Type::PING;

  // start_recording
  std::optional<int> sampleRate;
  std::optional<bool> enablePartials;
  std::vector<std::string> hotwords;

  // configure
  std::optional<double> vadThreshold;
  std::optional<double> silenceDuration;

  // Throws BridgeError(ProtocolError) on malformed JSON, unknown type or
  // out-of-range values.
  static ControlMessage parse(const std::string &text);
};

const char *controlTypeName(ControlMessage::Type type);
