#include "ControlMessage.h"
#include "../app/BridgeError.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Reads key from obj, or from obj["config"] when the client nests it.
const json *lookup(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it != obj.end() && !it->is_null())
    return &*it;
  auto cfg = obj.find("config");
  if (cfg != obj.end() && cfg->is_object()) {
    auto nested = cfg->find(key);
    if (nested != cfg->end() && !nested->is_null())
      return &*nested;
  }
  return nullptr;
}

double number(const json &value, const char *key) {
  if (!value.is_number())
    throw BridgeError(ErrorKind::ProtocolError, std::string(key) + " must be a number");
  return value.get<double>();
}

} // namespace

const char *controlTypeName(ControlMessage::Type type) {
  switch (type) {
  case ControlMessage::Type::START_RECORDING:
    return "start_recording";
  case ControlMessage::Type::STOP_RECORDING:
    return "stop_recording";
  case ControlMessage::Type::CONFIGURE:
    return "configure";
  case ControlMessage::Type::PING:
    return "ping";
  case ControlMessage::Type::GET_METRICS:
    return "get_metrics";
  }
  return "unknown";
}

ControlMessage ControlMessage::parse(const std::string &text) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded())
    throw BridgeError(ErrorKind::ProtocolError, "invalid JSON message");
  if (!doc.is_object())
    throw BridgeError(ErrorKind::ProtocolError, "control message must be a JSON object");

  auto typeIt = doc.find("type");
  if (typeIt == doc.end() || !typeIt->is_string())
    throw BridgeError(ErrorKind::ProtocolError, "missing message type");

  const std::string type = typeIt->get<std::string>();
  ControlMessage msg;

  if (type == "start_recording") {
    msg.type = Type::START_RECORDING;
    if (const json *rate = lookup(doc, "sample_rate")) {
      if (!rate->is_number_integer())
        throw BridgeError(ErrorKind::ProtocolError, "sample_rate must be an integer");
      msg.sampleRate = rate->get<int>();
    }
    if (const json *partials = lookup(doc, "enable_partials")) {
      if (!partials->is_boolean())
        throw BridgeError(ErrorKind::ProtocolError, "enable_partials must be a boolean");
      msg.enablePartials = partials->get<bool>();
    }
    if (const json *words = lookup(doc, "hotwords")) {
      if (!words->is_array())
        throw BridgeError(ErrorKind::ProtocolError, "hotwords must be a list");
      for (const auto &w : *words) {
        if (w.is_string())
          msg.hotwords.push_back(w.get<std::string>());
      }
    }
  } else if (type == "stop_recording") {
    msg.type = Type::STOP_RECORDING;
  } else if (type == "configure") {
    msg.type = Type::CONFIGURE;
    if (const json *t = lookup(doc, "vad_threshold")) {
      double v = number(*t, "vad_threshold");
      if (v < 0.0 || v > 1.0)
        throw BridgeError(ErrorKind::ProtocolError, "vad_threshold must be within [0, 1]");
      msg.vadThreshold = v;
    }
    if (const json *d = lookup(doc, "silence_duration")) {
      double v = number(*d, "silence_duration");
      if (v <= 0.0)
        throw BridgeError(ErrorKind::ProtocolError, "silence_duration must be positive");
      msg.silenceDuration = v;
    }
    if (!msg.vadThreshold && !msg.silenceDuration)
      throw BridgeError(ErrorKind::ProtocolError, "configure carries no settings");
  } else if (type == "ping") {
    msg.type = Type::PING;
  } else if (type == "get_metrics") {
    msg.type = Type::GET_METRICS;
  } else {
    throw BridgeError(ErrorKind::ProtocolError, "unknown message type: " + type);
  }
  return msg;
}
