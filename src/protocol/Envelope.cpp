#include "Envelope.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

using ojson = nlohmann::ordered_json;

namespace {

ojson connectionJson(const ConnectionSnapshot &c) {
  ojson j;
  j["id"] = c.id;
  j["uptime_s"] = c.uptimeS;
  j["state"] = c.state;
  j["total_audio_chunks"] = c.audioFrames;
  j["total_segments"] = c.segments;
  j["total_transcriptions"] = c.finals;
  return j;
}

} // namespace

std::string Envelope::isoTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm utc{};
  gmtime_r(&t, &utc);
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << ms.count() << 'Z';
  return out.str();
}

std::string Envelope::connection(const std::string &clientId,
                                 const std::string &protocolVersion) {
  ojson j;
  j["type"] = "connection";
  j["client_id"] = clientId;
  j["protocol_version"] = protocolVersion;
  return j.dump();
}

std::string Envelope::recordingStarted(int sampleRate, int channels,
                                       bool enablePartials) {
  ojson j;
  j["type"] = "recording_started";
  j["config"] = {{"sample_rate", sampleRate},
                 {"channels", channels},
                 {"encoding", "pcm16"},
                 {"enable_partials", enablePartials}};
  return j.dump();
}

std::string Envelope::recordingStopped(const std::string &finalTranscript,
                                       double totalDurationS,
                                       uint64_t totalSegments) {
  ojson j;
  j["type"] = "recording_stopped";
  j["final_transcript"] = finalTranscript;
  j["total_duration"] = totalDurationS;
  j["total_segments"] = totalSegments;
  return j.dump();
}

std::string Envelope::partial(const RecognitionResult &result) {
  ojson j;
  j["type"] = "partial";
  j["segment_id"] = result.sequence;
  j["text"] = result.text;
  j["is_final"] = false;
  return j.dump();
}

std::string Envelope::transcription(const RecognitionResult &result) {
  ojson j;
  j["type"] = "transcription";
  j["segment_id"] = result.sequence;
  j["text"] = result.text;
  j["is_final"] = true;

  ojson words = ojson::array();
  for (const auto &w : result.words) {
    ojson word;
    word["word"] = w.word;
    word["start"] = w.startS;
    word["end"] = w.endS;
    word["confidence"] = w.confidence;
    words.push_back(word);
  }
  j["words"] = words;
  j["processing_time_ms"] = result.latency.count();
  return j.dump();
}

std::string Envelope::error(const std::string &message,
                            std::optional<uint64_t> segmentId) {
  ojson j;
  j["type"] = "error";
  j["error"] = message;
  if (segmentId)
    j["segment_id"] = *segmentId;
  return j.dump();
}

std::string Envelope::pong() {
  ojson j;
  j["type"] = "pong";
  j["timestamp"] = isoTimestamp();
  return j.dump();
}

std::string Envelope::metrics(const GatewaySnapshot &bridge,
                              const ConnectionSnapshot &connection) {
  ojson j;
  j["type"] = "metrics";
  j["bridge"] = {{"active_connections", bridge.activeConnections},
                 {"max_connections", bridge.maxConnections},
                 {"total_connections", bridge.totalAccepted},
                 {"rejected_connections", bridge.totalRejected},
                 {"total_segments", bridge.totalSegments},
                 {"total_transcriptions", bridge.totalFinals},
                 {"backend_mode", bridge.backendMode}};
  j["connection"] = connectionJson(connection);
  j["timestamp"] = isoTimestamp();
  return j.dump();
}

std::string Envelope::status(const GatewaySnapshot &snapshot) {
  ojson j;
  j["status"] = "active";
  j["active_connections"] = snapshot.activeConnections;
  j["max_connections"] = snapshot.maxConnections;
  j["backend_mode"] = snapshot.backendMode;
  ojson conns = ojson::array();
  for (const auto &c : snapshot.connections) {
    conns.push_back({{"id", c.id}, {"uptime_s", c.uptimeS}});
  }
  j["connections"] = conns;
  return j.dump();
}
