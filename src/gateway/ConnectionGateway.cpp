#include "ConnectionGateway.h"
#include "../app/BridgeError.h"
#include "../app/Logger.h"
#include "../protocol/ControlMessage.h"
#include "../protocol/Envelope.h"
#include <algorithm>
#include <boost/uuid/uuid_io.hpp>

ConnectionGateway::ConnectionGateway(const Config &config,
                                     std::shared_ptr<RecognitionBackend> backend,
                                     std::shared_ptr<RecognitionBackend> fallback)
    : config_(config), backend_(std::move(backend)),
      fallback_(std::move(fallback)),
      registry_(config.server.maxConnections) {
  format_.sampleRate = config.audio.sampleRate;
  format_.channels = config.audio.channels;
  format_.bitDepth = config.audio.bitDepth;
}

ConnectionGateway::~ConnectionGateway() { shutdown(); }

std::string ConnectionGateway::generateId() {
  std::lock_guard<std::mutex> lock(uuidMutex_);
  return boost::uuids::to_string(uuidGen_());
}

std::shared_ptr<ClientConnection>
ConnectionGateway::makeConnection(const std::string &id,
                                  std::shared_ptr<Transport> transport) {
  auto connection = std::make_shared<ClientConnection>(id, format_, transport);
  std::weak_ptr<Transport> out = transport;
  connection->session = std::make_shared<TranscriptionSession>(
      id, format_, config_, backend_, fallback_,
      [out](const std::string &json) {
        if (auto t = out.lock())
          t->sendText(json);
      });
  connection->session->init();
  return connection;
}

std::string ConnectionGateway::onOpen(std::shared_ptr<Transport> transport,
                                      const std::string &requestedClientId) {
  std::string id = requestedClientId.empty() ? generateId() : requestedClientId;
  auto connection = makeConnection(id, transport);
  auto added = registry_.addConnection(connection);
  if (added == ConnectionRegistry::AddResult::DUPLICATE_ID) {
    LOG_WARN("client_id " << id << " already connected, assigning a new id");
    connection->session->close(std::chrono::milliseconds(0));
    id = generateId();
    connection = makeConnection(id, transport);
    added = registry_.addConnection(connection);
  }

  if (added != ConnectionRegistry::AddResult::ADDED) {
    totalRejected_++;
    LOG_WARN("Refusing connection " << id << ": " << registry_.count() << "/"
             << registry_.capacity() << " connections active");
    transport->sendText(Envelope::error(
        std::string(errorKindName(ErrorKind::Busy)) +
        ": maximum concurrent connections reached"));
    transport->close("connection limit reached");
    connection->session->close(std::chrono::milliseconds(0));
    return "";
  }

  totalAccepted_++;
  LOG_INFO("[conn " << id << "] connected (" << registry_.count() << "/"
           << registry_.capacity() << " active)");
  transport->sendText(Envelope::connection(id, config_.server.protocolVersion));
  return id;
}

void ConnectionGateway::onText(const std::string &connectionId,
                               const std::string &text) {
  auto connection = registry_.getConnection(connectionId);
  if (!connection)
    return;
  connection->touch();

  try {
    handleControl(connection, text);
  } catch (const BridgeError &e) {
    if (e.kind() == ErrorKind::FormatError) {
      terminate(connectionId, e.what(), "format error");
      return;
    }
    LOG_WARN("[conn " << connectionId << "] " << e.what());
    connection->transport->sendText(Envelope::error(e.what()));
  } catch (const std::exception &e) {
    LOG_ERROR("[conn " << connectionId << "] control message failed: " << e.what());
    terminate(connectionId,
              std::string(errorKindName(ErrorKind::ProtocolError)) + ": " + e.what(),
              "internal error");
  }
}

void ConnectionGateway::handleControl(
    const std::shared_ptr<ClientConnection> &connection, const std::string &text) {
  ControlMessage msg = ControlMessage::parse(text);
  LOG_DEBUG("[conn " << connection->id << "] " << controlTypeName(msg.type));

  switch (msg.type) {
  case ControlMessage::Type::START_RECORDING:
    connection->session->startRecording(msg);
    break;
  case ControlMessage::Type::STOP_RECORDING:
    connection->session->stopRecording();
    break;
  case ControlMessage::Type::CONFIGURE:
    connection->session->configure(msg);
    break;
  case ControlMessage::Type::PING:
    connection->transport->sendText(Envelope::pong());
    break;
  case ControlMessage::Type::GET_METRICS:
    connection->transport->sendText(Envelope::metrics(
        snapshot(), describe(*connection, Clock::now())));
    break;
  }
}

void ConnectionGateway::onBinary(const std::string &connectionId,
                                 std::vector<char> data) {
  auto connection = registry_.getConnection(connectionId);
  if (!connection)
    return;
  connection->touch();

  try {
    connection->session->onAudio(AudioFrame(connection->format, std::move(data)));
  } catch (const BridgeError &e) {
    LOG_ERROR("[conn " << connectionId << "] " << e.what());
    terminate(connectionId, e.what(), "invalid audio");
  } catch (const std::exception &e) {
    LOG_ERROR("[conn " << connectionId << "] audio handling failed: " << e.what());
    terminate(connectionId,
              std::string(errorKindName(ErrorKind::TransportError)) + ": " + e.what(),
              "internal error");
  }
}

void ConnectionGateway::onClose(const std::string &connectionId) {
  auto connection = registry_.removeConnection(connectionId);
  if (!connection)
    return;
  LOG_INFO("[conn " << connectionId << "] disconnected");
  release(connection);
}

void ConnectionGateway::terminate(const std::string &connectionId,
                                  const std::string &message,
                                  const std::string &reason) {
  auto connection = registry_.removeConnection(connectionId);
  if (!connection)
    return;
  LOG_INFO("[conn " << connectionId << "] closing: " << reason);
  if (!message.empty())
    connection->transport->sendText(Envelope::error(message));
  connection->transport->close(reason);
  release(connection);
}

void ConnectionGateway::release(const std::shared_ptr<ClientConnection> &connection) {
  auto counters = connection->session->counters();
  retiredSegments_ += counters.segments;
  retiredFinals_ += counters.finals;

  connection->session->cancel();
  std::lock_guard<std::mutex> lock(retiringMutex_);
  retiring_.push_back(
      {connection,
       Clock::now() + std::chrono::milliseconds(config_.session.cancelGraceMs)});
}

void ConnectionGateway::reap() {
  std::vector<Retiring> done;
  {
    std::lock_guard<std::mutex> lock(retiringMutex_);
    auto now = Clock::now();
    auto it = retiring_.begin();
    while (it != retiring_.end()) {
      if (it->connection->session->backendStopped() || now >= it->deadline) {
        done.push_back(*it);
        it = retiring_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (const auto &r : done) {
    if (!r.connection->session->close(std::chrono::milliseconds(0))) {
      LOG_ERROR("[conn " << r.connection->id
                << "] backend call did not stop within the grace period");
    }
  }
}

size_t ConnectionGateway::retiringConnections() {
  std::lock_guard<std::mutex> lock(retiringMutex_);
  return retiring_.size();
}

void ConnectionGateway::tick(Clock::time_point now) {
  const auto idleLimit = std::chrono::seconds(config_.server.idleTimeoutS);
  const auto maxDuration = std::chrono::seconds(config_.server.maxSessionDurationS);

  for (const auto &connection : registry_.getAllConnections()) {
    if (now - connection->createdAt >= maxDuration) {
      terminate(connection->id,
                std::string(errorKindName(ErrorKind::TransportError)) +
                    ": maximum session duration of " +
                    std::to_string(config_.server.maxSessionDurationS) +
                    "s reached",
                "max session duration");
      continue;
    }
    if (now - connection->lastActivity.load() >= idleLimit) {
      terminate(connection->id,
                std::string(errorKindName(ErrorKind::TransportError)) +
                    ": no activity for " +
                    std::to_string(config_.server.idleTimeoutS) + "s",
                "idle timeout");
      continue;
    }
    connection->session->tick(now);
  }
  reap();
}

void ConnectionGateway::shutdown() {
  auto all = registry_.getAllConnections();
  if (!all.empty())
    LOG_INFO("Closing " << all.size() << " connection(s)");
  for (const auto &connection : all)
    terminate(connection->id, "", "server shutting down");

  std::vector<Retiring> left;
  {
    std::lock_guard<std::mutex> lock(retiringMutex_);
    left.swap(retiring_);
  }
  for (const auto &r : left) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        r.deadline - Clock::now());
    if (!r.connection->session->close(
            std::max(remaining, std::chrono::milliseconds(0)))) {
      LOG_ERROR("[conn " << r.connection->id
                << "] backend call did not stop within the grace period");
    }
  }
}

ConnectionSnapshot ConnectionGateway::describe(const ClientConnection &connection,
                                               Clock::time_point now) {
  auto counters = connection.session->counters();
  ConnectionSnapshot c;
  c.id = connection.id;
  c.uptimeS = std::chrono::duration<double>(now - connection.createdAt).count();
  c.state = sessionStateName(connection.session->state());
  c.audioFrames = counters.audioFrames;
  c.segments = counters.segments;
  c.finals = counters.finals;
  return c;
}

GatewaySnapshot ConnectionGateway::snapshot() {
  GatewaySnapshot s;
  auto now = Clock::now();
  auto all = registry_.getAllConnections();
  s.activeConnections = all.size();
  s.maxConnections = registry_.capacity();
  s.totalAccepted = totalAccepted_;
  s.totalRejected = totalRejected_;
  s.totalSegments = retiredSegments_;
  s.totalFinals = retiredFinals_;
  s.backendMode = backendModeName(config_.backend.mode);
  for (const auto &connection : all) {
    ConnectionSnapshot c = describe(*connection, now);
    s.totalSegments += c.segments;
    s.totalFinals += c.finals;
    s.connections.push_back(c);
  }
  return s;
}

std::string ConnectionGateway::statusJson() { return Envelope::status(snapshot()); }
