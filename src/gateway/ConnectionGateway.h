#pragma once

#include "../app/Config.h"
#include "../asr/RecognitionBackend.h"
#include "ConnectionRegistry.h"
#include "Snapshot.h"
#include "Transport.h"
#include <atomic>
#include <boost/uuid/random_generator.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Entry point for every client connection. Transport callbacks for one
// connection must arrive in order; different connections may call in
// concurrently.
class ConnectionGateway {
public:
  ConnectionGateway(const Config &config,
                    std::shared_ptr<RecognitionBackend> backend,
                    std::shared_ptr<RecognitionBackend> fallback);
  ~ConnectionGateway();

  // Returns the connection id, or an empty string when the connection was
  // refused (the transport has then already been told and closed).
  std::string onOpen(std::shared_ptr<Transport> transport,
                     const std::string &requestedClientId = "");
  void onText(const std::string &connectionId, const std::string &text);
  void onBinary(const std::string &connectionId, std::vector<char> data);
  void onClose(const std::string &connectionId);

  // Idle timeout, maximum session duration and drain deadlines. Also joins
  // the backend workers of connections closed since the last tick.
  void tick(Clock::time_point now);

  // Closes every connection and waits out the backend workers.
  void shutdown();

  // Closed connections whose backend worker has not been joined yet.
  size_t retiringConnections();

  GatewaySnapshot snapshot();
  std::string statusJson();

private:
  // A closed connection waits here until its backend worker exits or the
  // cancel grace period runs out.
  struct Retiring {
    std::shared_ptr<ClientConnection> connection;
    Clock::time_point deadline;
  };

  std::string generateId();
  std::shared_ptr<ClientConnection> makeConnection(const std::string &id,
                                                   std::shared_ptr<Transport> transport);
  void handleControl(const std::shared_ptr<ClientConnection> &connection,
                     const std::string &text);
  // Sends a terminal error (when message is non-empty) and tears down.
  void terminate(const std::string &connectionId, const std::string &message,
                 const std::string &reason);
  // Cancels the session without blocking and hands it to reap().
  void release(const std::shared_ptr<ClientConnection> &connection);
  void reap();
  ConnectionSnapshot describe(const ClientConnection &connection,
                              Clock::time_point now);

  Config config_;
  AudioFormat format_;
  std::shared_ptr<RecognitionBackend> backend_;
  std::shared_ptr<RecognitionBackend> fallback_;
  ConnectionRegistry registry_;

  std::mutex uuidMutex_;
  boost::uuids::random_generator uuidGen_;

  std::mutex retiringMutex_;
  std::vector<Retiring> retiring_;

  std::atomic<uint64_t> totalAccepted_{0};
  std::atomic<uint64_t> totalRejected_{0};
  std::atomic<uint64_t> retiredSegments_{0};
  std::atomic<uint64_t> retiredFinals_{0};
};
