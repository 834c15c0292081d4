#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct ConnectionSnapshot {
  std::string id;
  double uptimeS = 0.0;
  std::string state;
  uint64_t audioFrames = 0;
  uint64_t segments = 0;
  uint64_t finals = 0;
};

// Read-only health view of the gateway.
struct GatewaySnapshot {
  size_t activeConnections = 0;
  size_t maxConnections = 0;
  uint64_t totalAccepted = 0;
  uint64_t totalRejected = 0;
  uint64_t totalSegments = 0;
  uint64_t totalFinals = 0;
  std::string backendMode;
  std::vector<ConnectionSnapshot> connections;
};
