#pragma once

#include <string>

// Outbound half of a client connection. Implementations must be safe to call
// from any thread and must not block on the network.
class Transport {
public:
  virtual ~Transport() = default;

  virtual void sendText(const std::string &text) = 0;
  // Flushes what was already queued, then closes.
  virtual void close(const std::string &reason) = 0;
};
