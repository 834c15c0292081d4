#pragma once

#include "ClientConnection.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class ConnectionRegistry {
public:
  enum class AddResult { ADDED, FULL, DUPLICATE_ID };

  explicit ConnectionRegistry(size_t capacity) : capacity_(capacity) {}

  AddResult addConnection(std::shared_ptr<ClientConnection> connection);
  std::shared_ptr<ClientConnection> getConnection(const std::string &id);
  // Returns the removed connection, null when it was already gone.
  std::shared_ptr<ClientConnection> removeConnection(const std::string &id);

  size_t count();
  size_t capacity() const { return capacity_; }
  std::vector<std::shared_ptr<ClientConnection>> getAllConnections();

private:
  size_t capacity_;
  std::map<std::string, std::shared_ptr<ClientConnection>> connections_;
  std::mutex mutex_;
};
