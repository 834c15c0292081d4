#include "ConnectionRegistry.h"

ConnectionRegistry::AddResult
ConnectionRegistry::addConnection(std::shared_ptr<ClientConnection> connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connections_.size() >= capacity_)
    return AddResult::FULL;
  if (connections_.find(connection->id) != connections_.end())
    return AddResult::DUPLICATE_ID;
  connections_[connection->id] = connection;
  return AddResult::ADDED;
}

std::shared_ptr<ClientConnection>
ConnectionRegistry::getConnection(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id);
  if (it != connections_.end())
    return it->second;
  return nullptr;
}

std::shared_ptr<ClientConnection>
ConnectionRegistry::removeConnection(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(id);
  if (it == connections_.end())
    return nullptr;
  auto connection = it->second;
  connections_.erase(it);
  return connection;
}

size_t ConnectionRegistry::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::vector<std::shared_ptr<ClientConnection>>
ConnectionRegistry::getAllConnections() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<ClientConnection>> all;
  for (const auto &pair : connections_) {
    all.push_back(pair.second);
  }
  return all;
}
