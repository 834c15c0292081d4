#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <string>

// Messages waiting for one client. While a write is in progress the front
// entry is the one being written.
class OutboundQueue {
public:
  explicit OutboundQueue(size_t limit) : limit_(limit == 0 ? 1 : limit) {}

  // False when the queue is at its limit; the message is then not kept.
  bool push(std::shared_ptr<const std::string> msg) {
    if (queue_.size() >= limit_)
      return false;
    queue_.push_back(std::move(msg));
    return true;
  }

  const std::string &front() const { return *queue_.front(); }
  void pop() { queue_.pop_front(); }

  // Keeps only the entry being written.
  void dropPending() {
    if (queue_.size() > 1)
      queue_.erase(queue_.begin() + 1, queue_.end());
  }

  void clear() { queue_.clear(); }
  bool empty() const { return queue_.empty(); }
  size_t size() const { return queue_.size(); }
  size_t limit() const { return limit_; }

private:
  size_t limit_;
  std::deque<std::shared_ptr<const std::string>> queue_;
};
