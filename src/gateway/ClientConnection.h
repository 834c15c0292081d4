#pragma once

#include "../audio/AudioTypes.h"
#include "../session/TranscriptionSession.h"
#include "Transport.h"
#include <atomic>
#include <memory>
#include <string>

struct ClientConnection {
  ClientConnection(const std::string &connectionId, const AudioFormat &fmt,
                   std::shared_ptr<Transport> out)
      : id(connectionId), format(fmt), createdAt(Clock::now()),
        lastActivity(createdAt), transport(std::move(out)) {}

  void touch() { lastActivity = Clock::now(); }

  const std::string id;
  const AudioFormat format;
  const Clock::time_point createdAt;
  std::atomic<Clock::time_point> lastActivity;

  std::shared_ptr<Transport> transport;
  std::shared_ptr<TranscriptionSession> session;
};
