#pragma once

#include "../asr/RecognitionBackend.h"
#include "../gateway/ConnectionGateway.h"
#include "../net/WebSocketServer.h"
#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>

class BridgeApp {
public:
  BridgeApp();
  ~BridgeApp();

  bool init(const std::string &configPath);
  void run();

private:
  bool createBackends();
  void stop();

  std::unique_ptr<boost::asio::io_context> ioc_;
  std::shared_ptr<RecognitionBackend> backend_;
  std::shared_ptr<RecognitionBackend> fallback_;
  std::unique_ptr<ConnectionGateway> gateway_;
  std::shared_ptr<WebSocketServer> server_;
  std::vector<std::thread> ioThreads_;
};
