#include "BridgeApp.h"
#include "../asr/RivaBackend.h"
#include "../asr/SyntheticBackend.h"
#include "Config.h"
#include "Logger.h"
#include "SignalHandler.h"
#include <chrono>

namespace {
const int kCloseFlushMs = 2000;
}

BridgeApp::BridgeApp() {}

BridgeApp::~BridgeApp() { stop(); }

bool BridgeApp::init(const std::string &configPath) {
  auto &config = Config::instance();
  if (!config.load(configPath))
    return false;

  Logger::instance().setLevel(Logger::parseLevel(config.logLevel));
  if (!config.logFile.empty() && !Logger::instance().setOutputFile(config.logFile)) {
    LOG_ERROR("Cannot open log file " << config.logFile);
    return false;
  }

  if (!createBackends())
    return false;

  gateway_ = std::make_unique<ConnectionGateway>(config, backend_, fallback_);

  ioc_ = std::make_unique<boost::asio::io_context>(config.server.threads);
  server_ = std::make_shared<WebSocketServer>(*ioc_, *gateway_, config.server);
  return server_->start();
}

bool BridgeApp::createBackends() {
  const auto &settings = Config::instance().backend;

  if (settings.mode == BackendSettings::Mode::SYNTHETIC) {
    backend_ = std::make_shared<SyntheticBackend>(settings);
    LOG_INFO("Using synthetic recognition backend");
    return true;
  }

  auto pool = RivaBackend::createChannelPool(settings);
  if (!pool) {
    LOG_ERROR("Failed to create channel pool for " << settings.target);
    return false;
  }
  backend_ = std::make_shared<RivaBackend>(settings, pool);
  if (settings.degradedMode == BackendSettings::DegradedMode::SYNTHETIC)
    fallback_ = std::make_shared<SyntheticBackend>(settings, "[synthetic] ");

  LOG_INFO("Using Riva backend at " << settings.target << " (degraded mode: "
           << (fallback_ ? "synthetic" : "reject") << ")");
  return true;
}

void BridgeApp::run() {
  const int threads = Config::instance().server.threads;
  for (int i = 0; i < threads; ++i) {
    ioThreads_.emplace_back([this]() {
      try {
        ioc_->run();
      } catch (const std::exception &e) {
        LOG_ERROR("I/O thread failed: " << e.what());
        SignalHandler::setExit();
      }
    });
  }

  LOG_INFO("Bridge running with " << threads << " I/O thread(s). Press Ctrl+C to exit.");

  while (!SignalHandler::shouldExit()) {
    gateway_->tick(Clock::now());
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (SignalHandler::lastSignal() != 0)
    LOG_INFO("Received signal " << SignalHandler::lastSignal());
  LOG_INFO("Shutting down...");
  stop();
}

void BridgeApp::stop() {
  if (server_) {
    server_->stop();
    server_.reset();
  }
  if (gateway_)
    gateway_->shutdown();

  // The loop runs out of work once every close handshake is done.
  if (ioc_ && !ioThreads_.empty()) {
    auto deadline = Clock::now() + std::chrono::milliseconds(kCloseFlushMs);
    while (!ioc_->stopped() && Clock::now() < deadline)
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    if (!ioc_->stopped())
      LOG_WARN("Close handshakes still pending after " << kCloseFlushMs << "ms");
  }
  if (ioc_)
    ioc_->stop();
  for (auto &t : ioThreads_) {
    if (t.joinable())
      t.join();
  }
  ioThreads_.clear();
}
