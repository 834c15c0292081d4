#include "app/BridgeApp.h"
#include "app/SignalHandler.h"
#include <iostream>

int main(int argc, char *argv[]) {
  SignalHandler::init();

  std::string configPath = "config/bridge.yaml";
  if (argc > 1) {
    std::string arg = argv[1];
    if (arg == "--config" && argc > 2) {
      configPath = argv[2];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: " << argv[0] << " [--config <path>]" << std::endl;
      return 0;
    }
  }

  BridgeApp app;
  if (!app.init(configPath)) {
    std::cerr << "Failed to initialize bridge" << std::endl;
    return 1;
  }

  app.run();
  return 0;
}
