#pragma once

#include <atomic>

class SignalHandler {
public:
  static void init();
  static bool shouldExit();
  static void setExit();
  // Number of the signal that requested the exit, 0 when none did.
  static int lastSignal();

private:
  static void handleSignal(int signum);
  static std::atomic<bool> exitFlag_;
  static std::atomic<int> lastSignal_;
};
