#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

Logger &Logger::instance() {
  static Logger instance;
  return instance;
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  currentLevel_ = level;
}

bool Logger::setOutputFile(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.close();
  if (path.empty())
    return true;

  file_.open(path, std::ios::out | std::ios::app);
  return file_.is_open();
}

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  return LogLevel::INFO;
}

void Logger::log(LogLevel level, const std::string &msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostream &out = file_.is_open() ? static_cast<std::ostream &>(file_) : std::cout;

  auto now = std::chrono::system_clock::now();
  auto in_time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&in_time_t, &local);
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms.count() << " ";

  switch (level) {
  case LogLevel::DEBUG:
    out << "[DEBUG] ";
    break;
  case LogLevel::INFO:
    out << "[INFO]  ";
    break;
  case LogLevel::WARN:
    out << "[WARN]  ";
    break;
  case LogLevel::ERROR:
    out << "[ERROR] ";
    break;
  }

  out << msg << std::endl;
}

bool Logger::isEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  return level >= currentLevel_;
}
