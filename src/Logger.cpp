#include "scantext/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <stdexcept>

namespace scantext {

Logger::Logger() : m_level(Level::Info), m_stream(&std::cerr) {}

Logger &Logger::instance() {
  static Logger logger;
  return logger;
}

void Logger::setStream(std::ostream *stream) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_stream = stream != nullptr ? stream : &std::cerr;
}

void Logger::log(Level level, const std::string &tag,
                 const std::string &message) {
  if (!enabled(level) || level == Level::Off) {
    return;
  }

  const char *levelStr = "INFO";
  switch (level) {
  case Level::Debug:
    levelStr = "DEBUG";
    break;
  case Level::Info:
    levelStr = "INFO";
    break;
  case Level::Warning:
    levelStr = "WARNING";
    break;
  case Level::Error:
    levelStr = "ERROR";
    break;
  case Level::Off:
    return;
  }

  auto now = std::chrono::system_clock::now();
  std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
  std::tm tmInfo{};
  localtime_r(&nowTime, &tmInfo);

  char timeBuffer[32];
  std::strftime(timeBuffer, sizeof(timeBuffer), "%Y-%m-%d %H:%M:%S", &tmInfo);

  std::lock_guard<std::mutex> lock(m_mutex);
  *m_stream << "[" << timeBuffer << "] [" << levelStr << "] [" << tag << "] "
            << message << std::endl;
}

Logger::Level Logger::parseLevel(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug") {
    return Level::Debug;
  }
  if (lower == "info") {
    return Level::Info;
  }
  if (lower == "warning" || lower == "warn") {
    return Level::Warning;
  }
  if (lower == "error") {
    return Level::Error;
  }
  if (lower == "off" || lower == "none") {
    return Level::Off;
  }
  throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace scantext
