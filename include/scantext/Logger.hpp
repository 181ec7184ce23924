#ifndef SCANTEXT_LOGGER_HPP
#define SCANTEXT_LOGGER_HPP

#include <atomic>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace scantext {

/**
 * @brief Leveled, thread-safe line logger writing to std::cerr
 *
 * Each line carries a timestamp, the level and a component tag:
 * @code
 * [2026-10-19 12:00:00] [INFO] [Orchestrator] request done in 12.5 ms
 * @endcode
 */
class Logger {
public:
  enum class Level { Debug, Info, Warning, Error, Off };

  /**
   * @brief Process-wide logger instance
   */
  static Logger &instance();

  void setLevel(Level level) { m_level = level; }
  Level level() const { return m_level; }
  bool enabled(Level level) const { return level >= m_level; }

  /**
   * @brief Redirect output (std::cerr by default); the stream must outlive
   * the logger or be reset before it is destroyed
   */
  void setStream(std::ostream *stream);

  void log(Level level, const std::string &tag, const std::string &message);

  /**
   * @brief Parse "debug", "info", "warning", "error" or "off"
   * @throws std::invalid_argument for any other name
   */
  static Level parseLevel(const std::string &name);

private:
  Logger();

  std::atomic<Level> m_level;
  std::ostream *m_stream;
  std::mutex m_mutex;
};

namespace detail {

inline void appendAll(std::ostringstream &) {}

template <typename T, typename... Rest>
void appendAll(std::ostringstream &out, const T &value, const Rest &...rest) {
  out << value;
  appendAll(out, rest...);
}

template <typename... Args>
void logParts(Logger::Level level, const std::string &tag,
              const Args &...parts) {
  Logger &logger = Logger::instance();
  if (!logger.enabled(level)) {
    return;
  }
  std::ostringstream out;
  appendAll(out, parts...);
  logger.log(level, tag, out.str());
}

} // namespace detail

template <typename... Args>
void logDebug(const std::string &tag, const Args &...parts) {
  detail::logParts(Logger::Level::Debug, tag, parts...);
}

template <typename... Args>
void logInfo(const std::string &tag, const Args &...parts) {
  detail::logParts(Logger::Level::Info, tag, parts...);
}

template <typename... Args>
void logWarning(const std::string &tag, const Args &...parts) {
  detail::logParts(Logger::Level::Warning, tag, parts...);
}

template <typename... Args>
void logError(const std::string &tag, const Args &...parts) {
  detail::logParts(Logger::Level::Error, tag, parts...);
}

} // namespace scantext

#endif // SCANTEXT_LOGGER_HPP
