/**
 * @file ilogger.hpp
 * @author Artem Ulyanov
 * @date March 2025
 * @brief Базовый интерфейс логгеров контроллера и вспомогательные компоненты.
 *
 * @details
 * Определяет уровни логирования, формат вывода (текст или JSON, по одной
 * записи в строке), форматирование меток времени и абстрактный класс ILogger,
 * от которого наследуются ConsoleLogger и CompositeLogger.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace rld {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/**
 * @brief Формат строки лога
 *
 * TEXT: "<время> [LEVEL] сообщение"; JSON: {"time","level","msg"}.
 * JSON-формат удобен для сборщиков логов кластера (fluent-bit, loki).
 */
enum class LogFormat { TEXT, JSON };

class TimeFormatter {
 public:
  static bool setGlobalFormat(const std::string& fmt);

  static std::string format(const std::chrono::system_clock::time_point& tp);

  /// Время в UTC в формате RFC 3339 (2025-05-14T10:00:00Z)
  static std::string formatRfc3339(
      const std::chrono::system_clock::time_point& tp);

 private:
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
};

class ILogger {
 public:
  virtual void init(const LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level) = 0;
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual ~ILogger() = default;
  virtual void log(LogLevel, const std::string&) = 0;
  virtual bool shouldSkipLog(LogLevel level) const = 0;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Преобразует строку конфигурации в уровень логирования
 * @param[in] level "debug", "info", "warning", "error" или "critical"
 * @throw std::invalid_argument Для неизвестного уровня
 */
LogLevel stringToLogLevel(const std::string& level);

/**
 * @brief Преобразует строку конфигурации в формат логирования
 * @param[in] format "text" или "json"
 * @throw std::invalid_argument Для неизвестного формата
 */
LogFormat stringToLogFormat(const std::string& format);

}  // namespace rld
