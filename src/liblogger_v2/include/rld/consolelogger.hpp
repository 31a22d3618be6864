#pragma once

#include <atomic>
#include <mutex>

#include "rld/ilogger.hpp"

#define RLD_ANSI_COLOR_RESET "\033[0m"

namespace rld {

/**
 * @class ConsoleLogger
 * @brief Логгер в stdout (Singleton)
 *
 * @details
 * Контроллер работает в поде, поэтому stdout является основным каналом
 * логов. В текстовом режиме строки раскрашиваются по уровню (если вывод
 * идёт в терминал), в JSON-режиме каждая запись выводится одним объектом
 * без цветовых кодов.
 */
class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  void setFormat(LogFormat format);
  LogFormat getFormat() const;

  /// Включает/выключает ANSI-цвета для текстового формата
  void setColored(bool colored);

 protected:
  ConsoleLogger() = default;
  ~ConsoleLogger() override = default;
  void log(LogLevel level, const std::string& message) override;
  bool shouldSkipLog(LogLevel level) const override;

 private:
  std::string formatText(LogLevel level, const std::string& message) const;
  std::string formatJson(LogLevel level, const std::string& message) const;
  static const char* colorCode(LogLevel level);

  mutable std::mutex mutex_;
  std::atomic<LogFormat> format_{LogFormat::TEXT};
  std::atomic<bool> colored_{false};
};
}  // namespace rld
