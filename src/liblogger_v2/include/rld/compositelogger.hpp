#pragma once

#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>

#include "rld/ilogger.hpp"

namespace rld {

/**
 * @class CompositeLogger
 * @brief Глобальная точка логирования, рассылающая записи вложенным логгерам
 *
 * @details
 * Все компоненты контроллера пишут через CompositeLogger::instance().
 * Набор вложенных логгеров формируется при старте ServiceController;
 * фильтрация по уровню выполняется вложенными логгерами.
 */
class CompositeLogger : public ILogger {
 public:
  static CompositeLogger& instance();

  CompositeLogger(const CompositeLogger&) = delete;
  CompositeLogger& operator=(const CompositeLogger&) = delete;

  void addLogger(const std::shared_ptr<ILogger>& logger);

  /// Удаляет все вложенные логгеры (используется при переинициализации)
  void clear();

  void init(const LogLevel level) override;

  void setLogLevel(LogLevel level) override;

  void flush() override;

  void debug(const std::string& message) override;
  void info(const std::string& message) override;
  void warning(const std::string& message) override;
  void error(const std::string& message) override;
  void critical(const std::string& message) override;

 protected:
  bool shouldSkipLog(LogLevel level) const override;
  void log(LogLevel level, const std::string& message) override;

 private:
  CompositeLogger() = default;
  ~CompositeLogger() override = default;

  std::vector<std::shared_ptr<ILogger>> snapshot() const;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace rld
