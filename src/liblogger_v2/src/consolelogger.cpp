#include "rld/consolelogger.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

rld::ConsoleLogger& rld::ConsoleLogger::instance() {
  static rld::ConsoleLogger instance;
  return instance;
}

void rld::ConsoleLogger::init(const LogLevel level) { setLogLevel(level); }

void rld::ConsoleLogger::setLogLevel(rld::LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void rld::ConsoleLogger::setFormat(LogFormat format) {
  format_.store(format, std::memory_order_release);
}

rld::LogFormat rld::ConsoleLogger::getFormat() const {
  return format_.load(std::memory_order_acquire);
}

void rld::ConsoleLogger::setColored(bool colored) {
  colored_.store(colored, std::memory_order_release);
}

void rld::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout.flush();
}

void rld::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::string formattedMsg;
  try {
    formattedMsg = getFormat() == LogFormat::JSON ? formatJson(level, message)
                                                  : formatText(level, message);
  } catch (const std::exception& e) {
    formattedMsg = "[LOGGER ERROR: " + std::string(e.what()) + "] " + message;
  }

  std::lock_guard lock(mutex_);
  const bool colored =
      colored_.load(std::memory_order_acquire) && getFormat() == LogFormat::TEXT;
  if (colored) std::cout << colorCode(level);
  std::cout << formattedMsg;
  if (colored) std::cout << RLD_ANSI_COLOR_RESET;
  std::cout << '\n';
  if (level >= LogLevel::LOG_ERROR) std::cout.flush();
}

bool rld::ConsoleLogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

std::string rld::ConsoleLogger::formatText(LogLevel level,
                                           const std::string& message) const {
  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message;
  return formatted.str();
}

std::string rld::ConsoleLogger::formatJson(LogLevel level,
                                           const std::string& message) const {
  nlohmann::json record;
  record["time"] =
      TimeFormatter::formatRfc3339(std::chrono::system_clock::now());
  record["level"] = leveltoString(level);
  record["msg"] = message;
  // Имена ресурсов приходят из API-сервера, невалидный UTF-8 заменяется
  return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

const char* rld::ConsoleLogger::colorCode(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "\033[36m";  // Cyan
    case LogLevel::LOG_INFO:
      return "\033[32m";  // Green
    case LogLevel::LOG_WARNING:
      return "\033[33m";  // Yellow
    case LogLevel::LOG_ERROR:
      return "\033[31m";  // Red
    case LogLevel::LOG_CRITICAL:
      return "\033[41m\033[37m";  // White on Red
  }
  return RLD_ANSI_COLOR_RESET;
}
