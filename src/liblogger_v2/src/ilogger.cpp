#include "rld/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

bool rld::TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) {
    std::cerr << "Ошибка формата времени: пустой формат" << std::endl;
    return false;
  }
  globalFormat_ = fmt;
  return true;
}

std::string rld::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  auto now_time = std::chrono::system_clock::to_time_t(tp);
  std::tm now_tm{};
  localtime_r(&now_time, &now_tm);

  std::ostringstream oss;
  oss << std::put_time(&now_tm, globalFormat_.c_str());
  return oss.str();
}

std::string rld::TimeFormatter::formatRfc3339(
    const std::chrono::system_clock::time_point& tp) {
  auto time = std::chrono::system_clock::to_time_t(tp);
  std::tm utc_tm{};
  gmtime_r(&time, &utc_tm);

  std::ostringstream oss;
  oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

rld::LogLevel rld::ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void rld::ILogger::debug(const std::string& message) {
  log(rld::LogLevel::LOG_DEBUG, message);
}

void rld::ILogger::info(const std::string& message) {
  log(rld::LogLevel::LOG_INFO, message);
}

void rld::ILogger::warning(const std::string& message) {
  log(rld::LogLevel::LOG_WARNING, message);
}

void rld::ILogger::error(const std::string& message) {
  log(rld::LogLevel::LOG_ERROR, message);
}

void rld::ILogger::critical(const std::string& message) {
  log(rld::LogLevel::LOG_CRITICAL, message);
}

std::string rld::leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "";
}

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

}  // namespace

rld::LogLevel rld::stringToLogLevel(const std::string& level) {
  const std::string lowered = toLower(level);
  if (lowered == "debug") return LogLevel::LOG_DEBUG;
  if (lowered == "info") return LogLevel::LOG_INFO;
  if (lowered == "warning" || lowered == "warn") return LogLevel::LOG_WARNING;
  if (lowered == "error") return LogLevel::LOG_ERROR;
  if (lowered == "critical") return LogLevel::LOG_CRITICAL;
  throw std::invalid_argument("Unknown log level: " + level);
}

rld::LogFormat rld::stringToLogFormat(const std::string& format) {
  const std::string lowered = toLower(format);
  if (lowered.empty() || lowered == "text") return LogFormat::TEXT;
  if (lowered == "json") return LogFormat::JSON;
  throw std::invalid_argument("Unknown log format: " + format);
}
