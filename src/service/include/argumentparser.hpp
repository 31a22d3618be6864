/**
 * @file argumentparser.hpp
 * @brief Разбор аргументов командной строки контроллера
 *
 * @details
 * Поддерживаемые параметры:
 *  - --help, -h; --version, -v
 *  - --config-file=FILE (или --config-file FILE)
 *  - --environment=NAME (или --environment NAME)
 *  - --log-level=LEVEL (или --log-level LEVEL)
 *  - --override=KEY:VALUE, можно повторять
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

struct ParsedArgs {
  std::string config_path = "config.json";
  std::unordered_map<std::string, std::string> overrides;
  std::optional<std::string> log_level;
  std::string environment = "production";
  bool help_message = false;
  bool version_message = false;
};

class ArgumentParser {
 public:
  /**
   * @throw std::invalid_argument Неизвестный параметр, отсутствующее или
   *        недопустимое значение
   */
  ParsedArgs parse(int argc, char **argv);

 private:
  static const std::vector<std::string> validLogLevels;

  /// Значение из "--name=value" или следующего аргумента
  std::string optionValue(const std::string &name, const std::string &arg,
                          int &i, int argc, char **argv) const;
  void parseOverride(const std::string &value, ParsedArgs &args) const;
};
