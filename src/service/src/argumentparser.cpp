/**
 * @file argumentparser.cpp
 * @brief Реализация парсера аргументов командной строки
 *
 * @details
 * Параметры со значением принимаются в GNU-форме "--name=value" и в форме
 * "--name value". Имя сравнивается целиком, поэтому "--config-filex" не
 * будет принят за "--config-file".
 */

#include "../include/argumentparser.hpp"

#include <algorithm>

using namespace std;

const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

namespace {

bool matchesOption(const string &arg, const string &name) {
  return arg == name || arg.compare(0, name.size() + 1, name + "=") == 0;
}

}  // namespace

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    const string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--version" || arg == "-v") {
      args.version_message = true;
    } else if (matchesOption(arg, "--override")) {
      parseOverride(optionValue("--override", arg, i, argc, argv), args);
    } else if (matchesOption(arg, "--config-file")) {
      args.config_path = optionValue("--config-file", arg, i, argc, argv);
    } else if (matchesOption(arg, "--environment")) {
      args.environment = optionValue("--environment", arg, i, argc, argv);
    } else if (matchesOption(arg, "--log-level")) {
      const string level = optionValue("--log-level", arg, i, argc, argv);
      if (find(validLogLevels.begin(), validLogLevels.end(), level) ==
          validLogLevels.end()) {
        throw invalid_argument("ArgumentParser: Invalid log level: " + level);
      }
      args.log_level = level;
    } else {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    }
  }

  return args;
}

string ArgumentParser::optionValue(const string &name, const string &arg,
                                   int &i, int argc, char **argv) const {
  string value;
  if (arg.size() > name.size()) {
    value = arg.substr(name.size() + 1);
  } else if (i + 1 < argc) {
    value = argv[++i];
  } else {
    throw invalid_argument("ArgumentParser: " + name + " requires a value");
  }

  if (value.empty()) {
    throw invalid_argument("ArgumentParser: " + name +
                           " requires a non-empty value");
  }
  return value;
}

void ArgumentParser::parseOverride(const string &value,
                                   ParsedArgs &args) const {
  const size_t colonPos = value.find(':');
  if (colonPos == string::npos || colonPos == 0) {
    throw invalid_argument(
        "ArgumentParser: Invalid override format. Use --override=key:value");
  }
  args.overrides[value.substr(0, colonPos)] = value.substr(colonPos + 1);
}
