#include "../include/enviromentprocessor.hpp"

#include <cstdlib>

#include "rld/compositelogger.hpp"

void EnvironmentProcessor::process(nlohmann::json &config) const {
  walkJson(config, [this](std::string &value) {
    const std::string original = value;
    if (resolveVariable(value) > 0) {
      rld::CompositeLogger::instance().warning(
          "Unresolved environment placeholder in config value '" + original +
          "'");
    }
  });
}

void EnvironmentProcessor::walkJson(
    nlohmann::json &node,
    const std::function<void(std::string &)> &func) const {
  if (node.is_object()) {
    for (auto &[key, value] : node.items()) {
      walkJson(value, func);
    }
  } else if (node.is_array()) {
    for (auto &element : node) {
      walkJson(element, func);
    }
  } else if (node.is_string()) {
    std::string str = node.get<std::string>();
    func(str);
    node = str;
  }
}

std::size_t EnvironmentProcessor::resolveVariable(std::string &value) const {
  static const std::string prefix = "$ENV{";
  std::size_t unresolved = 0;
  std::size_t start_pos = 0;

  while ((start_pos = value.find(prefix, start_pos)) != std::string::npos) {
    const std::size_t end_pos = value.find('}', start_pos + prefix.length());
    if (end_pos == std::string::npos) break;

    const std::string var_name =
        value.substr(start_pos + prefix.length(),
                     end_pos - start_pos - prefix.length());

    if (const char *env_val = std::getenv(var_name.c_str())) {
      const std::string replacement(env_val);
      value.replace(start_pos, end_pos - start_pos + 1, replacement);
      start_pos += replacement.size();
    } else {
      ++unresolved;
      start_pos = end_pos + 1;
    }
  }
  return unresolved;
}
