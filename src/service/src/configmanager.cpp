#include "../include/configmanager.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

ConfigManager &ConfigManager::instance() {
  static ConfigManager instance;
  return instance;
}

void ConfigManager::initialize(const std::string &filename) {
  nlohmann::json config;
  try {
    config = loader_.loadFromFile(filename);
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Config initialization failed: ") +
                             e.what());
  }
  initializeFromJson(std::move(config));

  std::lock_guard<std::mutex> lock(configMutex_);
  configFilePath_ = filename;
}

void ConfigManager::initializeFromJson(nlohmann::json config) {
  try {
    envProcessor_.process(config);
    validator_.validateRoot(config);
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Config initialization failed: ") +
                             e.what());
  }

  std::lock_guard<std::mutex> lock(configMutex_);
  baseConfig_ = std::move(config);
  overrides_ = nlohmann::json::object();
  configFilePath_.clear();
}

nlohmann::json ConfigManager::getMergedConfig(const std::string &env) const {
  std::lock_guard<std::mutex> lock(configMutex_);

  if (!baseConfig_.contains("environments") ||
      !baseConfig_["environments"].contains(env)) {
    throw std::runtime_error("Environment '" + env + "' not found");
  }

  nlohmann::json merged = baseConfig_["defaults"];
  merged.merge_patch(baseConfig_["environments"][env]);
  merged.merge_patch(overrides_);

  validator_.validateReloaderConfig(merged);
  return merged;
}

void ConfigManager::applyCliOverrides(
    const std::unordered_map<std::string, std::string> &overrides) {
  std::lock_guard<std::mutex> lock(configMutex_);

  for (const auto &[key, value] : overrides) {
    if (key.empty()) {
      throw std::invalid_argument("Override key cannot be empty");
    }
    // "alert.sink" -> /alert/sink
    std::string pointer;
    std::stringstream parts(key);
    std::string part;
    while (std::getline(parts, part, '.')) {
      if (part.empty()) {
        throw std::invalid_argument("Invalid override key: " + key);
      }
      pointer += "/" + part;
    }
    overrides_[nlohmann::json::json_pointer(pointer)] =
        parseOverrideValue(value);
  }
}

std::string ConfigManager::configFilePath() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return configFilePath_;
}

nlohmann::json ConfigManager::parseOverrideValue(const std::string &value) {
  auto parsed = nlohmann::json::parse(value, nullptr, false);
  if (parsed.is_discarded()) return value;
  return parsed;
}
