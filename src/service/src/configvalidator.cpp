/**
 * @file configvalidator.cpp
 * @brief Реализация валидатора конфигурации
 */
#include "../include/configvalidator.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <stdexcept>
#include <vector>

#include "../include/reloaderoptions.hpp"

using namespace std;

namespace {

string lowered(string value) {
  transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return static_cast<char>(tolower(c)); });
  return value;
}

}  // namespace

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
  if (!config.is_object()) {
    throw runtime_error("ConfigValidator: Configuration must be a JSON object");
  }

  const vector<string> required_sections = {"defaults", "environments"};
  for (const auto &section : required_sections) {
    if (!config.contains(section) || !config[section].is_object()) {
      throw runtime_error("ConfigValidator: Missing required section: " +
                          section);
    }
  }

  if (config["defaults"].empty()) {
    throw runtime_error("ConfigValidator: Defaults section cannot be empty");
  }

  return true;
}

bool ConfigValidator::validateReloaderConfig(
    const nlohmann::json &config) const {
  if (!config.is_object()) {
    throw runtime_error("ConfigValidator: Merged configuration must be an object");
  }

  validateOneOf(config, "reload_strategy", {"env-vars", "annotations"});
  validateOneOf(config, "log_level",
                {"debug", "info", "warning", "error", "critical"});
  validateOneOf(config, "log_format", {"text", "json"});

  for (const char *key : {"auto_reload_all", "reload_on_create", "is_openshift",
                          "is_argo_rollouts"}) {
    validateBoolean(config, key);
  }

  if (config.contains("delayed_upgrade_window_seconds")) {
    const auto &window = config["delayed_upgrade_window_seconds"];
    if (!window.is_number() || window.get<double>() < 0 ||
        window.get<double>() >
            ReloaderOptions::kMaxDelayedUpgradeWindowSeconds) {
      throw runtime_error(
          "ConfigValidator: delayed_upgrade_window_seconds must be a "
          "number within [0, 86400]");
    }
  }
  if (config.contains("poll_interval_seconds")) {
    const auto &interval = config["poll_interval_seconds"];
    if (!interval.is_number_integer() || interval.get<long long>() <= 0 ||
        interval.get<long long>() > ReloaderOptions::kMaxPollIntervalSeconds) {
      throw runtime_error(
          "ConfigValidator: poll_interval_seconds must be an integer within "
          "[1, 86400]");
    }
  }

  validateStringArray(config, "namespaces");
  validateStringArray(config, "namespaces_to_ignore");
  validateStringArray(config, "resources_to_ignore");
  if (config.contains("resources_to_ignore")) {
    bool configmaps = false;
    bool secrets = false;
    for (const auto &entry : config["resources_to_ignore"]) {
      const string kind = lowered(entry.get<string>());
      if (kind == "configmaps") {
        configmaps = true;
      } else if (kind == "secrets") {
        secrets = true;
      } else {
        throw runtime_error(
            "ConfigValidator: resources_to_ignore accepts only 'configmaps' "
            "or 'secrets', got '" +
            entry.get<string>() + "'");
      }
    }
    if (configmaps && secrets) {
      throw runtime_error(
          "ConfigValidator: resources_to_ignore cannot contain both "
          "'configmaps' and 'secrets'");
    }
  }

  if (config.contains("webhook_url") && !config["webhook_url"].is_string()) {
    throw runtime_error("ConfigValidator: webhook_url must be a string");
  }
  if (config.contains("annotations") && !config["annotations"].is_object()) {
    throw runtime_error("ConfigValidator: annotations must be an object");
  }
  if (config.contains("alert")) {
    validateAlert(config["alert"]);
  }
  if (config.contains("kubernetes")) {
    validateKubernetes(config["kubernetes"]);
  }
  return true;
}

void ConfigValidator::validateBoolean(const nlohmann::json &config,
                                      const string &key) const {
  if (config.contains(key) && !config[key].is_boolean()) {
    throw runtime_error("ConfigValidator: " + key + " must be a boolean");
  }
}

void ConfigValidator::validateStringArray(const nlohmann::json &config,
                                          const string &key) const {
  if (!config.contains(key)) return;
  const auto &value = config[key];
  if (!value.is_array()) {
    throw runtime_error("ConfigValidator: " + key + " must be an array");
  }
  for (const auto &entry : value) {
    if (!entry.is_string()) {
      throw runtime_error("ConfigValidator: " + key +
                          " must contain only strings");
    }
  }
}

void ConfigValidator::validateOneOf(
    const nlohmann::json &config, const string &key,
    initializer_list<const char *> allowed) const {
  if (!config.contains(key)) return;
  if (!config[key].is_string()) {
    throw runtime_error("ConfigValidator: " + key + " must be a string");
  }
  const string value = lowered(config[key].get<string>());
  for (const char *candidate : allowed) {
    if (value == candidate) return;
  }
  throw runtime_error("ConfigValidator: Invalid value '" +
                      config[key].get<string>() + "' for " + key);
}

void ConfigValidator::validateAlert(const nlohmann::json &alert) const {
  if (!alert.is_object()) {
    throw runtime_error("ConfigValidator: alert must be an object");
  }
  validateBoolean(alert, "on_reload");
  validateOneOf(alert, "sink", {"slack", "teams", "gchat", "raw"});
  for (const char *key : {"webhook_url", "additional_info", "proxy"}) {
    if (alert.contains(key) && !alert[key].is_string()) {
      throw runtime_error(string("ConfigValidator: alert.") + key +
                          " must be a string");
    }
  }
}

void ConfigValidator::validateKubernetes(
    const nlohmann::json &kubernetes) const {
  if (!kubernetes.is_object()) {
    throw runtime_error("ConfigValidator: kubernetes must be an object");
  }
  for (const char *key : {"server", "token_path", "ca_path"}) {
    if (kubernetes.contains(key) && !kubernetes[key].is_string()) {
      throw runtime_error(string("ConfigValidator: kubernetes.") + key +
                          " must be a string");
    }
  }
  if (kubernetes.contains("timeout_seconds")) {
    const auto &timeout = kubernetes["timeout_seconds"];
    if (!timeout.is_number_integer() || timeout.get<long long>() <= 0) {
      throw runtime_error(
          "ConfigValidator: kubernetes.timeout_seconds must be a positive "
          "integer");
    }
  }
}
