#include "../include/reloaderoptions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

std::string lowered(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

template <typename T>
T valueAs(const nlohmann::json &config, const char *key, T fallback) {
  auto it = config.find(key);
  if (it == config.end() || it->is_null()) return fallback;
  try {
    return it->get<T>();
  } catch (const nlohmann::json::type_error &e) {
    throw std::runtime_error(std::string("Invalid type of '") + key +
                             "': " + e.what());
  }
}

}  // namespace

ReloaderOptions ReloaderOptions::fromJson(const nlohmann::json &config) {
  if (!config.is_object()) {
    throw std::runtime_error("Reloader configuration must be an object");
  }

  ReloaderOptions options;
  options.reloadStrategy =
      lowered(valueAs(config, "reload_strategy", options.reloadStrategy));
  options.autoReloadAll = valueAs(config, "auto_reload_all", false);
  options.reloadOnCreate = valueAs(config, "reload_on_create", false);
  options.isOpenshift = valueAs(config, "is_openshift", false);
  options.isArgoRollouts = valueAs(config, "is_argo_rollouts", false);

  const double windowSeconds =
      valueAs(config, "delayed_upgrade_window_seconds", 10.0);
  if (windowSeconds < 0 || windowSeconds > kMaxDelayedUpgradeWindowSeconds) {
    throw std::runtime_error(
        "delayed_upgrade_window_seconds must be within [0, " +
        std::to_string(static_cast<long long>(kMaxDelayedUpgradeWindowSeconds)) +
        "]");
  }
  options.delayedUpgradeWindow = std::chrono::milliseconds(
      static_cast<long long>(std::llround(windowSeconds * 1000.0)));

  const long long poll = valueAs(config, "poll_interval_seconds", 15LL);
  if (poll <= 0 || poll > kMaxPollIntervalSeconds) {
    throw std::runtime_error("poll_interval_seconds must be within [1, " +
                             std::to_string(kMaxPollIntervalSeconds) + "]");
  }
  options.pollInterval = std::chrono::seconds(poll);

  options.namespaces =
      valueAs(config, "namespaces", std::vector<std::string>{});
  for (const auto &ns : valueAs(config, "namespaces_to_ignore",
                                std::vector<std::string>{})) {
    options.namespacesToIgnore.insert(ns);
  }
  for (const auto &kind : valueAs(config, "resources_to_ignore",
                                  std::vector<std::string>{})) {
    const std::string name = lowered(kind);
    if (name == "configmaps") {
      options.ignoreConfigMaps = true;
    } else if (name == "secrets") {
      options.ignoreSecrets = true;
    } else {
      throw std::runtime_error("Unknown resource kind to ignore: " + kind);
    }
  }

  options.webhookUrl = valueAs(config, "webhook_url", std::string{});
  options.logLevel = lowered(valueAs(config, "log_level", options.logLevel));
  options.logFormat = lowered(valueAs(config, "log_format", options.logFormat));

  if (auto it = config.find("annotations"); it != config.end()) {
    options.annotations = AnnotationKeys::fromJson(*it);
  }
  if (auto it = config.find("alert"); it != config.end()) {
    options.alert = AlertConfig::fromJson(*it);
  }
  if (auto it = config.find("kubernetes"); it != config.end()) {
    options.kubernetes = KubeClientConfig::fromJson(*it);
  }
  return options;
}

WatchOptions ReloaderOptions::watchOptions() const {
  WatchOptions watch;
  watch.namespaces = namespaces;
  watch.namespacesToIgnore = namespacesToIgnore;
  watch.watchConfigMaps = !ignoreConfigMaps;
  watch.watchSecrets = !ignoreSecrets;
  watch.reloadOnCreate = reloadOnCreate;
  watch.pollInterval = pollInterval;
  return watch;
}

TriggerEvaluator::Options ReloaderOptions::evaluatorOptions() const {
  TriggerEvaluator::Options evaluator;
  evaluator.autoReloadAll = autoReloadAll;
  evaluator.delayWindow = delayedUpgradeWindow;
  return evaluator;
}
