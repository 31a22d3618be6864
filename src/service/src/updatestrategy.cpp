/**
 * @file updatestrategy.cpp
 * @brief Реализация стратегий env-vars и annotations
 */

#include "../include/updatestrategy.hpp"

#include <cctype>
#include <stdexcept>

#include "../include/usagescanner.hpp"
#include "rld/compositelogger.hpp"

namespace {

std::string containerName(const nlohmann::json &containers, std::size_t i) {
  const auto &container = containers.at(i);
  if (!container.is_object()) return {};
  auto it = container.find("name");
  return (it != container.end() && it->is_string()) ? it->get<std::string>()
                                                     : std::string{};
}

}  // namespace

EvaluationResult PodAnnotationStrategy::apply(const ResourceAdapter &adapter,
                                              WorkloadItem &item,
                                              const ChangeConfig &config,
                                              bool autoReload) const {
  auto index = ResourceUsageScanner::findConsumingContainer(adapter, item,
                                                            config, autoReload);
  if (!index) return EvaluationResult::NoContainerFound;

  std::string value;
  try {
    auto source = ReloadSource::fromConfig(
        config, {containerName(adapter.containers(item), *index)});
    value = source.toJson().dump();
  } catch (const std::exception &e) {
    rld::CompositeLogger::instance().error(
        "Failed to create reloaded annotations for " + config.resourceName +
        ": " + e.what());
    return EvaluationResult::NotUpdated;
  }

  auto *annotations = adapter.mutablePodAnnotations(item);
  if (!annotations) return EvaluationResult::NotUpdated;

  (*annotations)[kLastReloadedFromAnnotation] = value;
  return EvaluationResult::Updated;
}

EvaluationResult EnvVarStrategy::apply(const ResourceAdapter &adapter,
                                       WorkloadItem &item,
                                       const ChangeConfig &config,
                                       bool autoReload) const {
  auto index = ResourceUsageScanner::findConsumingContainer(adapter, item,
                                                            config, autoReload);
  if (!index) return EvaluationResult::NoContainerFound;

  auto *containers = adapter.mutableContainers(item);
  if (!containers || *index >= containers->size()) {
    return EvaluationResult::NoContainerFound;
  }

  const std::string envVar = envVarName(config.resourceName, config.kind);
  auto result = updateExistingEnvVar(*containers, envVar, config.contentHash);
  if (result != EvaluationResult::NoEnvVarFound) return result;

  auto &container = (*containers)[*index];
  auto &env = container["env"];
  if (!env.is_array()) env = nlohmann::json::array();
  env.push_back({{"name", envVar}, {"value", config.contentHash}});
  return EvaluationResult::Updated;
}

std::string EnvVarStrategy::envVarName(const std::string &resourceName,
                                       ResourceKind kind) {
  return std::string(kEnvVarPrefix) + convertToEnvVarName(resourceName) + "_" +
         kindEnvPostfix(kind);
}

std::string EnvVarStrategy::convertToEnvVarName(const std::string &text) {
  std::string result;
  result.reserve(text.size());
  bool lastCharValid = false;

  for (unsigned char ch : text) {
    if (std::isalnum(ch) && ch < 0x80) {
      result.push_back(static_cast<char>(std::toupper(ch)));
      lastCharValid = true;
    } else {
      if (lastCharValid) result.push_back('_');
      lastCharValid = false;
    }
  }
  return result;
}

EvaluationResult EnvVarStrategy::updateExistingEnvVar(
    nlohmann::json &containers, const std::string &envVar,
    const std::string &value) {
  for (auto &container : containers) {
    if (!container.is_object()) continue;
    auto env = container.find("env");
    if (env == container.end() || !env->is_array()) continue;

    for (auto &var : *env) {
      if (!var.is_object() || var.value("name", std::string{}) != envVar) {
        continue;
      }
      if (var.value("value", std::string{}) == value) {
        return EvaluationResult::NotUpdated;
      }
      var["value"] = value;
      return EvaluationResult::Updated;
    }
  }
  return EvaluationResult::NoEnvVarFound;
}

std::unique_ptr<UpdateStrategy> createUpdateStrategy(const std::string &name) {
  if (name.empty() || name == "env-vars") {
    return std::make_unique<EnvVarStrategy>();
  }
  if (name == "annotations") {
    return std::make_unique<PodAnnotationStrategy>();
  }
  throw std::invalid_argument("Unknown reload strategy: " + name);
}
