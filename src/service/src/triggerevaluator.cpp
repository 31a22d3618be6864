/**
 * @file triggerevaluator.cpp
 * @brief Реализация правил перезагрузки workload'ов
 */

#include "../include/triggerevaluator.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "rld/MetricsCollector.hpp"
#include "rld/compositelogger.hpp"

namespace {

std::string trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\n\r\f\v");
  if (first == std::string::npos) return {};
  const auto last = value.find_last_not_of(" \t\n\r\f\v");
  return value.substr(first, last - first + 1);
}

std::vector<std::string> splitComma(const std::string &value) {
  std::vector<std::string> tokens;
  std::stringstream stream(value);
  std::string token;
  while (std::getline(stream, token, ',')) tokens.push_back(token);
  if (!value.empty() && value.back() == ',') tokens.emplace_back();
  return tokens;
}

std::string valueOf(const Annotations &annotations, const std::string &key) {
  auto it = annotations.find(key);
  return it == annotations.end() ? std::string{} : it->second;
}

}  // namespace

TriggerEvaluator::TriggerEvaluator(
    std::shared_ptr<KubeClient> client,
    std::vector<std::shared_ptr<ResourceAdapter>> adapters,
    std::shared_ptr<UpdateStrategy> strategy,
    std::shared_ptr<OutcomeReporter> reporter, AnnotationKeys keys,
    Options options)
    : client_(std::move(client)),
      adapters_(std::move(adapters)),
      strategy_(std::move(strategy)),
      reporter_(std::move(reporter)),
      keys_(std::move(keys)),
      options_(options) {
  if (!client_) {
    throw std::invalid_argument("Kubernetes client is required");
  }
  if (!strategy_) {
    throw std::invalid_argument("Update strategy is required");
  }
  coalescer_ = std::make_unique<DelayedUpgradeCoalescer>(
      options_.delayWindow,
      [this](const DelayedUpgradeCoalescer::FlushRequest &request) {
        flushDelayedBatch(request);
      });
}

void TriggerEvaluator::performRollingUpgrade(const ChangeConfig &config) {
  const auto started = std::chrono::steady_clock::now();
  try {
    for (const auto &adapter : adapters_) {
      performAction(adapter, config);
    }
  } catch (const UpdateError &e) {
    rld::CompositeLogger::instance().error("Rolling upgrade for '" +
                                           config.resourceName +
                                           "' failed with error = " + e.what());
    rld::MetricsCollector::instance().recordTaskTime(
        kRollingUpgradeTask,
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started));
    throw;
  }
  rld::MetricsCollector::instance().recordTaskTime(
      kRollingUpgradeTask,
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started));
}

void TriggerEvaluator::performAction(
    const std::shared_ptr<ResourceAdapter> &adapter,
    const ChangeConfig &config) {
  auto items = adapter->listItems(*client_, config.namespaceName);
  for (auto &item : items) {
    performActionOnSingleItem(adapter, item, {config});
  }
}

EvaluationResult TriggerEvaluator::performActionOnSingleItem(
    const std::shared_ptr<ResourceAdapter> &adapter, WorkloadItem &item,
    const std::vector<ChangeConfig> &configs, bool bypassDelay) {
  auto &logger = rld::CompositeLogger::instance();
  EvaluationResult atLeastOneUpdate = EvaluationResult::NotUpdated;
  const ChangeConfig *lastUpdatedConfig = nullptr;

  for (const auto &config : configs) {
    const Annotations workloadAnnotations = adapter->annotations(item);

    const std::string excluded =
        valueOf(workloadAnnotations, config.excludeAnnotationKey);
    if (isResourceExcluded(config.resourceName, excluded)) {
      logger.debug("'" + config.resourceName + "' is excluded by " +
                   adapter->kind() + " '" + item.name() + "'");
      continue;
    }

    if (!bypassDelay && workloadAnnotations.count(keys_.delayedUpgrade)) {
      logger.info("Found delayed upgrade annotation for '" + item.name() +
                  "' in namespace '" + config.namespaceName + "'");
      coalescer_->enqueue(adapter, item, config);
      continue;
    }

    // Если ни одна из управляющих аннотаций не задана на самом workload'е,
    // они читаются из шаблона пода
    const bool onWorkload =
        workloadAnnotations.count(config.annotationKey) ||
        workloadAnnotations.count(keys_.autoReload) ||
        workloadAnnotations.count(config.typedAutoAnnotationKey) ||
        workloadAnnotations.count(keys_.autoSearch);
    const Annotations annotations =
        onWorkload ? workloadAnnotations : adapter->podAnnotations(item);

    logger.info("Checking for changes in '" + config.resourceName +
                "' of type '" + config.typeName() + "' in namespace '" +
                config.namespaceName + "'");

    const auto result = evaluateConfig(*adapter, item, config, annotations);
    logger.debug("Result for '" + config.resourceName + "' on '" +
                 item.name() + "' is " + toString(result));

    atLeastOneUpdate = aggregate(atLeastOneUpdate, result);
    if (result == EvaluationResult::Updated) lastUpdatedConfig = &config;
  }

  if (atLeastOneUpdate != EvaluationResult::Updated || !lastUpdatedConfig) {
    return atLeastOneUpdate;
  }

  try {
    adapter->applyUpdate(*client_, lastUpdatedConfig->namespaceName, item);
  } catch (const UpdateError &e) {
    if (reporter_) {
      reporter_->reportFailure(*adapter, item, *lastUpdatedConfig, e.cause());
    }
    throw;
  }

  if (reporter_) reporter_->reportSuccess(*adapter, item, *lastUpdatedConfig);
  return atLeastOneUpdate;
}

EvaluationResult TriggerEvaluator::evaluateConfig(
    const ResourceAdapter &adapter, WorkloadItem &item,
    const ChangeConfig &config, const Annotations &annotations) {
  auto &logger = rld::CompositeLogger::instance();
  EvaluationResult result = EvaluationResult::NotUpdated;

  const std::string autoValue = valueOf(annotations, keys_.autoReload);
  const std::string typedAutoValue =
      valueOf(annotations, config.typedAutoAnnotationKey);

  if (parseBool(autoValue) || parseBool(typedAutoValue) ||
      (autoValue.empty() && typedAutoValue.empty() &&
       options_.autoReloadAll)) {
    logger.info("Auto reload enabled for '" + config.resourceName +
                "' of type '" + config.typeName() + "' in namespace '" +
                config.namespaceName + "'");
    result = invokeStrategy(adapter, item, config, true);
  }

  const std::string manualValue = valueOf(annotations, config.annotationKey);
  if (result != EvaluationResult::Updated && !manualValue.empty()) {
    for (const auto &raw : splitComma(manualValue)) {
      if (!matchesAnnotationList(config.resourceName, raw)) continue;
      result = invokeStrategy(adapter, item, config, false);
      if (result == EvaluationResult::Updated) break;
    }
  }

  if (result != EvaluationResult::Updated &&
      valueOf(annotations, keys_.autoSearch) == "true") {
    logger.info("Auto search enabled for '" + config.resourceName +
                "' of type '" + config.typeName() + "' in namespace '" +
                config.namespaceName + "'");
    if (valueOf(config.resourceAnnotations, keys_.searchMatch) == "true") {
      result = invokeStrategy(adapter, item, config, true);
    }
  }
  return result;
}

EvaluationResult TriggerEvaluator::invokeStrategy(const ResourceAdapter &adapter,
                                                  WorkloadItem &item,
                                                  const ChangeConfig &config,
                                                  bool autoReload) {
  try {
    return strategy_->apply(adapter, item, config, autoReload);
  } catch (const std::exception &e) {
    rld::CompositeLogger::instance().error(
        "Strategy '" + strategy_->name() + "' failed on " + adapter.kind() +
        " '" + item.name() + "': " + e.what());
    return EvaluationResult::NotUpdated;
  }
}

void TriggerEvaluator::flushDelayedBatch(
    const DelayedUpgradeCoalescer::FlushRequest &request) {
  auto &logger = rld::CompositeLogger::instance();
  logger.info("Performing delayed upgrade for '" + request.itemId + "'");

  auto items = request.adapter->listItems(*client_, request.namespaceName);
  for (auto &item : items) {
    if (workloadIdentity(request.adapter->kind(), item) != request.itemId) {
      continue;
    }
    try {
      performActionOnSingleItem(request.adapter, item, request.configs, true);
      logger.info("Delayed update for '" + request.itemId +
                  "' was successful");
    } catch (const UpdateError &e) {
      logger.error("Delayed update for '" + request.itemId +
                   "' failed with error " + e.what());
    }
    return;
  }
  logger.warning("Delayed update for '" + request.itemId +
                 "' not found, workload no longer exists");
}

void TriggerEvaluator::shutdown() { coalescer_->shutdown(); }

bool TriggerEvaluator::isResourceExcluded(
    const std::string &resourceName, const std::string &excludedResources) {
  if (excludedResources.empty()) return false;
  for (const auto &token : splitComma(excludedResources)) {
    if (trim(token) == resourceName) return true;
  }
  return false;
}

bool TriggerEvaluator::parseBool(const std::string &value) {
  return value == "1" || value == "t" || value == "T" || value == "TRUE" ||
         value == "true" || value == "True";
}

bool TriggerEvaluator::matchesAnnotationList(
    const std::string &resourceName, const std::string &annotationValue) {
  for (const auto &raw : splitComma(annotationValue)) {
    const std::string token = trim(raw);
    try {
      std::regex pattern("^" + token + "$", std::regex::ECMAScript);
      if (std::regex_match(resourceName, pattern)) return true;
    } catch (const std::regex_error &e) {
      rld::CompositeLogger::instance().warning(
          "Skipping invalid reload pattern '" + token + "': " + e.what());
    }
  }
  return false;
}
