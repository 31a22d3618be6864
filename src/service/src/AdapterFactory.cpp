/**
 * @file AdapterFactory.cpp
 * @brief Реализация реестра адаптеров workload'ов
 */

#include "../include/AdapterFactory.hpp"

#include "../include/workloadadapters.hpp"
#include "rld/compositelogger.hpp"

AdapterFactory::AdapterFactory() {
  registerBuiltinAdapters();
  rld::CompositeLogger::instance().debug("AdapterFactory initialized");
}

AdapterFactory &AdapterFactory::instance() {
  static AdapterFactory instance;
  return instance;
}

std::unique_ptr<ResourceAdapter> AdapterFactory::createAdapter(
    const std::string &kind, const AnnotationKeys &keys) {
  CreatorFunction creator;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    if (kind.empty()) {
      throw std::invalid_argument("Workload kind cannot be empty");
    }

    auto it = creators_.find(kind);
    if (it == creators_.end()) {
      throw std::invalid_argument("Unsupported workload kind: " + kind);
    }
    creator = it->second;
  }

  try {
    auto adapter = creator(keys);
    rld::CompositeLogger::instance().debug("Created adapter for kind: " +
                                           kind);
    return adapter;
  } catch (const std::exception &e) {
    rld::CompositeLogger::instance().error("Failed to create adapter for " +
                                           kind + ": " + e.what());
    throw std::runtime_error("Adapter creation failed: " +
                             std::string(e.what()));
  }
}

void AdapterFactory::registerAdapter(const std::string &kind,
                                     CreatorFunction creator) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (kind.empty()) {
    throw std::invalid_argument("Workload kind cannot be empty");
  }
  if (!creator) {
    throw std::invalid_argument("Creator function cannot be null");
  }

  creators_[kind] = std::move(creator);
}

bool AdapterFactory::isSupported(const std::string &kind) const noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  return creators_.find(kind) != creators_.end();
}

std::vector<std::shared_ptr<ResourceAdapter>>
AdapterFactory::createActiveAdapters(bool isOpenshift, bool isArgoRollouts,
                                     const AnnotationKeys &keys) {
  std::vector<std::string> kinds = {"Deployment", "CronJob", "DaemonSet",
                                    "StatefulSet"};
  if (isOpenshift) kinds.emplace_back("DeploymentConfig");
  if (isArgoRollouts) kinds.emplace_back("Rollout");

  std::vector<std::shared_ptr<ResourceAdapter>> adapters;
  adapters.reserve(kinds.size());
  for (const auto &kind : kinds) {
    adapters.push_back(createAdapter(kind, keys));
  }

  std::string summary;
  for (const auto &kind : kinds) {
    summary += (summary.empty() ? "" : ", ") + kind;
  }
  rld::CompositeLogger::instance().info("Active workload kinds: " + summary);
  return adapters;
}

void AdapterFactory::registerBuiltinAdapters() {
  registerAdapter("Deployment", [](const AnnotationKeys &) {
    return std::make_unique<DeploymentAdapter>();
  });
  registerAdapter("CronJob", [](const AnnotationKeys &) {
    return std::make_unique<CronJobAdapter>();
  });
  registerAdapter("DaemonSet", [](const AnnotationKeys &) {
    return std::make_unique<DaemonSetAdapter>();
  });
  registerAdapter("StatefulSet", [](const AnnotationKeys &) {
    return std::make_unique<StatefulSetAdapter>();
  });
  registerAdapter("DeploymentConfig", [](const AnnotationKeys &) {
    return std::make_unique<DeploymentConfigAdapter>();
  });
  registerAdapter("Rollout", [](const AnnotationKeys &keys) {
    return std::make_unique<ArgoRolloutAdapter>(keys.rolloutStrategy);
  });
}
