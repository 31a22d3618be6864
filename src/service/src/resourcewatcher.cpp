/**
 * @file resourcewatcher.cpp
 * @brief Реализация опроса ConfigMap/Secret
 */

#include "../include/resourcewatcher.hpp"

#include <stdexcept>
#include <utility>

#include "../include/contenthasher.hpp"
#include "rld/compositelogger.hpp"

namespace {

Annotations resourceAnnotations(const nlohmann::json &object) {
  Annotations result;
  auto meta = object.find("metadata");
  if (meta == object.end() || !meta->is_object()) return result;
  auto annotations = meta->find("annotations");
  if (annotations == meta->end() || !annotations->is_object()) return result;
  for (const auto &[key, value] : annotations->items()) {
    if (value.is_string()) result[key] = value.get<std::string>();
  }
  return result;
}

std::string metadataString(const nlohmann::json &object, const char *field) {
  auto meta = object.find("metadata");
  if (meta == object.end() || !meta->is_object()) return {};
  auto value = meta->find(field);
  return (value != meta->end() && value->is_string())
             ? value->get<std::string>()
             : std::string{};
}

}  // namespace

ResourceWatcher::ResourceWatcher(std::shared_ptr<KubeClient> client,
                                 AnnotationKeys keys, WatchOptions options,
                                 ChangeHandler handler)
    : client_(std::move(client)),
      keys_(std::move(keys)),
      options_(std::move(options)),
      handler_(std::move(handler)) {
  if (!client_) {
    throw std::invalid_argument("Kubernetes client is required");
  }
  if (!handler_) {
    throw std::invalid_argument("Change handler cannot be empty");
  }
}

std::string ResourceWatcher::resourceKey(ResourceKind kind,
                                         const std::string &namespaceName,
                                         const std::string &name) {
  return kindEnvPostfix(kind) + "/" + namespaceName + "/" + name;
}

std::size_t ResourceWatcher::pollOnce() {
  std::vector<ChangeConfig> changes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::string> current;

    if (options_.watchConfigMaps) {
      pollKind(ResourceKind::ConfigMap, current, changes);
    }
    if (options_.watchSecrets) {
      pollKind(ResourceKind::Secret, current, changes);
    }

    hashes_.swap(current);
    if (!baselineDone_) {
      baselineDone_ = true;
      changes.clear();
      rld::CompositeLogger::instance().info(
          "Initial poll recorded " + std::to_string(hashes_.size()) +
          " resource(s)");
    }
  }

  for (const auto &change : changes) {
    try {
      handler_(change);
    } catch (const std::exception &e) {
      rld::CompositeLogger::instance().error(
          "Handling change of " + change.typeName() + " '" +
          change.namespaceName + "/" + change.resourceName +
          "' failed: " + e.what());
    }
  }
  return changes.size();
}

void ResourceWatcher::pollKind(ResourceKind kind,
                               std::map<std::string, std::string> &current,
                               std::vector<ChangeConfig> &changes) {
  if (options_.namespaces.empty()) {
    pollScope(kind, "", current, changes);
    return;
  }
  for (const auto &ns : options_.namespaces) {
    if (options_.namespacesToIgnore.count(ns)) continue;
    pollScope(kind, ns, current, changes);
  }
}

void ResourceWatcher::pollScope(ResourceKind kind,
                                const std::string &namespaceName,
                                std::map<std::string, std::string> &current,
                                std::vector<ChangeConfig> &changes) {
  const std::string plural =
      kind == ResourceKind::Secret ? "secrets" : "configmaps";

  nlohmann::json list;
  try {
    list = client_->get(KubeClient::resourcePath("v1", plural, namespaceName));
  } catch (const std::exception &e) {
    rld::CompositeLogger::instance().error(
        "Failed to list " + plural + " in namespace '" + namespaceName +
        "': " + e.what());
    // Сохраняем прежние хеши области, чтобы не считать ресурсы новыми
    const std::string prefix =
        kindEnvPostfix(kind) + "/" +
        (namespaceName.empty() ? "" : namespaceName + "/");
    for (auto it = hashes_.lower_bound(prefix);
         it != hashes_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
         ++it) {
      current.insert(*it);
    }
    return;
  }

  auto items = list.find("items");
  if (items == list.end() || !items->is_array()) return;

  for (const auto &object : *items) {
    if (!object.is_object()) continue;
    const std::string name = metadataString(object, "name");
    const std::string ns = metadataString(object, "namespace");
    if (name.empty() || options_.namespacesToIgnore.count(ns)) continue;

    const Annotations annotations = resourceAnnotations(object);
    if (auto ignore = annotations.find(keys_.ignore);
        ignore != annotations.end() && ignore->second == "true") {
      continue;
    }

    const std::string hash = ContentHasher::hashResource(object);
    const std::string key = resourceKey(kind, ns, name);
    current[key] = hash;

    auto previous = hashes_.find(key);
    const bool changed = previous != hashes_.end() && previous->second != hash;
    const bool created = previous == hashes_.end() && options_.reloadOnCreate;
    if (!changed && !created) continue;

    rld::CompositeLogger::instance().info(
        std::string(changed ? "Detected change" : "Detected creation") +
        " of " + kindName(kind) + " '" + ns + "/" + name + "'");
    changes.push_back(
        ChangeConfig::create(keys_, kind, name, ns, hash, annotations));
  }
}

void ResourceWatcher::run() {
  rld::CompositeLogger::instance().info(
      "Resource watcher started, poll interval " +
      std::to_string(options_.pollInterval.count()) + "s");

  while (!stopRequested_) {
    try {
      pollOnce();
    } catch (const std::exception &e) {
      rld::CompositeLogger::instance().error("Poll failed: " +
                                             std::string(e.what()));
    }

    std::unique_lock<std::mutex> lock(waitMutex_);
    wakeup_.wait_for(lock, options_.pollInterval,
                     [this] { return stopRequested_.load(); });
  }
  rld::CompositeLogger::instance().info("Resource watcher stopped");
}

void ResourceWatcher::stop() {
  {
    std::lock_guard<std::mutex> lock(waitMutex_);
    stopRequested_ = true;
  }
  wakeup_.notify_all();
}

std::size_t ResourceWatcher::trackedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hashes_.size();
}
