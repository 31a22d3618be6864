#include "../include/usagescanner.hpp"

namespace {

std::string stringField(const nlohmann::json &object, const char *field) {
  if (!object.is_object()) return {};
  auto it = object.find(field);
  if (it == object.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

const nlohmann::json *objectField(const nlohmann::json &object,
                                  const char *field) {
  if (!object.is_object()) return nullptr;
  auto it = object.find(field);
  if (it == object.end() || !it->is_object()) return nullptr;
  return &*it;
}

// ConfigMap-источник ссылается по "name", Secret-том по "secretName",
// а Secret в projected-источнике по "name"
bool sourceMatches(const nlohmann::json &volume, ResourceKind kind,
                   const std::string &resourceName) {
  if (kind == ResourceKind::ConfigMap) {
    const auto *cm = objectField(volume, "configMap");
    return cm && stringField(*cm, "name") == resourceName;
  }
  const auto *secret = objectField(volume, "secret");
  return secret && stringField(*secret, "secretName") == resourceName;
}

bool projectedSourceMatches(const nlohmann::json &source, ResourceKind kind,
                            const std::string &resourceName) {
  const auto *ref = objectField(
      source, kind == ResourceKind::ConfigMap ? "configMap" : "secret");
  return ref && stringField(*ref, "name") == resourceName;
}

}  // namespace

std::optional<std::size_t> ResourceUsageScanner::findConsumingContainer(
    const ResourceAdapter &adapter, const WorkloadItem &item,
    const ChangeConfig &config, bool autoReload) {
  const auto &containers = adapter.containers(item);
  if (!containers.is_array() || containers.empty()) return std::nullopt;

  const auto &initContainers = adapter.initContainers(item);

  if (auto volume = mountedVolumeName(adapter.volumes(item), config.kind,
                                      config.resourceName)) {
    if (auto index = findByVolumeMount(containers, *volume)) return index;
    if (findByVolumeMount(initContainers, *volume)) return 0;
  }

  if (auto index =
          findByEnvReference(containers, config.kind, config.resourceName)) {
    return index;
  }
  if (findByEnvReference(initContainers, config.kind, config.resourceName)) {
    return 0;
  }

  if (!autoReload) return 0;
  return std::nullopt;
}

std::optional<std::string> ResourceUsageScanner::mountedVolumeName(
    const nlohmann::json &volumes, ResourceKind kind,
    const std::string &resourceName) {
  if (!volumes.is_array()) return std::nullopt;

  for (const auto &volume : volumes) {
    if (sourceMatches(volume, kind, resourceName)) {
      return stringField(volume, "name");
    }

    const auto *projected = objectField(volume, "projected");
    if (!projected) continue;
    auto sources = projected->find("sources");
    if (sources == projected->end() || !sources->is_array()) continue;
    for (const auto &source : *sources) {
      if (projectedSourceMatches(source, kind, resourceName)) {
        return stringField(volume, "name");
      }
    }
  }
  return std::nullopt;
}

std::optional<std::size_t> ResourceUsageScanner::findByVolumeMount(
    const nlohmann::json &containers, const std::string &volumeName) {
  if (!containers.is_array()) return std::nullopt;

  for (std::size_t i = 0; i < containers.size(); ++i) {
    const auto &container = containers[i];
    if (!container.is_object()) continue;
    auto mounts = container.find("volumeMounts");
    if (mounts == container.end() || !mounts->is_array()) continue;
    for (const auto &mount : *mounts) {
      if (stringField(mount, "name") == volumeName) return i;
    }
  }
  return std::nullopt;
}

std::optional<std::size_t> ResourceUsageScanner::findByEnvReference(
    const nlohmann::json &containers, ResourceKind kind,
    const std::string &resourceName) {
  if (!containers.is_array()) return std::nullopt;

  const char *keyRef =
      kind == ResourceKind::Secret ? "secretKeyRef" : "configMapKeyRef";
  const char *fromRef =
      kind == ResourceKind::Secret ? "secretRef" : "configMapRef";

  for (std::size_t i = 0; i < containers.size(); ++i) {
    const auto &container = containers[i];
    if (!container.is_object()) continue;

    if (auto env = container.find("env");
        env != container.end() && env->is_array()) {
      for (const auto &var : *env) {
        const auto *valueFrom = objectField(var, "valueFrom");
        if (!valueFrom) continue;
        const auto *ref = objectField(*valueFrom, keyRef);
        if (ref && stringField(*ref, "name") == resourceName) return i;
      }
    }

    if (auto envFrom = container.find("envFrom");
        envFrom != container.end() && envFrom->is_array()) {
      for (const auto &source : *envFrom) {
        const auto *ref = objectField(source, fromRef);
        if (ref && stringField(*ref, "name") == resourceName) return i;
      }
    }
  }
  return std::nullopt;
}
