#include "../include/changeconfig.hpp"

#include <chrono>

std::string kindEnvPostfix(ResourceKind kind) {
  return kind == ResourceKind::Secret ? "SECRET" : "CONFIGMAP";
}

std::string kindName(ResourceKind kind) {
  return kind == ResourceKind::Secret ? "Secret" : "ConfigMap";
}

ChangeConfig ChangeConfig::create(const AnnotationKeys &keys,
                                  ResourceKind kind, const std::string &name,
                                  const std::string &namespaceName,
                                  const std::string &contentHash,
                                  const Annotations &resourceAnnotations) {
  ChangeConfig config;
  config.resourceName = name;
  config.namespaceName = namespaceName;
  config.kind = kind;
  config.contentHash = contentHash;
  config.resourceAnnotations = resourceAnnotations;

  if (kind == ResourceKind::Secret) {
    config.annotationKey = keys.secretReload;
    config.typedAutoAnnotationKey = keys.secretAuto;
    config.excludeAnnotationKey = keys.secretExclude;
  } else {
    config.annotationKey = keys.configmapReload;
    config.typedAutoAnnotationKey = keys.configmapAuto;
    config.excludeAnnotationKey = keys.configmapExclude;
  }
  return config;
}

std::string toString(EvaluationResult result) {
  switch (result) {
    case EvaluationResult::Updated:
      return "Updated";
    case EvaluationResult::NotUpdated:
      return "NotUpdated";
    case EvaluationResult::NoContainerFound:
      return "NoContainerFound";
    case EvaluationResult::NoEnvVarFound:
      return "NoEnvVarFound";
  }
  return "Unknown";
}

EvaluationResult aggregate(EvaluationResult current, EvaluationResult next) {
  if (current == EvaluationResult::Updated ||
      next == EvaluationResult::Updated) {
    return EvaluationResult::Updated;
  }
  return next;
}

ReloadSource ReloadSource::fromConfig(const ChangeConfig &config,
                                      std::vector<std::string> containers) {
  ReloadSource source;
  source.type = config.typeName();
  source.name = config.resourceName;
  source.namespaceName = config.namespaceName;
  source.hash = config.contentHash;
  source.containerRefs = std::move(containers);
  source.observedAt = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return source;
}

nlohmann::json ReloadSource::toJson() const {
  return nlohmann::json{{"type", type},
                        {"name", name},
                        {"namespace", namespaceName},
                        {"hash", hash},
                        {"containerRefs", containerRefs},
                        {"observedAt", observedAt}};
}
