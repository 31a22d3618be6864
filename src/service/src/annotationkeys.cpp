#include "../include/annotationkeys.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

AnnotationKeys AnnotationKeys::fromJson(const nlohmann::json &src) {
  AnnotationKeys keys;
  if (src.is_null()) return keys;
  if (!src.is_object()) {
    throw std::runtime_error("'annotations' section must be an object");
  }

  const std::vector<std::pair<const char *, std::string *>> fields = {
      {"configmap_reload", &keys.configmapReload},
      {"secret_reload", &keys.secretReload},
      {"auto", &keys.autoReload},
      {"configmap_auto", &keys.configmapAuto},
      {"secret_auto", &keys.secretAuto},
      {"search", &keys.autoSearch},
      {"match", &keys.searchMatch},
      {"configmap_exclude", &keys.configmapExclude},
      {"secret_exclude", &keys.secretExclude},
      {"delayed_upgrade", &keys.delayedUpgrade},
      {"ignore", &keys.ignore},
      {"rollout_strategy", &keys.rolloutStrategy},
  };

  for (const auto &[name, target] : fields) {
    if (!src.contains(name)) continue;
    const auto &value = src[name];
    if (!value.is_string() || value.get<std::string>().empty()) {
      throw std::runtime_error(std::string("Annotation key '") + name +
                               "' must be a non-empty string");
    }
    *target = value.get<std::string>();
  }
  return keys;
}
