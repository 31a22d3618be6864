/**
 * @file annotationkeys.hpp
 * @brief Ключи аннотаций, которыми управляется перезагрузка workload'ов
 *
 * @details
 * Значения по умолчанию совместимы с аннотациями stakater/Reloader, поэтому
 * существующие манифесты кластера работают без изменений. Каждый ключ можно
 * переопределить в секции "annotations" конфигурации.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

/// Префикс имени переменной окружения, внедряемой env-var стратегией
inline constexpr const char *kEnvVarPrefix = "STAKATER_";

/// Аннотация шаблона пода, которую пишет annotations стратегия
inline constexpr const char *kLastReloadedFromAnnotation =
    "reloader.stakater.com/last-reloaded-from";

/**
 * @struct AnnotationKeys
 * @brief Набор ключей аннотаций, читаемых с workload'ов и ConfigMap/Secret
 */
struct AnnotationKeys {
  std::string configmapReload = "configmap.reloader.stakater.com/reload";
  std::string secretReload = "secret.reloader.stakater.com/reload";
  std::string autoReload = "reloader.stakater.com/auto";
  std::string configmapAuto = "configmap.reloader.stakater.com/auto";
  std::string secretAuto = "secret.reloader.stakater.com/auto";
  std::string autoSearch = "reloader.stakater.com/search";
  std::string searchMatch = "reloader.stakater.com/match";
  std::string configmapExclude =
      "configmaps.exclude.reloader.stakater.com/reload";
  std::string secretExclude = "secrets.exclude.reloader.stakater.com/reload";
  /// Присутствие включает отложенный (коалесцированный) rollout
  std::string delayedUpgrade = "reloader.stakater.com/delayed-upgrade";
  /// На ConfigMap/Secret: "true" исключает ресурс из наблюдения
  std::string ignore = "reloader.stakater.com/ignore";
  /// На Argo Rollout: "rollout" (по умолчанию) или "restart"
  std::string rolloutStrategy = "reloader.stakater.com/rollout-strategy";

  /**
   * @brief Читает переопределения ключей из JSON-объекта
   * @param[in] src Объект вида {"configmap_reload": "...", ...}
   * @throw std::runtime_error Если значение не строка или пустое
   *
   * Отсутствующие ключи сохраняют значения по умолчанию.
   */
  static AnnotationKeys fromJson(const nlohmann::json &src);
};
