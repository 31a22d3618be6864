/**
 * @file changeconfig.hpp
 * @brief Модель обнаруженного изменения ConfigMap/Secret и результата оценки
 *
 * @details
 * ChangeConfig создаётся наблюдателем ресурсов на каждое изменение
 * содержимого и передаётся в TriggerEvaluator. После создания не изменяется.
 */

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "annotationkeys.hpp"

/// Аннотации Kubernetes-объекта (строковые значения)
using Annotations = std::map<std::string, std::string>;

/// Тип наблюдаемого ресурса
enum class ResourceKind { ConfigMap, Secret };

/// "CONFIGMAP" / "SECRET": суффикс имени env-переменной и поле type
std::string kindEnvPostfix(ResourceKind kind);

/// "ConfigMap" / "Secret": имя kind в API Kubernetes
std::string kindName(ResourceKind kind);

/**
 * @struct ChangeConfig
 * @brief Одно обнаруженное изменение ConfigMap или Secret
 */
struct ChangeConfig {
  std::string resourceName;   ///< Имя ConfigMap/Secret
  std::string namespaceName;  ///< Пространство имён ресурса
  ResourceKind kind = ResourceKind::ConfigMap;
  std::string annotationKey;           ///< Ключ ручной перезагрузки для kind
  std::string typedAutoAnnotationKey;  ///< Ключ typed-auto для kind
  std::string excludeAnnotationKey;    ///< Ключ списка исключений для kind
  std::string contentHash;             ///< Хеш содержимого ресурса
  Annotations resourceAnnotations;     ///< Аннотации самого ресурса

  /**
   * @brief Собирает ChangeConfig, подставляя ключи аннотаций для kind
   *
   * @code
   auto cfg = ChangeConfig::create(keys, ResourceKind::Secret, "db-secret",
                                   "prod", hash, secretAnnotations);
   @endcode
   */
  static ChangeConfig create(const AnnotationKeys &keys, ResourceKind kind,
                             const std::string &name,
                             const std::string &namespaceName,
                             const std::string &contentHash,
                             const Annotations &resourceAnnotations = {});

  std::string typeName() const { return kindEnvPostfix(kind); }
};

/**
 * @brief Результат применения стратегии к одному workload'у
 *
 * NoEnvVarFound используется только внутри env-var стратегии.
 */
enum class EvaluationResult {
  Updated,
  NotUpdated,
  NoContainerFound,
  NoEnvVarFound
};

std::string toString(EvaluationResult result);

/// Агрегация по нескольким ChangeConfig: Updated доминирует
EvaluationResult aggregate(EvaluationResult current, EvaluationResult next);

/**
 * @struct ReloadSource
 * @brief Информационное описание последней перезагрузки
 *
 * Сериализуется в значение аннотации last-reloaded-from.
 */
struct ReloadSource {
  std::string type;
  std::string name;
  std::string namespaceName;
  std::string hash;
  std::vector<std::string> containerRefs;
  std::int64_t observedAt = 0;  ///< Unix-время в секундах

  static ReloadSource fromConfig(const ChangeConfig &config,
                                 std::vector<std::string> containers);

  nlohmann::json toJson() const;
};
