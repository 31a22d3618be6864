/**
 * @file reloaderoptions.hpp
 * @brief Типизированные параметры контроллера
 *
 * @details
 * ReloaderOptions отображает объединённую JSON-конфигурацию окружения
 * (см. ConfigManager::getMergedConfig) в поля, которые используют
 * ServiceController и компоненты перезагрузки. Отсутствующий ключ оставляет
 * значение по умолчанию.
 */

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

#include "alertnotifier.hpp"
#include "annotationkeys.hpp"
#include "kubeclient.hpp"
#include "resourcewatcher.hpp"
#include "triggerevaluator.hpp"

/**
 * @struct ReloaderOptions
 * @brief Параметры запуска контроллера
 */
struct ReloaderOptions {
  /// Верхняя граница окна отложенного обновления, секунды (сутки)
  static constexpr double kMaxDelayedUpgradeWindowSeconds = 86400.0;
  /// Верхняя граница интервала опроса, секунды (сутки)
  static constexpr long long kMaxPollIntervalSeconds = 86400;

  std::string reloadStrategy = "env-vars";  ///< env-vars | annotations
  bool autoReloadAll = false;
  bool reloadOnCreate = false;
  bool isOpenshift = false;     ///< Обрабатывать DeploymentConfig
  bool isArgoRollouts = false;  ///< Обрабатывать Argo Rollout
  std::chrono::milliseconds delayedUpgradeWindow{10000};
  std::chrono::seconds pollInterval{15};
  std::vector<std::string> namespaces;  ///< Пусто: все пространства имён
  std::set<std::string> namespacesToIgnore;
  bool ignoreConfigMaps = false;
  bool ignoreSecrets = false;
  /// Если задан, вместо rollout'а отправляется webhook
  std::string webhookUrl;
  std::string logLevel = "info";
  std::string logFormat = "text";
  AnnotationKeys annotations;
  AlertConfig alert;
  KubeClientConfig kubernetes;

  /**
   * @brief Строит параметры из объединённой конфигурации
   * @throw std::runtime_error Значение неверного типа или вне диапазона
   */
  static ReloaderOptions fromJson(const nlohmann::json &config);

  /// Параметры наблюдателя ConfigMap/Secret
  WatchOptions watchOptions() const;

  /// Параметры TriggerEvaluator
  TriggerEvaluator::Options evaluatorOptions() const;
};
