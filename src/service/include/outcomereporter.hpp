/**
 * @file outcomereporter.hpp
 * @brief Метрики, события Kubernetes и alert по итогам перезагрузки
 */

#pragma once

#include <memory>
#include <string>

#include "alertnotifier.hpp"
#include "changeconfig.hpp"
#include "kubeclient.hpp"
#include "resourceadapter.hpp"

/// Счётчик перезагрузок с меткой success
inline constexpr const char *kReloadedTotalMetric = "reloader_reloaded_total";
/// Счётчик перезагрузок с метками success и namespace
inline constexpr const char *kReloadedByNamespaceMetric =
    "reloader_reloaded_by_namespace_total";
/// Время одного прохода performRollingUpgrade
inline constexpr const char *kRollingUpgradeTask = "reloader_rolling_upgrade";

/**
 * @class EventRecorder
 * @brief Публикация события Kubernetes на объект workload'а
 */
class EventRecorder {
 public:
  virtual ~EventRecorder() = default;

  /**
   * @param[in] kind    Kind workload'а
   * @param[in] item    Workload, на который ссылается событие
   * @param[in] type    "Normal" или "Warning"
   * @param[in] reason  "Reloaded" или "ReloadFail"
   * @param[in] message Текст события
   */
  virtual void recordEvent(const std::string &kind, const WorkloadItem &item,
                           const std::string &type, const std::string &reason,
                           const std::string &message) = 0;
};

/**
 * @class KubeEventRecorder
 * @brief Создаёт объекты core/v1 Event через KubeClient
 *
 * Ошибки API логируются и не передаются вызывающему.
 */
class KubeEventRecorder : public EventRecorder {
 public:
  explicit KubeEventRecorder(std::shared_ptr<KubeClient> client,
                             std::string component = "reloader");

  void recordEvent(const std::string &kind, const WorkloadItem &item,
                   const std::string &type, const std::string &reason,
                   const std::string &message) override;

  /// Манифест события
  nlohmann::json buildEvent(const std::string &kind, const WorkloadItem &item,
                            const std::string &type,
                            const std::string &reason,
                            const std::string &message) const;

 private:
  std::shared_ptr<KubeClient> client_;
  std::string component_;
};

/**
 * @class OutcomeReporter
 * @brief Фиксирует результат применения изменения к workload'у
 *
 * @details
 * Успех: счётчики success="true", событие Reloaded, alert (если включён).
 * Ошибка: счётчики success="false", событие ReloadFail.
 */
class OutcomeReporter {
 public:
  /**
   * @param[in] recorder Может быть nullptr: события не публикуются
   * @param[in] notifier Может быть nullptr: alert не отправляется
   */
  OutcomeReporter(std::shared_ptr<EventRecorder> recorder,
                  std::shared_ptr<AlertNotifier> notifier);

  /// Регистрирует счётчики в rld::MetricsCollector (идемпотентно)
  static void registerMetrics();

  void reportSuccess(const ResourceAdapter &adapter, const WorkloadItem &item,
                     const ChangeConfig &config);

  void reportFailure(const ResourceAdapter &adapter, const WorkloadItem &item,
                     const ChangeConfig &config, const std::string &error);

 private:
  void countReload(bool success, const std::string &namespaceName);

  std::shared_ptr<EventRecorder> recorder_;
  std::shared_ptr<AlertNotifier> notifier_;
};
