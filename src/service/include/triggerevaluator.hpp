/**
 * @file triggerevaluator.hpp
 * @brief Принятие решения о перезагрузке workload'ов
 *
 * @details
 * TriggerEvaluator получает ChangeConfig и для каждого активного kind
 * проходит по workload'ам пространства имён. Для каждого workload'а
 * правила применяются в порядке:
 *  1. Исключение: список в аннотации exclude содержит имя ресурса.
 *  2. Отложенный rollout: изменение уходит в DelayedUpgradeCoalescer.
 *  3. Авто-перезагрузка (typed-auto, auto, либо auto_reload_all).
 *  4. Ручное совпадение: токены ручной аннотации как ^token$.
 *  5. Поиск: search=true на workload'е и match=true на ресурсе.
 * Если хотя бы одно изменение дало Updated, выполняется один
 * applyUpdate и фиксируется результат.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "annotationkeys.hpp"
#include "changeconfig.hpp"
#include "delayedupgrade.hpp"
#include "kubeclient.hpp"
#include "outcomereporter.hpp"
#include "resourceadapter.hpp"
#include "updatestrategy.hpp"

/**
 * @class TriggerEvaluator
 * @brief Машина решений: выбирает workload'ы и применяет стратегию
 */
class TriggerEvaluator {
 public:
  struct Options {
    bool autoReloadAll = false;
    std::chrono::milliseconds delayWindow{10000};
  };

  /**
   * @param[in] client   Клиент API (не nullptr)
   * @param[in] adapters Активные адаптеры в порядке обхода
   * @param[in] strategy Стратегия изменения (не nullptr)
   * @param[in] reporter Может быть nullptr
   * @throw std::invalid_argument При пустом client или strategy
   */
  TriggerEvaluator(std::shared_ptr<KubeClient> client,
                   std::vector<std::shared_ptr<ResourceAdapter>> adapters,
                   std::shared_ptr<UpdateStrategy> strategy,
                   std::shared_ptr<OutcomeReporter> reporter,
                   AnnotationKeys keys, Options options);

  TriggerEvaluator(const TriggerEvaluator &) = delete;
  TriggerEvaluator &operator=(const TriggerEvaluator &) = delete;

  /**
   * @brief Обрабатывает одно изменение по всем активным kind
   * @throw UpdateError Первая ошибка применения; остальные kind пропускаются
   */
  void performRollingUpgrade(const ChangeConfig &config);

  /**
   * @brief Обрабатывает одно изменение для workload'ов одного kind
   * @throw UpdateError Первая ошибка применения
   */
  void performAction(const std::shared_ptr<ResourceAdapter> &adapter,
                     const ChangeConfig &config);

  /**
   * @brief Оценивает набор изменений для одного workload'а
   * @param[in] bypassDelay true при срабатывании отложенного пакета
   * @return Агрегированный результат (Updated доминирует)
   * @throw UpdateError Если applyUpdate завершился ошибкой
   */
  EvaluationResult performActionOnSingleItem(
      const std::shared_ptr<ResourceAdapter> &adapter, WorkloadItem &item,
      const std::vector<ChangeConfig> &configs, bool bypassDelay = false);

  /// Немедленно срабатывает отложенные пакеты и ждёт их завершения
  void shutdown();

  DelayedUpgradeCoalescer &coalescer() noexcept { return *coalescer_; }

  const std::vector<std::shared_ptr<ResourceAdapter>> &adapters() const {
    return adapters_;
  }

  /// Список через запятую содержит имя (точное совпадение после trim)
  static bool isResourceExcluded(const std::string &resourceName,
                                 const std::string &excludedResources);

  /// "1", "t", "T", "true", "True", "TRUE" дают true, остальное false
  static bool parseBool(const std::string &value);

  /// Совпадение имени с одним из токенов списка как ^token$
  static bool matchesAnnotationList(const std::string &resourceName,
                                    const std::string &annotationValue);

 private:
  /// Правила 3-5 для одного изменения
  EvaluationResult evaluateConfig(const ResourceAdapter &adapter,
                                  WorkloadItem &item,
                                  const ChangeConfig &config,
                                  const Annotations &annotations);

  EvaluationResult invokeStrategy(const ResourceAdapter &adapter,
                                  WorkloadItem &item,
                                  const ChangeConfig &config, bool autoReload);

  void flushDelayedBatch(const DelayedUpgradeCoalescer::FlushRequest &request);

  std::shared_ptr<KubeClient> client_;
  std::vector<std::shared_ptr<ResourceAdapter>> adapters_;
  std::shared_ptr<UpdateStrategy> strategy_;
  std::shared_ptr<OutcomeReporter> reporter_;
  AnnotationKeys keys_;
  Options options_;
  // Уничтожается первым: потоки таймеров обращаются к полям выше
  std::unique_ptr<DelayedUpgradeCoalescer> coalescer_;
};
