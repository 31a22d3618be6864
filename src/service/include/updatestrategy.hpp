/**
 * @file updatestrategy.hpp
 * @brief Стратегии изменения workload'а, вызывающие rollout
 *
 * @details
 * Стратегия выбирается один раз при старте (reload_strategy):
 *  - "env-vars" (по умолчанию): EnvVarStrategy
 *  - "annotations": PodAnnotationStrategy
 * Обе изменяют только локальный WorkloadItem; отправку в кластер выполняет
 * ResourceAdapter::applyUpdate.
 */

#pragma once

#include <memory>
#include <string>

#include "changeconfig.hpp"
#include "resourceadapter.hpp"

/**
 * @class UpdateStrategy
 * @brief Интерфейс стратегии изменения шаблона пода
 */
class UpdateStrategy {
 public:
  virtual ~UpdateStrategy() = default;

  /**
   * @brief Изменяет item так, чтобы контроллер workload'а начал rollout
   * @param[in] adapter    Адаптер kind workload'а
   * @param[in,out] item   Изменяемый workload
   * @param[in] config     Обнаруженное изменение
   * @param[in] autoReload Влияет на выбор контейнера по умолчанию
   * @return Updated, NotUpdated или NoContainerFound
   */
  virtual EvaluationResult apply(const ResourceAdapter &adapter,
                                 WorkloadItem &item,
                                 const ChangeConfig &config,
                                 bool autoReload) const = 0;

  virtual std::string name() const = 0;
};

/**
 * @class PodAnnotationStrategy
 * @brief Записывает last-reloaded-from в аннотации шаблона пода
 *
 * Хранится только последняя перезагрузка.
 */
class PodAnnotationStrategy : public UpdateStrategy {
 public:
  EvaluationResult apply(const ResourceAdapter &adapter, WorkloadItem &item,
                         const ChangeConfig &config,
                         bool autoReload) const override;

  std::string name() const override { return "annotations"; }
};

/**
 * @class EnvVarStrategy
 * @brief Внедряет переменную окружения с хешем содержимого ресурса
 */
class EnvVarStrategy : public UpdateStrategy {
 public:
  EvaluationResult apply(const ResourceAdapter &adapter, WorkloadItem &item,
                         const ChangeConfig &config,
                         bool autoReload) const override;

  std::string name() const override { return "env-vars"; }

  /**
   * @brief Имя переменной: STAKATER_<ИМЯ>_<CONFIGMAP|SECRET>
   *
   * @code
   EnvVarStrategy::envVarName("app-config", ResourceKind::ConfigMap);
   // "STAKATER_APP_CONFIG_CONFIGMAP"
   @endcode
   */
  static std::string envVarName(const std::string &resourceName,
                                ResourceKind kind);

  /**
   * @brief Приводит имя ресурса к виду имени переменной окружения
   *
   * Буквы и цифры переводятся в верхний регистр; серия прочих символов
   * после допустимого символа заменяется одним '_'; ведущие недопустимые
   * символы отбрасываются.
   */
  static std::string convertToEnvVarName(const std::string &text);

 private:
  /// Обновляет существующую переменную в любом обычном контейнере
  static EvaluationResult updateExistingEnvVar(nlohmann::json &containers,
                                               const std::string &envVar,
                                               const std::string &value);
};

/**
 * @brief Создаёт стратегию по имени из конфигурации
 * @throw std::invalid_argument Для неизвестного имени
 */
std::unique_ptr<UpdateStrategy> createUpdateStrategy(const std::string &name);
