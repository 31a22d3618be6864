/**
 * @file resourceadapter.hpp
 * @brief Полиморфный интерфейс доступа к workload'ам одного kind
 *
 * @details
 * Каждый поддерживаемый kind (Deployment, CronJob, DaemonSet, StatefulSet,
 * DeploymentConfig, Rollout) реализует ResourceAdapter. Остальной движок
 * работает с workload'ами только через этот интерфейс и не знает, где
 * у конкретного kind лежит шаблон пода и как применяется изменение.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "changeconfig.hpp"
#include "kubeclient.hpp"
#include "workloaditem.hpp"

/**
 * @class UpdateError
 * @brief Ошибка применения изменённого workload'а к кластеру
 *
 * Оборачивает исходную ошибку API. Не повторяется, передаётся вызывающему.
 */
class UpdateError : public std::runtime_error {
 public:
  UpdateError(const std::string &kind, const std::string &namespaceName,
              const std::string &name, const std::string &cause);

  const std::string &kind() const noexcept { return kind_; }
  const std::string &namespaceName() const noexcept { return namespace_; }
  const std::string &name() const noexcept { return name_; }
  const std::string &cause() const noexcept { return cause_; }

 private:
  std::string kind_;
  std::string namespace_;
  std::string name_;
  std::string cause_;
};

/**
 * @class ResourceAdapter
 * @brief Набор возможностей для одного kind workload'а
 */
class ResourceAdapter {
 public:
  virtual ~ResourceAdapter() = default;

  /// Имя kind в API ("Deployment", "CronJob", ...)
  virtual std::string kind() const = 0;

  /**
   * @brief Возвращает workload'ы пространства имён
   * @param[in] namespaceName Пустая строка означает все пространства имён
   *
   * Никогда не бросает: ошибка получения списка логируется, результат
   * пустой.
   */
  virtual std::vector<WorkloadItem> listItems(
      KubeClient &client, const std::string &namespaceName) const = 0;

  /// Аннотации самого workload'а
  virtual Annotations annotations(const WorkloadItem &item) const = 0;

  /// Аннотации шаблона пода
  virtual Annotations podAnnotations(const WorkloadItem &item) const = 0;

  /**
   * @brief Изменяемый объект аннотаций шаблона пода
   * @return nullptr, если шаблон отсутствует или аннотации не объект
   *
   * Отсутствующий объект аннотаций создаётся.
   */
  virtual nlohmann::json *mutablePodAnnotations(WorkloadItem &item) const = 0;

  /// Массив обычных контейнеров (пустой массив, если поля нет)
  virtual const nlohmann::json &containers(const WorkloadItem &item) const = 0;

  /// Изменяемый массив обычных контейнеров; nullptr, если поля нет
  virtual nlohmann::json *mutableContainers(WorkloadItem &item) const = 0;

  virtual const nlohmann::json &initContainers(
      const WorkloadItem &item) const = 0;

  virtual const nlohmann::json &volumes(const WorkloadItem &item) const = 0;

  /**
   * @brief Применяет изменённый workload к кластеру
   * @throw UpdateError При ошибке API
   */
  virtual void applyUpdate(KubeClient &client,
                           const std::string &namespaceName,
                           const WorkloadItem &item) const = 0;
};
