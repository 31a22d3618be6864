/**
 * @file workloadadapters.hpp
 * @brief Адаптеры встроенных kind workload'ов
 *
 * @details
 * PodTemplateAdapter реализует общую часть: workload хранит шаблон пода
 * по фиксированному JSON-указателю и обновляется PUT'ом всего объекта.
 * Наследники задают API-группу, ресурс и расположение шаблона, а CronJob
 * и Rollout переопределяют способ применения изменения.
 */

#pragma once

#include <string>
#include <utility>

#include "resourceadapter.hpp"

/**
 * @class PodTemplateAdapter
 * @brief Базовый адаптер workload'а с шаблоном пода
 */
class PodTemplateAdapter : public ResourceAdapter {
 public:
  /**
   * @param[in] kind         Имя kind ("Deployment")
   * @param[in] apiVersion   Версия API ("apps/v1")
   * @param[in] plural       Имя ресурса в REST API ("deployments")
   * @param[in] templatePath JSON-указатель на шаблон пода ("/spec/template")
   */
  PodTemplateAdapter(std::string kind, std::string apiVersion,
                     std::string plural, const std::string &templatePath);

  std::string kind() const override { return kind_; }

  std::vector<WorkloadItem> listItems(
      KubeClient &client, const std::string &namespaceName) const override;

  Annotations annotations(const WorkloadItem &item) const override;
  Annotations podAnnotations(const WorkloadItem &item) const override;
  nlohmann::json *mutablePodAnnotations(WorkloadItem &item) const override;

  const nlohmann::json &containers(const WorkloadItem &item) const override;
  nlohmann::json *mutableContainers(WorkloadItem &item) const override;
  const nlohmann::json &initContainers(
      const WorkloadItem &item) const override;
  const nlohmann::json &volumes(const WorkloadItem &item) const override;

  /// PUT изменённого объекта целиком
  void applyUpdate(KubeClient &client, const std::string &namespaceName,
                   const WorkloadItem &item) const override;

  const std::string &apiVersion() const noexcept { return apiVersion_; }
  const std::string &plural() const noexcept { return plural_; }

 protected:
  /// Шаблон пода или nullptr
  const nlohmann::json *podTemplate(const WorkloadItem &item) const;
  nlohmann::json *podTemplate(WorkloadItem &item) const;

  /// Поле spec шаблона пода (containers, volumes, ...) или пустой массив
  const nlohmann::json &podSpecArray(const WorkloadItem &item,
                                     const char *field) const;

  std::string objectPath(const std::string &namespaceName,
                         const WorkloadItem &item) const;

  std::string kind_;
  std::string apiVersion_;
  std::string plural_;
  nlohmann::json::json_pointer templatePointer_;
};

class DeploymentAdapter : public PodTemplateAdapter {
 public:
  DeploymentAdapter()
      : PodTemplateAdapter("Deployment", "apps/v1", "deployments",
                           "/spec/template") {}
};

class DaemonSetAdapter : public PodTemplateAdapter {
 public:
  DaemonSetAdapter()
      : PodTemplateAdapter("DaemonSet", "apps/v1", "daemonsets",
                           "/spec/template") {}
};

class StatefulSetAdapter : public PodTemplateAdapter {
 public:
  StatefulSetAdapter()
      : PodTemplateAdapter("StatefulSet", "apps/v1", "statefulsets",
                           "/spec/template") {}
};

class DeploymentConfigAdapter : public PodTemplateAdapter {
 public:
  DeploymentConfigAdapter()
      : PodTemplateAdapter("DeploymentConfig", "apps.openshift.io/v1",
                           "deploymentconfigs", "/spec/template") {}
};

/**
 * @class CronJobAdapter
 * @brief CronJob: шаблон в spec.jobTemplate, изменение запускает Job
 *
 * @details
 * Сам CronJob не изменяется. applyUpdate создаёт разовый Job из
 * изменённого jobTemplate с аннотацией
 * cronjob.kubernetes.io/instantiate=manual и ownerReference на CronJob.
 */
class CronJobAdapter : public PodTemplateAdapter {
 public:
  CronJobAdapter()
      : PodTemplateAdapter("CronJob", "batch/v1", "cronjobs",
                           "/spec/jobTemplate/spec/template") {}

  void applyUpdate(KubeClient &client, const std::string &namespaceName,
                   const WorkloadItem &item) const override;

  /// Манифест Job, создаваемого из CronJob
  static nlohmann::json buildJob(const WorkloadItem &cronJob);
};

/**
 * @class ArgoRolloutAdapter
 * @brief Argo Rollout с поддержкой стратегии rollout/restart
 *
 * @details
 * Стратегия читается из аннотации workload'а (ключ rollout-strategy):
 *  - "rollout" (по умолчанию): PUT изменённого объекта
 *  - "restart": merge patch {"spec":{"restartAt":"<RFC 3339>"}}
 * Неизвестное значение логируется и трактуется как "rollout".
 */
class ArgoRolloutAdapter : public PodTemplateAdapter {
 public:
  explicit ArgoRolloutAdapter(std::string strategyAnnotation)
      : PodTemplateAdapter("Rollout", "argoproj.io/v1alpha1", "rollouts",
                           "/spec/template"),
        strategyAnnotation_(std::move(strategyAnnotation)) {}

  void applyUpdate(KubeClient &client, const std::string &namespaceName,
                   const WorkloadItem &item) const override;

 private:
  std::string strategyAnnotation_;
};
