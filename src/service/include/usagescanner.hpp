/**
 * @file usagescanner.hpp
 * @brief Поиск контейнера, использующего ConfigMap/Secret
 */

#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "changeconfig.hpp"
#include "resourceadapter.hpp"

/**
 * @class ResourceUsageScanner
 * @brief Определяет контейнер workload'а, который потребляет ресурс
 *
 * @details
 * Правила (побеждает первое совпадение):
 *  1. Том, монтирующий ресурс (напрямую или через projected-источник).
 *     Монтирование в обычном контейнере возвращает его; монтирование
 *     только в init-контейнере возвращает первый обычный контейнер.
 *  2. Ссылка из env (valueFrom.configMapKeyRef/secretKeyRef) или envFrom,
 *     с тем же правилом для init-контейнеров.
 *  3. Без совпадения: первый обычный контейнер при autoReload == false,
 *     иначе ничего.
 * Workload без обычных контейнеров не даёт контейнера ни в одной ветке.
 */
class ResourceUsageScanner {
 public:
  /**
   * @brief Индекс потребляющего контейнера в массиве обычных контейнеров
   * @return std::nullopt, если контейнер не найден
   */
  static std::optional<std::size_t> findConsumingContainer(
      const ResourceAdapter &adapter, const WorkloadItem &item,
      const ChangeConfig &config, bool autoReload);

  /// Имя тома, монтирующего ресурс, или std::nullopt
  static std::optional<std::string> mountedVolumeName(
      const nlohmann::json &volumes, ResourceKind kind,
      const std::string &resourceName);

 private:
  static std::optional<std::size_t> findByVolumeMount(
      const nlohmann::json &containers, const std::string &volumeName);

  static std::optional<std::size_t> findByEnvReference(
      const nlohmann::json &containers, ResourceKind kind,
      const std::string &resourceName);
};
