/**
 * @file workloaditem.hpp
 * @brief Обёртка над JSON-документом workload'а, полученным от API-сервера
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

/**
 * @struct WorkloadItem
 * @brief Один объект workload'а любого поддерживаемого kind
 *
 * @details
 * Содержимое (контейнеры, аннотации, тома) читается и изменяется только
 * через ResourceAdapter соответствующего kind.
 */
struct WorkloadItem {
  nlohmann::json object;

  std::string name() const { return metadataField("name"); }

  std::string namespaceName() const { return metadataField("namespace"); }

 private:
  std::string metadataField(const char *field) const {
    if (!object.is_object()) return {};
    auto meta = object.find("metadata");
    if (meta == object.end() || !meta->is_object()) return {};
    auto value = meta->find(field);
    if (value == meta->end() || !value->is_string()) return {};
    return value->get<std::string>();
  }
};

/// Идентичность workload'а для коалесцирования: "kind/namespace/name"
inline std::string workloadIdentity(const std::string &kind,
                                    const WorkloadItem &item) {
  return kind + "/" + item.namespaceName() + "/" + item.name();
}
