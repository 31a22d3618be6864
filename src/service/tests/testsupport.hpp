/**
 * @file testsupport.hpp
 * @brief Общие mock-объекты и построители манифестов для тестов сервиса
 */

#pragma once

#include <gmock/gmock.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../include/alertnotifier.hpp"
#include "../include/kubeclient.hpp"
#include "../include/outcomereporter.hpp"
#include "../include/workloaditem.hpp"

class MockKubeClient : public KubeClient {
 public:
  MOCK_METHOD(nlohmann::json, get, (const std::string &path), (override));
  MOCK_METHOD(nlohmann::json, create,
              (const std::string &path, const nlohmann::json &body),
              (override));
  MOCK_METHOD(nlohmann::json, replace,
              (const std::string &path, const nlohmann::json &body),
              (override));
  MOCK_METHOD(nlohmann::json, patch,
              (const std::string &path, const nlohmann::json &body),
              (override));
};

class MockEventRecorder : public EventRecorder {
 public:
  MOCK_METHOD(void, recordEvent,
              (const std::string &kind, const WorkloadItem &item,
               const std::string &type, const std::string &reason,
               const std::string &message),
              (override));
};

/// Перехватывает отправку вместо HTTP-запроса
class MockAlertNotifier : public AlertNotifier {
 public:
  explicit MockAlertNotifier(AlertConfig config)
      : AlertNotifier(std::move(config)) {}

  MOCK_METHOD(void, post, (const std::string &url, const nlohmann::json &body),
              (override));
};

namespace testsupport {

inline nlohmann::json container(const std::string &name) {
  return {{"name", name}, {"image", name + ":latest"}};
}

/// Deployment с заданными аннотациями, контейнерами и томами
inline nlohmann::json deployment(
    const std::string &name, const std::string &ns,
    nlohmann::json annotations = nlohmann::json::object(),
    std::vector<nlohmann::json> containers = {container("app")},
    std::vector<nlohmann::json> volumes = {},
    nlohmann::json podAnnotations = nlohmann::json::object()) {
  return {{"apiVersion", "apps/v1"},
          {"kind", "Deployment"},
          {"metadata",
           {{"name", name},
            {"namespace", ns},
            {"uid", name + "-uid"},
            {"annotations", std::move(annotations)}}},
          {"spec",
           {{"replicas", 1},
            {"template",
             {{"metadata",
               {{"labels", {{"app", name}}},
                {"annotations", std::move(podAnnotations)}}},
              {"spec",
               {{"containers", nlohmann::json(std::move(containers))},
                {"volumes", nlohmann::json(std::move(volumes))}}}}}}}};
}

inline nlohmann::json configMapVolume(const std::string &volume,
                                      const std::string &configMap) {
  return {{"name", volume}, {"configMap", {{"name", configMap}}}};
}

inline nlohmann::json secretVolume(const std::string &volume,
                                   const std::string &secret) {
  return {{"name", volume}, {"secret", {{"secretName", secret}}}};
}

inline nlohmann::json volumeMount(const std::string &volume) {
  return {{"name", volume}, {"mountPath", "/etc/" + volume}};
}

inline nlohmann::json itemList(std::vector<nlohmann::json> items) {
  return {{"kind", "List"}, {"items", nlohmann::json(std::move(items))}};
}

inline nlohmann::json configMap(const std::string &name, const std::string &ns,
                                nlohmann::json data,
                                nlohmann::json annotations =
                                    nlohmann::json::object()) {
  return {{"metadata",
           {{"name", name},
            {"namespace", ns},
            {"annotations", std::move(annotations)}}},
          {"data", std::move(data)}};
}

}  // namespace testsupport
