/**
 * @file outcomereporter.cpp
 * @brief Реализация отчёта о результате перезагрузки
 */

#include "../include/outcomereporter.hpp"

#include <chrono>
#include <utility>

#include "rld/MetricsCollector.hpp"
#include "rld/compositelogger.hpp"

KubeEventRecorder::KubeEventRecorder(std::shared_ptr<KubeClient> client,
                                     std::string component)
    : client_(std::move(client)), component_(std::move(component)) {}

nlohmann::json KubeEventRecorder::buildEvent(const std::string &kind,
                                             const WorkloadItem &item,
                                             const std::string &type,
                                             const std::string &reason,
                                             const std::string &message) const {
  const auto now =
      rld::TimeFormatter::formatRfc3339(std::chrono::system_clock::now());

  nlohmann::json involved = {{"kind", kind},
                             {"name", item.name()},
                             {"namespace", item.namespaceName()}};
  if (item.object.is_object()) {
    if (auto api = item.object.find("apiVersion");
        api != item.object.end() && api->is_string()) {
      involved["apiVersion"] = *api;
    }
    if (auto meta = item.object.find("metadata");
        meta != item.object.end() && meta->is_object()) {
      if (auto uid = meta->find("uid");
          uid != meta->end() && uid->is_string()) {
        involved["uid"] = *uid;
      }
      if (auto version = meta->find("resourceVersion");
          version != meta->end() && version->is_string()) {
        involved["resourceVersion"] = *version;
      }
    }
  }

  return {{"apiVersion", "v1"},
          {"kind", "Event"},
          {"metadata",
           {{"generateName", item.name() + "."},
            {"namespace", item.namespaceName()}}},
          {"involvedObject", involved},
          {"type", type},
          {"reason", reason},
          {"message", message},
          {"source", {{"component", component_}}},
          {"reportingComponent", component_},
          {"firstTimestamp", now},
          {"lastTimestamp", now},
          {"count", 1}};
}

void KubeEventRecorder::recordEvent(const std::string &kind,
                                    const WorkloadItem &item,
                                    const std::string &type,
                                    const std::string &reason,
                                    const std::string &message) {
  try {
    client_->create(
        KubeClient::resourcePath("v1", "events", item.namespaceName()),
        buildEvent(kind, item, type, reason, message));
  } catch (const std::exception &e) {
    rld::CompositeLogger::instance().error("Failed to record event " + reason +
                                           " for " + kind + " " + item.name() +
                                           ": " + e.what());
  }
}

OutcomeReporter::OutcomeReporter(std::shared_ptr<EventRecorder> recorder,
                                 std::shared_ptr<AlertNotifier> notifier)
    : recorder_(std::move(recorder)), notifier_(std::move(notifier)) {}

void OutcomeReporter::registerMetrics() {
  auto &metrics = rld::MetricsCollector::instance();
  if (!metrics.isRegistered(kReloadedTotalMetric)) {
    metrics.registerCounter(kReloadedTotalMetric,
                            "Counter of reloads executed by Reloader.");
  }
  if (!metrics.isRegistered(kReloadedByNamespaceMetric)) {
    metrics.registerCounter(
        kReloadedByNamespaceMetric,
        "Counter of reloads executed by Reloader by namespace.");
  }
}

void OutcomeReporter::reportSuccess(const ResourceAdapter &adapter,
                                    const WorkloadItem &item,
                                    const ChangeConfig &config) {
  const auto kind = adapter.kind();
  const auto workload = item.name();

  rld::CompositeLogger::instance().info(
      "Changes detected in '" + config.resourceName + "' of type '" +
      config.typeName() + "' in namespace '" + config.namespaceName +
      "'; updated '" + workload + "' of type '" + kind + "' in namespace '" +
      config.namespaceName + "'");

  countReload(true, config.namespaceName);

  if (recorder_) {
    recorder_->recordEvent(
        kind, item, "Normal", "Reloaded",
        "Changes detected in '" + config.resourceName + "' of type '" +
            config.typeName() + "' in namespace '" + config.namespaceName +
            "', Updated '" + workload + "' of type '" + kind +
            "' in namespace '" + config.namespaceName + "'");
  }

  if (notifier_) {
    notifier_->sendAlert(AlertNotifier::formatMessage(
        config.resourceName, config.typeName(), config.namespaceName, workload,
        kind));
  }
}

void OutcomeReporter::reportFailure(const ResourceAdapter &adapter,
                                    const WorkloadItem &item,
                                    const ChangeConfig &config,
                                    const std::string &error) {
  const std::string message = "Update for '" + item.name() + "' of type '" +
                              adapter.kind() + "' in namespace '" +
                              config.namespaceName +
                              "' failed with error " + error;
  rld::CompositeLogger::instance().error(message);

  countReload(false, config.namespaceName);

  if (recorder_) {
    recorder_->recordEvent(adapter.kind(), item, "Warning", "ReloadFail",
                           message);
  }
}

void OutcomeReporter::countReload(bool success,
                                  const std::string &namespaceName) {
  auto &metrics = rld::MetricsCollector::instance();
  const std::string label = success ? "true" : "false";
  metrics.incrementCounter(kReloadedTotalMetric, {{"success", label}});
  metrics.incrementCounter(kReloadedByNamespaceMetric,
                           {{"success", label}, {"namespace", namespaceName}});
}
