/**
 * @file workloadadapters.cpp
 * @brief Реализация адаптеров встроенных kind workload'ов
 */

#include "../include/workloadadapters.hpp"

#include <chrono>

#include "rld/compositelogger.hpp"
#include "rld/ilogger.hpp"

namespace {

const nlohmann::json &emptyArray() {
  static const nlohmann::json empty = nlohmann::json::array();
  return empty;
}

Annotations toAnnotations(const nlohmann::json &metadata) {
  Annotations result;
  if (!metadata.is_object()) return result;
  auto it = metadata.find("annotations");
  if (it == metadata.end() || !it->is_object()) return result;
  for (const auto &[key, value] : it->items()) {
    if (value.is_string()) result[key] = value.get<std::string>();
  }
  return result;
}

const nlohmann::json &metadataOf(const nlohmann::json &object) {
  static const nlohmann::json empty = nlohmann::json::object();
  if (!object.is_object()) return empty;
  auto it = object.find("metadata");
  return (it == object.end() || !it->is_object()) ? empty : *it;
}

}  // namespace

UpdateError::UpdateError(const std::string &kind,
                         const std::string &namespaceName,
                         const std::string &name, const std::string &cause)
    : std::runtime_error("Update of " + kind + " " + namespaceName + "/" +
                         name + " failed: " + cause),
      kind_(kind),
      namespace_(namespaceName),
      name_(name),
      cause_(cause) {}

PodTemplateAdapter::PodTemplateAdapter(std::string kind,
                                       std::string apiVersion,
                                       std::string plural,
                                       const std::string &templatePath)
    : kind_(std::move(kind)),
      apiVersion_(std::move(apiVersion)),
      plural_(std::move(plural)),
      templatePointer_(templatePath) {}

std::vector<WorkloadItem> PodTemplateAdapter::listItems(
    KubeClient &client, const std::string &namespaceName) const {
  std::vector<WorkloadItem> items;
  try {
    auto list = client.get(
        KubeClient::resourcePath(apiVersion_, plural_, namespaceName));
    auto it = list.find("items");
    if (it == list.end() || !it->is_array()) return items;

    items.reserve(it->size());
    for (auto &object : *it) {
      // Элементы списка приходят без apiVersion/kind, а PUT их требует
      if (object.is_object()) {
        object["apiVersion"] = apiVersion_;
        object["kind"] = kind_;
      }
      items.push_back(WorkloadItem{std::move(object)});
    }
  } catch (const std::exception &e) {
    rld::CompositeLogger::instance().error("Failed to list " + plural_ +
                                           " in namespace '" + namespaceName +
                                           "': " + e.what());
    items.clear();
  }
  return items;
}

Annotations PodTemplateAdapter::annotations(const WorkloadItem &item) const {
  return toAnnotations(metadataOf(item.object));
}

Annotations PodTemplateAdapter::podAnnotations(
    const WorkloadItem &item) const {
  const auto *tmpl = podTemplate(item);
  return tmpl ? toAnnotations(metadataOf(*tmpl)) : Annotations{};
}

nlohmann::json *PodTemplateAdapter::mutablePodAnnotations(
    WorkloadItem &item) const {
  auto *tmpl = podTemplate(item);
  if (!tmpl) return nullptr;

  auto &metadata = (*tmpl)["metadata"];
  if (metadata.is_null()) metadata = nlohmann::json::object();
  if (!metadata.is_object()) return nullptr;

  auto &annotations = metadata["annotations"];
  if (annotations.is_null()) annotations = nlohmann::json::object();
  return annotations.is_object() ? &annotations : nullptr;
}

const nlohmann::json &PodTemplateAdapter::containers(
    const WorkloadItem &item) const {
  return podSpecArray(item, "containers");
}

nlohmann::json *PodTemplateAdapter::mutableContainers(
    WorkloadItem &item) const {
  auto *tmpl = podTemplate(item);
  if (!tmpl) return nullptr;
  auto spec = tmpl->find("spec");
  if (spec == tmpl->end() || !spec->is_object()) return nullptr;
  auto list = spec->find("containers");
  if (list == spec->end() || !list->is_array()) return nullptr;
  return &*list;
}

const nlohmann::json &PodTemplateAdapter::initContainers(
    const WorkloadItem &item) const {
  return podSpecArray(item, "initContainers");
}

const nlohmann::json &PodTemplateAdapter::volumes(
    const WorkloadItem &item) const {
  return podSpecArray(item, "volumes");
}

void PodTemplateAdapter::applyUpdate(KubeClient &client,
                                     const std::string &namespaceName,
                                     const WorkloadItem &item) const {
  try {
    client.replace(objectPath(namespaceName, item), item.object);
  } catch (const std::exception &e) {
    throw UpdateError(kind_, namespaceName, item.name(), e.what());
  }
}

const nlohmann::json *PodTemplateAdapter::podTemplate(
    const WorkloadItem &item) const {
  if (!item.object.is_object() || !item.object.contains(templatePointer_)) {
    return nullptr;
  }
  const auto &tmpl = item.object.at(templatePointer_);
  return tmpl.is_object() ? &tmpl : nullptr;
}

nlohmann::json *PodTemplateAdapter::podTemplate(WorkloadItem &item) const {
  if (!item.object.is_object() || !item.object.contains(templatePointer_)) {
    return nullptr;
  }
  auto &tmpl = item.object.at(templatePointer_);
  return tmpl.is_object() ? &tmpl : nullptr;
}

const nlohmann::json &PodTemplateAdapter::podSpecArray(
    const WorkloadItem &item, const char *field) const {
  const auto *tmpl = podTemplate(item);
  if (!tmpl) return emptyArray();
  auto spec = tmpl->find("spec");
  if (spec == tmpl->end() || !spec->is_object()) return emptyArray();
  auto list = spec->find(field);
  if (list == spec->end() || !list->is_array()) return emptyArray();
  return *list;
}

std::string PodTemplateAdapter::objectPath(const std::string &namespaceName,
                                           const WorkloadItem &item) const {
  return KubeClient::resourcePath(apiVersion_, plural_, namespaceName,
                                  item.name());
}

nlohmann::json CronJobAdapter::buildJob(const WorkloadItem &cronJob) {
  const auto &object = cronJob.object;
  const nlohmann::json::json_pointer templatePointer("/spec/jobTemplate");
  nlohmann::json jobTemplate = nlohmann::json::object();
  if (object.is_object() && object.contains(templatePointer)) {
    jobTemplate = object.at(templatePointer);
  }
  const auto &templateMeta = metadataOf(jobTemplate);

  nlohmann::json annotations = nlohmann::json::object();
  if (auto it = templateMeta.find("annotations");
      it != templateMeta.end() && it->is_object()) {
    annotations = *it;
  }
  annotations["cronjob.kubernetes.io/instantiate"] = "manual";

  nlohmann::json metadata = {{"generateName", cronJob.name() + "-"},
                             {"namespace", cronJob.namespaceName()},
                             {"annotations", annotations}};
  if (auto it = templateMeta.find("labels");
      it != templateMeta.end() && it->is_object()) {
    metadata["labels"] = *it;
  }

  const auto &cronMeta = metadataOf(object);
  metadata["ownerReferences"] = nlohmann::json::array(
      {{{"apiVersion", "batch/v1"},
        {"kind", "CronJob"},
        {"name", cronJob.name()},
        {"uid", cronMeta.value("uid", std::string{})},
        {"controller", true}}});

  return nlohmann::json{
      {"apiVersion", "batch/v1"},
      {"kind", "Job"},
      {"metadata", metadata},
      {"spec", jobTemplate.is_object()
                   ? jobTemplate.value("spec", nlohmann::json::object())
                   : nlohmann::json::object()}};
}

void CronJobAdapter::applyUpdate(KubeClient &client,
                                 const std::string &namespaceName,
                                 const WorkloadItem &item) const {
  try {
    auto created = client.create(
        KubeClient::resourcePath("batch/v1", "jobs", namespaceName),
        buildJob(item));
    rld::CompositeLogger::instance().info(
        "Created Job " +
        metadataOf(created).value("name", std::string{"<unknown>"}) +
        " from CronJob " + item.name());
  } catch (const std::exception &e) {
    throw UpdateError(kind_, namespaceName, item.name(), e.what());
  }
}

void ArgoRolloutAdapter::applyUpdate(KubeClient &client,
                                     const std::string &namespaceName,
                                     const WorkloadItem &item) const {
  std::string strategy = "rollout";
  auto workloadAnnotations = annotations(item);
  if (auto it = workloadAnnotations.find(strategyAnnotation_);
      it != workloadAnnotations.end() && !it->second.empty()) {
    strategy = it->second;
  }
  if (strategy != "rollout" && strategy != "restart") {
    rld::CompositeLogger::instance().warning(
        "Unknown rollout strategy '" + strategy + "' on Rollout " +
        item.name() + ", using 'rollout'");
    strategy = "rollout";
  }

  if (strategy == "rollout") {
    PodTemplateAdapter::applyUpdate(client, namespaceName, item);
    return;
  }

  try {
    nlohmann::json patch = {
        {"spec",
         {{"restartAt", rld::TimeFormatter::formatRfc3339(
                            std::chrono::system_clock::now())}}}};
    client.patch(objectPath(namespaceName, item), patch);
  } catch (const std::exception &e) {
    throw UpdateError(kind_, namespaceName, item.name(), e.what());
  }
}
