/**
 * @file resourcewatcher.hpp
 * @brief Опрос ConfigMap/Secret и обнаружение изменений содержимого
 *
 * @details
 * ResourceWatcher периодически получает списки ConfigMap и Secret,
 * вычисляет хеш содержимого и сравнивает его с предыдущим опросом.
 * Первый опрос только запоминает хеши. Изменённый хеш порождает
 * ChangeConfig; новый ресурс порождает его только при reload_on_create.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "annotationkeys.hpp"
#include "changeconfig.hpp"
#include "kubeclient.hpp"

/**
 * @struct WatchOptions
 * @brief Область наблюдения
 */
struct WatchOptions {
  std::vector<std::string> namespaces;  ///< Пусто: все пространства имён
  std::set<std::string> namespacesToIgnore;
  bool watchConfigMaps = true;
  bool watchSecrets = true;
  bool reloadOnCreate = false;
  std::chrono::seconds pollInterval{15};
};

/**
 * @class ResourceWatcher
 * @brief Наблюдатель ConfigMap/Secret на основе периодического опроса
 */
class ResourceWatcher {
 public:
  using ChangeHandler = std::function<void(const ChangeConfig &)>;

  /**
   * @throw std::invalid_argument При пустом client или handler
   */
  ResourceWatcher(std::shared_ptr<KubeClient> client, AnnotationKeys keys,
                  WatchOptions options, ChangeHandler handler);

  /**
   * @brief Выполняет один опрос
   * @return Количество переданных обработчику изменений
   *
   * Исключения обработчика логируются и не прерывают опрос.
   */
  std::size_t pollOnce();

  /// Опрашивает до вызова stop(); блокирует вызывающий поток
  void run();

  /// Прерывает run(); безопасно вызывать из другого потока
  void stop();

  bool stopRequested() const noexcept { return stopRequested_.load(); }

  /// Количество отслеживаемых ресурсов
  std::size_t trackedCount() const;

 private:
  /// Ключ ресурса в таблице хешей: "CONFIGMAP/ns/name"
  static std::string resourceKey(ResourceKind kind,
                                 const std::string &namespaceName,
                                 const std::string &name);

  void pollKind(ResourceKind kind, std::map<std::string, std::string> &current,
                std::vector<ChangeConfig> &changes);

  void pollScope(ResourceKind kind, const std::string &namespaceName,
                 std::map<std::string, std::string> &current,
                 std::vector<ChangeConfig> &changes);

  std::shared_ptr<KubeClient> client_;
  AnnotationKeys keys_;
  WatchOptions options_;
  ChangeHandler handler_;

  mutable std::mutex mutex_;
  std::map<std::string, std::string> hashes_;
  bool baselineDone_ = false;

  std::atomic<bool> stopRequested_{false};
  std::mutex waitMutex_;
  std::condition_variable wakeup_;
};
