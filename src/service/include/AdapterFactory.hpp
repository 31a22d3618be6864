/**
 * @file AdapterFactory.hpp
 * @brief Реестр адаптеров workload'ов по kind (Abstract Factory)
 *
 * @details
 * Класс AdapterFactory сопоставляет имя kind ("Deployment", "CronJob", ...)
 * с функцией-производителем ResourceAdapter. Встроенные kind регистрируются
 * в конструкторе; новые можно добавить во время выполнения через
 * registerAdapter(). Набор активных адаптеров строится один раз при старте
 * по флагам is_openshift / is_argo_rollouts.
 * Доступ к реестру защищён std::mutex.
 */
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "../include/annotationkeys.hpp"
#include "../include/resourceadapter.hpp"

/**
 * @class AdapterFactory
 * @brief Singleton-реестр функций создания ResourceAdapter
 *
 * @ingroup Core
 */
class AdapterFactory {
 public:
  /**
   * @typedef CreatorFunction
   * @brief Функция создания адаптера
   *
   * Получает ключи аннотаций (Rollout читает из них ключ стратегии).
   */
  using CreatorFunction = std::function<std::unique_ptr<ResourceAdapter>(
      const AnnotationKeys &)>;

  /**
   * @brief Возвращает единственный экземпляр реестра (Singleton)
   *
   * @code
   AdapterFactory &factory = AdapterFactory::instance();
   @endcode
   */
  static AdapterFactory &instance();

  /**
   * @brief Создаёт адаптер указанного kind
   * @param[in] kind Имя kind
   * @param[in] keys Ключи аннотаций процесса
   * @throw std::invalid_argument Если kind пуст или не зарегистрирован
   * @throw std::runtime_error При ошибке внутри CreatorFunction
   */
  std::unique_ptr<ResourceAdapter> createAdapter(const std::string &kind,
                                                 const AnnotationKeys &keys);

  /**
   * @brief Регистрирует новый kind
   * @throw std::invalid_argument Если kind пуст или creator == nullptr
   *
   * @code
   AdapterFactory::instance().registerAdapter("Custom",
       [](const AnnotationKeys &) { return std::make_unique<CustomAdapter>(); });
   @endcode
   *
   * @warning Повторная регистрация kind перезапишет предыдущую функцию.
   */
  void registerAdapter(const std::string &kind, CreatorFunction creator);

  bool isSupported(const std::string &kind) const noexcept;

  /**
   * @brief Строит набор активных адаптеров в фиксированном порядке
   *
   * Порядок: Deployment, CronJob, DaemonSet, StatefulSet,
   * [DeploymentConfig, если isOpenshift], [Rollout, если isArgoRollouts].
   * В этом порядке performRollingUpgrade обходит kind'ы.
   */
  std::vector<std::shared_ptr<ResourceAdapter>> createActiveAdapters(
      bool isOpenshift, bool isArgoRollouts, const AnnotationKeys &keys);

 private:
  AdapterFactory();
  ~AdapterFactory() = default;

  AdapterFactory(const AdapterFactory &) = delete;
  AdapterFactory &operator=(const AdapterFactory &) = delete;
  AdapterFactory(AdapterFactory &&) = delete;
  AdapterFactory &operator=(AdapterFactory &&) = delete;

  /// Регистрирует Deployment, CronJob, DaemonSet, StatefulSet,
  /// DeploymentConfig и Rollout
  void registerBuiltinAdapters();

  std::unordered_map<std::string, CreatorFunction> creators_;
  mutable std::mutex mutex_;
};
