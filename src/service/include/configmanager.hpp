/**
 * @file configmanager.hpp
 * @brief Фасад загрузки и объединения конфигурации контроллера
 *
 * @details
 * ConfigManager объединяет загрузку (ConfigLoader), подстановку переменных
 * окружения (EnvironmentProcessor) и проверку (ConfigValidator). Документ
 * конфигурации состоит из секций "defaults" и "environments"; рабочая
 * конфигурация окружения получается через merge_patch:
 *
 * @code
 * {
 *   "defaults": { "reload_strategy": "env-vars", "log_level": "info" },
 *   "environments": {
 *     "production": { "namespaces_to_ignore": ["kube-system"] },
 *     "development": { "log_level": "debug" }
 *   }
 * }
 * @endcode
 *
 * Переопределения из командной строки (--override=key:value) применяются
 * поверх объединённой конфигурации любого окружения.
 */

#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

#include "configloader.hpp"
#include "configvalidator.hpp"
#include "enviromentprocessor.hpp"

/**
 * @class ConfigManager
 * @brief Singleton-хранилище конфигурации процесса
 * @ingroup Configuration
 */
class ConfigManager {
 public:
  static ConfigManager &instance();

  /**
   * @brief Загружает конфигурацию из файла
   * @param[in] filename Путь к JSON-файлу
   * @throw std::runtime_error Ошибка чтения, разбора или структуры
   */
  void initialize(const std::string &filename);

  /**
   * @brief Принимает уже разобранный документ конфигурации
   *
   * Выполняет те же шаги, что initialize(), кроме чтения файла.
   * Ранее применённые переопределения сбрасываются.
   *
   * @throw std::runtime_error Ошибка структуры
   */
  void initializeFromJson(nlohmann::json config);

  /**
   * @brief Возвращает конфигурацию окружения
   * @param[in] env Имя окружения из секции "environments"
   * @return defaults + environments[env] + CLI-переопределения
   * @throw std::runtime_error Окружение не найдено или значения
   *        не прошли проверку
   */
  nlohmann::json getMergedConfig(const std::string &env) const;

  /**
   * @brief Запоминает переопределения из командной строки
   *
   * Ключ может быть составным ("alert.sink"). Значение разбирается как
   * JSON ("true", "30", "[\"a\"]"); если разбор не удался, оно
   * сохраняется строкой.
   */
  void applyCliOverrides(
      const std::unordered_map<std::string, std::string> &overrides);

  /// Путь загруженного файла; пуст после initializeFromJson()
  std::string configFilePath() const;

 private:
  ConfigManager() = default;
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  static nlohmann::json parseOverrideValue(const std::string &value);

  ConfigLoader loader_;
  EnvironmentProcessor envProcessor_;
  ConfigValidator validator_;

  nlohmann::json baseConfig_;
  nlohmann::json overrides_ = nlohmann::json::object();
  std::string configFilePath_;
  mutable std::mutex configMutex_;
};
