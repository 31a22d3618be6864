/**
 * @file configvalidator.hpp
 * @brief Проверка структуры и допустимых значений конфигурации
 *
 * @details
 * Проверка выполняется в два этапа:
 *  - validateRoot() для исходного документа: наличие объектов "defaults"
 *    и "environments";
 *  - validateReloaderConfig() для объединённой конфигурации окружения:
 *    типы и диапазоны значений параметров контроллера.
 *
 * Все методы сообщают о первой найденной ошибке исключением
 * std::runtime_error с префиксом "ConfigValidator:".
 */

#pragma once

#include <initializer_list>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @class ConfigValidator
 * @brief Валидатор конфигурации контроллера
 * @ingroup Configuration
 */
class ConfigValidator {
 public:
  /**
   * @brief Проверяет корневую структуру документа
   * @throw std::runtime_error Нет секции "defaults" или "environments",
   *        либо "defaults" пуст
   */
  bool validateRoot(const nlohmann::json &config) const;

  /**
   * @brief Проверяет объединённую конфигурацию окружения
   *
   * Допустимые значения:
   *  - reload_strategy: "env-vars" или "annotations";
   *  - log_level: debug|info|warning|error|critical, log_format: text|json;
   *  - delayed_upgrade_window_seconds >= 0, poll_interval_seconds > 0;
   *  - namespaces, namespaces_to_ignore: массивы строк;
   *  - resources_to_ignore: массив из "configmaps" и/или "secrets";
   *  - annotations, alert, kubernetes: объекты.
   *
   * @throw std::runtime_error При первом нарушении
   */
  bool validateReloaderConfig(const nlohmann::json &config) const;

 private:
  void validateBoolean(const nlohmann::json &config,
                       const std::string &key) const;
  void validateStringArray(const nlohmann::json &config,
                           const std::string &key) const;
  void validateOneOf(const nlohmann::json &config, const std::string &key,
                     std::initializer_list<const char *> allowed) const;
  void validateAlert(const nlohmann::json &alert) const;
  void validateKubernetes(const nlohmann::json &kubernetes) const;
};
