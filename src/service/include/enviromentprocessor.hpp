/**
 * @file enviromentprocessor.hpp
 * @brief Подстановка переменных окружения в JSON-конфигурацию
 *
 * @details
 * В строковых значениях конфигурации шаблон `$ENV{NAME}` заменяется
 * значением переменной окружения процесса. Так в манифест Deployment'а
 * контроллера можно передать, например, адрес webhook'а через Secret:
 *
 * @code
 * "alert": { "webhook_url": "$ENV{ALERT_WEBHOOK_URL}" }
 * @endcode
 *
 * @warning Шаблон с неустановленной переменной остаётся в строке как есть;
 *          о нём пишется предупреждение в лог.
 */

#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @class EnvironmentProcessor
 * @brief Рекурсивная обработка шаблонов `$ENV{...}`
 * @ingroup Configuration
 */
class EnvironmentProcessor {
 public:
  /**
   * @brief Обходит все строковые узлы JSON и подставляет переменные
   * @param[in,out] config Обрабатываемый документ
   */
  void process(nlohmann::json &config) const;

  /**
   * @brief Подставляет переменные окружения в одну строку
   * @param[in,out] value Строка с шаблонами `$ENV{NAME}`
   * @return Количество шаблонов, оставшихся неразрешёнными
   */
  std::size_t resolveVariable(std::string &value) const;

 private:
  void walkJson(nlohmann::json &node,
                const std::function<void(std::string &)> &func) const;
};
