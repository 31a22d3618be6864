/**
 * @file configloader.hpp
 * @brief Чтение JSON-конфигурации контроллера перезагрузки
 *
 * @details
 * ConfigLoader читает файл конфигурации целиком и разбирает его через
 * nlohmann::json. Ошибки открытия и синтаксиса превращаются в
 * std::runtime_error с префиксом "ConfigLoader:", чтобы сообщение в
 * критическом логе при старте указывало на источник проблемы.
 *
 * @see ConfigManager
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

/**
 * @defgroup Configuration Компоненты управления конфигурацией
 */

/**
 * @class ConfigLoader
 * @brief Загрузчик JSON-документа из файла или строки
 * @ingroup Configuration
 */
class ConfigLoader {
 public:
  /**
   * @brief Загружает и разбирает файл конфигурации
   * @param[in] filename Путь к файлу
   * @return Разобранный JSON-документ
   * @throw std::runtime_error Файл не открывается или содержит
   *        некорректный JSON
   */
  nlohmann::json loadFromFile(const std::string &filename);

  /**
   * @brief Разбирает конфигурацию из строки
   * @throw std::runtime_error При синтаксической ошибке
   */
  static nlohmann::json loadFromString(const std::string &content);
};
