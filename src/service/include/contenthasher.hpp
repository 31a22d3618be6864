/**
 * @file contenthasher.hpp
 * @brief Хеш содержимого ConfigMap/Secret
 */

#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @class ContentHasher
 * @brief SHA-1 (OpenSSL EVP) от отсортированных записей "key=value"
 *
 * @details
 * Записи упорядочиваются по ключу и объединяются через ';', поэтому хеш
 * не зависит от порядка полей в ответе API-сервера.
 */
class ContentHasher {
 public:
  /**
   * @brief Хеш набора пар ключ-значение
   * @return Шестнадцатеричная строка в нижнем регистре (40 символов)
   * @throw std::runtime_error При ошибке OpenSSL
   */
  static std::string hashData(const std::map<std::string, std::string> &data);

  /**
   * @brief Хеш объекта ConfigMap или Secret
   *
   * Учитываются поля data и binaryData; нестроковые значения
   * сериализуются в JSON.
   */
  static std::string hashResource(const nlohmann::json &resource);

  /// SHA-1 произвольной строки в hex
  static std::string sha1Hex(const std::string &input);
};
