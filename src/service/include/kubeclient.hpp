/**
 * @file kubeclient.hpp
 * @brief Клиент API-сервера Kubernetes
 *
 * @details
 * KubeClient задаёт минимальный набор операций над путями REST API
 * (get/create/replace/patch с JSON-телами). CurlKubeClient реализует его
 * поверх libcurl с bearer-токеном сервисного аккаунта и CA кластера.
 * Абстракция позволяет подменять клиент в тестах (MockKubeClient).
 */

#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @class ApiError
 * @brief Ошибка обращения к API-серверу
 *
 * status() равен HTTP-коду ответа, либо 0 для транспортных ошибок.
 */
class ApiError : public std::runtime_error {
 public:
  ApiError(long status, const std::string &message)
      : std::runtime_error(message), status_(status) {}

  long status() const noexcept { return status_; }

 private:
  long status_;
};

/**
 * @struct KubeClientConfig
 * @brief Параметры подключения к API-серверу (секция "kubernetes")
 */
struct KubeClientConfig {
  std::string server = "https://kubernetes.default.svc";
  std::string tokenPath = "/var/run/secrets/kubernetes.io/serviceaccount/token";
  std::string caPath = "/var/run/secrets/kubernetes.io/serviceaccount/ca.crt";
  int timeoutSeconds = 30;

  static KubeClientConfig fromJson(const nlohmann::json &src);
};

/**
 * @class KubeClient
 * @brief Интерфейс операций над ресурсами Kubernetes
 */
class KubeClient {
 public:
  virtual ~KubeClient() = default;

  /// GET по пути API; возвращает тело ответа
  virtual nlohmann::json get(const std::string &path) = 0;

  /// POST нового объекта в коллекцию
  virtual nlohmann::json create(const std::string &path,
                                const nlohmann::json &body) = 0;

  /// PUT объекта целиком
  virtual nlohmann::json replace(const std::string &path,
                                 const nlohmann::json &body) = 0;

  /// PATCH с Content-Type application/merge-patch+json
  virtual nlohmann::json patch(const std::string &path,
                               const nlohmann::json &body) = 0;

  /**
   * @brief Строит путь REST API для ресурса
   * @param[in] apiVersion   "v1" для core-группы, иначе "group/version"
   * @param[in] plural       Имя ресурса во множественном числе
   * @param[in] namespaceName Пустая строка означает все пространства имён
   * @param[in] name         Имя объекта (необязательно)
   *
   * @code
   KubeClient::resourcePath("apps/v1", "deployments", "prod", "web");
   // "/apis/apps/v1/namespaces/prod/deployments/web"
   @endcode
   */
  static std::string resourcePath(const std::string &apiVersion,
                                  const std::string &plural,
                                  const std::string &namespaceName,
                                  const std::string &name = "");
};

/**
 * @class CurlKubeClient
 * @brief Реализация KubeClient на libcurl
 *
 * @note curl_global_init() вызывается владельцем процесса (ServiceController).
 */
class CurlKubeClient : public KubeClient {
 public:
  /**
   * @brief Создаёт клиента и читает токен сервисного аккаунта
   * @throw std::invalid_argument Если адрес сервера пуст
   *
   * Отсутствующий файл токена не является ошибкой: запросы уходят без
   * заголовка Authorization (например, через kubectl proxy).
   */
  explicit CurlKubeClient(KubeClientConfig config);

  nlohmann::json get(const std::string &path) override;
  nlohmann::json create(const std::string &path,
                        const nlohmann::json &body) override;
  nlohmann::json replace(const std::string &path,
                         const nlohmann::json &body) override;
  nlohmann::json patch(const std::string &path,
                       const nlohmann::json &body) override;

 private:
  struct CurlResponse {
    std::string data;
  };

  static size_t writeCallback(void *contents, size_t size, size_t nmemb,
                              CurlResponse *response);

  /**
   * @brief Выполняет HTTP-запрос к API-серверу
   * @throw ApiError При транспортной ошибке, HTTP-статусе >= 400 или
   *                 невалидном JSON в ответе
   */
  nlohmann::json request(const std::string &method, const std::string &path,
                         const std::string &body,
                         const std::string &contentType);

  KubeClientConfig config_;
  std::string token_;
};
