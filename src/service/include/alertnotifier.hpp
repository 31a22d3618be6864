/**
 * @file alertnotifier.hpp
 * @brief Отправка alert-сообщений о перезагрузке и webhook-уведомлений
 *
 * @details
 * Доставка "best effort": ошибки логируются и не передаются вызывающему.
 * Формат тела зависит от sink: slack, teams, gchat или raw (любое другое
 * значение).
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

/**
 * @struct AlertConfig
 * @brief Секция "alert" конфигурации
 */
struct AlertConfig {
  bool onReload = false;       ///< Отправлять alert после успешного rollout
  std::string webhookUrl;      ///< Адрес webhook'а
  std::string sink = "raw";    ///< slack | teams | gchat | raw
  std::string additionalInfo;  ///< Префикс сообщения
  std::string proxy;           ///< HTTP-прокси для доставки

  static AlertConfig fromJson(const nlohmann::json &src);
};

/**
 * @class AlertNotifier
 * @brief HTTP POST JSON-сообщений на webhook (libcurl)
 */
class AlertNotifier {
 public:
  explicit AlertNotifier(AlertConfig config);
  virtual ~AlertNotifier() = default;

  /**
   * @brief Текст alert-сообщения о перезагрузке
   *
   * @code
   AlertNotifier::formatMessage("app-config", "CONFIGMAP", "prod", "web",
                                "Deployment");
   // "Reloader detected changes in *app-config* of type *CONFIGMAP* in
   //  namespace *prod*. Hence reloaded *web* of type *Deployment* in
   //  namespace *prod*"
   @endcode
   */
  static std::string formatMessage(const std::string &resourceName,
                                   const std::string &resourceType,
                                   const std::string &namespaceName,
                                   const std::string &workloadName,
                                   const std::string &workloadKind);

  /// Тело запроса для sink с учётом additional_info
  static nlohmann::json formatAlertBody(const std::string &sink,
                                        const std::string &message,
                                        const std::string &additionalInfo);

  /// Отправляет alert, если включён on_reload и задан webhook_url
  void sendAlert(const std::string &message);

  /// POST {"webhook":"update successful"} (режим только-webhook)
  void sendUpgradeWebhook(const std::string &url);

  const AlertConfig &config() const noexcept { return config_; }

 protected:
  /**
   * @brief Выполняет POST
   * @throw std::runtime_error При транспортной ошибке или HTTP >= 400
   */
  virtual void post(const std::string &url, const nlohmann::json &body);

 private:
  struct CurlResponse {
    std::string data;
  };

  static size_t writeCallback(void *contents, size_t size, size_t nmemb,
                              CurlResponse *response);

  AlertConfig config_;
};
