#include "../include/alertnotifier.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "rld/compositelogger.hpp"

AlertConfig AlertConfig::fromJson(const nlohmann::json &src) {
  AlertConfig config;
  if (src.is_null()) return config;
  config.onReload = src.value("on_reload", config.onReload);
  config.webhookUrl = src.value("webhook_url", config.webhookUrl);
  config.sink = src.value("sink", config.sink);
  config.additionalInfo = src.value("additional_info", config.additionalInfo);
  config.proxy = src.value("proxy", config.proxy);
  std::transform(config.sink.begin(), config.sink.end(), config.sink.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return config;
}

AlertNotifier::AlertNotifier(AlertConfig config)
    : config_(std::move(config)) {}

std::string AlertNotifier::formatMessage(const std::string &resourceName,
                                         const std::string &resourceType,
                                         const std::string &namespaceName,
                                         const std::string &workloadName,
                                         const std::string &workloadKind) {
  return "Reloader detected changes in *" + resourceName + "* of type *" +
         resourceType + "* in namespace *" + namespaceName +
         "*. Hence reloaded *" + workloadName + "* of type *" + workloadKind +
         "* in namespace *" + namespaceName + "*";
}

nlohmann::json AlertNotifier::formatAlertBody(
    const std::string &sink, const std::string &message,
    const std::string &additionalInfo) {
  std::string text =
      additionalInfo.empty() ? message : additionalInfo + " : " + message;

  if (sink == "slack" || sink == "gchat") {
    return {{"text", text}};
  }
  if (sink == "teams") {
    return {{"@type", "MessageCard"},
            {"@context", "http://schema.org/extensions"},
            {"text", text}};
  }

  text.erase(std::remove(text.begin(), text.end(), '*'), text.end());
  return {{"text", text}};
}

void AlertNotifier::sendAlert(const std::string &message) {
  if (!config_.onReload || config_.webhookUrl.empty()) return;

  try {
    post(config_.webhookUrl,
         formatAlertBody(config_.sink, message, config_.additionalInfo));
    rld::CompositeLogger::instance().debug("Alert sent to " + config_.sink +
                                           " webhook");
  } catch (const std::exception &e) {
    rld::CompositeLogger::instance().error(
        "Failed to send alert to webhook: " + std::string(e.what()));
  }
}

void AlertNotifier::sendUpgradeWebhook(const std::string &url) {
  try {
    post(url, {{"webhook", "update successful"}});
  } catch (const std::exception &e) {
    rld::CompositeLogger::instance().error("Failed to send webhook to " +
                                           url + ": " + e.what());
  }
}

size_t AlertNotifier::writeCallback(void *contents, size_t size, size_t nmemb,
                                    CurlResponse *response) {
  size_t total = size * nmemb;
  response->data.append(static_cast<char *>(contents), total);
  return total;
}

void AlertNotifier::post(const std::string &url, const nlohmann::json &body) {
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Failed to initialize CURL");
  }

  const std::string payload = body.dump();
  struct curl_slist *headers =
      curl_slist_append(nullptr, "Content-Type: application/json");
  CurlResponse response;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(payload.size()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (!config_.proxy.empty()) {
    curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy.c_str());
  }

  CURLcode res = curl_easy_perform(curl);
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    throw std::runtime_error("POST " + url + " failed: " +
                             std::string(curl_easy_strerror(res)));
  }
  if (status >= 400) {
    throw std::runtime_error("POST " + url + " returned HTTP " +
                             std::to_string(status) + ": " + response.data);
  }
}
