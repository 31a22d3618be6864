/**
 * @file kubeclient.cpp
 * @brief Реализация клиента API-сервера Kubernetes на libcurl
 */

#include "../include/kubeclient.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "rld/compositelogger.hpp"

KubeClientConfig KubeClientConfig::fromJson(const nlohmann::json &src) {
  KubeClientConfig config;
  if (src.is_null()) return config;
  config.server = src.value("server", config.server);
  config.tokenPath = src.value("token_path", config.tokenPath);
  config.caPath = src.value("ca_path", config.caPath);
  config.timeoutSeconds = src.value("timeout_seconds", config.timeoutSeconds);
  return config;
}

std::string KubeClient::resourcePath(const std::string &apiVersion,
                                     const std::string &plural,
                                     const std::string &namespaceName,
                                     const std::string &name) {
  std::string path = apiVersion == "v1" ? "/api/v1" : "/apis/" + apiVersion;
  if (!namespaceName.empty()) path += "/namespaces/" + namespaceName;
  path += "/" + plural;
  if (!name.empty()) path += "/" + name;
  return path;
}

CurlKubeClient::CurlKubeClient(KubeClientConfig config)
    : config_(std::move(config)) {
  if (config_.server.empty()) {
    throw std::invalid_argument("Kubernetes API server address is empty");
  }
  while (!config_.server.empty() && config_.server.back() == '/') {
    config_.server.pop_back();
  }

  if (!config_.tokenPath.empty()) {
    std::ifstream tokenFile(config_.tokenPath);
    if (tokenFile) {
      std::stringstream buffer;
      buffer << tokenFile.rdbuf();
      token_ = buffer.str();
      while (!token_.empty() &&
             (token_.back() == '\n' || token_.back() == '\r')) {
        token_.pop_back();
      }
    } else {
      rld::CompositeLogger::instance().warning(
          "Service account token not found at " + config_.tokenPath +
          ", requests will be unauthenticated");
    }
  }

  rld::CompositeLogger::instance().info("Kubernetes client created for " +
                                        config_.server);
}

size_t CurlKubeClient::writeCallback(void *contents, size_t size,
                                     size_t nmemb, CurlResponse *response) {
  size_t total = size * nmemb;
  response->data.append(static_cast<char *>(contents), total);
  return total;
}

nlohmann::json CurlKubeClient::get(const std::string &path) {
  return request("GET", path, "", "");
}

nlohmann::json CurlKubeClient::create(const std::string &path,
                                      const nlohmann::json &body) {
  return request("POST", path, body.dump(), "application/json");
}

nlohmann::json CurlKubeClient::replace(const std::string &path,
                                       const nlohmann::json &body) {
  return request("PUT", path, body.dump(), "application/json");
}

nlohmann::json CurlKubeClient::patch(const std::string &path,
                                     const nlohmann::json &body) {
  return request("PATCH", path, body.dump(), "application/merge-patch+json");
}

nlohmann::json CurlKubeClient::request(const std::string &method,
                                       const std::string &path,
                                       const std::string &body,
                                       const std::string &contentType) {
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw ApiError(0, "Failed to initialize CURL");
  }

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Accept: application/json");
  if (!contentType.empty()) {
    headers = curl_slist_append(headers,
                                ("Content-Type: " + contentType).c_str());
  }
  if (!token_.empty()) {
    headers =
        curl_slist_append(headers, ("Authorization: Bearer " + token_).c_str());
  }

  const std::string url = config_.server + path;
  CurlResponse response;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                   static_cast<long>(config_.timeoutSeconds));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (!config_.caPath.empty()) {
    curl_easy_setopt(curl, CURLOPT_CAINFO, config_.caPath.c_str());
  }
  if (!body.empty()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
  }

  CURLcode res = curl_easy_perform(curl);
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    throw ApiError(0, method + " " + path + " failed: " +
                          std::string(curl_easy_strerror(res)));
  }

  nlohmann::json parsed =
      nlohmann::json::parse(response.data, nullptr, false);

  if (status >= 400) {
    std::string message = response.data;
    if (!parsed.is_discarded() && parsed.is_object() &&
        parsed.contains("message") && parsed["message"].is_string()) {
      message = parsed["message"].get<std::string>();
    }
    throw ApiError(status, method + " " + path + " returned HTTP " +
                               std::to_string(status) + ": " + message);
  }

  if (response.data.empty()) return nlohmann::json::object();
  if (parsed.is_discarded()) {
    throw ApiError(status, method + " " + path + " returned invalid JSON");
  }

  rld::CompositeLogger::instance().debug(method + " " + path + " -> HTTP " +
                                         std::to_string(status));
  return parsed;
}
