#include "engines/http_transport.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <chrono>
#include <mutex>
#include <thread>

namespace {
std::once_flag curlInitFlag;
}

std::string HTTPResponse::header(const std::string &name) const {
  auto it = headers.find(StringUtils::toLower(name));
  return it == headers.end() ? std::string{} : it->second;
}

HttpTransport::HttpTransport(const std::string &baseUrl) : baseUrl_(baseUrl) {
  timeoutSeconds_ = 30;
  maxRetries_ = 3;
  std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void HttpTransport::setApiKey(const std::string &headerName,
                              const std::string &key) {
  apiKeyHeader_ = headerName;
  apiKey_ = key;
}

void HttpTransport::setTimeout(int seconds) { timeoutSeconds_ = seconds; }

void HttpTransport::setMaxRetries(int retries) { maxRetries_ = retries; }

size_t HttpTransport::WriteCallback(void *contents, size_t size, size_t nmemb,
                                    void *userp) {
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            size * nmemb);
  return size * nmemb;
}

void HttpTransport::collectHeaderLine(
    const std::string &line, std::map<std::string, std::string> &headers) {
  if (StringUtils::startsWith(line, "HTTP/")) {
    headers.clear();
    return;
  }

  auto colon = line.find(':');
  if (colon != std::string::npos) {
    std::string name =
        StringUtils::toLower(StringUtils::trim(line.substr(0, colon)));
    if (!name.empty())
      headers[name] = StringUtils::trim(line.substr(colon + 1));
  }
}

size_t HttpTransport::HeaderCallback(char *buffer, size_t size, size_t nitems,
                                     void *userp) {
  auto *headers = static_cast<std::map<std::string, std::string> *>(userp);
  collectHeaderLine(std::string(buffer, size * nitems), *headers);
  return size * nitems;
}

std::string HttpTransport::buildURL(const std::string &endpoint) const {
  std::string url = baseUrl_;
  if (!url.empty() && url.back() != '/' && !endpoint.empty() &&
      endpoint.front() != '/') {
    url += "/";
  } else if (!url.empty() && url.back() == '/' && !endpoint.empty() &&
             endpoint.front() == '/') {
    url.pop_back();
  }
  return url + endpoint;
}

bool HttpTransport::handleRateLimit(int statusCode, int &retryCount) {
  if (statusCode == 429 && retryCount < maxRetries_) {
    int backoffSeconds = (1 << retryCount);
    Logger::warning(LogCategory::NETWORK, "HttpTransport",
                    "Rate limit detected (429), backing off for " +
                        std::to_string(backoffSeconds) + " seconds");
    std::this_thread::sleep_for(std::chrono::seconds(backoffSeconds));
    retryCount++;
    return true;
  }
  return false;
}

HTTPResponse HttpTransport::executeRequest(
    const std::string &url, const std::string &method, const std::string &body,
    const std::map<std::string, std::string> &headers, bool withApiKey) {
  HTTPResponse response;

  CurlHandle curl;
  if (!curl.is_valid()) {
    response.error_message = "CURL not initialized";
    return response;
  }

  std::string responseBody;
  struct curl_slist *headerList = nullptr;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseBody);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, HeaderCallback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds_));
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

  if (method == "POST") {
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.length()));
    headerList =
        curl_slist_append(headerList, "Content-Type: application/json");
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  }

  for (const auto &item : headers) {
    std::string header = item.first + ": " + item.second;
    headerList = curl_slist_append(headerList, header.c_str());
  }

  if (withApiKey && !apiKeyHeader_.empty() && !apiKey_.empty()) {
    std::string header = apiKeyHeader_ + ": " + apiKey_;
    headerList = curl_slist_append(headerList, header.c_str());
  }

  if (headerList) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList);
  }

  CURLcode res = curl_easy_perform(curl.get());

  if (headerList) {
    curl_slist_free_all(headerList);
  }

  if (res != CURLE_OK) {
    response.error_message = curl_easy_strerror(res);
    return response;
  }

  long httpCode = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);
  response.status_code = static_cast<int>(httpCode);
  response.body = std::move(responseBody);

  return response;
}

// Retries 5xx and connection failures with linear backoff and 429 with
// exponential backoff. Any other 4xx is final. A non-2xx outcome is reported
// through error_message.
HTTPResponse HttpTransport::executeWithRetry(
    const std::string &url, const std::string &method, const std::string &body,
    const std::map<std::string, std::string> &headers, bool withApiKey) {
  HTTPResponse response;
  int retryCount = 0;

  while (retryCount < maxRetries_) {
    response = executeRequest(url, method, body, headers, withApiKey);

    if (response.status_code >= 200 && response.status_code < 300) {
      break;
    }

    if (response.status_code == 429) {
      if (handleRateLimit(response.status_code, retryCount)) {
        continue;
      }
      break;
    }

    if (response.status_code >= 400 && response.status_code < 500) {
      break;
    }

    retryCount++;
    if (retryCount < maxRetries_) {
      int backoffSeconds = retryCount;
      Logger::warning(LogCategory::NETWORK, "HttpTransport",
                      "Request to " + url + " failed with status " +
                          std::to_string(response.status_code) +
                          ", retrying in " + std::to_string(backoffSeconds) +
                          " seconds");
      std::this_thread::sleep_for(std::chrono::seconds(backoffSeconds));
    }
  }

  if (response.status_code < 200 || response.status_code >= 300) {
    if (response.error_message.empty()) {
      std::string errorBody = response.body.length() > 200
                                  ? response.body.substr(0, 200)
                                  : response.body;
      response.error_message =
          "HTTP " + std::to_string(response.status_code) + ": " + errorBody;
    }
  } else {
    response.error_message.clear();
  }

  return response;
}

HTTPResponse HttpTransport::postJson(const std::string &endpoint,
                                     const json &body) {
  return executeWithRetry(buildURL(endpoint), "POST", body.dump(), {}, true);
}

// List content lives on a CDN, so the API key is not forwarded to it.
HTTPResponse
HttpTransport::get(const std::string &url,
                   const std::map<std::string, std::string> &headers) {
  return executeWithRetry(url, "GET", "", headers, false);
}
