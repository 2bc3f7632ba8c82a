#ifndef HTTP_TRANSPORT_H
#define HTTP_TRANSPORT_H

#include <curl/curl.h>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

struct HTTPResponse {
  int status_code = 0;
  std::string body;
  // Header names are lower-cased.
  std::map<std::string, std::string> headers;
  std::string error_message;

  bool ok() const { return error_message.empty(); }
  std::string header(const std::string &name) const;
};

// RAII wrapper for a libcurl easy handle.
class CurlHandle {
private:
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle_;

public:
  CurlHandle() : handle_(curl_easy_init(), curl_easy_cleanup) {}

  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  CURL *get() const noexcept { return handle_.get(); }
  bool is_valid() const noexcept { return handle_ != nullptr; }
};

// Request side of the HTTP layer as seen by the remote source.
class IHttpTransport {
public:
  virtual ~IHttpTransport() = default;

  // POSTs body as JSON to the base URL + endpoint, with the API key header.
  virtual HTTPResponse postJson(const std::string &endpoint,
                                const json &body) = 0;

  // GETs an absolute URL with extra request headers and no API key.
  virtual HTTPResponse
  get(const std::string &url,
      const std::map<std::string, std::string> &headers) = 0;
};

// Blocking libcurl client. Every request runs on its own easy handle, so one
// transport can serve concurrent callers.
class HttpTransport : public IHttpTransport {
  std::string baseUrl_;
  std::string apiKeyHeader_;
  std::string apiKey_;
  int timeoutSeconds_;
  int maxRetries_;

  static size_t WriteCallback(void *contents, size_t size, size_t nmemb,
                              void *userp);
  static size_t HeaderCallback(char *buffer, size_t size, size_t nitems,
                               void *userp);

public:
  explicit HttpTransport(const std::string &baseUrl);

  HttpTransport(const HttpTransport &) = delete;
  HttpTransport &operator=(const HttpTransport &) = delete;

  void setApiKey(const std::string &headerName, const std::string &key);
  void setTimeout(int seconds);
  void setMaxRetries(int retries);

  HTTPResponse postJson(const std::string &endpoint,
                        const json &body) override;
  HTTPResponse get(const std::string &url,
                   const std::map<std::string, std::string> &headers) override;

  std::string buildURL(const std::string &endpoint) const;

  // Folds one raw response header line into headers. Names are lower-cased
  // and values trimmed; a status line starts a new response and clears what
  // was collected so far.
  static void collectHeaderLine(const std::string &line,
                                std::map<std::string, std::string> &headers);

private:
  HTTPResponse executeRequest(const std::string &url,
                              const std::string &method,
                              const std::string &body,
                              const std::map<std::string, std::string> &headers,
                              bool withApiKey);
  HTTPResponse executeWithRetry(
      const std::string &url, const std::string &method,
      const std::string &body,
      const std::map<std::string, std::string> &headers, bool withApiKey);
  bool handleRateLimit(int statusCode, int &retryCount);
};

#endif
