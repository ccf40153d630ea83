#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace lore_core {

struct HttpRequest {
  std::string url;
  std::vector<std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
  long status_code = 0;
  std::string body;
  // Header names are lower-cased
  std::map<std::string, std::string> headers;
};

class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  // Throws ProviderUnavailable when no HTTP response was received at all.
  virtual HttpResponse post(const HttpRequest &request) = 0;
};

/**
 * @class CurlTransport
 * @brief libcurl implementation of HttpTransport.
 *
 * A fresh easy handle is used per request, so one transport can be shared by concurrent
 * callers. curl_global_init must have been called by the process before first use.
 */
class CurlTransport : public HttpTransport {
 public:
  CurlTransport() = default;

  HttpResponse post(const HttpRequest &request) override;

 private:
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
  static size_t header_callback(char *buffer, size_t size, size_t nitems, HttpResponse *response);
};

}  // namespace lore_core
