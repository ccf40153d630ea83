#include "lore_core/llm/http_transport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>

#include "lore_core/errors.hpp"

namespace lore_core {

namespace {

std::string trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

}  // namespace

size_t CurlTransport::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

size_t CurlTransport::header_callback(char *buffer, size_t size, size_t nitems,
                                      HttpResponse *response) {
  const size_t total = size * nitems;
  std::string line(buffer, total);
  const auto colon = line.find(':');
  if (colon != std::string::npos) {
    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    response->headers[trim(name)] = trim(line.substr(colon + 1));
  }
  return total;
}

HttpResponse CurlTransport::post(const HttpRequest &request) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    throw ProviderUnavailable("Failed to initialize CURL");
  }

  struct curl_slist *raw_headers = nullptr;
  for (const auto &header : request.headers) {
    raw_headers = curl_slist_append(raw_headers, header.c_str());
  }
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers,
                                                                      &curl_slist_free_all);

  HttpResponse response;
  const long timeout_ms = static_cast<long>(request.timeout.count());

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  if (res == CURLE_OPERATION_TIMEDOUT) {
    throw ProviderUnavailable("Request to " + request.url + " timed out after " +
                              std::to_string(timeout_ms) + " ms");
  }
  if (res != CURLE_OK) {
    throw ProviderUnavailable("Request to " + request.url +
                              " failed: " + std::string(curl_easy_strerror(res)));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

}  // namespace lore_core
