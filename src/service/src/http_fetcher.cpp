#include "../include/http_fetcher.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

#include "../include/cancellation_token.hpp"

namespace {

struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

// Ненулевой результат прерывает передачу с CURLE_ABORTED_BY_CALLBACK
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t,
                     curl_off_t) {
  const auto* token = static_cast<const CancellationToken*>(clientp);
  return (token && token->isCancelled()) ? 1 : 0;
}

}  // namespace

size_t CurlHttpFetcher::writeCallback(void* contents, size_t size,
                                      size_t nmemb, std::string* body) {
  const size_t total = size * nmemb;
  body->append(static_cast<const char*>(contents), total);
  return total;
}

HttpResponse CurlHttpFetcher::get(const HttpRequest& request) {
  HttpResponse response;

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    response.error = "Failed to initialize CURL";
    return response;
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,
                   static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "tornet");
  if (!request.proxy.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_PROXY, request.proxy.c_str());
  }
  if (request.cancel) {
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA,
                     const_cast<CancellationToken*>(request.cancel));
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  }

  CURLcode res = curl_easy_perform(curl.get());
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

  if (res != CURLE_OK) {
    response.error = curl_easy_strerror(res);
    return response;
  }
  if (response.status < 200 || response.status >= 300) {
    response.error = "HTTP status " + std::to_string(response.status);
    return response;
  }
  response.ok = true;
  return response;
}

CurlGlobalGuard::CurlGlobalGuard() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("curl_global_init failed");
  }
}

CurlGlobalGuard::~CurlGlobalGuard() { curl_global_cleanup(); }
