/**
 * @file http_fetcher.hpp
 * @brief HTTP GET через libcurl, напрямую или через SOCKS-прокси
 *
 * @note Использует libcurl; curl_global_init() вызывается один раз через
 * CurlGlobalGuard в начале программы.
 * @warning Требует установленной библиотеки libcurl
 */
#pragma once

#include <chrono>
#include <string>

class CancellationToken;

/**
 * @struct HttpRequest
 * @brief Параметры одного запроса
 */
struct HttpRequest {
  std::string url;
  std::string proxy;  ///< Например "socks5h://127.0.0.1:9050"; пусто: напрямую
  std::chrono::seconds timeout{10};
  const CancellationToken* cancel = nullptr;  ///< Прерывает передачу при отмене
};

/**
 * @struct HttpResponse
 * @brief Результат запроса; ok == false при сетевой ошибке или коде не 2xx
 */
struct HttpResponse {
  bool ok = false;
  long status = 0;
  std::string body;
  std::string error;
};

class IHttpFetcher {
 public:
  virtual ~IHttpFetcher() = default;
  virtual HttpResponse get(const HttpRequest& request) = 0;
};

/**
 * @class CurlHttpFetcher
 * @brief Реализация IHttpFetcher на curl easy API
 */
class CurlHttpFetcher : public IHttpFetcher {
 public:
  HttpResponse get(const HttpRequest& request) override;

 private:
  static size_t writeCallback(void* contents, size_t size, size_t nmemb,
                              std::string* body);
};

/**
 * @class CurlGlobalGuard
 * @brief RAII-обёртка над curl_global_init/curl_global_cleanup
 * @throw std::runtime_error Если инициализация libcurl не удалась
 */
class CurlGlobalGuard {
 public:
  CurlGlobalGuard();
  ~CurlGlobalGuard();
  CurlGlobalGuard(const CurlGlobalGuard&) = delete;
  CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;
};
