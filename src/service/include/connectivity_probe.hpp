/**
 * @file connectivity_probe.hpp
 * @date October 2026
 * @brief Определение текущего внешнего IP напрямую или через SOCKS-прокси Tor
 *
 * @details Результаты пробы никогда не кэшируются: каждый вызов выполняет
 * новый HTTP-запрос. Сетевые ошибки не фатальны, они записываются в лог как
 * предупреждения, а вызывающий код получает пустой результат.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "http_fetcher.hpp"
#include "tornet/ProcessLister.hpp"
#include "tornet/ilogger.hpp"

class CancellationToken;

/**
 * @struct ProbeSettings
 * @brief Адреса и таймауты проб
 */
struct ProbeSettings {
  std::string ipEchoUrl = "https://api.ipify.org";
  std::string connectivityUrl = "http://www.google.com";
  std::string proxyUrl = "socks5h://127.0.0.1:9050";
  std::chrono::seconds directTimeout{10};
  std::chrono::seconds proxyTimeout{15};
  std::chrono::seconds connectivityTimeout{5};
  std::string relayProcessName = "tor";
};

/**
 * @struct ProbeResult
 * @brief Итог одной пробы
 */
struct ProbeResult {
  std::optional<std::string> ip;
  bool succeeded = false;
};

class ConnectivityProbe {
 public:
  /**
   * @param cancel Токен завершения; запросы через прокси прерываются при
   * его срабатывании. Может быть nullptr.
   */
  ConnectivityProbe(IHttpFetcher& fetcher,
                    const tornet::IProcessLister& processes,
                    tornet::ILogger& logger, ProbeSettings settings = {},
                    const CancellationToken* cancel = nullptr);

  /// IP без прокси; при ошибке предупреждение и пустой результат
  std::optional<std::string> getIpDirect();

  /// IP через SOCKS-прокси Tor; при ошибке предупреждение и пустой результат
  std::optional<std::string> getIpViaProxy();

  /// Через прокси, если процесс Tor запущен, иначе напрямую
  std::optional<std::string> getCurrentIp();

  bool isManagedProcessRunning() const;

  ProbeResult probe(bool viaProxy);

  /// Базовая проверка доступа в интернет без прокси
  bool hasInternetConnection();

  const ProbeSettings& settings() const { return settings_; }

 private:
  std::optional<std::string> fetchIp(const HttpRequest& request,
                                     const std::string& failureMessage);

  IHttpFetcher& fetcher_;
  const tornet::IProcessLister& processes_;
  tornet::ILogger& logger_;
  ProbeSettings settings_;
  const CancellationToken* cancel_;
};
