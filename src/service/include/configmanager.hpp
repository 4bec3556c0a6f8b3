/**
 * @file configmanager.hpp
 * @date October 2026
 * @brief Фасад настроек tornet: значения по умолчанию, файл пользователя,
 * переопределения из командной строки
 *
 * @details
 * Итоговая конфигурация собирается в три слоя:
 *  1. Встроенные значения по умолчанию (defaultConfig())
 *  2. JSON-файл пользователя, применяемый через merge_patch
 *  3. CLI-переопределения --override=key.path:value
 * После каждого изменения конфигурация проверяется ConfigValidator.
 * Компоненты ядра получают не JSON, а типизированный снимок ToolSettings.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../include/configloader.hpp"
#include "../include/configvalidator.hpp"
#include "../include/connectivity_probe.hpp"

/**
 * @struct LoggerSpec
 * @brief Описание одного приёмника логов
 */
struct LoggerSpec {
  std::string type;   ///< console | sync_file
  std::string level;  ///< Пусто: уровень по умолчанию
  std::string file;   ///< Только для sync_file
};

/**
 * @struct ToolSettings
 * @brief Типизированный снимок итоговой конфигурации
 */
struct ToolSettings {
  std::string serviceName;
  std::string systemdMarker;
  std::string relayProcessName;
  std::string relayBinary;
  std::string proxyHost;
  int proxyPort = 0;
  ProbeSettings probe;
  std::chrono::seconds bootstrapGrace{0};
  std::chrono::seconds startupWait{0};
  std::chrono::seconds rotationSettle{0};
  std::vector<std::string> torrcCandidates;
  std::string toolName;
  std::vector<LoggerSpec> logging;

  /// "socks5h://host:port": имя хоста разрешается на стороне прокси
  std::string proxyUrl() const;
};

/**
 * @class ConfigManager
 * @brief Класс управления конфигурацией (Singleton)
 *
 * @note Потокобезопасен: все методы берут configMutex_
 */
class ConfigManager {
 public:
  static ConfigManager &instance();

  /// Встроенные значения по умолчанию
  static nlohmann::json defaultConfig();

  /**
   * @brief Собрать конфигурацию заново
   * @param[in] filename Необязательный файл пользователя
   * @throw UsageError Файл не читается, не разбирается или не проходит
   * проверку
   *
   * @code
   ConfigManager::instance().initialize(std::string("tornet.json"));
   @endcode
   */
  void initialize(const std::optional<std::string> &filename = std::nullopt);

  /**
   * @brief Применить CLI-переопределения
   * @param[in] overrides Пары "proxy.port" -> "9150"
   * @details Значение разбирается как JSON (числа, true/false, массивы);
   * если разбор не удался, сохраняется как строка. Точка в ключе задаёт
   * вложенность.
   * @throw UsageError Результат не проходит проверку; конфигурация
   * остаётся прежней
   */
  void applyCliOverrides(
      const std::unordered_map<std::string, std::string> &overrides);

  nlohmann::json getCurrentConfig() const;

  /// @throw UsageError Конфигурация не соответствует ожидаемым типам
  ToolSettings settings() const;

  static ToolSettings toSettings(const nlohmann::json &config);

 private:
  ConfigManager();
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  /// Проверка с переводом std::runtime_error в UsageError
  void validateOrThrow(const nlohmann::json &config) const;

  ConfigLoader loader_;
  ConfigValidator validator_;
  nlohmann::json baseConfig_;
  mutable std::mutex configMutex_;
};
