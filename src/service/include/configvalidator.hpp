/**
 * @file configvalidator.hpp
 * @date October 2026
 * @brief Проверка структуры и типов настроек tornet
 */
#pragma once

#include <nlohmann/json.hpp>
#include <string>

/**
 * @class ConfigValidator
 * @brief Проверяет итоговую (слитую) конфигурацию
 *
 * @details Все известные ключи обязательны: значения по умолчанию всегда
 * присутствуют, поэтому отсутствие ключа означает удаление через null в
 * пользовательском файле или --override. Неизвестные ключи допускаются.
 */
class ConfigValidator {
 public:
  /**
   * @brief Проверить корень конфигурации
   * @return true при успехе
   * @throw std::runtime_error С описанием первого нарушения
   */
  bool validateRoot(const nlohmann::json &config) const;

  /**
   * @brief Проверить массив logging
   * @details Каждый элемент: объект с "type" (console | sync_file),
   * необязательными "level" и "file"
   */
  bool validateLogging(const nlohmann::json &logging) const;

 private:
  const nlohmann::json &requireSection(const nlohmann::json &config,
                                       const std::string &name) const;
  void requireString(const nlohmann::json &section, const std::string &path,
                     const std::string &key) const;
  void requirePositive(const nlohmann::json &section, const std::string &path,
                       const std::string &key, bool allowZero) const;
};
