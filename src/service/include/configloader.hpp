/**
 * @file configloader.hpp
 * @date October 2026
 * @brief Загрузчик JSON-файла настроек tornet
 */
#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @class ConfigLoader
 * @brief Чтение и разбор JSON-файла
 *
 * @details Только ввод-вывод и синтаксис. Структура проверяется
 * ConfigValidator, слияние со значениями по умолчанию выполняет
 * ConfigManager.
 */
class ConfigLoader {
 public:
  /**
   * @brief Загрузить конфигурацию из файла
   * @param[in] filename Путь к JSON-файлу
   * @return Разобранный JSON
   * @throw std::invalid_argument Пустой путь
   * @throw std::runtime_error Файл не открывается, синтаксическая ошибка JSON
   * или корень не является объектом
   *
   * @code
   ConfigLoader loader;
   auto user = loader.loadFromFile("/etc/tornet/tornet.json");
   @endcode
   */
  nlohmann::json loadFromFile(const std::string &filename) const;

  /// Разобрать JSON из строки; ошибки как у loadFromFile()
  nlohmann::json loadFromString(const std::string &text) const;

 private:
  nlohmann::json parseStream(std::istream &in, const std::string &origin) const;
};
