/**
 * @file exit_policy.hpp
 * @brief Ограничение на страну выходного узла Tor
 */
#pragma once

#include <string>
#include <vector>

/**
 * @struct ExitPolicy
 * @brief Набор кодов стран (ISO, нижний регистр) и флаг строгости
 *
 * @details Пустой список с strict == false означает «любой выходной узел».
 * Порядок стран сохраняется; повторы допустимы.
 */
struct ExitPolicy {
  std::vector<std::string> countries;
  bool strict = false;

  static ExitPolicy any() { return ExitPolicy{}; }
  static ExitPolicy strictCountry(const std::string& country);

  bool isUnconstrained() const { return countries.empty(); }

  /// Значение директивы ExitNodes: {ru},{de}; пусто для isUnconstrained()
  std::string exitNodesValue() const;

  /// Для логов: "ExitNodes {ru}, StrictNodes 1"
  std::string describe() const;

  bool operator==(const ExitPolicy& other) const {
    return countries == other.countries && strict == other.strict;
  }
  bool operator!=(const ExitPolicy& other) const { return !(*this == other); }
};

/**
 * @struct FallbackSpec
 * @brief Запасная политика: "any" или упорядоченный список стран
 */
struct FallbackSpec {
  std::vector<std::string> countries;  ///< Пусто означает "any"

  /**
   * @brief Разобрать "any", "" или "de, NL,fr"
   * @details Элементы обрезаются и приводятся к нижнему регистру, пустые
   * элементы отбрасываются.
   */
  static FallbackSpec parse(const std::string& text);

  bool isAny() const { return countries.empty(); }

  /// Всегда нестрогая политика
  ExitPolicy toPolicy() const { return ExitPolicy{countries, false}; }
};

/// Нормализовать код страны: обрезать пробелы, нижний регистр
std::string normalizeCountryCode(const std::string& code);
