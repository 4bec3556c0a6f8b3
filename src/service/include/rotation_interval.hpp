/**
 * @file rotation_interval.hpp
 * @brief Интервал ротации IP: фиксированный или диапазон "lo-hi"
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <string>

/**
 * @class RotationInterval
 * @brief Интервал в секундах; при lo < hi каждое значение выбирается
 * равномерно из [lo, hi] заново
 */
class RotationInterval {
 public:
  /**
   * @brief Разобрать строку "60" или "30-120"
   * @throw IntervalFormatError Пустая строка, нечисловые части, отрицательные
   * значения, лишние символы или lo > hi
   */
  static RotationInterval parse(const std::string& text);

  RotationInterval(std::uint32_t lo, std::uint32_t hi);
  explicit RotationInterval(std::uint32_t fixed)
      : RotationInterval(fixed, fixed) {}

  std::uint32_t lo() const { return lo_; }
  std::uint32_t hi() const { return hi_; }
  bool isRange() const { return lo_ != hi_; }

  /// Выбрать значение в секундах из [lo, hi] включительно
  template <typename Rng>
  std::uint32_t sample(Rng& rng) const {
    if (!isRange()) return lo_;
    std::uniform_int_distribution<std::uint32_t> dist(lo_, hi_);
    return dist(rng);
  }

  template <typename Rng>
  std::chrono::seconds sampleDuration(Rng& rng) const {
    return std::chrono::seconds(sample(rng));
  }

  std::string toString() const;

 private:
  std::uint32_t lo_;
  std::uint32_t hi_;
};

/**
 * @struct RotationConfig
 * @brief Параметры планировщика; count == 0 означает бесконечный цикл
 */
struct RotationConfig {
  RotationInterval interval{60};
  std::uint32_t count = 10;
};
