/**
 * @file rotation_scheduler.hpp
 * @date October 2026
 * @brief Периодическая смена IP через reload службы Tor
 *
 * @details Каждая итерация: выбрать интервал, подождать его на
 * CancellationToken, выполнить changeIp(). Отмена во время ожидания
 * завершает цикл до reload текущей итерации.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <random>
#include <string>

#include "cancellation_token.hpp"
#include "connectivity_probe.hpp"
#include "rotation_interval.hpp"
#include "service_controller.hpp"
#include "tornet/ilogger.hpp"

class RotationScheduler {
 public:
  /// Вызывается с каждым полученным IP
  using IpObserver = std::function<void(const std::string&)>;

  RotationScheduler(ServiceController& service, ConnectivityProbe& probe,
                    CancellationToken& cancel, tornet::ILogger& logger,
                    std::chrono::milliseconds settleDelay =
                        std::chrono::seconds(2));

  /**
   * @brief Выполнить ротации
   * @param config count == 0 означает цикл до отмены
   * @return Число завершённых ротаций
   */
  std::size_t run(const RotationConfig& config);

  /**
   * @brief Одна ротация: reload, пауза, проба, отчёт
   * @return Новый IP или пусто, если проба не удалась
   */
  std::optional<std::string> changeIp();

  void setObserver(IpObserver observer) { observer_ = std::move(observer); }

  /// Для воспроизводимых тестов
  void seed(std::mt19937::result_type value) { rng_.seed(value); }

  /// Множитель единицы интервала; в тестах секунды заменяются миллисекундами
  void setIntervalUnit(std::chrono::milliseconds unit) { intervalUnit_ = unit; }

 private:
  ServiceController& service_;
  ConnectivityProbe& probe_;
  CancellationToken& cancel_;
  tornet::ILogger& logger_;
  std::chrono::milliseconds settleDelay_;
  std::chrono::milliseconds intervalUnit_{std::chrono::seconds(1)};
  IpObserver observer_;
  std::mt19937 rng_{std::random_device{}()};
};
