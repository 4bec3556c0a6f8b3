/**
 * @file cancellation_token.hpp
 * @brief Признак «запрошено завершение» с прерываемым ожиданием
 *
 * @details Единственное состояние, разделяемое обработчиком сигналов и
 * основным потоком. Переходит из false в true один раз. Все паузы
 * (ожидание бутстрапа, интервал ротации) выполняются через waitFor(),
 * поэтому сигнал прерывает их немедленно.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

class CancellationToken {
 public:
  /// Запросить завершение; повторные вызовы ничего не меняют
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
    }
    cv_.notify_all();
  }

  bool isCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  /**
   * @brief Ждать duration либо отмены
   * @return true, если ожидание прервано отменой
   */
  template <typename Rep, typename Period>
  bool waitFor(const std::chrono::duration<Rep, Period>& duration) {
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_for(lock, duration, [this] {
      return cancelled_.load(std::memory_order_acquire);
    });
  }

 private:
  std::atomic<bool> cancelled_{false};
  std::mutex mtx_;
  std::condition_variable cv_;
};
