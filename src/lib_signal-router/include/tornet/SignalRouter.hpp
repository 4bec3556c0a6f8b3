/**
 * @file SignalRouter.hpp
 * @brief Асинхронный маршрутизатор POSIX-сигналов
 *
 * @date October 2026
 * @version 1.1
 * @license MIT
 *
 * @details Сигналы блокируются в вызывающем потоке и принимаются через
 * signalfd на отдельном рабочем потоке (epoll). Обработчики выполняются в
 * обычном контексте потока, поэтому могут вызывать любые функции, в том числе
 * запускать внешние процессы и завершать программу.
 */
#pragma once

#include <sys/signalfd.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace tornet {

/**
 * @class SignalRouter
 * @brief Потокобезопасный менеджер обработки сигналов (Singleton)
 *
 * @warning
 * - Только для Linux систем
 * - Не поддерживает SIGKILL и SIGSTOP
 * - registerHandler() нужно вызывать из главного потока до создания других
 *   потоков: маска сигналов наследуется потоками при создании
 */
class SignalRouter {
 public:
  using Handler = std::function<void(int)>;

  static SignalRouter& instance() {
    static SignalRouter router;
    return router;
  }

  SignalRouter(const SignalRouter&) = delete;
  SignalRouter& operator=(const SignalRouter&) = delete;

  /**
   * @brief Зарегистрировать обработчик для сигнала
   * @param signum Номер сигнала (например, SIGINT)
   * @param handler Функция-обработчик
   * @throw std::invalid_argument При неверном номере сигнала, SIGKILL, SIGSTOP
   * @throw std::system_error При ошибках системных вызовов
   *
   * @note Несколько обработчиков одного сигнала вызываются в порядке
   * регистрации.
   *
   * @code
   * router.registerHandler(SIGTERM, [](int sig) {
   *     logger.info("Graceful shutdown requested");
   * });
   * @endcode
   */
  void registerHandler(int signum, Handler handler);

  /**
   * @brief Удалить все обработчики для сигнала
   * @note Сигнал остаётся заблокированным до уничтожения маршрутизатора
   */
  void unregisterHandler(int signum);

  /**
   * @brief Запустить поток обработки сигналов
   * @throw std::system_error Если не удалось создать epoll
   * @note Повторный вызов игнорируется
   */
  void start();

  /**
   * @brief Остановить поток обработки
   * @note Безопасен при вызове из самого обработчика
   */
  void stop() noexcept;

  bool isRunning() const noexcept { return running_.load(); }

  ~SignalRouter();

 private:
  SignalRouter();
  void processSignals(int epoll_fd);
  void dispatch(int signum);

  std::unordered_map<int, std::vector<Handler>> handlers_;
  std::mutex handlers_mutex_;
  std::atomic<bool> running_{false};
  std::thread worker_thread_;
  int signal_fd_ = -1;
  sigset_t original_mask_;
  sigset_t blocked_mask_{};
};

}  // namespace tornet
