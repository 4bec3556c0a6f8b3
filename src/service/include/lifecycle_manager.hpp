/**
 * @file lifecycle_manager.hpp
 * @date October 2026
 * @brief Завершение по сигналу и команда --stop
 *
 * @details LifecycleManager регистрирует обработчики SIGINT, SIGQUIT и
 * SIGTERM в tornet::SignalRouter. Обработчик выполняется на потоке
 * маршрутизатора:
 *  1. Срабатывает CancellationToken, все паузы основного потока прерываются
 *  2. shutdown(): остановка службы Tor (ServiceController::stopForShutdown,
 *     после неё основной поток уже не запустит службу) и других
 *     экземпляров tornet
 *  3. Завершение процесса с кодом 0
 *
 * shutdown() выполняется не более одного раза за время жизни процесса.
 */
#pragma once

#include <sys/types.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

#include "cancellation_token.hpp"
#include "service_controller.hpp"
#include "tornet/ProcessLister.hpp"
#include "tornet/ilogger.hpp"

/**
 * @struct LifecycleHooks
 * @brief Системные действия, подменяемые в тестах
 */
struct LifecycleHooks {
  std::function<void(int)> exit;           ///< Завершить процесс
  std::function<int(pid_t, int)> kill;     ///< Послать сигнал процессу
};

/// exit: сброс логгера и std::_Exit; kill: ::kill
LifecycleHooks defaultLifecycleHooks(tornet::ILogger& logger);

class LifecycleManager {
 public:
  LifecycleManager(ServiceController& service,
                   const tornet::IProcessLister& processes,
                   CancellationToken& cancel, tornet::ILogger& logger,
                   std::string toolName, LifecycleHooks hooks);
  ~LifecycleManager();

  LifecycleManager(const LifecycleManager&) = delete;
  LifecycleManager& operator=(const LifecycleManager&) = delete;

  /**
   * @brief Зарегистрировать обработчики сигналов и запустить маршрутизатор
   * @throw std::system_error Ошибки signalfd/epoll
   * @note Вызывать из главного потока до запуска других потоков
   */
  void install();

  /// Реакция на сигнал: отмена, shutdown(), завершение с кодом 0
  void handleSignal(int signum);

  /**
   * @brief Остановить службу и другие экземпляры, сообщить пользователю
   * @return false, если завершение уже выполнялось
   */
  bool shutdown();

  /// Действие команды --stop
  void stopEverything();

  /**
   * @brief Послать SIGTERM процессам, в командной строке которых есть
   * имя инструмента, кроме текущего
   * @return Число процессов, которым отправлен сигнал
   */
  std::size_t terminatePeers();

  bool isShutDown() const { return shutDown_.load(); }

 private:
  void stopServiceQuietly();

  ServiceController& service_;
  const tornet::IProcessLister& processes_;
  CancellationToken& cancel_;
  tornet::ILogger& logger_;
  std::string toolName_;
  LifecycleHooks hooks_;
  std::atomic<bool> shutDown_{false};
  bool installed_ = false;
};
