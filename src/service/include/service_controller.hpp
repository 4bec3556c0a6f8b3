/**
 * @file service_controller.hpp
 * @date October 2026
 * @brief Управление системной службой Tor через systemd или SysV init
 *
 * @details
 * ServiceController определяет доступный менеджер служб (один раз за время
 * жизни объекта) и выполняет действия start/stop/reload/restart над
 * службой с заданным именем. Команда строится как CommandSpec:
 *  - systemd: systemctl <action> <service>
 *  - SysV:    service <service> <action>
 * Если процесс запущен не от root, команда предваряется sudo.
 *
 * Ненулевой код завершения команды не считается фатальным: он
 * записывается в лог как предупреждение и возвращается вызывающему коду.
 * Фатальны только отсутствие менеджера служб и отсутствие sudo при
 * недостатке прав.
 *
 * Действия выполняются по одному. После stopForShutdown() остаётся
 * доступен только stop: start, reload и restart, пришедшие из основного
 * потока во время или после завершения по сигналу, пропускаются.
 */
#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "tornet/ProcessRunner.hpp"
#include "tornet/ilogger.hpp"

/**
 * @enum ServiceManagerKind
 * @brief Обнаруженный механизм управления службами
 */
enum class ServiceManagerKind { Systemd, SysV, None };

enum class ServiceAction { Start, Stop, Reload, Restart };

std::string toString(ServiceManagerKind kind);
std::string toString(ServiceAction action);

/**
 * @struct ActionOutcome
 * @brief Результат действия над службой
 */
struct ActionOutcome {
  int exitCode = 0;
  std::string stderrText;
  bool skipped = false;  ///< Команда не запускалась: служба уже остановлена при завершении

  bool succeeded() const { return exitCode == 0 && !skipped; }
};

class ServiceController {
 public:
  /**
   * @param runner Исполнитель внешних команд
   * @param logger Приёмник предупреждений
   * @param serviceName Имя службы (по умолчанию "tor")
   * @param systemdMarker Каталог, существующий только при работающем systemd
   */
  ServiceController(tornet::ICommandRunner& runner, tornet::ILogger& logger,
                    std::string serviceName = "tor",
                    std::string systemdMarker = "/run/systemd/system");

  /**
   * @brief Определить менеджер служб
   * @details systemctl в PATH и существующий systemdMarker дают Systemd;
   * иначе service в PATH даёт SysV; иначе None. Побочных эффектов нет,
   * результат кэшируется. Потокобезопасен: stop() может прийти из
   * обработчика сигнала.
   */
  ServiceManagerKind detectManager();

  /**
   * @brief Выполнить действие над службой
   * @return Код завершения и stderr команды
   * @throw ServiceManagerError Менеджер служб не найден
   * @throw PrivilegeError Нужны права root, а sudo недоступен
   */
  ActionOutcome performAction(ServiceAction action);

  /**
   * @brief Остановить службу и запретить дальнейшие запуски
   * @details Ждёт завершения действия, выполняемого другим потоком
   */
  ActionOutcome stopForShutdown();

  bool isShutDown() const;

  ActionOutcome start() { return performAction(ServiceAction::Start); }
  ActionOutcome stop() { return performAction(ServiceAction::Stop); }
  ActionOutcome reload() { return performAction(ServiceAction::Reload); }
  ActionOutcome restart() { return performAction(ServiceAction::Restart); }

  /// Команда, которую выполнит performAction() (для логов и тестов)
  tornet::CommandSpec buildCommand(ServiceAction action);

  const std::string& serviceName() const { return serviceName_; }

 private:
  tornet::CommandSpec elevate(tornet::CommandSpec spec) const;
  ActionOutcome runAction(ServiceAction action);

  tornet::ICommandRunner& runner_;
  tornet::ILogger& logger_;
  std::string serviceName_;
  std::string systemdMarker_;
  std::mutex detectMutex_;
  std::optional<ServiceManagerKind> detected_;
  mutable std::mutex actionMutex_;
  bool shutDown_ = false;
};
