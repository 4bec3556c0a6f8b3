/**
 * @file policy_applier.hpp
 * @date October 2026
 * @brief Применение предпочтительной политики выходных узлов с запасным
 * вариантом
 *
 * @details Конечный автомат:
 * @code
 *   Idle -> TryPreferred -> VerifyPreferred -> Done
 *                                           -> TryFallback -> VerifyFallback -> Done
 * @endcode
 * В состоянии Try* политика записывается в torrc, служба перезапускается и
 * выдерживается пауза на бутстрап Tor. В состоянии Verify* выполняется проба
 * через прокси. Запасная политика применяется ровно один раз; её неудача
 * только записывается в лог. Срабатывание CancellationToken во время паузы
 * останавливает автомат без дальнейших перезапусков.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "cancellation_token.hpp"
#include "connectivity_probe.hpp"
#include "exit_policy.hpp"
#include "exit_policy_editor.hpp"
#include "service_controller.hpp"
#include "tornet/ilogger.hpp"

enum class PolicyState {
  Idle,
  TryPreferred,
  VerifyPreferred,
  TryFallback,
  VerifyFallback,
  Done,
};

std::string toString(PolicyState state);

/**
 * @struct PolicyOutcome
 * @brief Итог работы автомата
 */
struct PolicyOutcome {
  bool preferredVerified = false;
  bool fallbackApplied = false;
  bool fallbackVerified = false;
  bool cancelled = false;
  std::optional<std::string> ip;  ///< IP, полученный при успешной проверке
  ExitPolicy activePolicy;        ///< Политика, записанная последней
};

class PolicyApplier {
 public:
  PolicyApplier(const ExitPolicyEditor& editor, ServiceController& service,
                ConnectivityProbe& probe, CancellationToken& cancel,
                tornet::ILogger& logger,
                std::chrono::milliseconds bootstrapGrace =
                    std::chrono::seconds(6));

  /**
   * @brief Применить preferred, при неудаче проверки один раз fallback
   * @param torrcPath Путь к torrc
   * @throw TorrcReadError, TorrcWriteError Ошибки ввода-вывода torrc
   * @throw ServiceManagerError, PrivilegeError Ошибки перезапуска службы
   */
  PolicyOutcome apply(const std::string& torrcPath, const ExitPolicy& preferred,
                      const FallbackSpec& fallback);

  PolicyState state() const { return state_; }

 private:
  /// Записать политику, перезапустить службу, подождать бутстрап
  /// @return false, если ожидание прервано
  bool tryPolicy(const std::string& torrcPath, const ExitPolicy& policy);

  void transition(PolicyState next);

  const ExitPolicyEditor& editor_;
  ServiceController& service_;
  ConnectivityProbe& probe_;
  CancellationToken& cancel_;
  tornet::ILogger& logger_;
  std::chrono::milliseconds bootstrapGrace_;
  PolicyState state_ = PolicyState::Idle;
};
