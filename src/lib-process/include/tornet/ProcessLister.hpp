/**
 * @file ProcessLister.hpp
 * @brief Поиск процессов по имени
 *
 * @details Две реализации: через утилиту pgrep и прямым просмотром /proc.
 * makeProcessLister() выбирает pgrep, если он установлен, иначе /proc.
 */
#pragma once

#include <sys/types.h>

#include <memory>
#include <set>
#include <string>

#include "tornet/ProcessRunner.hpp"

namespace tornet {

enum class MatchMode {
  ExactName,    ///< Имя команды (comm) совпадает полностью, как pgrep -x
  CommandLine,  ///< Подстрока полной командной строки, как pgrep -f
};

class IProcessLister {
 public:
  virtual ~IProcessLister() = default;

  /**
   * @brief Найти PID процессов, подходящих под шаблон
   * @return Пустое множество, если ничего не найдено или поиск не удался
   */
  virtual std::set<pid_t> findMatching(const std::string& name,
                                       MatchMode mode) const = 0;
};

/**
 * @class PgrepProcessLister
 * @brief Поиск через pgrep; код 1 у pgrep означает «нет совпадений»
 */
class PgrepProcessLister : public IProcessLister {
 public:
  explicit PgrepProcessLister(ICommandRunner& runner) : runner_(runner) {}

  std::set<pid_t> findMatching(const std::string& name,
                               MatchMode mode) const override;

 private:
  ICommandRunner& runner_;
};

/**
 * @class ProcfsProcessLister
 * @brief Поиск сканированием /proc/<pid>/comm и /proc/<pid>/cmdline
 */
class ProcfsProcessLister : public IProcessLister {
 public:
  explicit ProcfsProcessLister(std::string procRoot = "/proc")
      : procRoot_(std::move(procRoot)) {}

  std::set<pid_t> findMatching(const std::string& name,
                               MatchMode mode) const override;

 private:
  std::string procRoot_;
};

std::unique_ptr<IProcessLister> makeProcessLister(ICommandRunner& runner);

}  // namespace tornet
