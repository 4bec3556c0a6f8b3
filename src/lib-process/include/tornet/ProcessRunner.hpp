/**
 * @file ProcessRunner.hpp
 * @brief Запуск внешних программ с перехватом вывода
 *
 * @date October 2026
 * @license MIT
 *
 * @details Команда описывается значением CommandSpec (программа + список
 * аргументов) и никогда не собирается в строку для оболочки. Результат
 * возвращается значением CommandResult; ненулевой код завершения не является
 * исключением, его интерпретирует вызывающий код.
 */
#pragma once

#include <sys/types.h>

#include <optional>
#include <string>
#include <vector>

namespace tornet {

/**
 * @struct CommandSpec
 * @brief Описание запускаемой команды
 */
struct CommandSpec {
  std::string program;            ///< Имя программы (ищется в PATH) или путь
  std::vector<std::string> args;  ///< Аргументы без имени программы

  /// Представление для логов: "program arg1 arg2"
  std::string toString() const;

  bool operator==(const CommandSpec& other) const {
    return program == other.program && args == other.args;
  }
};

/**
 * @struct CommandResult
 * @brief Итог выполнения внешней команды
 */
struct CommandResult {
  int exitCode = -1;       ///< Код завершения; 127 если exec не удался
  std::string stdoutText;  ///< Захваченный stdout
  std::string stderrText;  ///< Захваченный stderr

  bool succeeded() const { return exitCode == 0; }
};

/**
 * @class ICommandRunner
 * @brief Узкий интерфейс «запустить внешний процесс»
 *
 * @note В модульных тестах подменяется моком.
 */
class ICommandRunner {
 public:
  virtual ~ICommandRunner() = default;

  /**
   * @brief Выполнить команду и дождаться завершения
   * @throw std::system_error При сбое pipe/fork/waitpid
   */
  virtual CommandResult run(const CommandSpec& spec) = 0;

  /// Найти исполняемый файл в PATH; пусто, если не найден
  virtual std::optional<std::string> findExecutable(
      const std::string& name) const = 0;

  /// Процесс уже работает с правами root
  virtual bool isPrivileged() const = 0;
};

/**
 * @class PosixCommandRunner
 * @brief Реализация через fork/execvp, stdout и stderr читаются через poll
 *
 * @note Таймаута нет: длительность ограничена самой внешней программой.
 * Маска сигналов в дочернем процессе сбрасывается, чтобы заблокированные
 * маршрутизатором сигналы не наследовались.
 */
class PosixCommandRunner : public ICommandRunner {
 public:
  explicit PosixCommandRunner(std::string searchPath = "");

  CommandResult run(const CommandSpec& spec) override;
  std::optional<std::string> findExecutable(
      const std::string& name) const override;
  bool isPrivileged() const override;

 private:
  std::string searchPath_;  ///< Пусто: значение переменной PATH
};

}  // namespace tornet
