/**
 * @file compositelogger.hpp
 * @brief Логгер-компоновщик: рассылает сообщения во все вложенные логгеры.
 *
 * @details Фильтрация по уровню выполняется вложенными логгерами, сам
 * компоновщик пропускает всё. Экземпляр instance() служит логгером
 * приложения и передаётся компонентам ядра по ссылке.
 */

#pragma once

#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>

#include "tornet/ilogger.hpp"

namespace tornet {

class CompositeLogger : public ILogger {
 public:
  static CompositeLogger& instance();

  CompositeLogger() = default;
  CompositeLogger(std::initializer_list<std::shared_ptr<ILogger>> loggers)
      : loggers_(loggers) {}
  ~CompositeLogger() override = default;

  void addLogger(const std::shared_ptr<ILogger>& logger);
  void clear();
  std::size_t size() const;

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  void debug(const std::string& message) override;
  void info(const std::string& message) override;
  void warning(const std::string& message) override;
  void error(const std::string& message) override;
  void critical(const std::string& message) override;

 protected:
  bool shouldSkipLog(LogLevel level) const override;
  void log(LogLevel level, const std::string& message) override;

 private:
  std::vector<std::shared_ptr<ILogger>> snapshot() const;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace tornet
