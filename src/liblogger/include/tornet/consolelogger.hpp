/**
 * @file consolelogger.hpp
 * @brief Логгер в стандартный вывод с цветовой разметкой уровней.
 */

#pragma once

#include <mutex>

#include "tornet/ilogger.hpp"

#define TORNET_ANSI_COLOR_RESET "\033[0m"
#define TORNET_ANSI_COLOR_RED "\033[31m"
#define TORNET_ANSI_COLOR_GREEN "\033[32m"
#define TORNET_ANSI_COLOR_YELLOW "\033[33m"
#define TORNET_ANSI_COLOR_CYAN "\033[36m"
#define TORNET_ANSI_COLOR_WHITE_ON_RED "\033[41m\033[37m"

namespace tornet {

class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  /// Отключить ANSI-последовательности (вывод не в терминал)
  void setColorEnabled(bool enabled);

 protected:
  ConsoleLogger();
  ~ConsoleLogger() override = default;
  void log(LogLevel level, const std::string& message) override;
  bool shouldSkipLog(LogLevel level) const override;

 private:
  const char* colorFor(LogLevel level) const;

  mutable std::mutex mutex_;
  std::atomic<bool> colorEnabled_{true};
};

}  // namespace tornet
