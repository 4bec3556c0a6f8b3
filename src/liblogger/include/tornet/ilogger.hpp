/**
 * @file ilogger.hpp
 * @date October 2026
 * @brief Базовый интерфейс логгеров tornet и форматтер временных меток.
 *
 * @details Все компоненты ядра получают ссылку на ILogger и не пишут в
 * стандартные потоки напрямую. Конкретный приёмник (консоль, файл, композиция)
 * выбирается при старте приложения.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <string>

namespace tornet {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/**
 * @class TimeFormatter
 * @brief Глобальный формат временной метки для всех логгеров процесса.
 */
class TimeFormatter {
 public:
  /**
   * @brief Установить новый формат strftime
   * @return false, если формат не удалось применить (старый сохраняется)
   */
  static bool setGlobalFormat(const std::string& fmt);

  static std::string format(const std::chrono::system_clock::time_point& tp);

 private:
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
};

/**
 * @class ILogger
 * @brief Абстрактный логгер с фильтрацией по уровню.
 *
 * @note Наследники реализуют log() и shouldSkipLog(); удобные методы
 * debug()..critical() делегируют в log().
 */
class ILogger {
 public:
  virtual ~ILogger() = default;

  virtual void init(const LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level) = 0;
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual void log(LogLevel, const std::string&) = 0;
  virtual bool shouldSkipLog(LogLevel level) const = 0;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Разобрать имя уровня (debug|info|warning|error|critical)
 * @throw std::invalid_argument При неизвестном имени
 */
LogLevel stringToLogLevel(const std::string& name);

}  // namespace tornet
