/**
 * @file syncfilelogger.hpp
 * @brief Синхронный файловый логгер с резервным файлом.
 *
 * @details Каждое сообщение дописывается в основной файл и сразу сбрасывается
 * на диск. Если основной файл открыть не удалось, запись идёт в резервный.
 * Ошибки ввода-вывода сообщаются в stderr и никогда не пробрасываются.
 */

#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "tornet/ilogger.hpp"

namespace tornet {

class SyncFileLogger : public ILogger {
 public:
  static SyncFileLogger& instance();

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  void setMainLogPath(const std::string& path);
  void setFallbackLogPath(const std::string& path);
  std::string getMainLogPath() const;
  std::string getFallbackLogPath() const;

 protected:
  SyncFileLogger() = default;
  ~SyncFileLogger() override = default;
  void log(LogLevel level, const std::string& message) override;
  bool shouldSkipLog(LogLevel level) const override;

 private:
  /// Переоткрыть файлы; вызывается под mutex_
  void reopenFilesLocked();
  void writeLocked(const std::string& line);

  mutable std::mutex mutex_;
  std::ofstream mainLogFile_;
  std::ofstream fallbackLogFile_;
  std::string mainLogPath_ = "tornet.log";
  std::string fallbackLogPath_ = "tornet_fallback.log";
  bool warnedAboutFallback_ = false;
};

}  // namespace tornet
