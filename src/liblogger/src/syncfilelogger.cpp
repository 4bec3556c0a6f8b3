#include "tornet/syncfilelogger.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

namespace tornet {

SyncFileLogger& SyncFileLogger::instance() {
  static SyncFileLogger instance;
  return instance;
}

void SyncFileLogger::init(const LogLevel level) {
  setLogLevel(level);
  std::lock_guard<std::mutex> lock(mutex_);
  reopenFilesLocked();
}

void SyncFileLogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void SyncFileLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogFile_.is_open()) mainLogFile_.flush();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

void SyncFileLogger::setMainLogPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogPath_ == path && mainLogFile_.is_open()) return;
  mainLogPath_ = path;
  reopenFilesLocked();
}

void SyncFileLogger::setFallbackLogPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fallbackLogPath_ == path) return;
  fallbackLogPath_ = path;
  reopenFilesLocked();
}

std::string SyncFileLogger::getMainLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mainLogPath_;
}

std::string SyncFileLogger::getFallbackLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fallbackLogPath_;
}

void SyncFileLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message << "\n";

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    writeLocked(formatted.str());
  } catch (const std::exception& e) {
    std::cerr << "[LOGGER ERROR] Exception during file write: " << e.what()
              << std::endl;
  }
}

bool SyncFileLogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

void SyncFileLogger::reopenFilesLocked() {
  if (mainLogFile_.is_open()) mainLogFile_.close();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.close();

  mainLogFile_.open(mainLogPath_, std::ios::app);
  if (mainLogFile_.is_open()) return;

  std::cerr << "[LOGGER ERROR] Cannot open main log file: " << mainLogPath_
            << std::endl;
  fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
  if (!fallbackLogFile_.is_open()) {
    std::cerr << "[LOGGER ERROR] Cannot open fallback log file: "
              << fallbackLogPath_ << std::endl;
  }
}

void SyncFileLogger::writeLocked(const std::string& line) {
  // Файл могли удалить или переместить между записями
  if (mainLogFile_.is_open() && !std::filesystem::exists(mainLogPath_)) {
    reopenFilesLocked();
  }
  if (!mainLogFile_.is_open() && !fallbackLogFile_.is_open()) {
    reopenFilesLocked();
  }

  if (mainLogFile_.is_open()) {
    mainLogFile_ << line;
    mainLogFile_.flush();
    warnedAboutFallback_ = false;
    return;
  }

  if (fallbackLogFile_.is_open()) {
    if (!warnedAboutFallback_) {
      std::cerr << "[LOGGER WARNING] Main log file unavailable, using "
                << fallbackLogPath_ << std::endl;
      warnedAboutFallback_ = true;
    }
    fallbackLogFile_ << line;
    fallbackLogFile_.flush();
    return;
  }

  std::cerr << "[LOGGER ERROR] No log file is open for writing: " << line;
}

}  // namespace tornet
