#include "tornet/consolelogger.hpp"

#include <unistd.h>

#include <iostream>
#include <sstream>

tornet::ConsoleLogger& tornet::ConsoleLogger::instance() {
  static tornet::ConsoleLogger instance;
  return instance;
}

tornet::ConsoleLogger::ConsoleLogger() {
  colorEnabled_.store(isatty(STDOUT_FILENO) == 1);
}

void tornet::ConsoleLogger::init(const LogLevel level) { setLogLevel(level); }

void tornet::ConsoleLogger::setLogLevel(tornet::LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void tornet::ConsoleLogger::setColorEnabled(bool enabled) {
  colorEnabled_.store(enabled, std::memory_order_release);
}

void tornet::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout.flush();
  std::cerr.flush();
}

void tornet::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::string formattedMsg;
  try {
    std::ostringstream formatted;
    formatted << TimeFormatter::format(std::chrono::system_clock::now())
              << " [" << leveltoString(level) << "] " << message;
    formattedMsg = formatted.str();
  } catch (const std::exception& e) {
    formattedMsg = "[LOGGER ERROR: " + std::string(e.what()) + "] " + message;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (colorEnabled_.load(std::memory_order_acquire)) {
    std::cout << colorFor(level) << formattedMsg << TORNET_ANSI_COLOR_RESET
              << std::endl;
  } else {
    std::cout << formattedMsg << std::endl;
  }
}

bool tornet::ConsoleLogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

const char* tornet::ConsoleLogger::colorFor(LogLevel level) const {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return TORNET_ANSI_COLOR_CYAN;
    case LogLevel::LOG_INFO:
      return TORNET_ANSI_COLOR_GREEN;
    case LogLevel::LOG_WARNING:
      return TORNET_ANSI_COLOR_YELLOW;
    case LogLevel::LOG_ERROR:
      return TORNET_ANSI_COLOR_RED;
    case LogLevel::LOG_CRITICAL:
      return TORNET_ANSI_COLOR_WHITE_ON_RED;
  }
  return TORNET_ANSI_COLOR_RESET;
}
