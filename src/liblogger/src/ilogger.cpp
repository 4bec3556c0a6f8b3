#include "tornet/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

bool tornet::TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) {
    std::cerr << "[LOGGER ERROR] Empty time format rejected" << std::endl;
    return false;
  }
  try {
    std::tm probe{};
    std::ostringstream oss;
    oss << std::put_time(&probe, fmt.c_str());
    if (!oss) {
      std::cerr << "[LOGGER ERROR] Invalid time format: " << fmt << std::endl;
      return false;
    }
    globalFormat_ = fmt;
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[LOGGER ERROR] Invalid time format: " << e.what()
              << std::endl;
    return false;
  }
}

std::string tornet::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  try {
    auto as_time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm local_tm;
    localtime_r(&as_time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, globalFormat_.c_str());
    return oss.str();
  } catch (const std::exception&) {
    return "[INVALID_TIME]";
  }
}

tornet::LogLevel tornet::ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void tornet::ILogger::debug(const std::string& message) {
  log(tornet::LogLevel::LOG_DEBUG, message);
}

void tornet::ILogger::info(const std::string& message) {
  log(tornet::LogLevel::LOG_INFO, message);
}

void tornet::ILogger::warning(const std::string& message) {
  log(tornet::LogLevel::LOG_WARNING, message);
}

void tornet::ILogger::error(const std::string& message) {
  log(tornet::LogLevel::LOG_ERROR, message);
}

void tornet::ILogger::critical(const std::string& message) {
  log(tornet::LogLevel::LOG_CRITICAL, message);
}

std::string tornet::leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

tornet::LogLevel tornet::stringToLogLevel(const std::string& name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "debug") return LogLevel::LOG_DEBUG;
  if (lowered == "info") return LogLevel::LOG_INFO;
  if (lowered == "warning") return LogLevel::LOG_WARNING;
  if (lowered == "error") return LogLevel::LOG_ERROR;
  if (lowered == "critical") return LogLevel::LOG_CRITICAL;
  throw std::invalid_argument("Unknown log level: " + name);
}
