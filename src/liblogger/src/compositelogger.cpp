#include "tornet/compositelogger.hpp"

namespace tornet {

CompositeLogger& CompositeLogger::instance() {
  static CompositeLogger instance;
  return instance;
}

void CompositeLogger::addLogger(const std::shared_ptr<ILogger>& logger) {
  if (!logger) return;
  std::lock_guard<std::mutex> lock(mutex_);
  loggers_.push_back(logger);
}

void CompositeLogger::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  loggers_.clear();
}

std::size_t CompositeLogger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loggers_.size();
}

void CompositeLogger::init(const LogLevel level) {
  for (auto& logger : snapshot()) logger->init(level);
}

void CompositeLogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
  for (auto& logger : snapshot()) logger->setLogLevel(level);
}

void CompositeLogger::flush() {
  for (auto& logger : snapshot()) logger->flush();
}

void CompositeLogger::debug(const std::string& message) {
  log(LogLevel::LOG_DEBUG, message);
}

void CompositeLogger::info(const std::string& message) {
  log(LogLevel::LOG_INFO, message);
}

void CompositeLogger::warning(const std::string& message) {
  log(LogLevel::LOG_WARNING, message);
}

void CompositeLogger::error(const std::string& message) {
  log(LogLevel::LOG_ERROR, message);
}

void CompositeLogger::critical(const std::string& message) {
  log(LogLevel::LOG_CRITICAL, message);
}

bool CompositeLogger::shouldSkipLog(LogLevel) const { return false; }

void CompositeLogger::log(LogLevel level, const std::string& message) {
  for (auto& logger : snapshot()) {
    switch (level) {
      case LogLevel::LOG_DEBUG:
        logger->debug(message);
        break;
      case LogLevel::LOG_INFO:
        logger->info(message);
        break;
      case LogLevel::LOG_WARNING:
        logger->warning(message);
        break;
      case LogLevel::LOG_ERROR:
        logger->error(message);
        break;
      case LogLevel::LOG_CRITICAL:
        logger->critical(message);
        break;
    }
  }
}

std::vector<std::shared_ptr<ILogger>> CompositeLogger::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loggers_;
}

}  // namespace tornet
