/**
 * @file test_doubles.hpp
 * @brief Моки и фейки для модульных тестов ядра tornet
 */
#pragma once

#include <gmock/gmock.h>

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "../include/http_fetcher.hpp"
#include "tornet/ProcessLister.hpp"
#include "tornet/ProcessRunner.hpp"
#include "tornet/ilogger.hpp"

class MockCommandRunner : public tornet::ICommandRunner {
 public:
  MOCK_METHOD(tornet::CommandResult, run, (const tornet::CommandSpec&),
              (override));
  MOCK_METHOD(std::optional<std::string>, findExecutable,
              (const std::string&), (const, override));
  MOCK_METHOD(bool, isPrivileged, (), (const, override));
};

class MockProcessLister : public tornet::IProcessLister {
 public:
  MOCK_METHOD(std::set<pid_t>, findMatching,
              (const std::string&, tornet::MatchMode), (const, override));
};

class MockHttpFetcher : public IHttpFetcher {
 public:
  MOCK_METHOD(HttpResponse, get, (const HttpRequest&), (override));
};

inline HttpResponse okResponse(const std::string& body) {
  HttpResponse response;
  response.ok = true;
  response.status = 200;
  response.body = body;
  return response;
}

inline HttpResponse failedResponse(const std::string& error = "timeout") {
  HttpResponse response;
  response.error = error;
  return response;
}

inline tornet::CommandResult commandResult(int exitCode,
                                           const std::string& err = "") {
  tornet::CommandResult result;
  result.exitCode = exitCode;
  result.stderrText = err;
  return result;
}

/// Логгер, запоминающий все сообщения
class RecordingLogger : public tornet::ILogger {
 public:
  using Entry = std::pair<tornet::LogLevel, std::string>;

  void init(const tornet::LogLevel level) override { currentLevel_ = level; }
  void setLogLevel(tornet::LogLevel level) override { currentLevel_ = level; }
  void flush() override {}

  std::vector<Entry> entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

  bool contains(tornet::LogLevel level, const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const Entry& e) {
                         return e.first == level &&
                                e.second.find(needle) != std::string::npos;
                       });
  }

  std::size_t count(tornet::LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(entries_.begin(), entries_.end(),
                      [&](const Entry& e) { return e.first == level; }));
  }

 protected:
  void log(tornet::LogLevel level, const std::string& message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.emplace_back(level, message);
  }
  bool shouldSkipLog(tornet::LogLevel) const override { return false; }

 private:
  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};
