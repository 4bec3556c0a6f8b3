/**
 * @file platform.hpp
 * @date October 2026
 * @brief Системные зависимости Application
 *
 * @details Platform отдаёт Application исполнитель команд, поиск процессов,
 * HTTP-клиент и системные действия LifecycleManager. SystemPlatform
 * работает с настоящей ОС и libcurl; тесты подставляют свою реализацию
 * с моками.
 */
#pragma once

#include <memory>

#include "http_fetcher.hpp"
#include "lifecycle_manager.hpp"
#include "tornet/ProcessLister.hpp"
#include "tornet/ProcessRunner.hpp"
#include "tornet/ilogger.hpp"

class Platform {
 public:
  virtual ~Platform() = default;

  virtual tornet::ICommandRunner& commandRunner() = 0;
  virtual const tornet::IProcessLister& processLister() = 0;
  virtual IHttpFetcher& httpFetcher() = 0;
  virtual LifecycleHooks lifecycleHooks(tornet::ILogger& logger) = 0;
};

/**
 * @class SystemPlatform
 * @brief fork/exec, pgrep или /proc, libcurl
 * @throw std::runtime_error Если libcurl не инициализировалась
 */
class SystemPlatform : public Platform {
 public:
  SystemPlatform();

  tornet::ICommandRunner& commandRunner() override { return runner_; }
  const tornet::IProcessLister& processLister() override { return *lister_; }
  IHttpFetcher& httpFetcher() override { return fetcher_; }
  LifecycleHooks lifecycleHooks(tornet::ILogger& logger) override;

 private:
  CurlGlobalGuard curlGuard_;
  tornet::PosixCommandRunner runner_;
  std::unique_ptr<tornet::IProcessLister> lister_;
  CurlHttpFetcher fetcher_;
};
