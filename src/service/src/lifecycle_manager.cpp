#include "../include/lifecycle_manager.hpp"

#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <system_error>

#include "../include/errors.hpp"
#include "tornet/SignalRouter.hpp"

namespace {

constexpr int kShutdownSignals[] = {SIGINT, SIGQUIT, SIGTERM};

}  // namespace

LifecycleHooks defaultLifecycleHooks(tornet::ILogger& logger) {
  LifecycleHooks hooks;
  // std::exit здесь нельзя: статический SignalRouter ждал бы свой же поток
  hooks.exit = [&logger](int status) {
    logger.flush();
    std::cout.flush();
    std::_Exit(status);
  };
  hooks.kill = [](pid_t pid, int signum) { return ::kill(pid, signum); };
  return hooks;
}

LifecycleManager::LifecycleManager(ServiceController& service,
                                   const tornet::IProcessLister& processes,
                                   CancellationToken& cancel,
                                   tornet::ILogger& logger,
                                   std::string toolName, LifecycleHooks hooks)
    : service_(service),
      processes_(processes),
      cancel_(cancel),
      logger_(logger),
      toolName_(std::move(toolName)),
      hooks_(std::move(hooks)) {}

LifecycleManager::~LifecycleManager() {
  if (!installed_) return;
  // Обработчики ссылаются на this
  auto& router = tornet::SignalRouter::instance();
  router.stop();
  for (int signum : kShutdownSignals) router.unregisterHandler(signum);
}

void LifecycleManager::install() {
  auto& router = tornet::SignalRouter::instance();
  for (int signum : kShutdownSignals) {
    router.registerHandler(signum, [this](int sig) { handleSignal(sig); });
  }
  installed_ = true;
  router.start();
  logger_.debug("LifecycleManager: signal handlers installed");
}

void LifecycleManager::handleSignal(int signum) {
  logger_.debug("LifecycleManager: received signal " + std::to_string(signum) +
                " (" + strsignal(signum) + ")");
  cancel_.cancel();
  shutdown();
  if (hooks_.exit) hooks_.exit(0);
}

bool LifecycleManager::shutdown() {
  if (shutDown_.exchange(true)) return false;

  stopServiceQuietly();
  terminatePeers();
  logger_.warning("Program terminated by user.");
  return true;
}

void LifecycleManager::stopEverything() {
  service_.stop();
  terminatePeers();
  logger_.info("Tor services and " + toolName_ + " processes stopped.");
}

std::size_t LifecycleManager::terminatePeers() {
  const pid_t self = ::getpid();
  std::size_t signalled = 0;

  for (pid_t pid :
       processes_.findMatching(toolName_, tornet::MatchMode::CommandLine)) {
    if (pid == self) continue;
    if (hooks_.kill && hooks_.kill(pid, SIGTERM) == 0) {
      ++signalled;
    } else {
      logger_.debug("LifecycleManager: failed to signal pid " +
                    std::to_string(pid) + ": " + std::strerror(errno));
    }
  }

  logger_.debug("LifecycleManager: signalled " + std::to_string(signalled) +
                " peer process(es)");
  return signalled;
}

void LifecycleManager::stopServiceQuietly() {
  try {
    service_.stopForShutdown();
  } catch (const FatalError& e) {
    logger_.error("Failed to stop " + service_.serviceName() +
                  " service: " + e.what());
  } catch (const std::system_error& e) {
    logger_.error("Failed to stop " + service_.serviceName() +
                  " service: " + e.what());
  }
}
