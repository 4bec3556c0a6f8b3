#include "../include/platform.hpp"

SystemPlatform::SystemPlatform()
    : lister_(tornet::makeProcessLister(runner_)) {}

LifecycleHooks SystemPlatform::lifecycleHooks(tornet::ILogger& logger) {
  return defaultLifecycleHooks(logger);
}
