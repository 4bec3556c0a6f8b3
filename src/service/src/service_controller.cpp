/**
 * @file service_controller.cpp
 * @brief Реализация ServiceController
 */

#include "../include/service_controller.hpp"

#include <filesystem>

#include "../include/errors.hpp"

namespace {

std::string trimmed(std::string text) {
  while (!text.empty() &&
         (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
    text.pop_back();
  }
  return text;
}

}  // namespace

std::string toString(ServiceManagerKind kind) {
  switch (kind) {
    case ServiceManagerKind::Systemd:
      return "systemctl";
    case ServiceManagerKind::SysV:
      return "service";
    case ServiceManagerKind::None:
      return "none";
  }
  return "none";
}

std::string toString(ServiceAction action) {
  switch (action) {
    case ServiceAction::Start:
      return "start";
    case ServiceAction::Stop:
      return "stop";
    case ServiceAction::Reload:
      return "reload";
    case ServiceAction::Restart:
      return "restart";
  }
  return "unknown";
}

ServiceController::ServiceController(tornet::ICommandRunner& runner,
                                     tornet::ILogger& logger,
                                     std::string serviceName,
                                     std::string systemdMarker)
    : runner_(runner),
      logger_(logger),
      serviceName_(std::move(serviceName)),
      systemdMarker_(std::move(systemdMarker)) {}

ServiceManagerKind ServiceController::detectManager() {
  std::lock_guard<std::mutex> lock(detectMutex_);
  if (detected_) return *detected_;

  std::error_code ec;
  if (runner_.findExecutable("systemctl") &&
      std::filesystem::exists(systemdMarker_, ec)) {
    detected_ = ServiceManagerKind::Systemd;
  } else if (runner_.findExecutable("service")) {
    detected_ = ServiceManagerKind::SysV;
  } else {
    detected_ = ServiceManagerKind::None;
  }

  logger_.debug("ServiceController: detected service manager: " +
                toString(*detected_));
  return *detected_;
}

tornet::CommandSpec ServiceController::buildCommand(ServiceAction action) {
  switch (detectManager()) {
    case ServiceManagerKind::Systemd:
      return elevate({"systemctl", {toString(action), serviceName_}});
    case ServiceManagerKind::SysV:
      return elevate({"service", {serviceName_, toString(action)}});
    case ServiceManagerKind::None:
      break;
  }
  throw ServiceManagerError(
      "No supported service manager found (systemctl or service)");
}

tornet::CommandSpec ServiceController::elevate(tornet::CommandSpec spec) const {
  if (runner_.isPrivileged()) return spec;

  if (!runner_.findExecutable("sudo")) {
    throw PrivilegeError(
        "Root privileges required but sudo not available. Run as root or "
        "install sudo.");
  }

  std::vector<std::string> args;
  args.reserve(spec.args.size() + 1);
  args.push_back(spec.program);
  args.insert(args.end(), spec.args.begin(), spec.args.end());
  return {"sudo", std::move(args)};
}

ActionOutcome ServiceController::performAction(ServiceAction action) {
  std::lock_guard<std::mutex> lock(actionMutex_);
  if (shutDown_ && action != ServiceAction::Stop) {
    logger_.debug("ServiceController: " + toString(action) +
                  " skipped, service stopped for shutdown");
    ActionOutcome outcome;
    outcome.skipped = true;
    return outcome;
  }
  return runAction(action);
}

ActionOutcome ServiceController::stopForShutdown() {
  std::lock_guard<std::mutex> lock(actionMutex_);
  shutDown_ = true;
  return runAction(ServiceAction::Stop);
}

bool ServiceController::isShutDown() const {
  std::lock_guard<std::mutex> lock(actionMutex_);
  return shutDown_;
}

ActionOutcome ServiceController::runAction(ServiceAction action) {
  const tornet::CommandSpec spec = buildCommand(action);
  logger_.debug("ServiceController: running " + spec.toString());

  const tornet::CommandResult result = runner_.run(spec);
  ActionOutcome outcome{result.exitCode, trimmed(result.stderrText)};

  if (!outcome.succeeded()) {
    logger_.warning("Failed to " + toString(action) + " " + serviceName_ +
                    " service: " + outcome.stderrText);
  }
  return outcome;
}
