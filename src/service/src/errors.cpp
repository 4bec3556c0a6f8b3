#include "../include/errors.hpp"

std::string describeExitCode(ExitCode code) {
  switch (code) {
    case ExitCode::Success:
      return "success";
    case ExitCode::UsageError:
      return "usage error";
    case ExitCode::MissingPrivilege:
      return "missing privilege";
    case ExitCode::NoServiceManager:
      return "no service manager";
    case ExitCode::NoPackageManager:
      return "no package manager";
    case ExitCode::MalformedInterval:
      return "malformed interval";
    case ExitCode::NoConnectivity:
      return "no connectivity";
    case ExitCode::RelayNotInstalled:
      return "relay not installed";
    case ExitCode::TorrcNotFound:
      return "torrc not found";
    case ExitCode::TorrcUnreadable:
      return "torrc unreadable";
    case ExitCode::TorrcUnwritable:
      return "torrc unwritable";
  }
  return "unknown";
}
