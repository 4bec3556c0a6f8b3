/**
 * @file application.cpp
 * @date October 2026
 * @brief Реализация Application
 */

#include "../include/application.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "../include/connectivity_probe.hpp"
#include "../include/errors.hpp"
#include "../include/exit_policy_editor.hpp"
#include "../include/lifecycle_manager.hpp"
#include "../include/policy_applier.hpp"
#include "../include/rotation_scheduler.hpp"
#include "../include/service_controller.hpp"
#include "tornet/compositelogger.hpp"
#include "tornet/consolelogger.hpp"
#include "tornet/syncfilelogger.hpp"

namespace {

// shared_ptr без владения: синглтоны живут до конца процесса
template <typename T>
std::shared_ptr<T> singletonPtr(T &singleton) {
  return std::shared_ptr<T>(&singleton, [](T *) {});
}

// Сообщение об ошибке до настройки логгеров тоже должно быть видно
void ensureSomeLogger() {
  auto &composite = tornet::CompositeLogger::instance();
  if (composite.size() == 0) {
    composite.addLogger(singletonPtr(tornet::ConsoleLogger::instance()));
  }
}

}  // namespace

int Application::run(int argc, char **argv) {
  try {
    ArgumentParser parser;
    ParsedArgs args = parser.parse(argc, argv);

    if (args.help_message) {
      ArgumentParser::printHelp(std::cout);
      return toInt(ExitCode::Success);
    }
    if (args.version_message) {
      printVersion();
      return toInt(ExitCode::Success);
    }

    const RotationConfig rotation = rotationFromArgs(args);

    auto &config = ConfigManager::instance();
    config.initialize(args.config_path);
    if (!args.overrides.empty()) {
      config.applyCliOverrides(args.overrides);
    }
    const ToolSettings settings = config.settings();

    initLogger(args, settings);
    return execute(args, settings, rotation);
  } catch (const FatalError &e) {
    ensureSomeLogger();
    tornet::CompositeLogger::instance().critical(
        std::string(e.what()) + " [" + describeExitCode(e.code()) +
        ", exit code " + std::to_string(toInt(e.code())) + "]");
    tornet::CompositeLogger::instance().flush();
    return toInt(e.code());
  } catch (const std::exception &e) {
    ensureSomeLogger();
    tornet::CompositeLogger::instance().critical(e.what());
    tornet::CompositeLogger::instance().flush();
    return EXIT_FAILURE;
  }
}

int Application::execute(const ParsedArgs &args, const ToolSettings &settings,
                         const RotationConfig &rotation) {
  auto &logger = tornet::CompositeLogger::instance();

  if (!platform_) platform_ = std::make_unique<SystemPlatform>();
  tornet::ICommandRunner &runner = platform_->commandRunner();
  const tornet::IProcessLister &processes = platform_->processLister();
  ServiceController service(runner, logger, settings.serviceName,
                            settings.systemdMarker);

  // Обработчики ставятся до появления других потоков
  LifecycleManager lifecycle(service, processes, cancel_, logger,
                             settings.toolName,
                             platform_->lifecycleHooks(logger));
  lifecycle.install();

  ConnectivityProbe probe(platform_->httpFetcher(), processes, logger,
                          settings.probe, &cancel_);

  if (args.stop) {
    lifecycle.stopEverything();
    return toInt(ExitCode::Success);
  }

  if (args.show_ip) {
    if (auto ip = probe.getCurrentIp()) {
      std::cout << "Your IP address is: " << *ip << std::endl;
    }
    return toInt(ExitCode::Success);
  }

  if (!runner.findExecutable(settings.relayBinary)) {
    throw RelayMissingError("Tor is not installed (" + settings.relayBinary +
                            " not found in PATH). Please install tor.");
  }

  const bool online = probe.hasInternetConnection();
  if (cancel_.isCancelled()) return toInt(ExitCode::Success);
  if (!online) {
    throw ConnectivityError("Internet connection required but not available.");
  }

  printBanner();

  if (args.prefer_exit) {
    ExitPolicyEditor editor(settings.torrcCandidates);
    const auto torrcPath = editor.locateConfigPath(args.torrc_path);
    if (!torrcPath) {
      throw TorrcNotFoundError(
          "torrc file not found. Use --torrc /path/to/torrc");
    }
    logger.info("Using torrc: " + *torrcPath);

    PolicyApplier applier(editor, service, probe, cancel_, logger,
                          settings.bootstrapGrace);
    const PolicyOutcome outcome =
        applier.apply(*torrcPath, ExitPolicy::strictCountry(args.prefer_country),
                      FallbackSpec::parse(args.fallback_exits));
    if (outcome.cancelled) return toInt(ExitCode::Success);
  }

  // Сигнал между проверкой и start() ловит сам ServiceController
  if (cancel_.isCancelled() || service.start().skipped) {
    return toInt(ExitCode::Success);
  }
  logger.info(
      "Tor service started. Please wait for Tor to establish connection.");
  logger.info("Configure your browser to use Tor proxy (" +
              settings.proxyHost + ":" + std::to_string(settings.proxyPort) +
              ") for anonymity.");

  if (cancel_.waitFor(settings.startupWait)) {
    return toInt(ExitCode::Success);
  }

  RotationScheduler scheduler(service, probe, cancel_, logger,
                              settings.rotationSettle);
  scheduler.run(rotation);
  return toInt(ExitCode::Success);
}

void Application::initLogger(const ParsedArgs &args,
                             const ToolSettings &settings) {
  auto &composite_logger = tornet::CompositeLogger::instance();
  composite_logger.clear();

  if (!args.use_cli_logging || args.logger_types.empty()) {
    for (const auto &entry : settings.logging) {
      const auto level = tornet::stringToLogLevel(
          entry.level.empty() ? std::string("info") : entry.level);

      if (entry.type == "console") {
        auto &logger = tornet::ConsoleLogger::instance();
        logger.setLogLevel(level);
        composite_logger.addLogger(singletonPtr(logger));
      } else if (entry.type == "sync_file") {
        auto &logger = tornet::SyncFileLogger::instance();
        logger.setMainLogPath(entry.file.empty() ? settings.toolName + ".log"
                                                 : entry.file);
        logger.setLogLevel(level);
        composite_logger.addLogger(singletonPtr(logger));
      }
    }
  } else {
    for (const auto &type : args.logger_types) {
      if (type == "console") {
        composite_logger.addLogger(
            singletonPtr(tornet::ConsoleLogger::instance()));
      } else if (type == "sync_file") {
        auto &logger = tornet::SyncFileLogger::instance();
        logger.setMainLogPath(settings.toolName + ".log");
        composite_logger.addLogger(singletonPtr(logger));
      }
    }
  }

  if (composite_logger.size() == 0) {
    composite_logger.addLogger(singletonPtr(tornet::ConsoleLogger::instance()));
  }

  if (args.log_level.has_value()) {
    composite_logger.setLogLevel(tornet::stringToLogLevel(args.log_level.value()));
  }
}

RotationConfig Application::rotationFromArgs(const ParsedArgs &args) {
  RotationConfig rotation;
  rotation.interval = RotationInterval::parse(args.interval);
  rotation.count = args.count;
  return rotation;
}

void Application::printBanner() {
  std::cout << "\n"
               "  _____           _   _      _\n"
               " |_   _|__  _ __ | \\ | | ___| |_\n"
               "   | |/ _ \\| '__||  \\| |/ _ \\ __|\n"
               "   | | (_) | |   | |\\  |  __/ |_\n"
               "   |_|\\___/|_|   |_| \\_|\\___|\\__|\n"
               "                    Version: "
            << kVersion << "\n"
            << std::endl;
}

void Application::printVersion() {
  std::cout << "tornet " << kVersion << std::endl;
}
