#include "../include/rotation_scheduler.hpp"

RotationScheduler::RotationScheduler(ServiceController& service,
                                     ConnectivityProbe& probe,
                                     CancellationToken& cancel,
                                     tornet::ILogger& logger,
                                     std::chrono::milliseconds settleDelay)
    : service_(service),
      probe_(probe),
      cancel_(cancel),
      logger_(logger),
      settleDelay_(settleDelay) {}

std::size_t RotationScheduler::run(const RotationConfig& config) {
  std::size_t completed = 0;
  logger_.debug("RotationScheduler: interval " + config.interval.toString() +
                ", count " +
                (config.count == 0 ? std::string("unbounded")
                                   : std::to_string(config.count)));

  while (config.count == 0 || completed < config.count) {
    const std::uint32_t seconds = config.interval.sample(rng_);
    logger_.debug("RotationScheduler: next rotation in " +
                  std::to_string(seconds) + "s");

    if (cancel_.waitFor(intervalUnit_ * seconds)) break;

    changeIp();
    ++completed;
  }

  logger_.debug("RotationScheduler: finished after " +
                std::to_string(completed) + " rotation(s)");
  return completed;
}

std::optional<std::string> RotationScheduler::changeIp() {
  service_.reload();

  // Даём Tor построить новую цепочку
  if (cancel_.waitFor(settleDelay_)) return std::nullopt;

  std::optional<std::string> ip = probe_.getCurrentIp();
  if (ip) {
    logger_.info("Your IP address is: " + *ip);
    if (observer_) observer_(*ip);
  }
  return ip;
}
