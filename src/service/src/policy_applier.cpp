#include "../include/policy_applier.hpp"

std::string toString(PolicyState state) {
  switch (state) {
    case PolicyState::Idle:
      return "Idle";
    case PolicyState::TryPreferred:
      return "TryPreferred";
    case PolicyState::VerifyPreferred:
      return "VerifyPreferred";
    case PolicyState::TryFallback:
      return "TryFallback";
    case PolicyState::VerifyFallback:
      return "VerifyFallback";
    case PolicyState::Done:
      return "Done";
  }
  return "Unknown";
}

PolicyApplier::PolicyApplier(const ExitPolicyEditor& editor,
                             ServiceController& service,
                             ConnectivityProbe& probe,
                             CancellationToken& cancel,
                             tornet::ILogger& logger,
                             std::chrono::milliseconds bootstrapGrace)
    : editor_(editor),
      service_(service),
      probe_(probe),
      cancel_(cancel),
      logger_(logger),
      bootstrapGrace_(bootstrapGrace) {}

PolicyOutcome PolicyApplier::apply(const std::string& torrcPath,
                                   const ExitPolicy& preferred,
                                   const FallbackSpec& fallback) {
  PolicyOutcome outcome;
  state_ = PolicyState::Idle;

  transition(PolicyState::TryPreferred);
  logger_.info("Trying preferred Tor exits (" + preferred.describe() + ")...");
  outcome.activePolicy = preferred;
  if (!tryPolicy(torrcPath, preferred)) {
    outcome.cancelled = true;
    transition(PolicyState::Done);
    return outcome;
  }

  transition(PolicyState::VerifyPreferred);
  outcome.ip = probe_.getIpViaProxy();
  if (outcome.ip) {
    outcome.preferredVerified = true;
    logger_.info(
        "Tor is up with preferred exit (if available). Current Tor IP: " +
        *outcome.ip);
    transition(PolicyState::Done);
    return outcome;
  }

  transition(PolicyState::TryFallback);
  logger_.warning(
      "Preferred exits not available (Tor didn't establish). Falling back...");
  const ExitPolicy fallbackPolicy = fallback.toPolicy();
  outcome.fallbackApplied = true;
  outcome.activePolicy = fallbackPolicy;
  if (!tryPolicy(torrcPath, fallbackPolicy)) {
    outcome.cancelled = true;
    transition(PolicyState::Done);
    return outcome;
  }

  transition(PolicyState::VerifyFallback);
  outcome.ip = probe_.getIpViaProxy();
  if (outcome.ip) {
    outcome.fallbackVerified = true;
    logger_.info("Tor is up after fallback. Current Tor IP: " + *outcome.ip);
  } else {
    logger_.warning(
        "Fallback also failed to establish Tor connectivity (Tor may be "
        "blocked).");
  }
  transition(PolicyState::Done);
  return outcome;
}

bool PolicyApplier::tryPolicy(const std::string& torrcPath,
                              const ExitPolicy& policy) {
  if (cancel_.isCancelled()) return false;

  editor_.writePolicy(torrcPath, policy);
  logger_.debug("PolicyApplier: wrote " + policy.describe() + " to " +
                torrcPath);
  service_.restart();

  // Бутстрап Tor не отслеживается, пауза фиксированная
  return !cancel_.waitFor(bootstrapGrace_);
}

void PolicyApplier::transition(PolicyState next) {
  logger_.debug("PolicyApplier: " + toString(state_) + " -> " +
                toString(next));
  state_ = next;
}
