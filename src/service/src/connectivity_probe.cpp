#include "../include/connectivity_probe.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string trim(const std::string& s) {
  auto notSpace = [](unsigned char c) { return std::isspace(c) == 0; };
  auto begin = std::find_if(s.begin(), s.end(), notSpace);
  auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
  return begin < end ? std::string(begin, end) : std::string();
}

}  // namespace

ConnectivityProbe::ConnectivityProbe(IHttpFetcher& fetcher,
                                     const tornet::IProcessLister& processes,
                                     tornet::ILogger& logger,
                                     ProbeSettings settings,
                                     const CancellationToken* cancel)
    : fetcher_(fetcher),
      processes_(processes),
      logger_(logger),
      settings_(std::move(settings)),
      cancel_(cancel) {}

std::optional<std::string> ConnectivityProbe::getIpDirect() {
  HttpRequest request;
  request.url = settings_.ipEchoUrl;
  request.timeout = settings_.directTimeout;
  return fetchIp(request,
                 "Having trouble fetching IP address. Please check your "
                 "internet connection.");
}

std::optional<std::string> ConnectivityProbe::getIpViaProxy() {
  HttpRequest request;
  request.url = settings_.ipEchoUrl;
  request.proxy = settings_.proxyUrl;
  request.timeout = settings_.proxyTimeout;
  request.cancel = cancel_;
  return fetchIp(request,
                 "Having trouble connecting to the Tor network. Please wait a "
                 "moment.");
}

std::optional<std::string> ConnectivityProbe::getCurrentIp() {
  return isManagedProcessRunning() ? getIpViaProxy() : getIpDirect();
}

bool ConnectivityProbe::isManagedProcessRunning() const {
  return !processes_
              .findMatching(settings_.relayProcessName,
                            tornet::MatchMode::ExactName)
              .empty();
}

ProbeResult ConnectivityProbe::probe(bool viaProxy) {
  ProbeResult result;
  result.ip = viaProxy ? getIpViaProxy() : getIpDirect();
  result.succeeded = result.ip.has_value();
  return result;
}

bool ConnectivityProbe::hasInternetConnection() {
  HttpRequest request;
  request.url = settings_.connectivityUrl;
  request.timeout = settings_.connectivityTimeout;

  // Любой HTTP-ответ означает, что сеть доступна
  const HttpResponse response = fetcher_.get(request);
  const bool reachable = response.ok || response.status > 0;
  if (!reachable) {
    logger_.debug("ConnectivityProbe: " + request.url + ": " + response.error);
  }
  return reachable;
}

std::optional<std::string> ConnectivityProbe::fetchIp(
    const HttpRequest& request, const std::string& failureMessage) {
  logger_.debug("ConnectivityProbe: GET " + request.url +
                (request.proxy.empty() ? "" : " via " + request.proxy));

  const HttpResponse response = fetcher_.get(request);
  if (response.ok) {
    std::string ip = trim(response.body);
    if (!ip.empty()) return ip;
  } else {
    logger_.debug("ConnectivityProbe: request failed: " + response.error);
  }

  logger_.warning(failureMessage);
  return std::nullopt;
}
