#include "../include/configmanager.hpp"

#include <sstream>
#include <stdexcept>

#include "../include/errors.hpp"

namespace {

std::vector<std::string> splitKey(const std::string &key) {
  std::vector<std::string> parts;
  std::stringstream ss(key);
  std::string part;
  while (std::getline(ss, part, '.')) {
    if (part.empty()) {
      throw UsageError("Invalid override key: " + key);
    }
    parts.push_back(part);
  }
  if (parts.empty()) throw UsageError("Invalid override key: " + key);
  return parts;
}

nlohmann::json parseOverrideValue(const std::string &value) {
  nlohmann::json parsed = nlohmann::json::parse(value, nullptr, false);
  if (parsed.is_discarded()) return value;
  return parsed;
}

}  // namespace

std::string ToolSettings::proxyUrl() const {
  return "socks5h://" + proxyHost + ":" + std::to_string(proxyPort);
}

ConfigManager &ConfigManager::instance() {
  static ConfigManager instance;
  return instance;
}

ConfigManager::ConfigManager() : baseConfig_(defaultConfig()) {}

nlohmann::json ConfigManager::defaultConfig() {
  return {
      {"service",
       {{"name", "tor"}, {"systemd_marker", "/run/systemd/system"}}},
      {"relay", {{"process_name", "tor"}, {"binary", "tor"}}},
      {"proxy", {{"host", "127.0.0.1"}, {"port", 9050}}},
      {"probe",
       {{"ip_echo_url", "https://api.ipify.org"},
        {"connectivity_url", "http://www.google.com"},
        {"direct_timeout_sec", 10},
        {"proxy_timeout_sec", 15},
        {"connectivity_timeout_sec", 5}}},
      {"timing",
       {{"bootstrap_grace_sec", 6},
        {"startup_wait_sec", 5},
        {"rotation_settle_sec", 2}}},
      {"torrc",
       {{"candidates",
         {"/etc/tor/torrc", "/etc/tor/torrc.default",
          "/usr/local/etc/tor/torrc", "/etc/torrc"}}}},
      {"tool_name", "tornet"},
      {"logging", nlohmann::json::array({{{"type", "console"},
                                          {"level", "info"}}})},
  };
}

void ConfigManager::initialize(const std::optional<std::string> &filename) {
  std::lock_guard<std::mutex> lock(configMutex_);

  nlohmann::json config = defaultConfig();
  if (filename) {
    try {
      config.merge_patch(loader_.loadFromFile(*filename));
    } catch (const std::exception &e) {
      throw UsageError(std::string("Config initialization failed: ") +
                       e.what());
    }
  }

  validateOrThrow(config);
  baseConfig_ = std::move(config);
}

void ConfigManager::applyCliOverrides(
    const std::unordered_map<std::string, std::string> &overrides) {
  std::lock_guard<std::mutex> lock(configMutex_);

  // Применение CLI переопределений
  nlohmann::json overrideJson = nlohmann::json::object();
  try {
    for (const auto &[key, value] : overrides) {
      nlohmann::json *node = &overrideJson;
      for (const auto &part : splitKey(key)) {
        node = &(*node)[part];
      }
      *node = parseOverrideValue(value);
    }
  } catch (const nlohmann::json::exception &e) {
    throw UsageError(std::string("Conflicting overrides: ") + e.what());
  }

  nlohmann::json candidate = baseConfig_;
  candidate.merge_patch(overrideJson);
  validateOrThrow(candidate);
  baseConfig_ = std::move(candidate);
}

nlohmann::json ConfigManager::getCurrentConfig() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return baseConfig_;
}

ToolSettings ConfigManager::settings() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return toSettings(baseConfig_);
}

ToolSettings ConfigManager::toSettings(const nlohmann::json &config) {
  ToolSettings s;
  try {
    const auto &service = config.at("service");
    s.serviceName = service.at("name").get<std::string>();
    s.systemdMarker = service.at("systemd_marker").get<std::string>();

    const auto &relay = config.at("relay");
    s.relayProcessName = relay.at("process_name").get<std::string>();
    s.relayBinary = relay.at("binary").get<std::string>();

    const auto &proxy = config.at("proxy");
    s.proxyHost = proxy.at("host").get<std::string>();
    s.proxyPort = proxy.at("port").get<int>();

    const auto &probe = config.at("probe");
    s.probe.ipEchoUrl = probe.at("ip_echo_url").get<std::string>();
    s.probe.connectivityUrl = probe.at("connectivity_url").get<std::string>();
    s.probe.directTimeout =
        std::chrono::seconds(probe.at("direct_timeout_sec").get<int>());
    s.probe.proxyTimeout =
        std::chrono::seconds(probe.at("proxy_timeout_sec").get<int>());
    s.probe.connectivityTimeout =
        std::chrono::seconds(probe.at("connectivity_timeout_sec").get<int>());
    s.probe.proxyUrl = s.proxyUrl();
    s.probe.relayProcessName = s.relayProcessName;

    const auto &timing = config.at("timing");
    s.bootstrapGrace =
        std::chrono::seconds(timing.at("bootstrap_grace_sec").get<int>());
    s.startupWait =
        std::chrono::seconds(timing.at("startup_wait_sec").get<int>());
    s.rotationSettle =
        std::chrono::seconds(timing.at("rotation_settle_sec").get<int>());

    s.torrcCandidates = config.at("torrc")
                            .at("candidates")
                            .get<std::vector<std::string>>();
    s.toolName = config.at("tool_name").get<std::string>();

    for (const auto &entry : config.at("logging")) {
      LoggerSpec spec;
      spec.type = entry.at("type").get<std::string>();
      spec.level = entry.value("level", "");
      spec.file = entry.value("file", "");
      s.logging.push_back(spec);
    }
  } catch (const nlohmann::json::exception &e) {
    throw UsageError(std::string("Invalid settings: ") + e.what());
  }
  return s;
}

void ConfigManager::validateOrThrow(const nlohmann::json &config) const {
  try {
    validator_.validateRoot(config);
  } catch (const std::runtime_error &e) {
    throw UsageError(e.what());
  }
}
