/**
 * @file configvalidator.cpp
 * @date October 2026
 * @brief Реализация валидатора настроек tornet
 */
#include "../include/configvalidator.hpp"

#include <vector>

#include "tornet/ilogger.hpp"

using namespace std;

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
  if (!config.is_object()) {
    throw runtime_error("ConfigValidator: root must be an object");
  }

  const auto &service = requireSection(config, "service");
  requireString(service, "service", "name");
  requireString(service, "service", "systemd_marker");

  const auto &relay = requireSection(config, "relay");
  requireString(relay, "relay", "process_name");
  requireString(relay, "relay", "binary");

  const auto &proxy = requireSection(config, "proxy");
  requireString(proxy, "proxy", "host");
  requirePositive(proxy, "proxy", "port", false);
  if (proxy["port"].get<long long>() > 65535) {
    throw runtime_error("ConfigValidator: proxy.port must be in 1..65535");
  }

  const auto &probe = requireSection(config, "probe");
  requireString(probe, "probe", "ip_echo_url");
  requireString(probe, "probe", "connectivity_url");
  for (const char *key : {"direct_timeout_sec", "proxy_timeout_sec",
                          "connectivity_timeout_sec"}) {
    requirePositive(probe, "probe", key, false);
  }

  const auto &timing = requireSection(config, "timing");
  for (const char *key :
       {"bootstrap_grace_sec", "startup_wait_sec", "rotation_settle_sec"}) {
    requirePositive(timing, "timing", key, true);
  }

  const auto &torrc = requireSection(config, "torrc");
  if (!torrc.contains("candidates") || !torrc["candidates"].is_array()) {
    throw runtime_error("ConfigValidator: torrc.candidates must be an array");
  }
  for (const auto &candidate : torrc["candidates"]) {
    if (!candidate.is_string()) {
      throw runtime_error(
          "ConfigValidator: torrc.candidates must contain only strings");
    }
  }

  requireString(config, "", "tool_name");

  if (!config.contains("logging")) {
    throw runtime_error("ConfigValidator: Missing required section: logging");
  }
  return validateLogging(config["logging"]);
}

bool ConfigValidator::validateLogging(const nlohmann::json &logging) const {
  if (!logging.is_array()) {
    throw runtime_error("ConfigValidator: logging must be an array");
  }

  const vector<string> validTypes = {"console", "sync_file"};
  for (const auto &entry : logging) {
    if (!entry.is_object() || !entry.contains("type") ||
        !entry["type"].is_string()) {
      throw runtime_error(
          "ConfigValidator: logging entry must be an object with a type");
    }

    const string type = entry["type"].get<string>();
    bool known = false;
    for (const auto &valid : validTypes) known = known || valid == type;
    if (!known) {
      throw runtime_error("ConfigValidator: Invalid logger type: " + type);
    }

    if (entry.contains("level")) {
      if (!entry["level"].is_string()) {
        throw runtime_error("ConfigValidator: logging level must be a string");
      }
      try {
        tornet::stringToLogLevel(entry["level"].get<string>());
      } catch (const invalid_argument &e) {
        throw runtime_error(string("ConfigValidator: ") + e.what());
      }
    }
    if (entry.contains("file") && !entry["file"].is_string()) {
      throw runtime_error("ConfigValidator: logging file must be a string");
    }
  }
  return true;
}

const nlohmann::json &ConfigValidator::requireSection(
    const nlohmann::json &config, const string &name) const {
  if (!config.contains(name) || !config[name].is_object()) {
    throw runtime_error("ConfigValidator: Missing required section: " + name);
  }
  return config[name];
}

void ConfigValidator::requireString(const nlohmann::json &section,
                                    const string &path,
                                    const string &key) const {
  const string full = path.empty() ? key : path + "." + key;
  if (!section.contains(key) || !section[key].is_string()) {
    throw runtime_error("ConfigValidator: " + full + " must be a string");
  }
  if (section[key].get<string>().empty()) {
    throw runtime_error("ConfigValidator: " + full + " cannot be empty");
  }
}

void ConfigValidator::requirePositive(const nlohmann::json &section,
                                      const string &path, const string &key,
                                      bool allowZero) const {
  const string full = path + "." + key;
  if (!section.contains(key) || !section[key].is_number_integer()) {
    throw runtime_error("ConfigValidator: " + full + " must be an integer");
  }
  const long long value = section[key].get<long long>();
  if (value < 0 || (!allowZero && value == 0)) {
    throw runtime_error("ConfigValidator: " + full +
                        (allowZero ? " must not be negative"
                                   : " must be positive"));
  }
}
