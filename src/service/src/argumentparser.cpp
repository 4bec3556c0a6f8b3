/**
 * @file argumentparser.cpp
 * @date October 2026
 * @brief Реализация парсера аргументов командной строки
 *
 * @details
 * Поддерживаются флаги режима работы (--ip, --stop), параметры ротации
 * (--interval, --count), выбор страны выхода (--prefer-ru,
 * --prefer-country, --fallback-exits, --torrc) и общие параметры
 * (--config-file, --override, --log-type, --log-level).
 *
 * Формат интервала здесь не проверяется: строка разбирается
 * RotationInterval::parse(), чтобы ошибка получила собственный код.
 */

#include "../include/argumentparser.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>

#include "../include/errors.hpp"

using namespace std;

// Инициализация статических членов класса
const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

const vector<string> ArgumentParser::validLogTypes = {"console", "sync_file"};

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--version" || arg == "-v") {
      args.version_message = true;
    } else if (arg == "--ip") {
      args.show_ip = true;
    } else if (arg == "--stop") {
      args.stop = true;
    } else if (arg == "--prefer-ru") {
      args.prefer_exit = true;
      args.prefer_country = "ru";
    } else if (matches(arg, "--prefer-country")) {
      string country = takeValue(arg, "--prefer-country", i, argc, argv);
      if (country.empty() ||
          !all_of(country.begin(), country.end(),
                  [](unsigned char c) { return isalpha(c) != 0; })) {
        throw UsageError("ArgumentParser: Invalid country code: " + country);
      }
      args.prefer_exit = true;
      args.prefer_country = country;
    } else if (matches(arg, "--interval")) {
      args.interval = takeValue(arg, "--interval", i, argc, argv);
    } else if (matches(arg, "--count")) {
      parseCount(takeValue(arg, "--count", i, argc, argv), args);
    } else if (matches(arg, "--fallback-exits")) {
      args.fallback_exits = takeValue(arg, "--fallback-exits", i, argc, argv);
    } else if (matches(arg, "--torrc")) {
      args.torrc_path = takeValue(arg, "--torrc", i, argc, argv);
    } else if (matches(arg, "--config-file")) {
      args.config_path = takeValue(arg, "--config-file", i, argc, argv);
    } else if (arg.compare(0, 11, "--override=") == 0) {
      parseOverride(arg, args);
    } else if (matches(arg, "--log-type")) {
      parseLogType(takeValue(arg, "--log-type", i, argc, argv), args);
    } else if (matches(arg, "--log-level")) {
      parseLogLevel(takeValue(arg, "--log-level", i, argc, argv), args);
    } else {
      throw UsageError("ArgumentParser: Unknown argument: " + arg);
    }
  }

  validateLogTypes(args.logger_types);
  return args;
}

void ArgumentParser::printHelp(ostream &out) {
  out << "Usage: tornet [options]\n"
         "Automate IP address changes using Tor\n\n"
         "Options:\n"
         "  --interval VAL          Seconds between IP changes, or a range "
         "like 30-120 (default 60)\n"
         "  --count N               Number of IP changes, 0 for infinite "
         "(default 10)\n"
         "  --ip                    Display current IP address and exit\n"
         "  --stop                  Stop Tor service and tornet processes\n"
         "  --prefer-ru             Try Russia (RU) exit nodes first, fall "
         "back if unavailable\n"
         "  --prefer-country CC     Try exit nodes of country CC first\n"
         "  --fallback-exits LIST   Comma-separated fallback country codes, "
         "or \"any\"\n"
         "                          (default de,nl,fr,pl,se,fi,lt,lv,ee)\n"
         "  --torrc PATH            Path to torrc (default: auto-detect)\n"
         "  --config-file PATH      JSON settings file\n"
         "  --override=KEY:VALUE    Override a setting, e.g. "
         "proxy.port:9150\n"
         "  --log-type TYPES        console,sync_file\n"
         "  --log-level LEVEL       debug|info|warning|error|critical\n"
         "  -h, --help              Show this help\n"
         "  -v, --version           Show version\n";
}

bool ArgumentParser::matches(const string &arg, const string &name) {
  return arg == name || arg.compare(0, name.size() + 1, name + "=") == 0;
}

string ArgumentParser::takeValue(const string &arg, const string &name, int &i,
                                 int argc, char **argv) {
  if (arg.size() > name.size()) {
    return arg.substr(name.size() + 1);
  }
  if (i + 1 < argc) {
    return argv[++i];
  }
  throw UsageError("ArgumentParser: " + name + " requires a value");
}

void ArgumentParser::parseCount(const string &value, ParsedArgs &args) {
  if (value.empty() || !all_of(value.begin(), value.end(), [](unsigned char c) {
        return isdigit(c) != 0;
      })) {
    throw UsageError("ArgumentParser: --count expects a non-negative integer: " +
                     value);
  }
  unsigned long long count = 0;
  try {
    count = stoull(value);
  } catch (const out_of_range &) {
    throw UsageError("ArgumentParser: --count is too large: " + value);
  }
  if (count > numeric_limits<uint32_t>::max()) {
    throw UsageError("ArgumentParser: --count is too large: " + value);
  }
  args.count = static_cast<uint32_t>(count);
}

void ArgumentParser::parseOverride(const string &arg, ParsedArgs &args) {
  string overrideStr = arg.substr(arg.find('=') + 1);
  size_t colonPos = overrideStr.find(':');
  if (colonPos == string::npos || colonPos == 0) {
    throw UsageError(
        "ArgumentParser: Invalid override format. Use --override=key:value");
  }

  string key = overrideStr.substr(0, colonPos);
  string value = overrideStr.substr(colonPos + 1);
  args.overrides[key] = value;
}

void ArgumentParser::parseLogType(const string &value, ParsedArgs &args) {
  string rest = value;
  size_t pos = 0;
  while ((pos = rest.find(',')) != string::npos) {
    args.logger_types.push_back(rest.substr(0, pos));
    rest.erase(0, pos + 1);
  }

  if (!rest.empty()) {
    args.logger_types.push_back(rest);
  }

  args.use_cli_logging = true;
}

void ArgumentParser::parseLogLevel(const string &value, ParsedArgs &args) {
  if (find(validLogLevels.begin(), validLogLevels.end(), value) ==
      validLogLevels.end()) {
    throw UsageError("ArgumentParser: Invalid log level: " + value);
  }

  args.log_level = value;
  args.use_cli_logging = true;
}

void ArgumentParser::validateLogTypes(const vector<string> &types) {
  for (const auto &type : types) {
    if (find(validLogTypes.begin(), validLogTypes.end(), type) ==
        validLogTypes.end()) {
      throw UsageError("ArgumentParser: Invalid logger type: " + type);
    }
  }
}
