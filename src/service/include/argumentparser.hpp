#pragma once
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct ParsedArgs {
  std::string interval = "60";
  std::uint32_t count = 10;
  bool show_ip = false;
  bool stop = false;

  bool prefer_exit = false;
  std::string prefer_country = "ru";
  std::string fallback_exits = "de,nl,fr,pl,se,fi,lt,lv,ee";
  std::string torrc_path;

  std::optional<std::string> config_path;
  std::unordered_map<std::string, std::string> overrides;
  std::vector<std::string> logger_types;
  std::optional<std::string> log_level;
  bool use_cli_logging = false;

  bool help_message = false;
  bool version_message = false;
};

/**
 * @class ArgumentParser
 * @brief Разбор командной строки tornet
 *
 * @details Значения принимаются в двух формах: "--flag value" и
 * "--flag=value". Любая ошибка приводит к UsageError (код завершения 1).
 */
class ArgumentParser {
 public:
  ParsedArgs parse(int argc, char **argv);

  static void printHelp(std::ostream &out);

 private:
  static const std::vector<std::string> validLogLevels;
  static const std::vector<std::string> validLogTypes;

  /// Совпадает ли arg с name или name=...
  static bool matches(const std::string &arg, const std::string &name);
  static std::string takeValue(const std::string &arg, const std::string &name,
                               int &i, int argc, char **argv);

  void parseCount(const std::string &value, ParsedArgs &args);
  void parseOverride(const std::string &arg, ParsedArgs &args);
  void parseLogType(const std::string &value, ParsedArgs &args);
  void parseLogLevel(const std::string &value, ParsedArgs &args);
  void validateLogTypes(const std::vector<std::string> &types);
};
