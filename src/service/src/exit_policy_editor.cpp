#include "../include/exit_policy_editor.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "../include/errors.hpp"

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
  auto notSpace = [](unsigned char c) { return std::isspace(c) == 0; };
  auto begin = std::find_if(s.begin(), s.end(), notSpace);
  auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
  return begin < end ? std::string(begin, end) : std::string();
}

bool startsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

bool isPolicyDirective(const std::string& trimmed) {
  return startsWith(trimmed, ExitPolicyEditor::kExitNodesKey) ||
         startsWith(trimmed, ExitPolicyEditor::kStrictNodesKey);
}

std::string errnoText() { return std::strerror(errno); }

}  // namespace

const std::vector<std::string>& ExitPolicyEditor::defaultCandidates() {
  static const std::vector<std::string> candidates = {
      "/etc/tor/torrc",
      "/etc/tor/torrc.default",
      "/usr/local/etc/tor/torrc",
      "/etc/torrc",
  };
  return candidates;
}

ExitPolicyEditor::ExitPolicyEditor(std::vector<std::string> candidates)
    : candidates_(std::move(candidates)) {}

std::optional<std::string> ExitPolicyEditor::locateConfigPath(
    const std::string& explicitPath) const {
  std::error_code ec;
  if (!explicitPath.empty() && fs::is_regular_file(explicitPath, ec)) {
    return explicitPath;
  }
  for (const auto& candidate : candidates_) {
    if (fs::is_regular_file(candidate, ec)) return candidate;
  }
  return std::nullopt;
}

std::vector<std::string> ExitPolicyEditor::applyPolicy(
    const std::vector<std::string>& lines, const ExitPolicy& policy) {
  std::vector<std::string> result;
  result.reserve(lines.size() + 4);

  for (const auto& line : lines) {
    const std::string trimmed = trim(line);
    if (trimmed == kMarker) {
      // Вместе с маркером убираем пустую строку, добавленную перед ним
      if (!result.empty() && trim(result.back()).empty()) result.pop_back();
      continue;
    }
    if (isPolicyDirective(trimmed)) continue;
    result.push_back(line);
  }

  result.emplace_back();
  result.emplace_back(kMarker);
  if (!policy.countries.empty()) {
    result.push_back(std::string(kExitNodesKey) + " " +
                     policy.exitNodesValue());
  }
  result.push_back(std::string(kStrictNodesKey) + " " +
                   (policy.strict ? "1" : "0"));
  return result;
}

void ExitPolicyEditor::writePolicy(const std::string& path,
                                   const ExitPolicy& policy) const {
  const std::vector<std::string> lines = applyPolicy(readLines(path), policy);

  std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out) {
    throw TorrcWriteError("Failed to write torrc " + path + ": " +
                          errnoText());
  }
  for (const auto& line : lines) out << line << '\n';
  out.close();
  if (!out) {
    throw TorrcWriteError("Failed to write torrc " + path + ": " +
                          errnoText());
  }
}

ExitPolicy ExitPolicyEditor::readPolicy(const std::string& path) const {
  ExitPolicy policy;
  for (const auto& line : readLines(path)) {
    const std::string trimmed = trim(line);
    std::istringstream fields(trimmed);
    std::string key;
    std::string value;
    fields >> key;
    std::getline(fields >> std::ws, value);
    value = trim(value);

    if (key == kExitNodesKey) {
      policy.countries.clear();
      std::istringstream groups(value);
      std::string group;
      while (std::getline(groups, group, ',')) {
        group.erase(std::remove(group.begin(), group.end(), '{'), group.end());
        group.erase(std::remove(group.begin(), group.end(), '}'), group.end());
        group = normalizeCountryCode(group);
        if (!group.empty()) policy.countries.push_back(group);
      }
    } else if (key == kStrictNodesKey) {
      policy.strict = (value == "1");
    }
  }
  return policy;
}

std::vector<std::string> ExitPolicyEditor::readLines(const std::string& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw TorrcReadError("Failed to read torrc " + path +
                         ": no such regular file");
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    throw TorrcReadError("Failed to read torrc " + path + ": " + errnoText());
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  if (in.bad()) {
    throw TorrcReadError("Failed to read torrc " + path + ": " + errnoText());
  }
  return lines;
}
