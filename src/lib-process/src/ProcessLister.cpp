#include "tornet/ProcessLister.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace tornet {

namespace {

bool isAllDigits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
           return std::isdigit(c) != 0;
         });
}

std::string trimRight(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.pop_back();
  }
  return s;
}

}  // namespace

std::set<pid_t> PgrepProcessLister::findMatching(const std::string& name,
                                                 MatchMode mode) const {
  CommandSpec spec{"pgrep", {mode == MatchMode::ExactName ? "-x" : "-f", name}};
  std::set<pid_t> pids;
  CommandResult result;
  try {
    result = runner_.run(spec);
  } catch (const std::system_error&) {
    return pids;
  }
  if (result.exitCode != 0) return pids;

  std::istringstream lines(result.stdoutText);
  std::string line;
  while (std::getline(lines, line)) {
    line = trimRight(line);
    if (isAllDigits(line)) pids.insert(static_cast<pid_t>(std::stol(line)));
  }
  return pids;
}

std::set<pid_t> ProcfsProcessLister::findMatching(const std::string& name,
                                                  MatchMode mode) const {
  namespace fs = std::filesystem;
  std::set<pid_t> pids;

  std::error_code ec;
  fs::directory_iterator it(procRoot_, ec);
  if (ec) return pids;

  for (const auto& entry : it) {
    const std::string pid_str = entry.path().filename().string();
    if (!isAllDigits(pid_str)) continue;

    // Процесс может завершиться во время обхода
    if (mode == MatchMode::ExactName) {
      std::ifstream comm(entry.path() / "comm");
      std::string value;
      if (!comm || !std::getline(comm, value)) continue;
      if (trimRight(value) == name) pids.insert(std::stol(pid_str));
    } else {
      std::ifstream cmdline(entry.path() / "cmdline", std::ios::binary);
      if (!cmdline) continue;
      std::string raw((std::istreambuf_iterator<char>(cmdline)),
                      std::istreambuf_iterator<char>());
      std::replace(raw.begin(), raw.end(), '\0', ' ');
      if (!raw.empty() && raw.find(name) != std::string::npos) {
        pids.insert(std::stol(pid_str));
      }
    }
  }
  return pids;
}

std::unique_ptr<IProcessLister> makeProcessLister(ICommandRunner& runner) {
  if (runner.findExecutable("pgrep")) {
    return std::make_unique<PgrepProcessLister>(runner);
  }
  return std::make_unique<ProcfsProcessLister>();
}

}  // namespace tornet
