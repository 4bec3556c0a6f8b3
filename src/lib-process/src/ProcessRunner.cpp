#include "tornet/ProcessRunner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace tornet {

namespace {

// Закрывает дескриптор при выходе из области видимости
class FdGuard {
 public:
  explicit FdGuard(int fd = -1) : fd_(fd) {}
  ~FdGuard() { reset(); }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const { return fd_; }
  void reset(int fd = -1) {
    if (fd_ >= 0) close(fd_);
    fd_ = fd;
  }

 private:
  int fd_;
};

void makePipe(int fds[2]) {
  if (pipe2(fds, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "ProcessRunner: pipe2 failed");
  }
}

// Массив argv для execvp; строки принадлежат CommandSpec
std::vector<char*> buildArgv(const CommandSpec& spec) {
  std::vector<char*> argv;
  argv.reserve(spec.args.size() + 2);
  argv.push_back(const_cast<char*>(spec.program.c_str()));
  for (const auto& arg : spec.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);
  return argv;
}

// После fork() в многопоточном процессе: только async-signal-safe вызовы
[[noreturn]] void execChild(char* const* argv, int out_fd, int err_fd) {
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);

  int devnull = open("/dev/null", O_RDONLY);
  if (devnull >= 0) dup2(devnull, STDIN_FILENO);
  dup2(out_fd, STDOUT_FILENO);
  dup2(err_fd, STDERR_FILENO);

  execvp(argv[0], argv);
  _exit(127);
}

// Читает оба канала до EOF
void drainPipes(int out_fd, int err_fd, std::string& out, std::string& err) {
  struct pollfd fds[2];
  fds[0] = {out_fd, POLLIN, 0};
  fds[1] = {err_fd, POLLIN, 0};
  int open_count = 2;
  char buffer[4096];

  while (open_count > 0) {
    int ready = poll(fds, 2, -1);
    if (ready == -1) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::system_category(),
                              "ProcessRunner: poll failed");
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        (i == 0 ? out : err).append(buffer, static_cast<size_t>(n));
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        fds[i].fd = -1;
        --open_count;
      }
    }
  }
}

}  // namespace

std::string CommandSpec::toString() const {
  std::ostringstream oss;
  oss << program;
  for (const auto& arg : args) oss << ' ' << arg;
  return oss.str();
}

PosixCommandRunner::PosixCommandRunner(std::string searchPath)
    : searchPath_(std::move(searchPath)) {}

CommandResult PosixCommandRunner::run(const CommandSpec& spec) {
  if (spec.program.empty()) {
    throw std::invalid_argument("ProcessRunner: empty program name");
  }

  int out_pipe[2];
  int err_pipe[2];
  makePipe(out_pipe);
  FdGuard out_read(out_pipe[0]);
  FdGuard out_write(out_pipe[1]);
  makePipe(err_pipe);
  FdGuard err_read(err_pipe[0]);
  FdGuard err_write(err_pipe[1]);

  std::vector<char*> argv = buildArgv(spec);

  pid_t pid = fork();
  if (pid < 0) {
    throw std::system_error(errno, std::system_category(),
                            "ProcessRunner: fork failed");
  }
  if (pid == 0) {
    execChild(argv.data(), out_write.get(), err_write.get());
  }

  out_write.reset();
  err_write.reset();

  CommandResult result;
  drainPipes(out_read.get(), err_read.get(), result.stdoutText,
             result.stderrText);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::system_category(),
                              "ProcessRunner: waitpid failed");
    }
  }

  if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exitCode = 128 + WTERMSIG(status);
  }
  return result;
}

std::optional<std::string> PosixCommandRunner::findExecutable(
    const std::string& name) const {
  if (name.empty()) return std::nullopt;

  auto isExecutable = [](const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           access(path.c_str(), X_OK) == 0;
  };

  if (name.find('/') != std::string::npos) {
    if (isExecutable(name)) return name;
    return std::nullopt;
  }

  std::string path = searchPath_;
  if (path.empty()) {
    const char* env = std::getenv("PATH");
    path = env ? env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
  }

  std::istringstream dirs(path);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (isExecutable(candidate)) return candidate;
  }
  return std::nullopt;
}

bool PosixCommandRunner::isPrivileged() const { return geteuid() == 0; }

}  // namespace tornet
