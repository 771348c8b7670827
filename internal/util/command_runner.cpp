#include "command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <optional>

#include "internal/util/errors.hpp"

extern char** environ;

namespace refinery::util {

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(50);

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string kv(*entry);
    const auto  eq = kv.find('=');
    if (eq != std::string::npos && overrides.count(kv.substr(0, eq)) > 0) {
      continue;
    }
    env.push_back(std::move(kv));
  }
  for (const auto& [key, value] : overrides) {
    env.push_back(key + "=" + value);
  }
  return env;
}

std::vector<char*> ToCharPointers(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& v : values) out.push_back(v.data());
  out.push_back(nullptr);
  return out;
}

class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_.data(), O_CLOEXEC) != 0) {
      throw InfrastructureError(std::string("pipe: ") + std::strerror(errno));
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int ReadEnd() const {
    return fds_[0];
  }
  int WriteEnd() const {
    return fds_[1];
  }

  void CloseRead() {
    if (fds_[0] >= 0) ::close(fds_[0]);
    fds_[0] = -1;
  }
  void CloseWrite() {
    if (fds_[1] >= 0) ::close(fds_[1]);
    fds_[1] = -1;
  }

 private:
  std::array<int, 2> fds_{-1, -1};
};

// Returns false on EOF.
bool DrainInto(int fd, std::string* out) {
  char buffer[4096];
  for (;;) {
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      out->append(buffer, static_cast<std::size_t>(n));
      if (static_cast<std::size_t>(n) < sizeof(buffer)) return true;
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    return false;
  }
}

} // namespace

std::vector<std::string> ShellArgv(const std::string& command) {
  return {"sh", "-c", command};
}

CommandResult ProcessCommandRunner::Run(const CommandSpec& spec, const Context& ctx) {
  if (spec.argv.empty()) {
    throw InvalidArgument("command argv is empty");
  }

  CommandResult result;
  if (ctx.IsCancelled()) {
    result.cancelled = true;
    return result;
  }

  // everything the child needs is built before fork
  std::vector<std::string> argv_storage = spec.argv;
  std::vector<std::string> env_storage  = BuildEnvironment(spec.env);
  std::vector<char*>       argv         = ToCharPointers(argv_storage);
  std::vector<char*>       envp         = ToCharPointers(env_storage);
  const char*              work_dir     = spec.work_dir.empty() ? nullptr : spec.work_dir.c_str();

  Pipe out_pipe;
  Pipe err_pipe;

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw InfrastructureError(std::string("fork: ") + std::strerror(errno));
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out_pipe.WriteEnd(), STDOUT_FILENO);
    ::dup2(err_pipe.WriteEnd(), STDERR_FILENO);
    if (work_dir && ::chdir(work_dir) != 0) {
      const char msg[] = "chdir failed\n";
      (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
      ::_exit(127);
    }
    ::execvpe(argv[0], argv.data(), envp.data());
    const char msg[] = "exec failed\n";
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ::_exit(127);
  }

  // parent side also sets the group to close the race with kill()
  ::setpgid(pid, pid);
  out_pipe.CloseWrite();
  err_pipe.CloseWrite();
  ::fcntl(out_pipe.ReadEnd(), F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe.ReadEnd(), F_SETFL, O_NONBLOCK);

  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (spec.timeout > std::chrono::nanoseconds::zero()) {
    deadline = std::chrono::steady_clock::now() + spec.timeout;
  }

  bool out_open = true;
  bool err_open = true;
  bool killed   = false;

  auto enforce_limits = [&] {
    if (killed) return;
    if (ctx.IsCancelled()) {
      result.cancelled = true;
    } else if (deadline && std::chrono::steady_clock::now() >= *deadline) {
      result.timed_out = true;
    }
    if (result.cancelled || result.timed_out) {
      ::kill(-pid, SIGKILL);
      killed = true;
    }
  };

  while (out_open || err_open) {
    enforce_limits();

    std::array<pollfd, 2> fds{};
    nfds_t                count = 0;
    if (out_open) fds[count++] = pollfd{out_pipe.ReadEnd(), POLLIN, 0};
    if (err_open) fds[count++] = pollfd{err_pipe.ReadEnd(), POLLIN, 0};

    const int rc = ::poll(fds.data(), count, static_cast<int>(kPollSlice.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      ::kill(-pid, SIGKILL);
      ::waitpid(pid, nullptr, 0);
      throw InfrastructureError(std::string("poll: ") + std::strerror(errno));
    }
    if (rc == 0) continue;

    for (nfds_t i = 0; i < count; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
      if (fds[i].fd == out_pipe.ReadEnd()) {
        out_open = DrainInto(fds[i].fd, &result.stdout_text);
      } else {
        err_open = DrainInto(fds[i].fd, &result.stderr_text);
      }
    }
  }

  // the child may close or redirect its output and keep running
  int status = 0;
  for (;;) {
    const pid_t done = ::waitpid(pid, &status, killed ? 0 : WNOHANG);
    if (done == pid) break;
    if (done < 0) {
      if (errno == EINTR) continue;
      throw InfrastructureError(std::string("waitpid: ") + std::strerror(errno));
    }
    enforce_limits();
    if (!killed) ctx.WaitFor(kPollSlice);
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace refinery::util
