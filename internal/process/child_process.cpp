#include "internal/process/child_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>

extern char** environ;

namespace fwbuild::process {
namespace {

void CheckRc(bool ok, const char* what) {
  if (!ok) {
    throw std::system_error(std::error_code(errno, std::system_category()), what);
  }
}

std::vector<std::string> MergeEnvironment(const std::map<std::string, std::string>& overrides) {
  std::map<std::string, std::string> merged;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string_view kv(*entry);
    auto             eq = kv.find('=');
    if (eq == std::string_view::npos) continue;
    merged[std::string(kv.substr(0, eq))] = std::string(kv.substr(eq + 1));
  }
  for (const auto& [key, value] : overrides) {
    merged[key] = value;
  }

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [key, value] : merged) {
    out.push_back(key + "=" + value);
  }
  return out;
}

// -1 where the kernel has no pidfd_open; the caller falls back to polling.
int OpenPidFd(pid_t pid) {
#ifdef SYS_pidfd_open
  return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
#else
  (void)pid;
  return -1;
#endif
}

// Everything the child needs is allocated before fork().
pid_t SpawnChild(const ProcessSpec& spec, int read_fd, int write_fd) {
  std::vector<const char*> args;
  args.reserve(spec.argv.size() + 1);
  for (const auto& a : spec.argv) {
    args.push_back(a.c_str());
  }
  args.push_back(nullptr);

  auto                     env_strings = MergeEnvironment(spec.env);
  std::vector<char*>       envp;
  envp.reserve(env_strings.size() + 1);
  for (auto& e : env_strings) {
    envp.push_back(e.data());
  }
  envp.push_back(nullptr);

  std::string exec_failed = "fwbuild: cannot execute " + spec.argv.front() + ": ";

  pid_t pid = ::fork();
  CheckRc(pid != -1, "fork");
  if (pid != 0) return pid;

  // child
  ::setpgid(0, 0);
  ::close(read_fd);
  int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull != -1) ::dup2(devnull, STDIN_FILENO);
  ::dup2(write_fd, STDOUT_FILENO);
  ::dup2(write_fd, STDERR_FILENO);
  if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
    std::fputs(exec_failed.c_str(), stderr);
    std::fputs(std::strerror(errno), stderr);
    std::fputs("\n", stderr);
    std::_Exit(127);
  }

  // execvp resolves PATH from environ
  environ = envp.data();
  ::execvp(args[0], const_cast<char* const*>(args.data()));

  std::fputs(exec_failed.c_str(), stderr);
  std::fputs(std::strerror(errno), stderr);
  std::fputs("\n", stderr);
  std::_Exit(127);
}

void Drain(int fd, const OutputSink& sink, bool& eof) {
  char buffer[4096];
  for (;;) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
      if (sink) sink(std::string_view(buffer, static_cast<size_t>(n)));
      continue;
    }
    if (n == 0) {
      eof = true;
      return;
    }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return;
    // anything else: treat the stream as closed
    eof = true;
    return;
  }
}

} // namespace

ProcessResult RunProcess(const ProcessSpec& spec, const OutputSink& sink, const CancelToken* token,
                         std::chrono::milliseconds grace) {
  if (spec.argv.empty()) {
    throw std::system_error(std::make_error_code(std::errc::invalid_argument), "empty argv");
  }

  int fds[2] = {};
  CheckRc(::pipe2(fds, O_CLOEXEC) == 0, "pipe2");
  int read_fd  = fds[0];
  int write_fd = fds[1];

  pid_t pid;
  try {
    pid = SpawnChild(spec, read_fd, write_fd);
  } catch (const std::system_error&) {
    ::close(read_fd);
    ::close(write_fd);
    throw;
  }
  ::close(write_fd);
  // race with the child's own setpgid; whichever runs first wins
  ::setpgid(pid, pid);
  ::fcntl(read_fd, F_SETFL, ::fcntl(read_fd, F_GETFL) | O_NONBLOCK);
  // readable once the child exits, so output and exit share one poll
  const int pid_fd = OpenPidFd(pid);

  ProcessResult result;
  bool          eof    = false;
  bool          exited = false;
  int           status = 0;

  bool                                  term_sent = false;
  bool                                  kill_sent = false;
  std::chrono::steady_clock::time_point kill_at;

  while (!exited) {
    pollfd fds[2];
    nfds_t count = 0;
    if (!eof) fds[count++] = pollfd{read_fd, POLLIN, 0};
    if (pid_fd >= 0) fds[count++] = pollfd{pid_fd, POLLIN, 0};

    // a token needs a periodic look; without a pidfd so does the exit
    int timeout_ms = -1;
    if (token) timeout_ms = 100;
    if (pid_fd < 0) timeout_ms = eof ? 20 : 100;

    int rc = ::poll(fds, count, timeout_ms);
    if (rc < 0 && errno != EINTR) {
      const int err = errno;
      if (pid_fd >= 0) ::close(pid_fd);
      ::close(read_fd);
      ::kill(-pid, SIGKILL);
      ::waitpid(pid, nullptr, 0);
      throw std::system_error(std::error_code(err, std::system_category()), "poll");
    }
    if (rc > 0 && !eof && fds[0].revents != 0) Drain(read_fd, sink, eof);

    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      exited = true;
      break;
    }

    if (token && !term_sent) {
      auto reason = token->Reason();
      if (reason != CancelReason::kNone) {
        result.cancelled = reason;
        ::kill(-pid, SIGTERM);
        term_sent = true;
        kill_at   = std::chrono::steady_clock::now() + grace;
      }
    }
    if (term_sent && !kill_sent && std::chrono::steady_clock::now() >= kill_at) {
      ::kill(-pid, SIGKILL);
      kill_sent = true;
    }
  }

  if (!eof) Drain(read_fd, sink, eof);
  ::close(read_fd);
  if (pid_fd >= 0) ::close(pid_fd);

  // leftovers of a cancelled build must not keep writing into the workspace
  if (term_sent) ::kill(-pid, SIGKILL);

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
    result.exit_code   = 128 + result.term_signal;
  }
  return result;
}

std::string QuoteCommand(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) out += ' ';
    if (arg.find_first_of(" \t\n'\"") != std::string::npos) {
      out += '\'' + arg + '\'';
    } else {
      out += arg;
    }
  }
  return out;
}

} // namespace fwbuild::process
