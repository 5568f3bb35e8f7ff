#include <fnrun/sandbox/internal/process.hpp>

#include <fnrun/common/exceptions.hpp>
#include <fnrun/common/util.hpp>

#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

namespace fnrun::sandbox::internal {

  namespace {

    // The helpers below run in the forked child before execve.
    // Only async-signal-safe calls are allowed there.

    void child_fail(const char* msg, size_t len, int code)
    {
      // Nothing to do if stderr is already gone.
      [[maybe_unused]] ssize_t ret = ::write(STDERR_FILENO, msg, len);
      _exit(code);
    }

    void child_limit(int resource, rlim_t soft, rlim_t hard)
    {
      struct rlimit limit {};
      limit.rlim_cur = soft;
      limit.rlim_max = hard;
      if (setrlimit(resource, &limit) != 0) {
        static constexpr char msg[] = "fnrun: could not apply resource limits\n";
        child_fail(msg, sizeof(msg) - 1, EXIT_SETUP_FAILED);
      }
    }

    void child_redirect(int from, int to)
    {
      int ret = 0;
      if (from == to) {
        // dup2 does nothing here, clear close-on-exec by hand.
        ret = fcntl(to, F_SETFD, 0);
      } else {
        ret = dup2(from, to);
      }
      if (ret == -1) {
        static constexpr char msg[] = "fnrun: could not redirect descriptors\n";
        child_fail(msg, sizeof(msg) - 1, EXIT_SETUP_FAILED);
      }
    }

    [[noreturn]] void child_exec(
        char** argv, char** envp, const Limits& limits, pid_t parent, int stdin_fd, int output_fd,
        int result_fd
    )
    {
      // New session, so the parent can kill everything we start.
      setsid();

      // Never outlive the server.
      if (prctl(PR_SET_PDEATHSIG, SIGKILL) != 0 || getppid() != parent) {
        _exit(EXIT_SETUP_FAILED);
      }
      if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        static constexpr char msg[] = "fnrun: could not drop privileges\n";
        child_fail(msg, sizeof(msg) - 1, EXIT_SETUP_FAILED);
      }

      // Soft limit delivers SIGXCPU, the hard one SIGKILL a second later.
      auto cpu = static_cast<rlim_t>(limits.cpu_time_s);
      child_limit(RLIMIT_CPU, cpu, cpu + 1);
      if (limits.memory_mb > 0) {
        auto bytes = static_cast<rlim_t>(limits.memory_mb) * 1024 * 1024;
        child_limit(RLIMIT_AS, bytes, bytes);
      }
      auto files = static_cast<rlim_t>(limits.max_open_files);
      child_limit(RLIMIT_NOFILE, files, files);
      child_limit(RLIMIT_FSIZE, 0, 0);
      child_limit(RLIMIT_CORE, 0, 0);

      // Order matters: the standard descriptors are occupied in the parent,
      // so none of the pipe ends can be 0, 1 or 2.
      child_redirect(stdin_fd, STDIN_FILENO);
      child_redirect(output_fd, STDOUT_FILENO);
      child_redirect(output_fd, STDERR_FILENO);
      child_redirect(result_fd, RESULT_FD);

      // Everything else is close-on-exec already; a failure here leaves only those.
      close_range(RESULT_FD + 1, ~0U, 0);

      execve(argv[0], argv, envp);

      static constexpr char msg[] = "fnrun: could not execute the sandbox host\n";
      child_fail(msg, sizeof(msg) - 1, EXIT_EXEC_FAILED);
      _exit(EXIT_EXEC_FAILED);
    }

  } // namespace

  void FileDescriptor::set_nonblocking()
  {
    int flags = fcntl(_fd, F_GETFL, 0);
    if (flags == -1 || fcntl(_fd, F_SETFL, flags | O_NONBLOCK) == -1) {
      throw common::SandboxError(
          fmt::format("Could not make descriptor {} non-blocking: {}", _fd, strerror(errno))
      );
    }
  }

  void FileDescriptor::close()
  {
    if (_fd >= 0) {
      common::util::expect_zero(::close(_fd));
      _fd = -1;
    }
  }

  Pipe Pipe::create()
  {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
      throw common::SandboxError(fmt::format("Could not create a pipe: {}", strerror(errno)));
    }
    return Pipe{FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
  }

  int ExitStatus::exit_code() const
  {
    return WEXITSTATUS(status);
  }

  bool ExitStatus::signaled() const
  {
    return WIFSIGNALED(status);
  }

  int ExitStatus::signal() const
  {
    return WTERMSIG(status);
  }

  std::chrono::milliseconds ExitStatus::cpu_time() const
  {
    auto to_ms = [](const struct timeval& val) {
      return std::chrono::milliseconds{val.tv_sec * 1000 + val.tv_usec / 1000};
    };
    return to_ms(usage.ru_utime) + to_ms(usage.ru_stime);
  }

  std::unique_ptr<SandboxProcess> SandboxProcess::spawn(
      char** argv, char** envp, const Limits& limits, int stdin_fd, int output_fd, int result_fd
  )
  {
    pid_t parent = getpid();
    pid_t pid = fork();
    if (pid < 0) {
      throw common::SandboxError{
          fmt::format("Fork failed! {}, reason {} {}", pid, errno, strerror(errno))};
    }

    if (pid == 0) {
      child_exec(argv, envp, limits, parent, stdin_fd, output_fd, result_fd);
    }

    SPDLOG_DEBUG("Started sandbox process with PID {}", pid);
    return std::unique_ptr<SandboxProcess>{new SandboxProcess{pid}};
  }

  SandboxProcess::~SandboxProcess()
  {
    if (!_reaped) {
      terminate();
    }
  }

  void SandboxProcess::kill()
  {
    if (_reaped) {
      return;
    }

    // The child might not have called setsid yet, signal it directly too.
    ::kill(-_pid, SIGKILL);
    ::kill(_pid, SIGKILL);
  }

  std::optional<ExitStatus> SandboxProcess::wait_until(clock_t::time_point deadline)
  {
    ExitStatus result{};
    while (true) {

      pid_t ret = wait4(_pid, &result.status, WNOHANG, &result.usage);
      if (ret == _pid) {
        _reaped = true;
        return result;
      }

      if (ret == -1 && errno != EINTR) {
        throw common::SandboxError{
            fmt::format("Waiting for sandbox {} failed: {}", _pid, strerror(errno))};
      }

      if (clock_t::now() >= deadline) {
        return std::nullopt;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  ExitStatus SandboxProcess::terminate()
  {
    kill();

    ExitStatus result{};
    while (!_reaped) {
      pid_t ret = wait4(_pid, &result.status, 0, &result.usage);
      if (ret == _pid) {
        _reaped = true;
      } else if (ret == -1 && errno != EINTR) {
        spdlog::error("Could not reap sandbox process {}: {}", _pid, strerror(errno));
        _reaped = true;
      }
    }
    return result;
  }

} // namespace fnrun::sandbox::internal
