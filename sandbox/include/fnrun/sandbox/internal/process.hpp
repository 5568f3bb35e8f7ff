#ifndef FNRUN_SANDBOX_INTERNAL_PROCESS_HPP
#define FNRUN_SANDBOX_INTERNAL_PROCESS_HPP

#include <fnrun/sandbox/limits.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <sys/resource.h>
#include <sys/types.h>

namespace fnrun::sandbox::internal {

  // Descriptor on which the sandbox host writes its result.
  static constexpr int RESULT_FD = 3;

  // Exit codes used by the child before the sandbox host starts.
  static constexpr int EXIT_SETUP_FAILED = 126;
  static constexpr int EXIT_EXEC_FAILED = 127;

  class FileDescriptor {
  public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : _fd(fd) {}

    ~FileDescriptor()
    {
      close();
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& obj) noexcept : _fd(obj._fd)
    {
      obj._fd = -1;
    }

    FileDescriptor& operator=(FileDescriptor&& obj) noexcept
    {
      if (this != &obj) {
        close();
        _fd = obj._fd;
        obj._fd = -1;
      }
      return *this;
    }

    int get() const
    {
      return _fd;
    }

    bool valid() const
    {
      return _fd >= 0;
    }

    void set_nonblocking();

    void close();

  private:
    int _fd = -1;
  };

  struct Pipe {
    FileDescriptor read;
    FileDescriptor write;

    // Both ends are close-on-exec; the child moves the ends it needs.
    static Pipe create();
  };

  struct ExitStatus {
    int status;
    struct rusage usage;

    int exit_code() const;
    bool signaled() const;
    int signal() const;

    // User and system time consumed by the process.
    std::chrono::milliseconds cpu_time() const;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Owns one sandbox host process.
  ///
  /// The process runs in its own session, so that the whole group can be
  /// killed. Destroying the object kills and reaps the process when it has not
  /// been reaped yet, on every exit path of the caller.
  ////////////////////////////////////////////////////////////////////////////////
  class SandboxProcess {
  public:
    using clock_t = std::chrono::steady_clock;

    ~SandboxProcess();

    SandboxProcess(const SandboxProcess&) = delete;
    SandboxProcess& operator=(const SandboxProcess&) = delete;
    SandboxProcess(SandboxProcess&&) = delete;
    SandboxProcess& operator=(SandboxProcess&&) = delete;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Forks and executes the sandbox host under resource limits.
    ///
    /// @param[in] argv NULL-terminated arguments, argv[0] is the executable
    /// @param[in] envp NULL-terminated environment of the new process
    /// @param[in] limits resource limits applied before execve
    /// @param[in] stdin_fd becomes the standard input
    /// @param[in] output_fd becomes both standard output and standard error
    /// @param[in] result_fd becomes RESULT_FD
    /// @return running process; throws common::SandboxError when fork fails
    ////////////////////////////////////////////////////////////////////////////////
    static std::unique_ptr<SandboxProcess> spawn(
        char** argv, char** envp, const Limits& limits, int stdin_fd, int output_fd,
        int result_fd
    );

    pid_t pid() const
    {
      return _pid;
    }

    // SIGKILL to the entire process group.
    void kill();

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Reaps the process.
    ///
    /// @param[in] deadline the latest point in time to wait for
    /// @return exit status, or nothing when the process is still running
    ////////////////////////////////////////////////////////////////////////////////
    std::optional<ExitStatus> wait_until(clock_t::time_point deadline);

    // Kills the process group and blocks until the process is reaped.
    ExitStatus terminate();

  private:
    SandboxProcess(pid_t pid) : _pid(pid) {}

    pid_t _pid;
    bool _reaped = false;
  };

} // namespace fnrun::sandbox::internal

#endif
