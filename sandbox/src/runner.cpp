#include <fnrun/sandbox/runner.hpp>

#include <fnrun/common/exceptions.hpp>
#include <fnrun/common/util.hpp>
#include <fnrun/sandbox/internal/process.hpp>
#include <fnrun/sandbox/protocol.hpp>

#include <algorithm>
#include <array>
#include <filesystem>

#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

#include <fmt/format.h>

namespace fnrun::sandbox {

  namespace {

    constexpr size_t READ_CHUNK = 64 * 1024;

    enum class ReadStatus { DATA, END, AGAIN };

    // Data above the limit is read and dropped.
    ReadStatus
    read_chunk(internal::FileDescriptor& fd, std::string& buffer, size_t limit, bool& truncated)
    {
      std::array<char, READ_CHUNK> chunk;
      ssize_t bytes = ::read(fd.get(), chunk.data(), chunk.size());

      if (bytes > 0) {
        size_t space = buffer.size() < limit ? limit - buffer.size() : 0;
        size_t to_copy = std::min(static_cast<size_t>(bytes), space);
        buffer.append(chunk.data(), to_copy);
        truncated |= to_copy < static_cast<size_t>(bytes);
        return ReadStatus::DATA;
      }

      if (bytes == 0) {
        return ReadStatus::END;
      }

      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        return ReadStatus::AGAIN;
      }

      throw common::SandboxError{
          fmt::format("Reading from the sandbox failed: {}", strerror(errno))};
    }

    int remaining_ms(std::chrono::steady_clock::time_point deadline)
    {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now()
      );
      return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    }

    Failure wall_time_exceeded(const Limits& limits)
    {
      return Failure::resource_exceeded(
          fmt::format("wall-clock time limit of {} ms exceeded", limits.wall_time.count())
      );
    }

  } // namespace

  ProcessRunner::ProcessRunner(ProcessRunnerOptions options)
      : _executable(std::move(options.executable)),
        _base_env(Environment::from_entries(options.environment)),
        _allowed_modules(std::move(options.allowed_modules)), _verbose(options.verbose),
        _logger(common::util::create_logger("ProcessRunner"))
  {
    if (_executable.empty()) {
      _executable = default_executable();
    }

    if (access(_executable.c_str(), X_OK) != 0) {
      throw common::InvalidConfigurationError(
          fmt::format("Sandbox executable {} is not executable: {}", _executable, strerror(errno))
      );
    }

    // A sandbox that dies early closes its stdin; writes must fail with EPIPE instead.
    signal(SIGPIPE, SIG_IGN);

    // Sandboxes run as our user; our environment and memory stay out of their reach.
    if (prctl(PR_SET_DUMPABLE, 0, 0, 0, 0) != 0) {
      throw common::SandboxError(
          fmt::format("Could not mark the server as not dumpable: {}", strerror(errno))
      );
    }

    _logger->info("Sandbox executable {}", _executable);
  }

  std::string ProcessRunner::default_executable()
  {
    auto path = std::filesystem::canonical("/proc/self/exe").parent_path();
    return (path / "fnrun-sandbox").string();
  }

  InvocationResult ProcessRunner::invoke(const Invocation& invocation, const Limits& limits)
  {
    Environment env = _base_env;
    try {
      env.overlay(invocation.env);
    } catch (common::InvalidArgument& exc) {
      return Failure::internal_error(exc.what());
    }
    Environment::Block env_block = env.block();

    std::vector<std::string> args{
        _executable, "--result-fd", std::to_string(internal::RESULT_FD)};
    if (_verbose) {
      args.emplace_back("--verbose");
    }
    std::vector<char*> argv;
    for (std::string& arg : args) {
      argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    protocol::Request request{
        invocation.source, invocation.entry_point, invocation.arguments, _allowed_modules};
    std::string data = protocol::encode(request);

    internal::Pipe request_pipe = internal::Pipe::create();
    internal::Pipe output_pipe = internal::Pipe::create();
    internal::Pipe result_pipe = internal::Pipe::create();

    auto start = std::chrono::steady_clock::now();
    auto process = internal::SandboxProcess::spawn(
        argv.data(), env_block.envp(), limits, request_pipe.read.get(), output_pipe.write.get(),
        result_pipe.write.get()
    );

    // Only the child keeps these ends, so that we see EOF when it exits.
    request_pipe.read.close();
    output_pipe.write.close();
    result_pipe.write.close();

    SPDLOG_LOGGER_DEBUG(
        _logger, "Invoking {}.{} in sandbox {}", invocation.key, invocation.entry_point,
        process->pid()
    );

    InvocationResult result = _supervise(
        *process, request_pipe.write, result_pipe.read, output_pipe.read, data, invocation, limits
    );

    auto end = std::chrono::steady_clock::now();
    SPDLOG_LOGGER_DEBUG(
        _logger, "Invocation of {} finished in {} ms, success {}", invocation.key,
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count(),
        succeeded(result)
    );

    return result;
  }

  InvocationResult ProcessRunner::_supervise(
      internal::SandboxProcess& process, internal::FileDescriptor& request_fd,
      internal::FileDescriptor& result_fd, internal::FileDescriptor& output_fd,
      const std::string& request, const Invocation& invocation, const Limits& limits
  )
  {
    auto deadline = std::chrono::steady_clock::now() + limits.wall_time;

    request_fd.set_nonblocking();
    result_fd.set_nonblocking();
    output_fd.set_nonblocking();

    std::string result;
    std::string output;
    bool result_truncated = false;
    bool output_truncated = false;
    size_t written = 0;

    while (result_fd.valid() || output_fd.valid()) {

      std::array<pollfd, 3> fds{};
      nfds_t count = 0;
      int request_idx = -1, result_idx = -1, output_idx = -1;

      if (request_fd.valid()) {
        request_idx = count;
        fds[count++] = pollfd{request_fd.get(), POLLOUT, 0};
      }
      if (result_fd.valid()) {
        result_idx = count;
        fds[count++] = pollfd{result_fd.get(), POLLIN, 0};
      }
      if (output_fd.valid()) {
        output_idx = count;
        fds[count++] = pollfd{output_fd.get(), POLLIN, 0};
      }

      int timeout = remaining_ms(deadline);
      if (timeout == 0) {
        process.terminate();
        _logger->warn("Invocation of {} exceeded the wall-clock limit", invocation.key);
        return wall_time_exceeded(limits);
      }

      int ret = poll(fds.data(), count, timeout);
      if (ret == -1) {
        if (errno == EINTR) {
          continue;
        }
        throw common::SandboxError{
            fmt::format("Polling the sandbox failed: {}", strerror(errno))};
      }
      if (ret == 0) {
        continue;
      }

      if (request_idx >= 0 && fds[request_idx].revents) {

        ssize_t bytes = ::write(request_fd.get(), request.data() + written, request.size() - written);
        if (bytes > 0) {
          written += bytes;
          if (written == request.size()) {
            request_fd.close();
          }
        } else if (bytes == -1 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
          // EPIPE: the sandbox stopped reading, its exit status tells why.
          SPDLOG_LOGGER_DEBUG(
              _logger, "Sandbox {} closed its input: {}", process.pid(), strerror(errno)
          );
          request_fd.close();
        }
      }

      if (result_idx >= 0 && fds[result_idx].revents) {

        ReadStatus status =
            read_chunk(result_fd, result, limits.max_result_bytes, result_truncated);
        if (result_truncated) {
          process.terminate();
          return Failure::resource_exceeded(fmt::format(
              "result size limit of {} bytes exceeded", limits.max_result_bytes
          ));
        } else if (status == ReadStatus::END) {
          result_fd.close();
        }
      }

      if (output_idx >= 0 && fds[output_idx].revents) {
        ReadStatus status =
            read_chunk(output_fd, output, limits.max_output_bytes, output_truncated);
        if (status == ReadStatus::END) {
          output_fd.close();
        }
      }
    }

    // Both channels are closed, the process should be exiting now.
    auto status = process.wait_until(deadline);
    if (!status.has_value()) {
      process.terminate();
      _logger->warn("Invocation of {} exceeded the wall-clock limit", invocation.key);
      return wall_time_exceeded(limits);
    }

    if (!output.empty()) {
      if (output_truncated) {
        output.append("... (truncated)");
      }
      SPDLOG_LOGGER_DEBUG(_logger, "Output of {}: {}", invocation.key, output);
    }

    return _interpret(status.value(), result, output, invocation, limits);
  }

  InvocationResult ProcessRunner::_interpret(
      const internal::ExitStatus& status, const std::string& result, const std::string& output,
      const Invocation& invocation, const Limits& limits
  )
  {
    if (status.signaled()) {

      int sig = status.signal();
      auto cpu_limit = std::chrono::seconds{limits.cpu_time_s};

      if (sig == SIGXCPU || (sig == SIGKILL && status.cpu_time() >= cpu_limit)) {
        _logger->warn("Invocation of {} exceeded the CPU time limit", invocation.key);
        return Failure::resource_exceeded(
            fmt::format("CPU time limit of {} s exceeded", limits.cpu_time_s)
        );
      }

      // We never send SIGKILL on this path, the kernel did.
      if (sig == SIGKILL) {
        _logger->warn("Sandbox of {} was killed by the system", invocation.key);
        return Failure::resource_exceeded(fmt::format(
            "sandbox was killed by the system, memory limit of {} MiB likely exceeded",
            limits.memory_mb
        ));
      }

      _logger->warn("Sandbox of {} terminated by signal {}", invocation.key, strsignal(sig));
      return Failure::execution_error(
          fmt::format("sandbox terminated by signal {} ({})", sig, strsignal(sig))
      );
    }

    int code = status.exit_code();
    if (code == internal::EXIT_SETUP_FAILED || code == internal::EXIT_EXEC_FAILED) {
      _logger->error("Could not start the sandbox host {}: {}", _executable, output);
      return Failure::internal_error(
          fmt::format("could not start the sandbox, exit status {}", code)
      );
    }

    if (result.empty()) {
      _logger->error(
          "Sandbox of {} exited with status {} without a result, output: {}", invocation.key,
          code, output
      );
      return Failure::internal_error(
          fmt::format("sandbox exited with status {} without a result", code)
      );
    }

    try {
      return protocol::decode_result(result);
    } catch (common::InvalidJSON& exc) {
      _logger->error("Sandbox of {} returned a malformed result: {}", invocation.key, exc.what());
      return Failure::internal_error("sandbox returned a malformed result");
    }
  }

} // namespace fnrun::sandbox
