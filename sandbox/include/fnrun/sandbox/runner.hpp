#ifndef FNRUN_SANDBOX_RUNNER_HPP
#define FNRUN_SANDBOX_RUNNER_HPP

#include <fnrun/sandbox/environment.hpp>
#include <fnrun/sandbox/limits.hpp>
#include <fnrun/sandbox/result.hpp>

#include <memory>
#include <string>
#include <vector>

#include <json/value.h>
#include <spdlog/logger.h>

namespace fnrun::sandbox {

  namespace internal {
    class SandboxProcess;
    class FileDescriptor;
    struct ExitStatus;
  } // namespace internal

  struct Invocation {
    // Deployment key, only used in logs.
    std::string key;

    std::string source;
    std::string entry_point;

    // JSON object of keyword arguments.
    Json::Value arguments{Json::objectValue};

    // Deployment variables, merged over the base environment.
    Environment::values_t env;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Executes one invocation of a deployed function in isolation.
  ///
  /// Implementations must be safe to call from many threads at once.
  /// Every outcome of the user code is returned as a Failure; exceptions are
  /// reserved for faults of the runner itself.
  ////////////////////////////////////////////////////////////////////////////////
  struct Runner {

    virtual ~Runner() = default;

    virtual InvocationResult invoke(const Invocation& invocation, const Limits& limits) = 0;
  };

  struct ProcessRunnerOptions {
    // Path of the sandbox host executable.
    std::string executable;

    // Base environment of every sandbox, as NAME=value entries.
    std::vector<std::string> environment;

    std::vector<std::string> allowed_modules;

    // Forwards debug logging to the sandbox host.
    bool verbose = false;
  };

  // One fresh sandbox host process per invocation.
  class ProcessRunner : public Runner {
  public:
    ProcessRunner(ProcessRunnerOptions options);

    InvocationResult invoke(const Invocation& invocation, const Limits& limits) override;

    // fnrun-sandbox located next to the running executable.
    static std::string default_executable();

  private:
    InvocationResult _supervise(
        internal::SandboxProcess& process, internal::FileDescriptor& request_fd,
        internal::FileDescriptor& result_fd, internal::FileDescriptor& output_fd,
        const std::string& request, const Invocation& invocation, const Limits& limits
    );

    InvocationResult _interpret(
        const internal::ExitStatus& status, const std::string& result, const std::string& output,
        const Invocation& invocation, const Limits& limits
    );

    std::string _executable;
    Environment _base_env;
    std::vector<std::string> _allowed_modules;
    bool _verbose;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace fnrun::sandbox

#endif
