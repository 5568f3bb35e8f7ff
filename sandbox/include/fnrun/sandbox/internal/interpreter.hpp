#ifndef FNRUN_SANDBOX_INTERNAL_INTERPRETER_HPP
#define FNRUN_SANDBOX_INTERNAL_INTERPRETER_HPP

#include <fnrun/sandbox/protocol.hpp>
#include <fnrun/sandbox/result.hpp>

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include <pybind11/embed.h>

namespace fnrun::sandbox::internal {

  // Builtins that never reach the sandboxed code.
  extern const std::vector<std::string> REMOVED_BUILTINS;

  // Name of the module the deployed source is executed as.
  static constexpr char MODULE_NAME[] = "deployment";

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Embedded interpreter of the sandbox host.
  ///
  /// Lives for exactly one request; the process exits afterwards. The
  /// restricted builtins and the import gate only narrow what the code can
  /// reach. Isolation itself comes from the process boundary and its limits.
  ////////////////////////////////////////////////////////////////////////////////
  class PythonInterpreter {
  public:
    // Throws common::SandboxError when the interpreter cannot be prepared.
    PythonInterpreter();

    PythonInterpreter(const PythonInterpreter&) = delete;
    PythonInterpreter& operator=(const PythonInterpreter&) = delete;

    // Every Python error is converted into a Failure before returning.
    InvocationResult run(const protocol::Request& request);

    // Callable top-level bindings not starting with an underscore, in definition order.
    static std::vector<std::string> available_callables(pybind11::dict globals);

  private:
    pybind11::dict _create_globals(const std::vector<std::string>& allowed_modules);

    InvocationResult _run(const protocol::Request& request);

    pybind11::scoped_interpreter _guard;
  };

} // namespace fnrun::sandbox::internal

#endif
