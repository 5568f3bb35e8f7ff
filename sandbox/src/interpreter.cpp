#include <fnrun/sandbox/internal/interpreter.hpp>

#include <fnrun/common/exceptions.hpp>
#include <fnrun/sandbox/internal/conversion.hpp>

#include <optional>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace fnrun::sandbox::internal {

  const std::vector<std::string> REMOVED_BUILTINS = {
      "open", "exec", "eval", "compile",   "input",   "breakpoint",
      "help", "exit", "quit", "copyright", "credits", "license"};

  namespace {

    // Exception messages may carry lone surrogates.
    std::string text(py::handle obj)
    {
      py::bytes encoded = py::str(obj).attr("encode")("utf-8", "backslashreplace");
      return encoded;
    }

    std::string describe(py::error_already_set& exc)
    {
      std::string name = text(exc.type().attr("__name__"));
      std::string message = text(exc.value());
      if (message.empty()) {
        return name;
      }
      return fmt::format("{}: {}", name, message);
    }

    // Read-only view of the process environment, served for "import os".
    py::module_ create_os_shim()
    {
      py::module_ types = py::module_::import("types");
      py::module_ real_os = py::module_::import("os");

      py::object shim = types.attr("ModuleType")("os");
      py::dict environ = py::dict(real_os.attr("environ"));
      shim.attr("environ") = environ;
      shim.attr("getenv") = py::cpp_function(
          [environ](py::object key, py::object default_value) -> py::object {
            return environ.attr("get")(key, default_value);
          },
          py::arg("key"), py::arg("default") = py::none()
      );

      return shim.cast<py::module_>();
    }

    py::cpp_function create_import(std::unordered_set<std::string> allowed)
    {
      py::object real_import = py::module_::import("builtins").attr("__import__");
      py::object os_shim = create_os_shim();

      return py::cpp_function(
          [allowed = std::move(allowed), real_import, os_shim](
              const std::string& name, py::object globals, py::object locals,
              py::object fromlist, int level
          ) -> py::object {
            if (level != 0) {
              throw py::import_error("relative imports are not allowed");
            }

            std::string top = name.substr(0, name.find('.'));
            if (allowed.find(top) == allowed.end()) {
              throw py::import_error(fmt::format("import of module '{}' is not allowed", top));
            }

            if (top == "os") {
              if (name != "os") {
                throw py::import_error(fmt::format("import of module '{}' is not allowed", name));
              }
              return os_shim;
            }

            return real_import(name, globals, locals, fromlist, level);
          },
          py::arg("name"), py::arg("globals") = py::none(), py::arg("locals") = py::none(),
          py::arg("fromlist") = py::tuple(), py::arg("level") = 0
      );
    }

  } // namespace

  PythonInterpreter::PythonInterpreter()
  {
    // Python errors must not outlive the interpreter they come from.
    try {
      // Writes are forbidden by RLIMIT_FSIZE anyway.
      py::module_::import("sys").attr("dont_write_bytecode") = true;
    } catch (py::error_already_set& exc) {
      throw common::SandboxError{fmt::format("Could not set up the interpreter: {}", exc.what())};
    }
  }

  InvocationResult PythonInterpreter::run(const protocol::Request& request)
  {
    try {
      return _run(request);
    } catch (py::error_already_set& exc) {
      // Failures of our own setup, not of the deployed code.
      spdlog::error("Interpreter failure: {}", exc.what());
      return Failure::internal_error(describe(exc));
    } catch (ConversionError& exc) {
      return Failure::internal_error(exc.what());
    } catch (py::cast_error& exc) {
      spdlog::error("Interpreter failure: {}", exc.what());
      return Failure::internal_error(exc.what());
    }
  }

  py::dict PythonInterpreter::_create_globals(const std::vector<std::string>& allowed_modules)
  {
    py::dict builtins = py::module_::import("builtins").attr("__dict__").attr("copy")();
    for (const std::string& name : REMOVED_BUILTINS) {
      builtins.attr("pop")(name, py::none());
    }
    builtins["__import__"] =
        create_import({allowed_modules.begin(), allowed_modules.end()});

    py::dict globals;
    globals["__builtins__"] = builtins;
    globals["__name__"] = MODULE_NAME;
    return globals;
  }

  std::vector<std::string> PythonInterpreter::available_callables(py::dict globals)
  {
    std::vector<std::string> names;
    for (auto [key, value] : globals) {
      if (!py::isinstance<py::str>(key)) {
        continue;
      }
      std::string name = key.cast<std::string>();
      if (!name.empty() && name[0] != '_' && PyCallable_Check(value.ptr())) {
        names.push_back(std::move(name));
      }
    }
    return names;
  }

  InvocationResult PythonInterpreter::_run(const protocol::Request& request)
  {
    py::module_ builtins = py::module_::import("builtins");
    py::dict globals = _create_globals(request.allowed_modules);

    // Load the deployment source.
    try {
      py::object code = builtins.attr("compile")(request.source, "<deployment>", "exec");
      builtins.attr("exec")(code, globals);
    } catch (py::error_already_set& exc) {
      if (exc.matches(PyExc_MemoryError)) {
        return Failure::resource_exceeded("memory limit exceeded");
      }
      return Failure::execution_error(describe(exc));
    }

    // Resolve the entry point.
    if (!globals.contains(request.entry_point) ||
        !PyCallable_Check(globals[py::str(request.entry_point)].ptr())) {
      Failure failure = Failure::not_found("");
      failure.available = available_callables(globals);
      failure.message = fmt::format(
          "entry point '{}' not found; available: {}", request.entry_point,
          format_available(failure.available)
      );
      return failure;
    }
    py::object func = globals[py::str(request.entry_point)];

    py::dict kwargs = to_python(request.arguments).cast<py::dict>();

    // Check the binding up front, so that a TypeError raised inside the function
    // is not mistaken for a wrong call.
    py::module_ inspect = py::module_::import("inspect");
    std::optional<py::object> signature;
    try {
      signature = inspect.attr("signature")(func);
    } catch (py::error_already_set& exc) {
      // Some callables have no introspectable signature.
      if (!exc.matches(PyExc_ValueError) && !exc.matches(PyExc_TypeError)) {
        throw;
      }
    }
    if (signature.has_value()) {
      try {
        signature->attr("bind")(**kwargs);
      } catch (py::error_already_set& exc) {
        if (!exc.matches(PyExc_TypeError)) {
          throw;
        }
        return Failure::invalid_arguments(
            fmt::format("Invalid arguments: {}", text(exc.value()))
        );
      }
    }

    // Call.
    py::object result;
    try {
      result = func(**kwargs);
      if (inspect.attr("iscoroutine")(result).cast<bool>()) {
        result = py::module_::import("asyncio").attr("run")(result);
      }
    } catch (py::error_already_set& exc) {
      if (exc.matches(PyExc_MemoryError)) {
        return Failure::resource_exceeded("memory limit exceeded");
      }
      return Failure::execution_error(describe(exc));
    }

    try {
      return Success{to_json(result)};
    } catch (ConversionError& exc) {
      return Failure::serialization_error(exc.what());
    } catch (py::error_already_set& exc) {
      return Failure::serialization_error(describe(exc));
    } catch (py::cast_error& exc) {
      return Failure::serialization_error(exc.what());
    }
  }

} // namespace fnrun::sandbox::internal
