#include <fnrun/common/exceptions.hpp>
#include <fnrun/common/util.hpp>
#include <fnrun/sandbox/internal/interpreter.hpp>
#include <fnrun/sandbox/protocol.hpp>

#include <execinfo.h>
#include <signal.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <iostream>
#include <iterator>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "isolation.hpp"
#include "opts.hpp"

void failure_handler(int signum)
{
  fprintf(stderr, "Unfortunately, the sandbox host has crashed - signal %d.\n", signum);
  void* array[10];
  size_t size;
  // get void*'s for all entries on the stack
  size = backtrace(array, 10);
  // print out all the frames to stderr
  fprintf(stderr, "Error: signal %d:\n", signum);
  backtrace_symbols_fd(array, size, STDERR_FILENO);
  _exit(1);
}

bool write_result(int fd, const std::string& data)
{
  size_t written = 0;
  while (written < data.size()) {
    ssize_t bytes = write(fd, data.data() + written, data.size() - written);
    if (bytes == -1) {
      if (errno == EINTR) {
        continue;
      }
      spdlog::error("Could not write the result: {}", strerror(errno));
      return false;
    }
    written += bytes;
  }
  return true;
}

int main(int argc, char** argv)
{
  // Other sandboxes of the same user must not read our environment or memory.
  try {
    fnrun::sandbox::isolation::make_undumpable();
    fnrun::sandbox::isolation::drop_capabilities();
  } catch (fnrun::common::SandboxError& exc) {
    spdlog::error("{}", exc.what());
    return 1;
  }

  auto config = fnrun::sandbox::opts(argc, argv);
  if (config.verbose)
    spdlog::set_level(spdlog::level::debug);
  else
    spdlog::set_level(spdlog::level::warn);
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");

  {
    // Catch failure signals
    struct sigaction sa;
    memset(&sa, 0, sizeof(struct sigaction));
    sigemptyset(&sa.sa_mask);
    sa.sa_handler = failure_handler;
    sa.sa_flags = 0;

    sigaction(SIGSEGV, &sa, nullptr);
    sigaction(SIGBUS, &sa, nullptr);
  }

  std::string input{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
  SPDLOG_DEBUG("Received request of {} bytes", input.size());

  std::string data;
  try {
    auto request = fnrun::sandbox::protocol::decode_request(input);
    fnrun::sandbox::internal::PythonInterpreter interpreter;
    fnrun::sandbox::isolation::restrict_syscalls();
    data = fnrun::sandbox::protocol::encode(interpreter.run(request));
  } catch (fnrun::common::InvalidJSON& exc) {
    spdlog::error("Malformed request: {}", exc.what());
    data = fnrun::sandbox::protocol::encode(
        fnrun::sandbox::Failure::internal_error(fmt::format("malformed request: {}", exc.what()))
    );
  } catch (fnrun::common::SandboxError& exc) {
    spdlog::error("Could not prepare the sandbox: {}", exc.what());
    data = fnrun::sandbox::protocol::encode(
        fnrun::sandbox::Failure::internal_error("could not prepare the sandbox")
    );
  }

  if (!write_result(config.result_fd, data)) {
    return 1;
  }
  fnrun::common::util::expect_zero(close(config.result_fd));
  SPDLOG_DEBUG("Sandbox host is closing down");
  return 0;
}
