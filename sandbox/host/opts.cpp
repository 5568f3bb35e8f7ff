#include "opts.hpp"

#include <fnrun/sandbox/internal/process.hpp>

#include <string>

#include <unistd.h>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

namespace fnrun::sandbox {

  Options opts(int argc, char** argv)
  {
    cxxopts::Options options("fnrun-sandbox", "Execute one function invocation.");
    options.add_options()(
        "result-fd", "Descriptor receiving the result.",
        cxxopts::value<int>()->default_value(std::to_string(internal::RESULT_FD))
    )("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"));
    auto parsed_options = options.parse(argc, argv);

    Options result;
    result.result_fd = parsed_options["result-fd"].as<int>();
    if (result.result_fd <= STDERR_FILENO) {
      spdlog::error("Result descriptor {} collides with the standard streams!", result.result_fd);
      exit(internal::EXIT_SETUP_FAILED);
    }
    result.verbose = parsed_options["verbose"].as<bool>();

    return result;
  }

} // namespace fnrun::sandbox
